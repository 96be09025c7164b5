#include "twosum/router.hpp"
#include "twosum/error.hpp"
#include "twosum/log.hpp"

namespace twosum {

void Router::on_request(const std::string& method, RequestHandler handler) {
    request_handlers_[method] = std::move(handler);
}

JsonRpcResponse Router::dispatch(const JsonRpcRequest& req) const {
    auto it = request_handlers_.find(req.method);
    if (it == request_handlers_.end()) {
        logger()->debug("No handler for method '{}'", req.method);
        return JsonRpcResponse::failure(req.id, JsonRpcError{
            error::MethodNotFound,
            "Method not found: " + req.method,
            std::nullopt
        });
    }

    // Absent params reach the handler as null so that each handler decides
    // what "no params" means for its method.
    const nlohmann::json params = req.params ? *req.params : nlohmann::json();

    try {
        auto result = it->second(params);
        if (auto* err = std::get_if<JsonRpcError>(&result)) {
            return JsonRpcResponse::failure(req.id, std::move(*err));
        }
        return JsonRpcResponse::success(req.id, std::move(std::get<nlohmann::json>(result)));
    } catch (const McpProtocolError& e) {
        return JsonRpcResponse::failure(req.id, JsonRpcError{e.code, e.what(), std::nullopt});
    } catch (const std::exception& e) {
        logger()->error("Handler for '{}' failed: {}", req.method, e.what());
        return JsonRpcResponse::failure(req.id,
            JsonRpcError{error::InternalError, e.what(), std::nullopt});
    }
}

} // namespace twosum
