#pragma once
#include "json_rpc.hpp"
#include <functional>
#include <string>
#include <unordered_map>
#include <variant>

namespace twosum {

using HandlerResult = std::variant<nlohmann::json, JsonRpcError>;
using RequestHandler = std::function<HandlerResult(const nlohmann::json& params)>;

/// Method-name dispatch table. Single-threaded: handlers are registered
/// before serving starts and dispatch runs on the session thread only.
class Router {
public:
    /// Register a request handler for a method.
    void on_request(const std::string& method, RequestHandler handler);

    /// Dispatch an incoming request. Always yields a response; unknown
    /// methods get MethodNotFound and handler exceptions become error objects.
    [[nodiscard]] JsonRpcResponse dispatch(const JsonRpcRequest& req) const;

private:
    std::unordered_map<std::string, RequestHandler> request_handlers_;
};

} // namespace twosum
