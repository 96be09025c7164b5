#include "twosum/server.hpp"
#include "twosum/error.hpp"
#include "twosum/log.hpp"
#include "twosum/router.hpp"
#include "twosum/session.hpp"
#include "twosum/version.hpp"
#include "twosum/transport/stdio_transport.hpp"

#include <stdexcept>
#include <string>

namespace twosum {

// ----------- McpServer::Impl -----------

struct McpServer::Impl {
    Options opts;
    const ToolRegistry& tools;
    Router router;

    Impl(Options o, const ToolRegistry& t) : opts(std::move(o)), tools(t) {}

    void setup_handlers() {
        // initialize
        router.on_request("initialize", [this](const nlohmann::json& params) -> HandlerResult {
            InitializeParams client = parse_initialize_params(params);
            if (client.client_info) {
                logger()->info("initialize from {} {} (protocol {})",
                               client.client_info->name, client.client_info->version,
                               client.protocol_version.value_or("unspecified"));
            } else {
                logger()->info("initialize from unidentified client (protocol {})",
                               client.protocol_version.value_or("unspecified"));
            }

            InitializeResult result;
            result.protocol_version = opts.protocol_version;
            result.capabilities.tools = nlohmann::json{{"listChanged", true}};
            result.server_info = opts.server_info;
            result.instructions = opts.instructions;

            nlohmann::json j;
            to_json(j, result);
            return j;
        });

        // tools/list
        router.on_request("tools/list", [this](const nlohmann::json&) -> HandlerResult {
            ListToolsResult result;
            result.tools = tools.list();
            nlohmann::json j;
            to_json(j, result);
            return j;
        });

        // tools/call
        router.on_request("tools/call", [this](const nlohmann::json& params) -> HandlerResult {
            CallToolParams call;
            try {
                from_json(params, call);
            } catch (const std::exception& e) {
                return JsonRpcError{error::InvalidParams,
                                    std::string("Invalid params: ") + e.what(), std::nullopt};
            }

            CallToolResult tool_result;
            try {
                tool_result = tools.call(call.name, call.arguments);
            } catch (const ToolNotFoundError& e) {
                return JsonRpcError{error::MethodNotFound, e.what(), std::nullopt};
            } catch (const InvalidArgumentsError& e) {
                return JsonRpcError{error::InvalidParams,
                                    "Invalid arguments for " + call.name + ": " + e.what(),
                                    std::nullopt};
            } catch (const std::exception& e) {
                // A tool that fails at run time reports it in-band.
                logger()->warn("Tool '{}' failed: {}", call.name, e.what());
                tool_result = CallToolResult{};
                tool_result.is_error = true;
                tool_result.content.push_back(TextContent{e.what()});
            }

            nlohmann::json j;
            to_json(j, tool_result);
            return j;
        });
    }
};

// ----------- McpServer -----------

McpServer::Options McpServer::default_options() {
    Options opts;
    opts.server_info = {std::string(SERVER_NAME), std::string(SERVER_VERSION)};
    opts.protocol_version = std::string(PROTOCOL_VERSION);
    opts.instructions = std::string(SERVER_INSTRUCTIONS);
    return opts;
}

McpServer::McpServer(Options opts, const ToolRegistry& tools)
    : impl_(std::make_unique<Impl>(std::move(opts), tools)) {
    impl_->setup_handlers();
}

McpServer::~McpServer() = default;

JsonRpcResponse McpServer::handle(const JsonRpcRequest& req) const {
    return impl_->router.dispatch(req);
}

SessionStats McpServer::serve(ITransport& transport) {
    Session session(impl_->router, transport);
    return session.run();
}

SessionStats McpServer::serve_stdio() {
    StdioTransport transport;
    return serve(transport);
}

} // namespace twosum
