#pragma once
#include "types.hpp"
#include "json_rpc.hpp"
#include "session.hpp"
#include "tool_registry.hpp"
#include "transport/transport.hpp"
#include <memory>
#include <optional>
#include <string>

namespace twosum {

class McpServer {
public:
    struct Options {
        Implementation server_info;
        std::optional<std::string> instructions;
        std::string protocol_version;
    };

    /// Defaults: two-sum-mcp identity, fixed protocol version, usage instructions.
    [[nodiscard]] static Options default_options();

    /// tools must outlive the server; it is only ever read.
    McpServer(Options opts, const ToolRegistry& tools);
    ~McpServer();

    // Non-copyable, non-movable
    McpServer(const McpServer&) = delete;
    McpServer& operator=(const McpServer&) = delete;

    /// Answer one request: initialize, tools/list, tools/call, or a
    /// MethodNotFound error. Handshake order is not enforced.
    [[nodiscard]] JsonRpcResponse handle(const JsonRpcRequest& req) const;

    // ---- Transport ----
    SessionStats serve(ITransport& transport);
    SessionStats serve_stdio();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace twosum
