/// two-sum-mcp: MCP server exposing the two_sum tool.
/// Usage: ./two_sum_server
/// Communicates over stdio (newline-delimited JSON-RPC). Diagnostics go to
/// stderr; set SPDLOG_LEVEL (e.g. SPDLOG_LEVEL=debug) to change verbosity.

#include <twosum/twosum.hpp>
#include <spdlog/cfg/env.h>
#include <csignal>

int main() {
    auto log = twosum::logger();
    spdlog::cfg::load_env_levels();

    // Report a vanished client as a write error instead of dying on SIGPIPE
    std::signal(SIGPIPE, SIG_IGN);

    twosum::ToolRegistry registry;
    twosum::register_two_sum(registry);

    twosum::McpServer server{twosum::McpServer::default_options(), registry};

    try {
        // Serve over stdio; blocks until end of input
        server.serve_stdio();
    } catch (const twosum::McpTransportError& e) {
        log->error("Session aborted: {}", e.what());
        return 1;
    }
    return 0;
}
