#pragma once
#include <string_view>

namespace twosum {

constexpr std::string_view SERVER_NAME         = "two-sum-mcp";
constexpr std::string_view SERVER_VERSION      = "0.1.0";
constexpr std::string_view PROTOCOL_VERSION    = "2025-03-26";
constexpr std::string_view JSONRPC_VERSION     = "2.0";

constexpr std::string_view SERVER_INSTRUCTIONS =
    "This server provides the two_sum tool: given an integer array and a target "
    "value, it returns the indices of the two elements whose sum equals the target.";

} // namespace twosum
