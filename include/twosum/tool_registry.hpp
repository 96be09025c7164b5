#pragma once
#include "types.hpp"
#include "error.hpp"
#include <functional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace twosum {

/// Runs a tool on its raw arguments. Throws InvalidArgumentsError when the
/// arguments do not match the tool's shape.
using ToolHandler = std::function<CallToolResult(const nlohmann::json& arguments)>;

/// Wrap a handler taking a typed argument struct. The arguments are decoded
/// through Args' from_json before fn runs; any decoding failure surfaces as
/// InvalidArgumentsError and fn is never called.
template <typename Args>
ToolHandler typed_tool_handler(std::function<CallToolResult(const Args&)> fn) {
    return [fn = std::move(fn)](const nlohmann::json& arguments) -> CallToolResult {
        Args args;
        try {
            from_json(arguments, args);
        } catch (const nlohmann::json::exception& e) {
            throw InvalidArgumentsError(e.what());
        } catch (const std::invalid_argument& e) {
            throw InvalidArgumentsError(e.what());
        }
        return fn(args);
    };
}

/// Name-keyed tool catalog. Filled once at start-up, then only read.
class ToolRegistry {
public:
    /// Register a tool. Throws std::invalid_argument on a duplicate name.
    void add_tool(ToolDefinition def, ToolHandler handler);

    /// Definitions in registration order.
    [[nodiscard]] const std::vector<ToolDefinition>& list() const noexcept;

    /// Resolve name, decode arguments, run the tool.
    /// Throws ToolNotFoundError or InvalidArgumentsError.
    [[nodiscard]] CallToolResult call(const std::string& name,
                                      const nlohmann::json& arguments) const;

private:
    std::vector<ToolDefinition> tools_;
    std::unordered_map<std::string, ToolHandler> handlers_;
};

} // namespace twosum
