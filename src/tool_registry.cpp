#include "twosum/tool_registry.hpp"
#include "twosum/log.hpp"

namespace twosum {

void ToolRegistry::add_tool(ToolDefinition def, ToolHandler handler) {
    if (handlers_.count(def.name) > 0) {
        throw std::invalid_argument("Duplicate tool name: " + def.name);
    }
    handlers_[def.name] = std::move(handler);
    tools_.push_back(std::move(def));
}

const std::vector<ToolDefinition>& ToolRegistry::list() const noexcept {
    return tools_;
}

CallToolResult ToolRegistry::call(const std::string& name,
                                  const nlohmann::json& arguments) const {
    auto it = handlers_.find(name);
    if (it == handlers_.end()) {
        throw ToolNotFoundError("Unknown tool: " + name);
    }
    logger()->debug("Calling tool '{}'", name);
    return it->second(arguments);
}

} // namespace twosum
