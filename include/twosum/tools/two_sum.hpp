#pragma once
#include "../tool_registry.hpp"
#include "../types.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

namespace twosum {

constexpr const char* TWO_SUM_TOOL_NAME = "two_sum";

struct TwoSumArguments {
    std::vector<int64_t> nums;
    int64_t target = 0;
};

/// Strict decode matching the published input schema: both fields required,
/// integers only, no extra properties. Throws InvalidArgumentsError.
void from_json(const nlohmann::json& j, TwoSumArguments& args);

/// Single left-to-right pass over nums. Returns the pair (i, j), i < j, with
/// nums[i] + nums[j] == target whose j is smallest, and among those the
/// smallest i. std::nullopt when no such pair exists.
[[nodiscard]] std::optional<std::pair<std::size_t, std::size_t>>
find_two_sum(const std::vector<int64_t>& nums, int64_t target);

[[nodiscard]] ToolDefinition two_sum_definition();

/// A missing pair is reported through CallToolResult::is_error with an
/// explanatory text block and no structured content.
[[nodiscard]] CallToolResult run_two_sum(const TwoSumArguments& args);

void register_two_sum(ToolRegistry& registry);

} // namespace twosum
