#include "twosum/tools/two_sum.hpp"
#include "twosum/error.hpp"
#include <limits>
#include <string>
#include <unordered_map>

namespace twosum {

namespace {

int64_t to_int64(const nlohmann::json& v, const std::string& what) {
    if (!v.is_number_integer()) {
        throw InvalidArgumentsError("'" + what + "' must be an integer");
    }
    if (v.is_number_unsigned()
        && v.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        throw InvalidArgumentsError("'" + what + "' is out of range");
    }
    return v.get<int64_t>();
}

// target - value, or nullopt when the difference does not fit in int64_t
// (no element can then be the partner).
std::optional<int64_t> complement_of(int64_t target, int64_t value) {
    constexpr int64_t max = std::numeric_limits<int64_t>::max();
    constexpr int64_t min = std::numeric_limits<int64_t>::min();
    if (value < 0 && target > max + value) return std::nullopt;
    if (value > 0 && target < min + value) return std::nullopt;
    return target - value;
}

} // anonymous namespace

void from_json(const nlohmann::json& j, TwoSumArguments& args) {
    if (!j.is_object()) {
        throw InvalidArgumentsError("arguments must be an object");
    }
    for (const auto& item : j.items()) {
        if (item.key() != "nums" && item.key() != "target") {
            throw InvalidArgumentsError("unexpected argument '" + item.key() + "'");
        }
    }

    auto nums = j.find("nums");
    if (nums == j.end()) {
        throw InvalidArgumentsError("missing required argument 'nums'");
    }
    if (!nums->is_array()) {
        throw InvalidArgumentsError("'nums' must be an array of integers");
    }
    args.nums.clear();
    args.nums.reserve(nums->size());
    for (const auto& n : *nums) {
        args.nums.push_back(to_int64(n, "nums[]"));
    }

    auto target = j.find("target");
    if (target == j.end()) {
        throw InvalidArgumentsError("missing required argument 'target'");
    }
    args.target = to_int64(*target, "target");
}

std::optional<std::pair<std::size_t, std::size_t>>
find_two_sum(const std::vector<int64_t>& nums, int64_t target) {
    // value -> earliest index it was seen at
    std::unordered_map<int64_t, std::size_t> seen;
    seen.reserve(nums.size());

    for (std::size_t i = 0; i < nums.size(); ++i) {
        if (auto want = complement_of(target, nums[i])) {
            auto it = seen.find(*want);
            if (it != seen.end()) {
                return std::make_pair(it->second, i);
            }
        }
        seen.emplace(nums[i], i);
    }
    return std::nullopt;
}

ToolDefinition two_sum_definition() {
    ToolDefinition def;
    def.name = TWO_SUM_TOOL_NAME;
    def.title = "Two Sum";
    def.description = "Return the indices of the two elements of an integer array "
                      "whose sum equals the target value";
    def.input_schema = {
        {"type", "object"},
        {"additionalProperties", false},
        {"properties", {
            {"nums", {
                {"type", "array"},
                {"items", {{"type", "integer"}}},
                {"description", "Array of integers"}
            }},
            {"target", {
                {"type", "integer"},
                {"description", "Target sum"}
            }}
        }},
        {"required", {"nums", "target"}}
    };
    def.output_schema = nlohmann::json{
        {"type", "object"},
        {"additionalProperties", false},
        {"properties", {
            {"indices", {
                {"type", "array"},
                {"items", {{"type", "integer"}}},
                {"minItems", 2},
                {"maxItems", 2},
                {"description", "The two indices whose elements sum to the target"}
            }}
        }},
        {"required", {"indices"}}
    };
    return def;
}

CallToolResult run_two_sum(const TwoSumArguments& args) {
    CallToolResult result;
    auto pair = find_two_sum(args.nums, args.target);
    if (!pair) {
        result.is_error = true;
        result.content.push_back(TextContent{"No two elements of nums add up to target"});
        return result;
    }

    auto [i, j] = *pair;
    result.content.push_back(
        TextContent{"indices: [" + std::to_string(i) + "," + std::to_string(j) + "]"});
    result.structured_content = nlohmann::json{{"indices", {i, j}}};
    return result;
}

void register_two_sum(ToolRegistry& registry) {
    registry.add_tool(two_sum_definition(),
                      typed_tool_handler<TwoSumArguments>(&run_two_sum));
}

} // namespace twosum
