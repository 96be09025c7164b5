#pragma once
#include "json_rpc.hpp"
#include "error.hpp"
#include <string>
#include <string_view>

namespace twosum {

class Codec {
public:
    /// Parse one raw record into a request envelope.
    /// Throws McpParseError on invalid JSON or a non-request shape.
    [[nodiscard]] static JsonRpcRequest parse(std::string_view raw);

    /// Serialize a response to a single-line JSON string. Never throws:
    /// an unserializable result is replaced by an InternalError response
    /// carrying the same id.
    [[nodiscard]] static std::string serialize(const JsonRpcResponse& msg);

private:
    static JsonRpcRequest parse_object(const nlohmann::json& j);
};

} // namespace twosum
