#pragma once
#include <cstdint>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>

namespace twosum {

/// Correlation id. Opaque to the server; echoed back as it arrived.
using RequestId = std::variant<int64_t, uint64_t, double, std::string>;

inline void to_json(nlohmann::json& j, const RequestId& id) {
    std::visit([&j](const auto& v) { j = v; }, id);
}

inline void from_json(const nlohmann::json& j, RequestId& id) {
    if (j.is_number_unsigned()) {
        auto u = j.get<uint64_t>();
        if (u > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            id = u;
        } else {
            id = static_cast<int64_t>(u);
        }
    } else if (j.is_number_integer()) {
        id = j.get<int64_t>();
    } else if (j.is_number_float()) {
        id = j.get<double>();
    } else if (j.is_string()) {
        id = j.get<std::string>();
    } else {
        throw std::invalid_argument("RequestId must be a number or string");
    }
}

struct JsonRpcError {
    int code;
    std::string message;
    std::optional<nlohmann::json> data;
};

inline void to_json(nlohmann::json& j, const JsonRpcError& e) {
    j = nlohmann::json{{"code", e.code}, {"message", e.message}};
    if (e.data) j["data"] = *e.data;
}

struct JsonRpcRequest {
    std::optional<RequestId> id;
    std::string method;
    // Left untyped here; each method handler decodes its own shape.
    std::optional<nlohmann::json> params;
};

/// Exactly one of result / error is set. id is absent when the request had none.
struct JsonRpcResponse {
    std::optional<RequestId> id;
    std::optional<nlohmann::json> result;
    std::optional<JsonRpcError> error;

    static JsonRpcResponse success(std::optional<RequestId> id, nlohmann::json result);
    static JsonRpcResponse failure(std::optional<RequestId> id, JsonRpcError error);
};

/// Envelope fields only; jsonrpc/method validation is the codec's job.
void from_json(const nlohmann::json& j, JsonRpcRequest& r);

void to_json(nlohmann::json& j, const JsonRpcResponse& r);

} // namespace twosum
