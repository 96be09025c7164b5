#include "twosum/codec.hpp"
#include "twosum/error.hpp"
#include "twosum/log.hpp"
#include "twosum/version.hpp"
#include <nlohmann/json.hpp>
#include <simdjson.h>
#include <cctype>
#include <cstddef>
#include <stdexcept>
#include <string>

namespace twosum {

namespace {

// Deepest container nesting accepted in a record, the top-level object
// counting as 1. The on-demand parser does not bound depth itself.
constexpr std::size_t MAX_NESTING_DEPTH = 256;

void check_depth(std::size_t depth) {
    if (depth > MAX_NESTING_DEPTH) {
        throw McpParseError("Nesting deeper than " + std::to_string(MAX_NESTING_DEPTH)
                            + " levels");
    }
}

// Convert simdjson value to nlohmann::json recursively
nlohmann::json simdjson_to_nlohmann(simdjson::ondemand::value val, std::size_t depth) {
    switch (val.type()) {
        case simdjson::ondemand::json_type::object: {
            check_depth(depth);
            nlohmann::json obj = nlohmann::json::object();
            auto object = val.get_object();
            for (auto field : object) {
                std::string_view key = field.unescaped_key();
                obj[std::string(key)] = simdjson_to_nlohmann(field.value(), depth + 1);
            }
            return obj;
        }
        case simdjson::ondemand::json_type::array: {
            check_depth(depth);
            nlohmann::json arr = nlohmann::json::array();
            for (auto elem : val.get_array()) {
                arr.push_back(simdjson_to_nlohmann(elem.value(), depth + 1));
            }
            return arr;
        }
        case simdjson::ondemand::json_type::string: {
            std::string_view sv = val.get_string();
            return nlohmann::json(std::string(sv));
        }
        case simdjson::ondemand::json_type::number: {
            // Integer first so that ids and tool arguments keep exact values
            auto result_int = val.get_int64();
            if (result_int.error() == simdjson::SUCCESS) {
                return nlohmann::json(result_int.value());
            }
            auto result_uint = val.get_uint64();
            if (result_uint.error() == simdjson::SUCCESS) {
                return nlohmann::json(result_uint.value());
            }
            return nlohmann::json(val.get_double().value());
        }
        case simdjson::ondemand::json_type::boolean:
            return nlohmann::json(val.get_bool().value());
        case simdjson::ondemand::json_type::null:
            return nlohmann::json(nullptr);
        default:
            return nlohmann::json(nullptr);
    }
}

nlohmann::json simdjson_doc_to_nlohmann(simdjson::ondemand::document& doc) {
    auto val = doc.get_value();
    if (val.error()) {
        throw McpParseError("Failed to get document value");
    }
    return simdjson_to_nlohmann(val.value(), 1);
}

// A numeric id is echoed from its decoded value, so its spelling must be the
// one that value serializes to ("1e2", "-0" and integers beyond uint64_t
// are not).
void check_numeric_id(simdjson::ondemand::document& doc, const nlohmann::json& id) {
    doc.rewind();
    simdjson::ondemand::value val;
    std::string_view raw;
    if (doc.find_field_unordered("id").get(val) != simdjson::SUCCESS) {
        throw McpParseError("Unreadable 'id' field");
    }
    raw = val.raw_json_token();
    while (!raw.empty() && std::isspace(static_cast<unsigned char>(raw.back()))) {
        raw.remove_suffix(1);
    }
    if (raw != id.dump()) {
        throw McpParseError("Numeric id " + std::string(raw) + " cannot be echoed unchanged");
    }
}

} // anonymous namespace

JsonRpcRequest Codec::parse_object(const nlohmann::json& j) {
    auto version = j.find("jsonrpc");
    if (version == j.end()) {
        throw McpParseError("Missing 'jsonrpc' field");
    }
    if (!version->is_string() || version->get<std::string>() != JSONRPC_VERSION) {
        throw McpParseError("Invalid jsonrpc version, expected '2.0'");
    }

    auto method = j.find("method");
    if (method == j.end() || !method->is_string()) {
        throw McpParseError("Missing or non-string 'method' field");
    }

    JsonRpcRequest req;
    try {
        from_json(j, req);
    } catch (const std::exception& e) {
        throw McpParseError(std::string("Invalid request envelope: ") + e.what());
    }
    return req;
}

JsonRpcRequest Codec::parse(std::string_view raw) {
    if (raw.empty()) {
        throw McpParseError("Empty input");
    }

    simdjson::ondemand::parser parser;
    // simdjson requires padded input
    simdjson::padded_string padded(raw.data(), raw.size());

    simdjson::ondemand::document doc;
    auto error = parser.iterate(padded).get(doc);
    if (error) {
        throw McpParseError(std::string("JSON parse error: ") + simdjson::error_message(error));
    }

    simdjson::ondemand::json_type type;
    if (doc.type().get(type) != simdjson::SUCCESS
        || type != simdjson::ondemand::json_type::object) {
        throw McpParseError("Message must be a JSON object");
    }

    nlohmann::json j;
    try {
        j = simdjson_doc_to_nlohmann(doc);
    } catch (const McpParseError&) {
        throw;
    } catch (const std::exception& e) {
        throw McpParseError(std::string("JSON conversion error: ") + e.what());
    }

    if (!doc.at_end()) {
        throw McpParseError("Trailing content after JSON object");
    }

    auto id = j.find("id");
    if (id != j.end() && id->is_number()) {
        check_numeric_id(doc, *id);
    }

    return parse_object(j);
}

std::string Codec::serialize(const JsonRpcResponse& msg) {
    try {
        nlohmann::json j;
        to_json(j, msg);
        return j.dump();
    } catch (const nlohmann::json::exception& e) {
        logger()->error("Failed to serialize response: {}", e.what());
    }

    JsonRpcResponse fallback = JsonRpcResponse::failure(
        msg.id, JsonRpcError{error::InternalError, "Internal error: failed to serialize result",
                             std::nullopt});
    nlohmann::json j;
    to_json(j, fallback);
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace twosum
