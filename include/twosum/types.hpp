#pragma once
#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>

namespace twosum {

// ---------- Content ----------

struct TextContent {
    std::string text;
};

// ---------- Tool ----------

struct ToolDefinition {
    std::string name;
    std::optional<std::string> title;
    std::optional<std::string> description;
    nlohmann::json input_schema;
    std::optional<nlohmann::json> output_schema;
};

/// is_error marks a tool that ran but produced no answer. It is not a
/// protocol error and still travels inside a successful response.
struct CallToolResult {
    std::vector<TextContent> content;
    std::optional<nlohmann::json> structured_content;
    bool is_error = false;
};

struct CallToolParams {
    std::string name;
    nlohmann::json arguments = nlohmann::json::object();
};

/// Always the complete catalog; no pagination cursor.
struct ListToolsResult {
    std::vector<ToolDefinition> tools;
};

// ---------- Lifecycle ----------

struct ServerCapabilities {
    std::optional<nlohmann::json> tools;
};

struct Implementation {
    std::string name;
    std::string version;
};

/// What the server reads from initialize params; client capabilities are
/// ignored. See parse_initialize_params for the lenient decoding rules.
struct InitializeParams {
    std::optional<std::string> protocol_version;
    std::optional<Implementation> client_info;
};

struct InitializeResult {
    std::string protocol_version;
    ServerCapabilities capabilities;
    Implementation server_info;
    std::optional<std::string> instructions;
};

/// Decode initialize params without ever failing. Fields of the wrong type
/// are dropped and the rest is kept.
InitializeParams parse_initialize_params(const nlohmann::json& params);

// ---------- JSON serialization ----------

void to_json(nlohmann::json& j, const TextContent& t);
void to_json(nlohmann::json& j, const ToolDefinition& t);
void to_json(nlohmann::json& j, const CallToolResult& t);

/// Throws std::invalid_argument when params is not an object with a string name.
void from_json(const nlohmann::json& j, CallToolParams& t);

void to_json(nlohmann::json& j, const ListToolsResult& t);
void to_json(nlohmann::json& j, const ServerCapabilities& t);

void to_json(nlohmann::json& j, const Implementation& t);
void from_json(const nlohmann::json& j, Implementation& t);

void to_json(nlohmann::json& j, const InitializeResult& t);

} // namespace twosum
