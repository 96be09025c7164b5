#include "twosum/types.hpp"
#include <stdexcept>

namespace twosum {

// ---------- TextContent ----------

void to_json(nlohmann::json& j, const TextContent& t) {
    j = {{"type", "text"}, {"text", t.text}};
}

// ---------- ToolDefinition ----------

void to_json(nlohmann::json& j, const ToolDefinition& t) {
    j = {{"name", t.name}, {"inputSchema", t.input_schema}};
    if (t.title) j["title"] = *t.title;
    if (t.description) j["description"] = *t.description;
    if (t.output_schema) j["outputSchema"] = *t.output_schema;
}

// ---------- CallToolResult ----------

void to_json(nlohmann::json& j, const CallToolResult& t) {
    j = nlohmann::json::object();
    j["content"] = nlohmann::json::array();
    for (const auto& c : t.content) {
        j["content"].push_back(nlohmann::json(c));
    }
    if (t.structured_content) j["structuredContent"] = *t.structured_content;
    if (t.is_error) j["isError"] = t.is_error;
}

// ---------- CallToolParams ----------

void from_json(const nlohmann::json& j, CallToolParams& t) {
    if (!j.is_object()) {
        throw std::invalid_argument("tools/call params must be an object");
    }
    auto name = j.find("name");
    if (name == j.end() || !name->is_string()) {
        throw std::invalid_argument("tools/call requires a string 'name'");
    }
    t.name = name->get<std::string>();

    auto args = j.find("arguments");
    if (args == j.end() || args->is_null()) {
        t.arguments = nlohmann::json::object();
    } else {
        t.arguments = *args;
    }
}

// ---------- ListToolsResult ----------

void to_json(nlohmann::json& j, const ListToolsResult& t) {
    j = {{"tools", t.tools}};
}

// ---------- Capabilities / Implementation ----------

void to_json(nlohmann::json& j, const ServerCapabilities& t) {
    j = nlohmann::json::object();
    if (t.tools) j["tools"] = *t.tools;
}

void to_json(nlohmann::json& j, const Implementation& t) {
    j = {{"name", t.name}, {"version", t.version}};
}

void from_json(const nlohmann::json& j, Implementation& t) {
    t.name = j.at("name").get<std::string>();
    t.version = j.at("version").get<std::string>();
}

// ---------- Initialize ----------

void to_json(nlohmann::json& j, const InitializeResult& t) {
    j = {
        {"protocolVersion", t.protocol_version},
        {"capabilities", t.capabilities},
        {"serverInfo", t.server_info}
    };
    if (t.instructions) j["instructions"] = *t.instructions;
}

InitializeParams parse_initialize_params(const nlohmann::json& params) {
    InitializeParams p;
    if (!params.is_object()) return p;

    auto version = params.find("protocolVersion");
    if (version != params.end() && version->is_string()) {
        p.protocol_version = version->get<std::string>();
    }

    auto info = params.find("clientInfo");
    if (info != params.end() && info->is_object()) {
        try {
            p.client_info = info->get<Implementation>();
        } catch (const nlohmann::json::exception&) {
            // Incomplete clientInfo is tolerated; the handshake goes on without it.
            p.client_info.reset();
        }
    }
    return p;
}

} // namespace twosum
