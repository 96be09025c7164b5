#include <gtest/gtest.h>
#include "twosum/types.hpp"
#include <nlohmann/json.hpp>

using namespace twosum;

// ---- Content ----

TEST(TextContent, Serialize) {
    nlohmann::json j = TextContent{"hello"};
    EXPECT_EQ(j["type"], "text");
    EXPECT_EQ(j["text"], "hello");
}

// ---- ToolDefinition ----

TEST(ToolDefinition, SerializeFull) {
    ToolDefinition def;
    def.name = "two_sum";
    def.title = "Two Sum";
    def.description = "Find two indices";
    def.input_schema = {{"type", "object"}};
    def.output_schema = nlohmann::json{{"type", "object"}};

    nlohmann::json j = def;
    EXPECT_EQ(j["name"], "two_sum");
    EXPECT_EQ(j["title"], "Two Sum");
    EXPECT_EQ(j["description"], "Find two indices");
    EXPECT_EQ(j["inputSchema"]["type"], "object");
    EXPECT_EQ(j["outputSchema"]["type"], "object");
}

TEST(ToolDefinition, OptionalFieldsOmitted) {
    ToolDefinition def;
    def.name = "bare";
    def.input_schema = {{"type", "object"}};

    nlohmann::json j = def;
    EXPECT_FALSE(j.contains("title"));
    EXPECT_FALSE(j.contains("description"));
    EXPECT_FALSE(j.contains("outputSchema"));
}

// ---- CallToolResult ----

TEST(CallToolResult, SuccessOmitsIsError) {
    CallToolResult r;
    r.content.push_back(TextContent{"indices: [0,1]"});
    r.structured_content = nlohmann::json{{"indices", {0, 1}}};

    nlohmann::json j = r;
    ASSERT_EQ(j["content"].size(), 1u);
    EXPECT_EQ(j["content"][0]["type"], "text");
    EXPECT_EQ(j["structuredContent"]["indices"], nlohmann::json::array({0, 1}));
    EXPECT_FALSE(j.contains("isError"));
}

TEST(CallToolResult, ErrorFlagSerialized) {
    CallToolResult r;
    r.is_error = true;
    r.content.push_back(TextContent{"no answer"});

    nlohmann::json j = r;
    EXPECT_EQ(j["isError"], true);
    EXPECT_FALSE(j.contains("structuredContent"));
}

TEST(CallToolResult, EmptyContentIsStillAnArray) {
    nlohmann::json j = CallToolResult{};
    EXPECT_TRUE(j["content"].is_array());
}

// ---- CallToolParams ----

TEST(CallToolParams, NameAndArguments) {
    auto p = nlohmann::json{{"name", "two_sum"}, {"arguments", {{"target", 3}}}}.get<CallToolParams>();
    EXPECT_EQ(p.name, "two_sum");
    EXPECT_EQ(p.arguments["target"], 3);
}

TEST(CallToolParams, MissingArgumentsDefaultsToEmptyObject) {
    auto p = nlohmann::json{{"name", "two_sum"}}.get<CallToolParams>();
    EXPECT_TRUE(p.arguments.is_object());
    EXPECT_TRUE(p.arguments.empty());
}

TEST(CallToolParams, MissingName) {
    EXPECT_THROW(nlohmann::json::object().get<CallToolParams>(), std::invalid_argument);
}

TEST(CallToolParams, NonStringName) {
    EXPECT_THROW((nlohmann::json{{"name", 5}}.get<CallToolParams>()), std::invalid_argument);
}

TEST(CallToolParams, NotAnObject) {
    EXPECT_THROW(nlohmann::json().get<CallToolParams>(), std::invalid_argument);
    EXPECT_THROW(nlohmann::json::array().get<CallToolParams>(), std::invalid_argument);
}

// ---- ListToolsResult ----

TEST(ListToolsResult, NeverCarriesCursor) {
    ListToolsResult r;
    ToolDefinition def;
    def.name = "two_sum";
    def.input_schema = {{"type", "object"}};
    r.tools.push_back(def);

    nlohmann::json j = r;
    ASSERT_EQ(j["tools"].size(), 1u);
    EXPECT_EQ(j["tools"][0]["name"], "two_sum");
    EXPECT_FALSE(j.contains("nextCursor"));
}

// ---- Initialize ----

TEST(InitializeResult, Serialize) {
    InitializeResult r;
    r.protocol_version = "2025-03-26";
    r.capabilities.tools = nlohmann::json{{"listChanged", true}};
    r.server_info = {"two-sum-mcp", "0.1.0"};
    r.instructions = "hi";

    nlohmann::json j = r;
    EXPECT_EQ(j["protocolVersion"], "2025-03-26");
    EXPECT_EQ(j["capabilities"]["tools"]["listChanged"], true);
    EXPECT_EQ(j["serverInfo"]["name"], "two-sum-mcp");
    EXPECT_EQ(j["serverInfo"]["version"], "0.1.0");
    EXPECT_EQ(j["instructions"], "hi");
}

TEST(InitializeResult, NoInstructionsOmitted) {
    InitializeResult r;
    r.protocol_version = "2025-03-26";
    r.server_info = {"two-sum-mcp", "0.1.0"};

    nlohmann::json j = r;
    EXPECT_FALSE(j.contains("instructions"));
    EXPECT_TRUE(j["capabilities"].is_object());
}

TEST(InitializeParams, FullyPopulated) {
    auto p = parse_initialize_params(nlohmann::json::parse(R"({
        "protocolVersion": "2025-06-18",
        "capabilities": {"roots": {"listChanged": true}, "sampling": {}},
        "clientInfo": {"name": "inspector", "version": "1.2.3"}
    })"));
    EXPECT_EQ(p.protocol_version, "2025-06-18");
    ASSERT_TRUE(p.client_info.has_value());
    EXPECT_EQ(p.client_info->name, "inspector");
    EXPECT_EQ(p.client_info->version, "1.2.3");
}

TEST(InitializeParams, NullParams) {
    auto p = parse_initialize_params(nlohmann::json());
    EXPECT_FALSE(p.protocol_version.has_value());
    EXPECT_FALSE(p.client_info.has_value());
}

TEST(InitializeParams, GarbledFieldsAreDropped) {
    auto p = parse_initialize_params(nlohmann::json::parse(R"({
        "protocolVersion": 2025,
        "capabilities": "all of them",
        "clientInfo": {"name": "no-version"}
    })"));
    EXPECT_FALSE(p.protocol_version.has_value());
    EXPECT_FALSE(p.client_info.has_value());
}

TEST(InitializeParams, NonObjectParams) {
    auto p = parse_initialize_params(nlohmann::json::array({1, 2, 3}));
    EXPECT_FALSE(p.protocol_version.has_value());
}
