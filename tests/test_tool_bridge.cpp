#include <gtest/gtest.h>
#include "conversation.hpp"
#include "tool_bridge.hpp"
#include "test_helpers.hpp"

using namespace chatbridge;

namespace {

McpToolInfo MakeTool(const std::string& name, const std::string& description, nlohmann::json schema) {
  McpToolInfo t;
  t.name = name;
  t.description = description;
  t.input_schema = std::move(schema);
  return t;
}

}  // namespace

TEST(ToolBridgeTest, EchoDescriptorBecomesFunctionSchema) {
  auto d = testing_util::EchoToolDescriptor();
  auto tools = BuildToolSchemas({MakeTool("echo", "Echoes input", d["inputSchema"])});
  ASSERT_EQ(tools.size(), 1u);
  EXPECT_EQ(tools[0].name, "echo");
  EXPECT_EQ(tools[0].description, "Echoes input");
  EXPECT_EQ(tools[0].parameters, d["inputSchema"]);

  auto j = ToOpenAiTools(tools);
  ASSERT_EQ(j.size(), 1u);
  EXPECT_EQ(j[0]["type"], "function");
  EXPECT_EQ(j[0]["function"]["name"], "echo");
  EXPECT_EQ(j[0]["function"]["parameters"]["properties"]["text"]["type"], "string");
}

TEST(ToolBridgeTest, MissingSchemaBecomesEmptyObject) {
  auto tools = BuildToolSchemas({MakeTool("now", "", nullptr)});
  ASSERT_EQ(tools.size(), 1u);
  EXPECT_TRUE(tools[0].parameters.is_object());
  EXPECT_TRUE(tools[0].parameters.empty());
  EXPECT_EQ(tools[0].description, "");

  auto j = ToOpenAiTools(tools);
  ASSERT_TRUE(j[0]["function"].contains("parameters"));
  EXPECT_TRUE(j[0]["function"]["parameters"].is_object());
}

TEST(ToolBridgeTest, TitleIsDescriptionFallback) {
  McpToolInfo t = MakeTool("fs.read", "", nlohmann::json::object());
  t.title = "Read a file";
  EXPECT_EQ(ToToolSchema(t).description, "Read a file");
}

TEST(ToolBridgeTest, PreservesOrder) {
  auto tools = BuildToolSchemas({MakeTool("c", "", nullptr), MakeTool("a", "", nullptr), MakeTool("b", "", nullptr)});
  EXPECT_EQ(ExtractToolNames(tools), (std::vector<std::string>{"c", "a", "b"}));
}

TEST(ToolBridgeTest, SystemPromptListsTools) {
  auto prompt = BuildToolSystemPrompt(
      {MakeTool("echo", "Echoes input", testing_util::EchoToolDescriptor()["inputSchema"]), MakeTool("now", "", nullptr)});
  EXPECT_NE(prompt.find("- echo: Echoes input (Parameters: text)"), std::string::npos);
  EXPECT_NE(prompt.find("- now: No description available"), std::string::npos);
  EXPECT_EQ(prompt.find("No tools available"), std::string::npos);
}

TEST(ToolBridgeTest, SystemPromptWithoutTools) {
  EXPECT_NE(BuildToolSystemPrompt({}).find("No tools available"), std::string::npos);
}

TEST(ConversationTest, ReplayPreservesTurnOrder) {
  Conversation c;
  c.Append(ChatMessage::User("say hi"));
  c.Append(ChatMessage::AssistantToolCalls("", {ToolCall{"call_1", "echo", R"({"text":"hi"})"}}));
  c.Append(ChatMessage::ToolResult("Tool results:\nTool echo result: {}"));

  auto j = c.ToOpenAiMessages();
  ASSERT_EQ(j.size(), 3u);
  EXPECT_EQ(j[0]["role"], "user");
  EXPECT_EQ(j[0]["content"], "say hi");
  EXPECT_EQ(j[1]["role"], "assistant");
  EXPECT_EQ(j[1]["tool_calls"][0]["id"], "call_1");
  EXPECT_EQ(j[1]["tool_calls"][0]["type"], "function");
  EXPECT_EQ(j[1]["tool_calls"][0]["function"]["name"], "echo");
  EXPECT_EQ(j[1]["tool_calls"][0]["function"]["arguments"], R"({"text":"hi"})");
  EXPECT_EQ(j[2]["role"], "user");
  EXPECT_EQ(j[2]["content"], "Tool results:\nTool echo result: {}");
}

TEST(ConversationTest, SessionRecordsDistinctToolUse) {
  ChatSession s(nullptr);
  s.RecordToolUse("echo");
  s.RecordToolUse("now");
  s.RecordToolUse("echo");
  EXPECT_EQ(s.tools_used, (std::vector<std::string>{"echo", "now"}));
}
