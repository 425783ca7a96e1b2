#include <gtest/gtest.h>
#include "openai_compatible_gateway.hpp"

using namespace chatbridge;

TEST(GatewayBodyTest, ToolsOnlyWhenPresent) {
  CompletionRequest req;
  req.model = "local-model";
  req.messages = {ChatMessage::System("sys"), ChatMessage::User("hi")};
  req.temperature = 0.7;
  req.max_tokens = 2000;

  auto plain = BuildChatCompletionBody(req);
  EXPECT_EQ(plain["model"], "local-model");
  EXPECT_EQ(plain["messages"].size(), 2u);
  EXPECT_EQ(plain["messages"][1]["role"], "user");
  EXPECT_EQ(plain["max_tokens"], 2000);
  EXPECT_FALSE(plain.contains("tools"));
  EXPECT_FALSE(plain.contains("tool_choice"));

  req.tools = {ToolSchema{"echo", "Echoes input", nlohmann::json::object()}};
  auto with_tools = BuildChatCompletionBody(req);
  EXPECT_EQ(with_tools["tool_choice"], "auto");
  EXPECT_EQ(with_tools["tools"][0]["function"]["name"], "echo");
}

TEST(GatewayBodyTest, ParsesPlainMessage) {
  BridgeError err;
  auto c = ParseChatCompletionBody(
      nlohmann::json::parse(R"({"model":"m","choices":[{"message":{"role":"assistant","content":"hello"},"finish_reason":"stop"}]})"),
      &err);
  ASSERT_TRUE(c.has_value()) << err.message;
  EXPECT_EQ(c->message.kind, TurnKind::kAssistant);
  EXPECT_EQ(c->message.content, "hello");
  EXPECT_EQ(c->finish_reason, "stop");
}

TEST(GatewayBodyTest, ParsesToolCalls) {
  BridgeError err;
  auto c = ParseChatCompletionBody(nlohmann::json::parse(R"({"choices":[{"message":{"role":"assistant","content":null,
      "tool_calls":[{"function":{"name":"echo","arguments":"{\"text\":\"hi\"}"}},
                    {"id":"c2","function":{"name":"now","arguments":{"tz":"UTC"}}}]}}]})"),
                                   &err);
  ASSERT_TRUE(c.has_value()) << err.message;
  EXPECT_EQ(c->message.kind, TurnKind::kAssistantToolCalls);
  ASSERT_EQ(c->message.tool_calls.size(), 2u);
  EXPECT_EQ(c->message.tool_calls[0].name, "echo");
  EXPECT_EQ(c->message.tool_calls[0].arguments_json, R"({"text":"hi"})");
  EXPECT_EQ(c->message.tool_calls[1].id, "c2");
  EXPECT_EQ(c->message.tool_calls[1].arguments_json, R"({"tz":"UTC"})");
  EXPECT_EQ(c->message.content, "");
}

TEST(GatewayBodyTest, ErrorObjectIsGatewayError) {
  BridgeError err;
  EXPECT_FALSE(ParseChatCompletionBody(nlohmann::json::parse(R"({"error":{"message":"model not loaded"}})"), &err));
  EXPECT_EQ(err.code, ErrorCode::kGateway);
  EXPECT_EQ(err.message, "API error: model not loaded");

  EXPECT_FALSE(ParseChatCompletionBody(nlohmann::json::parse(R"({"choices":[]})"), &err));
  EXPECT_EQ(err.code, ErrorCode::kGateway);
}

TEST(GatewayBodyTest, UnreachableEndpointIsGatewayError) {
  HttpEndpoint ep;
  ep.host = "127.0.0.1";
  ep.port = 1;
  OpenAiCompatibleGateway gw("test", ep);
  gw.SetTimeouts(1, 1, 1);
  CompletionRequest req;
  req.model = "local-model";
  req.messages = {ChatMessage::User("hi")};
  BridgeError err;
  EXPECT_FALSE(gw.Complete(req, &err).has_value());
  EXPECT_EQ(err.code, ErrorCode::kGateway);
  EXPECT_EQ(err.message.rfind("Connection failed: ", 0), 0u);
}
