#include <gtest/gtest.h>
#include "chat_runner.hpp"
#include "test_helpers.hpp"

#include <memory>
#include <sstream>
#include <stdexcept>

using namespace chatbridge;
using chatbridge::testing_util::EchoServer;
using chatbridge::testing_util::FakeGateway;
using chatbridge::testing_util::FakeTransport;

namespace {

// Gateway that throws, to exercise the per-turn exception boundary.
class ThrowingGateway : public ICompletionGateway {
 public:
  std::string Name() const override { return "throwing"; }
  std::optional<Completion> Complete(const CompletionRequest&, BridgeError*) override {
    throw std::runtime_error("gateway exploded");
  }
};

// Splits a stream of pretty-printed JSON documents.
std::vector<nlohmann::json> ParseDocuments(const std::string& text) {
  std::vector<nlohmann::json> out;
  std::string current;
  std::istringstream in(text);
  std::string line;
  while (std::getline(in, line)) {
    current += line + "\n";
    if (line == "}") {
      out.push_back(nlohmann::json::parse(current));
      current.clear();
    }
  }
  return out;
}

}  // namespace

class ChatRunnerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    ClearInterrupt();
    auto t = std::make_unique<FakeTransport>();
    transport = t.get();
    transport->on_write = EchoServer();
    client = std::make_unique<McpClient>(std::move(t), nullptr);
    BridgeError err;
    ASSERT_TRUE(client->Initialize(&err)) << err.message;
  }

  void TearDown() override { ClearInterrupt(); }

  std::unique_ptr<ChatOrchestrator> MakeOrchestrator(ICompletionGateway* gw) {
    auto o = std::make_unique<ChatOrchestrator>(&session, client.get(), gw);
    BridgeError err;
    EXPECT_TRUE(o->Start(&err)) << err.message;
    return o;
  }

  ChatSession session{nullptr};
  FakeTransport* transport = nullptr;
  std::unique_ptr<McpClient> client;
  FakeGateway gateway;
};

TEST_F(ChatRunnerTest, StdioEmitsOneEnvelopePerLine) {
  auto orchestrator = MakeOrchestrator(&gateway);
  gateway.PushText("plain answer");
  gateway.PushToolCalls({ToolCall{"call_1", "echo", R"({"text":"hi"})"}});
  gateway.PushText("tool answer");

  std::istringstream in("hello\n\n   \nplease echo hi\n");
  std::ostringstream out;
  EXPECT_EQ(RunStdio(*orchestrator, session, in, out, nullptr), 0);

  auto docs = ParseDocuments(out.str());
  ASSERT_EQ(docs.size(), 2u);
  EXPECT_EQ(docs[0]["response"], "plain answer");
  EXPECT_TRUE(docs[0]["timestamp"].is_string());
  EXPECT_EQ(docs[0]["metadata"]["tools_available"], nlohmann::json::array({"echo"}));
  EXPECT_TRUE(docs[0]["metadata"]["tools_used"].empty());
  EXPECT_EQ(docs[1]["response"], "tool answer");
  EXPECT_EQ(docs[1]["metadata"]["tools_used"], nlohmann::json::array({"echo"}));
  EXPECT_EQ(gateway.requests.size(), 3u);
}

TEST_F(ChatRunnerTest, StdioEndOfInputLeavesClientForCaller) {
  auto orchestrator = MakeOrchestrator(&gateway);
  std::istringstream in("");
  std::ostringstream out;
  EXPECT_EQ(RunStdio(*orchestrator, session, in, out, nullptr), 0);
  EXPECT_TRUE(out.str().empty());
  EXPECT_EQ(transport->stop_calls, 0);
  client->Close();
  EXPECT_EQ(transport->stop_calls, 1);
}

TEST_F(ChatRunnerTest, StdioGatewayErrorIsAResponse) {
  auto orchestrator = MakeOrchestrator(&gateway);
  gateway.PushError("Connection failed: refused");
  std::istringstream in("hi\n");
  std::ostringstream out;
  RunStdio(*orchestrator, session, in, out, nullptr);
  auto docs = ParseDocuments(out.str());
  ASSERT_EQ(docs.size(), 1u);
  EXPECT_EQ(docs[0]["response"], "Error: Connection failed: refused");
}

TEST_F(ChatRunnerTest, StdioExceptionBecomesErrorEnvelopeAndLoopContinues) {
  ThrowingGateway throwing;
  auto orchestrator = MakeOrchestrator(&throwing);
  std::istringstream in("one\ntwo\n");
  std::ostringstream out;
  EXPECT_EQ(RunStdio(*orchestrator, session, in, out, nullptr), 0);
  auto docs = ParseDocuments(out.str());
  ASSERT_EQ(docs.size(), 2u);
  EXPECT_EQ(docs[0]["error"], "gateway exploded");
  EXPECT_EQ(docs[0]["metadata"]["error_type"], "runtime_error");
  EXPECT_EQ(docs[0]["metadata"]["tools_available"], nlohmann::json::array({"echo"}));
  EXPECT_FALSE(docs[0].contains("response"));
}

TEST_F(ChatRunnerTest, InteractiveQuitEndsSession) {
  auto orchestrator = MakeOrchestrator(&gateway);
  gateway.PushText("Hi!");
  std::istringstream in("hello\n\nBye\nnever processed\n");
  std::ostringstream out;
  EXPECT_EQ(RunInteractive(*orchestrator, session, in, out, nullptr), 0);
  const auto text = out.str();
  EXPECT_NE(text.find("Available tools: echo"), std::string::npos);
  EXPECT_NE(text.find("You: "), std::string::npos);
  EXPECT_NE(text.find("Assistant: Hi!"), std::string::npos);
  EXPECT_NE(text.find("Goodbye!"), std::string::npos);
  EXPECT_EQ(gateway.requests.size(), 1u);
}

TEST_F(ChatRunnerTest, InteractiveEndOfInputExitsCleanly) {
  auto orchestrator = MakeOrchestrator(&gateway);
  std::istringstream in("");
  std::ostringstream out;
  EXPECT_EQ(RunInteractive(*orchestrator, session, in, out, nullptr), 0);
  EXPECT_TRUE(gateway.requests.empty());
}

TEST_F(ChatRunnerTest, InterruptStopsBeforeNextTurn) {
  auto orchestrator = MakeOrchestrator(&gateway);
  RequestInterrupt();
  std::istringstream in("hello\n");
  std::ostringstream out;
  EXPECT_EQ(RunStdio(*orchestrator, session, in, out, nullptr), 0);
  EXPECT_TRUE(gateway.requests.empty());
  EXPECT_TRUE(out.str().empty());
}

TEST(ChatRunnerHelpersTest, QuitWords) {
  EXPECT_TRUE(IsQuitCommand("quit"));
  EXPECT_TRUE(IsQuitCommand("EXIT"));
  EXPECT_TRUE(IsQuitCommand("  bye "));
  EXPECT_FALSE(IsQuitCommand("goodbye"));
  EXPECT_FALSE(IsQuitCommand(""));
}

TEST(ChatRunnerHelpersTest, EnvelopeShape) {
  auto ok = BuildStdioResponse("hi", {"echo"}, {"echo", "now"}, "2024-01-01T00:00:00.000000");
  EXPECT_EQ(ok["response"], "hi");
  EXPECT_EQ(ok["timestamp"], "2024-01-01T00:00:00.000000");
  EXPECT_EQ(ok["metadata"]["tools_used"], nlohmann::json::array({"echo"}));
  EXPECT_EQ(ok["metadata"]["tools_available"].size(), 2u);

  auto failed = BuildStdioError("boom", "runtime_error", {}, "t");
  EXPECT_EQ(failed["error"], "boom");
  EXPECT_EQ(failed["metadata"]["error_type"], "runtime_error");
  EXPECT_TRUE(failed["metadata"]["tools_available"].is_array());
}

TEST(ChatRunnerHelpersTest, TimestampLooksIso) {
  auto ts = IsoTimestampNow();
  ASSERT_EQ(ts.size(), 26u);
  EXPECT_EQ(ts[4], '-');
  EXPECT_EQ(ts[10], 'T');
  EXPECT_EQ(ts[19], '.');
}
