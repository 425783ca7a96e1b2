#pragma once

#include "conversation.hpp"
#include "errors.hpp"
#include "mcp_client.hpp"
#include "providers/completion_gateway.hpp"
#include "tool_bridge.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace chatbridge {

struct OrchestratorOptions {
  std::string model = "local-model";
  double temperature = 0.7;
  int max_tokens = 2000;
};

struct TurnResult {
  bool ok = true;
  // Terminal assistant text, or "Error: ..." / "Error in final response: ..." when the
  // completion endpoint failed.
  std::string text;
  // Distinct tool names called during this turn, in call order.
  std::vector<std::string> tools_used;
  BridgeError error;
};

// Outcome of one requested tool call as it is reported back to the model.
struct ToolOutcome {
  std::string name;
  bool ok = false;
  nlohmann::json result;
  BridgeError error;
};

// Parses the argument text the model produced. Empty or blank text means no
// arguments; anything else must be a JSON object.
std::optional<nlohmann::json> ParseToolArguments(const std::string& arguments_json, BridgeError* err);

// "Tool <name> result: <json>" lines under a "Tool results:" header.
std::string FormatToolResults(const std::vector<ToolOutcome>& outcomes);

// Drives one user turn: at most one tool round trip followed by one follow-up
// completion. Never recurses into a second round of tool calls.
class ChatOrchestrator {
 public:
  ChatOrchestrator(ChatSession* session,
                   McpClient* client,
                   ICompletionGateway* gateway,
                   OrchestratorOptions options = {});

  // Discovers tools and seeds the conversation with the system prompt. A failed
  // tools/list is logged and leaves the session without tools.
  bool Start(BridgeError* err);

  TurnResult ProcessTurn(const std::string& user_text);

  const std::vector<ToolSchema>& tool_schemas() const { return tool_schemas_; }
  const OrchestratorOptions& options() const { return options_; }

 private:
  ChatSession* session_;
  McpClient* client_;
  ICompletionGateway* gateway_;
  OrchestratorOptions options_;
  std::vector<ToolSchema> tool_schemas_;

  CompletionRequest MakeRequest(bool with_tools) const;
  ToolOutcome ExecuteToolCall(const ToolCall& call);
};

}  // namespace chatbridge
