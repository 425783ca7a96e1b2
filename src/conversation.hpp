#pragma once

#include "mcp_client.hpp"
#include "tool_bridge.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace chatbridge {

class Logger;

enum class TurnKind { kSystem, kUser, kAssistant, kAssistantToolCalls, kToolResult };

// Role used when the turn is replayed to the completion endpoint. Tool results are
// replayed as user text.
const char* RoleFor(TurnKind kind);

struct ChatMessage {
  TurnKind kind = TurnKind::kUser;
  std::string content;
  std::vector<ToolCall> tool_calls;

  static ChatMessage System(std::string text);
  static ChatMessage User(std::string text);
  static ChatMessage Assistant(std::string text);
  static ChatMessage AssistantToolCalls(std::string text, std::vector<ToolCall> calls);
  static ChatMessage ToolResult(std::string text);
};

nlohmann::json ToOpenAiMessage(const ChatMessage& message);

// Ordered, append-only. Replayed verbatim on every completion request.
class Conversation {
 public:
  void Append(ChatMessage message);
  const std::vector<ChatMessage>& Messages() const { return messages_; }
  size_t size() const { return messages_.size(); }
  bool empty() const { return messages_.empty(); }
  const ChatMessage& back() const { return messages_.back(); }

  nlohmann::json ToOpenAiMessages() const;

 private:
  std::vector<ChatMessage> messages_;
};

// Everything one chat session carries between turns.
struct ChatSession {
  explicit ChatSession(Logger* log) : log(log) {}

  Conversation conversation;
  std::vector<McpToolInfo> available_tools;
  // Distinct tool names in order of first use across the whole session.
  std::vector<std::string> tools_used;
  Logger* log;

  void RecordToolUse(const std::string& name);
};

}  // namespace chatbridge
