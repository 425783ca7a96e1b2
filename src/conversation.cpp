#include "conversation.hpp"

#include <algorithm>
#include <utility>

namespace chatbridge {

const char* RoleFor(TurnKind kind) {
  switch (kind) {
    case TurnKind::kSystem:
      return "system";
    case TurnKind::kUser:
    case TurnKind::kToolResult:
      return "user";
    case TurnKind::kAssistant:
    case TurnKind::kAssistantToolCalls:
      return "assistant";
  }
  return "user";
}

ChatMessage ChatMessage::System(std::string text) {
  return ChatMessage{TurnKind::kSystem, std::move(text), {}};
}

ChatMessage ChatMessage::User(std::string text) {
  return ChatMessage{TurnKind::kUser, std::move(text), {}};
}

ChatMessage ChatMessage::Assistant(std::string text) {
  return ChatMessage{TurnKind::kAssistant, std::move(text), {}};
}

ChatMessage ChatMessage::AssistantToolCalls(std::string text, std::vector<ToolCall> calls) {
  return ChatMessage{TurnKind::kAssistantToolCalls, std::move(text), std::move(calls)};
}

ChatMessage ChatMessage::ToolResult(std::string text) {
  return ChatMessage{TurnKind::kToolResult, std::move(text), {}};
}

nlohmann::json ToOpenAiMessage(const ChatMessage& message) {
  nlohmann::json j;
  j["role"] = RoleFor(message.kind);
  j["content"] = message.content;
  if (message.kind == TurnKind::kAssistantToolCalls && !message.tool_calls.empty()) {
    nlohmann::json calls = nlohmann::json::array();
    for (const auto& c : message.tool_calls) {
      nlohmann::json call;
      if (!c.id.empty()) call["id"] = c.id;
      call["type"] = "function";
      call["function"] = {{"name", c.name}, {"arguments", c.arguments_json}};
      calls.push_back(std::move(call));
    }
    j["tool_calls"] = std::move(calls);
  }
  return j;
}

void Conversation::Append(ChatMessage message) {
  messages_.push_back(std::move(message));
}

nlohmann::json Conversation::ToOpenAiMessages() const {
  nlohmann::json out = nlohmann::json::array();
  for (const auto& m : messages_) out.push_back(ToOpenAiMessage(m));
  return out;
}

void ChatSession::RecordToolUse(const std::string& name) {
  if (std::find(tools_used.begin(), tools_used.end(), name) == tools_used.end()) tools_used.push_back(name);
}

}  // namespace chatbridge
