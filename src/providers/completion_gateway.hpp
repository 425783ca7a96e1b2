#pragma once

#include "conversation.hpp"
#include "errors.hpp"
#include "tool_bridge.hpp"

#include <optional>
#include <string>
#include <vector>

namespace chatbridge {

struct CompletionRequest {
  std::string model;
  std::vector<ChatMessage> messages;
  std::optional<int> max_tokens;
  std::optional<double> temperature;
  // Empty means tools are disabled for this request.
  std::vector<ToolSchema> tools;
};

struct Completion {
  std::string model;
  // kAssistant, or kAssistantToolCalls when the model requested tool execution.
  ChatMessage message;
  std::string finish_reason;
};

class ICompletionGateway {
 public:
  virtual ~ICompletionGateway() = default;

  virtual std::string Name() const = 0;

  // kGateway when the endpoint is unreachable, answers with a non-success status, or
  // returns an error object or an unusable body.
  virtual std::optional<Completion> Complete(const CompletionRequest& req, BridgeError* err) = 0;
};

}  // namespace chatbridge
