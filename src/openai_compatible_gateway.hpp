#pragma once

#include "config.hpp"
#include "providers/completion_gateway.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace chatbridge {

class Logger;

// Client for an OpenAI-compatible /v1/chat/completions endpoint (LM Studio,
// llama.cpp server, vLLM, Ollama).
class OpenAiCompatibleGateway : public ICompletionGateway {
 public:
  OpenAiCompatibleGateway(std::string name, HttpEndpoint endpoint, Logger* log = nullptr);

  void SetTimeouts(int connect_seconds, int read_seconds, int write_seconds);

  std::string Name() const override;
  std::optional<Completion> Complete(const CompletionRequest& req, BridgeError* err) override;

  std::vector<std::string> ListModels(BridgeError* err);

  const HttpEndpoint& endpoint() const { return endpoint_; }

 private:
  std::string name_;
  HttpEndpoint endpoint_;
  Logger* log_;
  int connect_timeout_seconds_ = 5;
  int read_timeout_seconds_ = 300;
  int write_timeout_seconds_ = 30;
};

nlohmann::json BuildChatCompletionBody(const CompletionRequest& req);
std::optional<Completion> ParseChatCompletionBody(const nlohmann::json& body, BridgeError* err);

}  // namespace chatbridge
