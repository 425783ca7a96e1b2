#include "openai_compatible_gateway.hpp"

#include "logger.hpp"

#include <httplib.h>

#include <memory>
#include <string>
#include <utility>

namespace chatbridge {
namespace {

static std::unique_ptr<httplib::Client> MakeClient(const HttpEndpoint& ep,
                                                   int connect_timeout_seconds,
                                                   int read_timeout_seconds,
                                                   int write_timeout_seconds) {
  auto cli = std::make_unique<httplib::Client>(ep.host, ep.port);
  cli->set_connection_timeout(connect_timeout_seconds);
  cli->set_read_timeout(read_timeout_seconds);
  cli->set_write_timeout(write_timeout_seconds);
  return cli;
}

static std::string JoinPath(const std::string& base, const std::string& path) {
  if (base.empty()) return path;
  if (base.back() == '/' && !path.empty() && path.front() == '/') return base + path.substr(1);
  if (base.back() != '/' && !path.empty() && path.front() != '/') return base + "/" + path;
  return base + path;
}

static std::string ExtractErrorMessage(const nlohmann::json& e) {
  if (e.is_string()) return e.get<std::string>();
  if (e.is_object() && e.contains("message") && e["message"].is_string()) return e["message"].get<std::string>();
  return e.dump();
}

static std::string ArgumentsToText(const nlohmann::json& args) {
  if (args.is_string()) return args.get<std::string>();
  if (args.is_null()) return {};
  return args.dump();
}

}  // namespace

nlohmann::json BuildChatCompletionBody(const CompletionRequest& req) {
  nlohmann::json j;
  j["model"] = req.model;
  j["messages"] = nlohmann::json::array();
  for (const auto& m : req.messages) j["messages"].push_back(ToOpenAiMessage(m));
  if (req.temperature.has_value()) j["temperature"] = req.temperature.value();
  if (req.max_tokens.has_value() && req.max_tokens.value() > 0) j["max_tokens"] = req.max_tokens.value();
  if (!req.tools.empty()) {
    j["tools"] = ToOpenAiTools(req.tools);
    j["tool_choice"] = "auto";
  }
  return j;
}

std::optional<Completion> ParseChatCompletionBody(const nlohmann::json& body, BridgeError* err) {
  if (!body.is_object()) {
    SetError(err, ErrorCode::kGateway, "response is not a json object");
    return std::nullopt;
  }
  if (body.contains("error") && !body["error"].is_null()) {
    SetError(err, ErrorCode::kGateway, "API error: " + ExtractErrorMessage(body["error"]));
    return std::nullopt;
  }
  if (!body.contains("choices") || !body["choices"].is_array() || body["choices"].empty() ||
      !body["choices"][0].is_object() || !body["choices"][0].contains("message") ||
      !body["choices"][0]["message"].is_object()) {
    SetError(err, ErrorCode::kGateway, "response has no choices[0].message");
    return std::nullopt;
  }

  const auto& choice = body["choices"][0];
  const auto& msg = choice["message"];
  Completion out;
  if (body.contains("model") && body["model"].is_string()) out.model = body["model"].get<std::string>();
  if (choice.contains("finish_reason") && choice["finish_reason"].is_string()) {
    out.finish_reason = choice["finish_reason"].get<std::string>();
  }

  std::string content;
  if (msg.contains("content") && msg["content"].is_string()) content = msg["content"].get<std::string>();

  std::vector<ToolCall> calls;
  if (msg.contains("tool_calls") && msg["tool_calls"].is_array()) {
    for (const auto& tc : msg["tool_calls"]) {
      if (!tc.is_object() || !tc.contains("function") || !tc["function"].is_object()) continue;
      const auto& fn = tc["function"];
      ToolCall c;
      if (tc.contains("id") && tc["id"].is_string()) c.id = tc["id"].get<std::string>();
      if (fn.contains("name") && fn["name"].is_string()) c.name = fn["name"].get<std::string>();
      if (fn.contains("arguments")) c.arguments_json = ArgumentsToText(fn["arguments"]);
      calls.push_back(std::move(c));
    }
  }

  if (calls.empty()) {
    out.message = ChatMessage::Assistant(std::move(content));
  } else {
    out.message = ChatMessage::AssistantToolCalls(std::move(content), std::move(calls));
  }
  return out;
}

OpenAiCompatibleGateway::OpenAiCompatibleGateway(std::string name, HttpEndpoint endpoint, Logger* log)
    : name_(std::move(name)), endpoint_(std::move(endpoint)), log_(log) {}

void OpenAiCompatibleGateway::SetTimeouts(int connect_seconds, int read_seconds, int write_seconds) {
  if (connect_seconds > 0) connect_timeout_seconds_ = connect_seconds;
  if (read_seconds > 0) read_timeout_seconds_ = read_seconds;
  if (write_seconds > 0) write_timeout_seconds_ = write_seconds;
}

std::string OpenAiCompatibleGateway::Name() const {
  return name_;
}

std::vector<std::string> OpenAiCompatibleGateway::ListModels(BridgeError* err) {
  auto cli = MakeClient(endpoint_, connect_timeout_seconds_, read_timeout_seconds_, write_timeout_seconds_);
  auto res = cli->Get(JoinPath(endpoint_.base_path, "/v1/models"));
  if (!res) {
    SetError(err, ErrorCode::kGateway, name_ + ": failed to connect: " + httplib::to_string(res.error()));
    return {};
  }
  if (res->status < 200 || res->status >= 300) {
    SetError(err, ErrorCode::kGateway, name_ + ": /v1/models http " + std::to_string(res->status));
    return {};
  }
  auto j = nlohmann::json::parse(res->body, nullptr, false);
  if (j.is_discarded() || !j.contains("data") || !j["data"].is_array()) {
    SetError(err, ErrorCode::kGateway, name_ + ": invalid json from /v1/models");
    return {};
  }
  std::vector<std::string> out;
  for (const auto& it : j["data"]) {
    if (it.is_object() && it.contains("id") && it["id"].is_string()) out.push_back(it["id"].get<std::string>());
  }
  return out;
}

std::optional<Completion> OpenAiCompatibleGateway::Complete(const CompletionRequest& req, BridgeError* err) {
  auto cli = MakeClient(endpoint_, connect_timeout_seconds_, read_timeout_seconds_, write_timeout_seconds_);
  const auto body = BuildChatCompletionBody(req);
  const auto path = JoinPath(endpoint_.base_path, "/v1/chat/completions");
  if (log_) {
    log_->Debug("gateway", "POST " + path + " messages=" + std::to_string(req.messages.size()) +
                               " tools=" + std::to_string(req.tools.size()));
  }

  auto res = cli->Post(path, body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace), "application/json");
  if (!res) {
    const std::string why = httplib::to_string(res.error());
    if (log_) log_->Error("gateway", "failed to connect to " + name_ + ": " + why);
    SetError(err, ErrorCode::kGateway, "Connection failed: " + why);
    return std::nullopt;
  }
  if (res->status < 200 || res->status >= 300) {
    if (log_) {
      log_->Error("gateway", name_ + " API error: " + std::to_string(res->status) + " - " + TruncateForLog(res->body, 2000));
    }
    SetError(err, ErrorCode::kGateway, "API error: " + std::to_string(res->status));
    return std::nullopt;
  }

  auto jr = nlohmann::json::parse(res->body, nullptr, false);
  if (jr.is_discarded()) {
    if (log_) log_->Error("gateway", "invalid json from " + path + ": " + TruncateForLog(res->body, 2000));
    SetError(err, ErrorCode::kGateway, name_ + ": invalid json from /v1/chat/completions");
    return std::nullopt;
  }
  auto out = ParseChatCompletionBody(jr, err);
  if (!out) {
    if (log_ && err) log_->Error("gateway", err->message);
    return std::nullopt;
  }
  if (out->model.empty()) out->model = req.model;
  return out;
}

}  // namespace chatbridge
