#include "orchestrator.hpp"

#include "logger.hpp"

#include <algorithm>
#include <string>
#include <utility>

namespace chatbridge {
namespace {

constexpr size_t kMaxLoggedPayload = 2000;

static bool IsBlank(const std::string& s) {
  return std::all_of(s.begin(), s.end(), [](char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; });
}

static void AppendUnique(std::vector<std::string>* names, const std::string& name) {
  if (std::find(names->begin(), names->end(), name) == names->end()) names->push_back(name);
}

// MCP servers flag failed tool executions inside a successful result.
static bool ResultIsError(const nlohmann::json& result) {
  return result.is_object() && result.contains("isError") && result["isError"].is_boolean() &&
         result["isError"].get<bool>();
}

}  // namespace

std::optional<nlohmann::json> ParseToolArguments(const std::string& arguments_json, BridgeError* err) {
  if (IsBlank(arguments_json)) return nlohmann::json::object();
  auto args = nlohmann::json::parse(arguments_json, nullptr, false);
  if (args.is_discarded()) {
    SetError(err, ErrorCode::kArgumentParse, "arguments are not valid json: " + TruncateForLog(arguments_json, 200));
    return std::nullopt;
  }
  if (!args.is_object()) {
    SetError(err, ErrorCode::kArgumentParse, std::string("arguments must be a json object, got ") + args.type_name());
    return std::nullopt;
  }
  return args;
}

std::string FormatToolResults(const std::vector<ToolOutcome>& outcomes) {
  std::string out = "Tool results:\n";
  for (size_t i = 0; i < outcomes.size(); i++) {
    const auto& o = outcomes[i];
    if (i > 0) out += "\n";
    out += "Tool " + o.name + " result: " + o.result.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
  }
  return out;
}

ChatOrchestrator::ChatOrchestrator(ChatSession* session,
                                   McpClient* client,
                                   ICompletionGateway* gateway,
                                   OrchestratorOptions options)
    : session_(session), client_(client), gateway_(gateway), options_(std::move(options)) {}

bool ChatOrchestrator::Start(BridgeError* err) {
  if (client_->state() != McpClientState::kReady) {
    SetError(err, ErrorCode::kInvalidState, std::string("mcp client is ") + McpClientStateName(client_->state()));
    return false;
  }
  Logger* log = session_->log;

  BridgeError list_err;
  session_->available_tools = client_->ListTools(&list_err);
  if (!list_err.ok() && log) log->Warn("orchestrator", "tools/list failed: " + Describe(list_err));

  if (session_->available_tools.empty() && log) {
    log->Warn("orchestrator", "mcp server reported no tools");
    if (const auto* transport = client_->transport()) {
      for (const auto& line : transport->RecentDiagnostics()) log->Warn("mcp-server", line);
    }
  }

  tool_schemas_ = BuildToolSchemas(session_->available_tools);
  if (log) {
    std::string names;
    for (const auto& n : ExtractToolNames(tool_schemas_)) names += (names.empty() ? "" : ",") + n;
    log->Info("orchestrator", "tools=" + std::to_string(tool_schemas_.size()) + " names=" + (names.empty() ? "-" : names));
  }

  session_->conversation.Append(ChatMessage::System(BuildToolSystemPrompt(session_->available_tools)));
  return true;
}

CompletionRequest ChatOrchestrator::MakeRequest(bool with_tools) const {
  CompletionRequest req;
  req.model = options_.model;
  req.messages = session_->conversation.Messages();
  req.temperature = options_.temperature;
  req.max_tokens = options_.max_tokens;
  if (with_tools) req.tools = tool_schemas_;
  return req;
}

ToolOutcome ChatOrchestrator::ExecuteToolCall(const ToolCall& call) {
  Logger* log = session_->log;
  ToolOutcome out;
  out.name = call.name;

  if (log) {
    log->Info("tool-call", "id=" + (call.id.empty() ? std::string("-") : call.id) + " name=" + call.name +
                               " arguments=" + TruncateForLog(call.arguments_json, kMaxLoggedPayload));
  }

  auto args = ParseToolArguments(call.arguments_json, &out.error);
  if (args) {
    BridgeError call_err;
    auto result = client_->CallTool(call.name, *args, &call_err);
    if (result) {
      out.ok = !ResultIsError(*result);
      out.result = std::move(*result);
    } else {
      out.error = call_err;
    }
  }
  if (!out.error.ok()) out.result = {{"error", out.error.message}};

  if (log) {
    log->Info("tool-result", "id=" + (call.id.empty() ? std::string("-") : call.id) + " name=" + call.name +
                                 " ok=" + (out.ok ? "1" : "0") +
                                 " error=" + (out.error.ok() ? std::string("-") : Describe(out.error)) +
                                 " result=" + TruncateForLog(SanitizeJsonForLog(out.result), kMaxLoggedPayload));
  }
  return out;
}

TurnResult ChatOrchestrator::ProcessTurn(const std::string& user_text) {
  Logger* log = session_->log;
  TurnResult turn;
  session_->conversation.Append(ChatMessage::User(user_text));

  BridgeError gw_err;
  auto first = gateway_->Complete(MakeRequest(true), &gw_err);
  if (!first) {
    if (log) log->Error("orchestrator", "completion failed: " + Describe(gw_err));
    turn.ok = false;
    turn.error = gw_err;
    turn.text = "Error: " + gw_err.message;
    return turn;
  }

  if (first->message.kind != TurnKind::kAssistantToolCalls) {
    turn.text = first->message.content;
    session_->conversation.Append(ChatMessage::Assistant(first->message.content));
    return turn;
  }

  std::vector<ToolOutcome> outcomes;
  outcomes.reserve(first->message.tool_calls.size());
  for (const auto& call : first->message.tool_calls) {
    AppendUnique(&turn.tools_used, call.name);
    outcomes.push_back(ExecuteToolCall(call));
  }
  session_->conversation.Append(first->message);
  session_->conversation.Append(ChatMessage::ToolResult(FormatToolResults(outcomes)));

  BridgeError final_err;
  auto follow_up = gateway_->Complete(MakeRequest(false), &final_err);
  if (!follow_up) {
    if (log) log->Error("orchestrator", "follow-up completion failed: " + Describe(final_err));
    turn.ok = false;
    turn.error = final_err;
    turn.text = "Error in final response: " + final_err.message;
    return turn;
  }
  if (follow_up->message.kind == TurnKind::kAssistantToolCalls && log) {
    log->Warn("orchestrator", "follow-up requested " + std::to_string(follow_up->message.tool_calls.size()) +
                                  " more tool call(s); not executed");
  }

  for (const auto& name : turn.tools_used) session_->RecordToolUse(name);
  turn.text = follow_up->message.content;
  session_->conversation.Append(ChatMessage::Assistant(follow_up->message.content));
  return turn;
}

}  // namespace chatbridge
