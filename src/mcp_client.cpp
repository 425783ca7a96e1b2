#include "mcp_client.hpp"

#include "logger.hpp"

#include <string>
#include <utility>

namespace chatbridge {
namespace {

constexpr int kMaxToolPages = 64;
constexpr size_t kMaxLoggedLine = 2000;

static std::string GetString(const nlohmann::json& j, const char* key) {
  if (j.is_object() && j.contains(key) && j[key].is_string()) return j[key].get<std::string>();
  return {};
}

}  // namespace

const char* McpClientStateName(McpClientState state) {
  switch (state) {
    case McpClientState::kUninitialized:
      return "uninitialized";
    case McpClientState::kInitializing:
      return "initializing";
    case McpClientState::kReady:
      return "ready";
    case McpClientState::kClosed:
      return "closed";
  }
  return "unknown";
}

McpClient::McpClient(std::unique_ptr<LineTransport> transport, Logger* log, std::chrono::milliseconds request_timeout)
    : transport_(std::move(transport)), log_(log), request_timeout_(request_timeout) {}

McpClient::~McpClient() {
  Close();
}

void McpClient::SetClientInfo(std::string name, std::string version) {
  client_name_ = std::move(name);
  client_version_ = std::move(version);
}

void McpClient::SetRequestTimeout(std::chrono::milliseconds timeout) {
  if (timeout.count() > 0) request_timeout_ = timeout;
}

McpClientState McpClient::state() const {
  std::lock_guard<std::mutex> lock(mu_);
  return state_;
}

void McpClient::SetState(McpClientState state) {
  std::lock_guard<std::mutex> lock(mu_);
  state_ = state;
}

bool McpClient::Initialize(BridgeError* err) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (state_ != McpClientState::kUninitialized) {
      SetError(err, ErrorCode::kInvalidState, std::string("mcp: initialize in state ") + McpClientStateName(state_));
      return false;
    }
    state_ = McpClientState::kInitializing;
  }

  nlohmann::json params;
  params["protocolVersion"] = kMcpProtocolVersion;
  params["capabilities"] = {{"tools", nlohmann::json::object()}};
  params["clientInfo"] = {{"name", client_name_}, {"version", client_version_}};

  BridgeError rpc_err;
  auto result = Rpc("initialize", params, &rpc_err);
  if (!result) {
    if (log_) log_->Error("mcp", "initialize failed: " + Describe(rpc_err));
    SetError(err, rpc_err.code, "mcp: initialize failed: " + rpc_err.message);
    Close();
    return false;
  }

  server_info_ = McpServerInfo{};
  if (result->is_object()) {
    if (result->contains("serverInfo") && (*result)["serverInfo"].is_object()) {
      server_info_.name = GetString((*result)["serverInfo"], "name");
      server_info_.version = GetString((*result)["serverInfo"], "version");
    }
    server_info_.protocol_version = GetString(*result, "protocolVersion");
    if (result->contains("capabilities")) server_info_.capabilities = (*result)["capabilities"];
  }
  if (log_) {
    log_->Info("mcp", "initialized server=" + (server_info_.name.empty() ? std::string("-") : server_info_.name) +
                          " version=" + (server_info_.version.empty() ? std::string("-") : server_info_.version) +
                          " protocol=" +
                          (server_info_.protocol_version.empty() ? std::string("-") : server_info_.protocol_version));
  }

  // Servers differ in whether they expect this notification; failing to deliver it
  // does not fail the handshake.
  BridgeError note_err;
  if (!SendNotification(JsonRpcNotification{"notifications/initialized", nlohmann::json::object()}, &note_err)) {
    if (log_) log_->Warn("mcp", "could not send initialized notification: " + Describe(note_err));
  } else if (log_) {
    log_->Info("mcp", "sent initialized notification");
  }

  SetState(McpClientState::kReady);
  return true;
}

std::vector<McpToolInfo> McpClient::ListTools(BridgeError* err) {
  if (state() != McpClientState::kReady) {
    SetError(err, ErrorCode::kInvalidState, std::string("mcp: tools/list in state ") + McpClientStateName(state()));
    return {};
  }

  std::vector<McpToolInfo> out;
  std::string cursor;
  for (int page = 0; page < kMaxToolPages; page++) {
    nlohmann::json params = nlohmann::json::object();
    if (!cursor.empty()) params["cursor"] = cursor;
    BridgeError rpc_err;
    auto r = Rpc("tools/list", params, &rpc_err);
    if (!r) {
      if (log_) log_->Error("mcp", "failed to list tools: " + Describe(rpc_err));
      SetError(err, rpc_err.code, rpc_err.message);
      return {};
    }
    if (!r->is_object() || !r->contains("tools") || !(*r)["tools"].is_array()) break;
    for (const auto& t : (*r)["tools"]) {
      if (!t.is_object()) continue;
      McpToolInfo info;
      info.name = GetString(t, "name");
      info.title = GetString(t, "title");
      info.description = GetString(t, "description");
      if (t.contains("inputSchema") && t["inputSchema"].is_object()) info.input_schema = t["inputSchema"];
      if (!info.name.empty()) out.push_back(std::move(info));
    }
    cursor = GetString(*r, "nextCursor");
    if (cursor.empty()) break;
  }
  if (log_) log_->Info("mcp", "retrieved " + std::to_string(out.size()) + " tools");
  return out;
}

std::optional<nlohmann::json> McpClient::CallTool(const std::string& name,
                                                  const nlohmann::json& arguments,
                                                  BridgeError* err) {
  if (state() != McpClientState::kReady) {
    SetError(err, ErrorCode::kToolError, std::string("client is ") + McpClientStateName(state()));
    return std::nullopt;
  }

  nlohmann::json params;
  params["name"] = name;
  params["arguments"] = arguments.is_null() ? nlohmann::json::object() : arguments;
  BridgeError rpc_err;
  auto r = Rpc("tools/call", params, &rpc_err);
  if (!r) {
    if (log_) log_->Error("mcp", "failed to call tool " + name + ": " + Describe(rpc_err));
    SetError(err, ErrorCode::kToolError, rpc_err.message.empty() ? "tool call failed" : rpc_err.message);
    return std::nullopt;
  }
  return r;
}

std::optional<nlohmann::json> McpClient::Rpc(const std::string& method,
                                             const nlohmann::json& params,
                                             BridgeError* err) {
  JsonRpcRequest req;
  req.method = method;
  req.params = params;
  auto resp = Send(std::move(req), err);
  if (!resp) return std::nullopt;
  if (resp->error) {
    SetError(err, ErrorCode::kProtocolError,
             resp->error->message + " (code " + std::to_string(resp->error->code) + ")");
    return std::nullopt;
  }
  if (!resp->result || resp->result->is_null()) return nlohmann::json::object();
  return *resp->result;
}

std::optional<JsonRpcResponse> McpClient::Send(JsonRpcRequest request, BridgeError* err) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (state_ != McpClientState::kInitializing && state_ != McpClientState::kReady) {
      SetError(err, ErrorCode::kInvalidState, std::string("mcp: cannot send in state ") + McpClientStateName(state_));
      return std::nullopt;
    }
    if (in_flight_) {
      SetError(err, ErrorCode::kInvalidState, "mcp: request " + pending_id_ + " is still in flight");
      return std::nullopt;
    }
    if (request.id.empty()) request.id = std::to_string(next_id_++);
    in_flight_ = true;
    pending_id_ = request.id;
  }
  auto clear_pending = [this]() {
    std::lock_guard<std::mutex> lock(mu_);
    in_flight_ = false;
    pending_id_.clear();
  };

  const std::string line = SerializeLine(request);
  if (log_) log_->Debug("mcp", "send " + TruncateForLog(line, kMaxLoggedLine));

  BridgeError io_err;
  if (!transport_->WriteLine(line, &io_err)) {
    clear_pending();
    SetError(err, io_err.code, request.method + ": " + io_err.message);
    return std::nullopt;
  }

  auto reply = transport_->ReadLine(request_timeout_, &io_err);
  clear_pending();
  if (!reply) {
    if (io_err.code == ErrorCode::kTimeout) {
      if (log_) log_->Error("mcp", "timeout waiting for response method=" + request.method + " id=" + request.id);
      SetError(err, ErrorCode::kProtocolTimeout, "timeout waiting for response to " + request.method);
    } else {
      SetError(err, io_err.code, request.method + ": " + io_err.message);
    }
    return std::nullopt;
  }
  if (log_) log_->Debug("mcp", "recv " + TruncateForLog(*reply, kMaxLoggedLine));

  BridgeError parse_err;
  auto msg = ParseLine(*reply, &parse_err);
  if (!msg) {
    if (log_) {
      log_->Error("mcp", "failed to parse response: " + parse_err.message + " raw=" + TruncateForLog(*reply, kMaxLoggedLine));
    }
    SetError(err, ErrorCode::kMalformedMessage, request.method + ": " + parse_err.message);
    return std::nullopt;
  }
  auto* resp = std::get_if<JsonRpcResponse>(&*msg);
  if (!resp) {
    if (log_) {
      log_->Error("mcp", std::string("expected response, got ") + MessageKind(*msg) +
                             " raw=" + TruncateForLog(*reply, kMaxLoggedLine));
    }
    SetError(err, ErrorCode::kMalformedMessage, request.method + ": expected a response, got a " + MessageKind(*msg));
    return std::nullopt;
  }
  if (resp->id != request.id && log_) {
    log_->Warn("mcp", "response id=" + resp->id + " does not match request id=" + request.id);
  }
  return std::move(*resp);
}

bool McpClient::SendNotification(const JsonRpcNotification& notification, BridgeError* err) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (state_ == McpClientState::kClosed || state_ == McpClientState::kUninitialized) {
      SetError(err, ErrorCode::kInvalidState, std::string("mcp: cannot notify in state ") + McpClientStateName(state_));
      return false;
    }
    if (in_flight_) {
      SetError(err, ErrorCode::kInvalidState, "mcp: request " + pending_id_ + " is still in flight");
      return false;
    }
  }
  const std::string line = SerializeLine(notification);
  if (log_) log_->Debug("mcp", "notify " + TruncateForLog(line, kMaxLoggedLine));
  BridgeError io_err;
  if (!transport_->WriteLine(line, &io_err)) {
    SetError(err, io_err.code, notification.method + ": " + io_err.message);
    return false;
  }
  return true;
}

void McpClient::Close() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (state_ == McpClientState::kClosed) return;
    state_ = McpClientState::kClosed;
  }
  if (transport_) transport_->Stop();
  if (log_) log_->Info("mcp", "client closed");
}

}  // namespace chatbridge
