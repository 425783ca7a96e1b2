#pragma once

#include "errors.hpp"
#include "jsonrpc.hpp"
#include "line_transport.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace chatbridge {

class Logger;

struct McpToolInfo {
  std::string name;
  std::string title;
  std::string description;
  nlohmann::json input_schema;
};

struct McpServerInfo {
  std::string name;
  std::string version;
  std::string protocol_version;
  nlohmann::json capabilities;
};

enum class McpClientState { kUninitialized, kInitializing, kReady, kClosed };

const char* McpClientStateName(McpClientState state);

inline constexpr const char* kMcpProtocolVersion = "2024-11-05";
inline constexpr std::chrono::milliseconds kDefaultRequestTimeout{10000};

// MCP client over a line transport. Requests are strictly one at a time: Send() writes
// a request and treats the next line read as its response, so callers must never
// overlap calls. A re-entrant Send() is rejected with kInvalidState.
class McpClient {
 public:
  McpClient(std::unique_ptr<LineTransport> transport,
            Logger* log,
            std::chrono::milliseconds request_timeout = kDefaultRequestTimeout);
  ~McpClient();

  McpClient(const McpClient&) = delete;
  McpClient& operator=(const McpClient&) = delete;

  void SetClientInfo(std::string name, std::string version);
  void SetRequestTimeout(std::chrono::milliseconds timeout);

  // Handshake. A failed initialize closes the client. A failed "initialized"
  // notification is only logged.
  bool Initialize(BridgeError* err);

  // Empty on error or timeout, with `err` describing why.
  std::vector<McpToolInfo> ListTools(BridgeError* err);

  // kToolError carrying the cause when the server reports an error, times out, or the
  // reply cannot be read.
  std::optional<nlohmann::json> CallTool(const std::string& name, const nlohmann::json& arguments, BridgeError* err);

  // Assigns the next id when `request.id` is empty, writes the request and reads the
  // next line as the response.
  std::optional<JsonRpcResponse> Send(JsonRpcRequest request, BridgeError* err);
  bool SendNotification(const JsonRpcNotification& notification, BridgeError* err);

  // Idempotent; stops the transport.
  void Close();

  McpClientState state() const;
  const McpServerInfo& server_info() const { return server_info_; }
  LineTransport* transport() const { return transport_.get(); }

 private:
  std::unique_ptr<LineTransport> transport_;
  Logger* log_;
  std::chrono::milliseconds request_timeout_;
  std::string client_name_ = "chatbridge";
  std::string client_version_ = "1.0.0";
  int64_t next_id_ = 1;
  McpServerInfo server_info_;

  mutable std::mutex mu_;
  McpClientState state_ = McpClientState::kUninitialized;
  bool in_flight_ = false;
  std::string pending_id_;

  std::optional<nlohmann::json> Rpc(const std::string& method, const nlohmann::json& params, BridgeError* err);
  void SetState(McpClientState state);
};

}  // namespace chatbridge
