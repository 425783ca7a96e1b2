#pragma once

#include "errors.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <variant>

namespace chatbridge {

struct JsonRpcError {
  int code = 0;
  std::string message;
  nlohmann::json data;
};

struct JsonRpcRequest {
  std::string id;
  std::string method;
  nlohmann::json params;
};

struct JsonRpcNotification {
  std::string method;
  nlohmann::json params;
};

// Carries exactly one of `result` or `error`.
struct JsonRpcResponse {
  std::string id;
  std::optional<nlohmann::json> result;
  std::optional<JsonRpcError> error;

  static JsonRpcResponse Success(std::string id, nlohmann::json result);
  static JsonRpcResponse Failure(std::string id, JsonRpcError error);
};

using JsonRpcMessage = std::variant<JsonRpcRequest, JsonRpcNotification, JsonRpcResponse>;

// Null fields are omitted; "jsonrpc":"2.0" is always present.
nlohmann::json ToJson(const JsonRpcMessage& message);

// One wire line, without the trailing newline.
std::string SerializeLine(const JsonRpcMessage& message);

// kMalformedMessage when the text is not JSON or is not a JSON-RPC 2.0 message shape.
std::optional<JsonRpcMessage> ParseLine(const std::string& line, BridgeError* err);
std::optional<JsonRpcMessage> ParseMessage(const nlohmann::json& j, BridgeError* err);

// Integer ids are accepted on input and rendered as decimal text.
std::optional<std::string> IdToString(const nlohmann::json& id);

const char* MessageKind(const JsonRpcMessage& message);

}  // namespace chatbridge
