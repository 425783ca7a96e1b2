#include "jsonrpc.hpp"

#include <cstdint>
#include <utility>

namespace chatbridge {
namespace {

constexpr const char* kJsonRpcVersion = "2.0";

static std::optional<JsonRpcError> ParseErrorObject(const nlohmann::json& e) {
  JsonRpcError out;
  if (e.is_string()) {
    out.message = e.get<std::string>();
    return out;
  }
  if (!e.is_object()) return std::nullopt;
  if (e.contains("code") && e["code"].is_number_integer()) out.code = e["code"].get<int>();
  if (e.contains("message") && e["message"].is_string()) out.message = e["message"].get<std::string>();
  if (e.contains("data")) out.data = e["data"];
  if (out.message.empty()) out.message = "json-rpc error";
  return out;
}

}  // namespace

JsonRpcResponse JsonRpcResponse::Success(std::string id, nlohmann::json result) {
  JsonRpcResponse r;
  r.id = std::move(id);
  r.result = std::move(result);
  return r;
}

JsonRpcResponse JsonRpcResponse::Failure(std::string id, JsonRpcError error) {
  JsonRpcResponse r;
  r.id = std::move(id);
  r.error = std::move(error);
  return r;
}

std::optional<std::string> IdToString(const nlohmann::json& id) {
  if (id.is_string()) return id.get<std::string>();
  if (id.is_number_unsigned()) return std::to_string(id.get<uint64_t>());
  if (id.is_number_integer()) return std::to_string(id.get<int64_t>());
  return std::nullopt;
}

nlohmann::json ToJson(const JsonRpcMessage& message) {
  nlohmann::json j;
  j["jsonrpc"] = kJsonRpcVersion;
  if (const auto* req = std::get_if<JsonRpcRequest>(&message)) {
    j["id"] = req->id;
    j["method"] = req->method;
    if (!req->params.is_null()) j["params"] = req->params;
  } else if (const auto* note = std::get_if<JsonRpcNotification>(&message)) {
    j["method"] = note->method;
    if (!note->params.is_null()) j["params"] = note->params;
  } else if (const auto* resp = std::get_if<JsonRpcResponse>(&message)) {
    j["id"] = resp->id;
    if (resp->error) {
      nlohmann::json e;
      e["code"] = resp->error->code;
      e["message"] = resp->error->message;
      if (!resp->error->data.is_null()) e["data"] = resp->error->data;
      j["error"] = std::move(e);
    } else {
      j["result"] = resp->result ? *resp->result : nlohmann::json::object();
    }
  }
  return j;
}

std::string SerializeLine(const JsonRpcMessage& message) {
  return ToJson(message).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::optional<JsonRpcMessage> ParseMessage(const nlohmann::json& j, BridgeError* err) {
  if (!j.is_object()) {
    SetError(err, ErrorCode::kMalformedMessage, "message is not a json object");
    return std::nullopt;
  }
  if (j.contains("jsonrpc") && (!j["jsonrpc"].is_string() || j["jsonrpc"].get<std::string>() != kJsonRpcVersion)) {
    SetError(err, ErrorCode::kMalformedMessage, "unsupported jsonrpc version");
    return std::nullopt;
  }

  if (j.contains("method")) {
    if (!j["method"].is_string()) {
      SetError(err, ErrorCode::kMalformedMessage, "method is not a string");
      return std::nullopt;
    }
    nlohmann::json params;
    if (j.contains("params")) params = j["params"];
    if (j.contains("id") && !j["id"].is_null()) {
      auto id = IdToString(j["id"]);
      if (!id) {
        SetError(err, ErrorCode::kMalformedMessage, "request id must be a string or integer");
        return std::nullopt;
      }
      return JsonRpcMessage(JsonRpcRequest{*id, j["method"].get<std::string>(), std::move(params)});
    }
    return JsonRpcMessage(JsonRpcNotification{j["method"].get<std::string>(), std::move(params)});
  }

  const bool has_result = j.contains("result");
  const bool has_error = j.contains("error") && !j["error"].is_null();
  if (has_result == has_error) {
    SetError(err, ErrorCode::kMalformedMessage, "response must carry exactly one of result or error");
    return std::nullopt;
  }
  if (!j.contains("id")) {
    SetError(err, ErrorCode::kMalformedMessage, "response without id");
    return std::nullopt;
  }

  std::string id;
  if (!j["id"].is_null()) {
    auto parsed = IdToString(j["id"]);
    if (!parsed) {
      SetError(err, ErrorCode::kMalformedMessage, "response id must be a string or integer");
      return std::nullopt;
    }
    id = *parsed;
  }

  if (has_error) {
    auto e = ParseErrorObject(j["error"]);
    if (!e) {
      SetError(err, ErrorCode::kMalformedMessage, "error member is not an object");
      return std::nullopt;
    }
    return JsonRpcMessage(JsonRpcResponse::Failure(std::move(id), std::move(*e)));
  }
  return JsonRpcMessage(JsonRpcResponse::Success(std::move(id), j["result"]));
}

std::optional<JsonRpcMessage> ParseLine(const std::string& line, BridgeError* err) {
  auto j = nlohmann::json::parse(line, nullptr, false);
  if (j.is_discarded()) {
    SetError(err, ErrorCode::kMalformedMessage, "invalid json");
    return std::nullopt;
  }
  return ParseMessage(j, err);
}

const char* MessageKind(const JsonRpcMessage& message) {
  if (std::holds_alternative<JsonRpcRequest>(message)) return "request";
  if (std::holds_alternative<JsonRpcNotification>(message)) return "notification";
  return "response";
}

}  // namespace chatbridge
