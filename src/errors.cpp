#include "errors.hpp"

namespace chatbridge {

const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::kNone:
      return "ok";
    case ErrorCode::kSpawn:
      return "spawn_error";
    case ErrorCode::kPipeClosed:
      return "pipe_closed";
    case ErrorCode::kTimeout:
      return "timeout";
    case ErrorCode::kProtocolTimeout:
      return "protocol_timeout";
    case ErrorCode::kProtocolError:
      return "protocol_error";
    case ErrorCode::kMalformedMessage:
      return "malformed_message";
    case ErrorCode::kToolError:
      return "tool_error";
    case ErrorCode::kArgumentParse:
      return "argument_parse_error";
    case ErrorCode::kGateway:
      return "gateway_error";
    case ErrorCode::kInvalidState:
      return "invalid_state";
    case ErrorCode::kConfig:
      return "config_error";
  }
  return "unknown";
}

std::string Describe(const BridgeError& err) {
  if (err.message.empty()) return ErrorCodeName(err.code);
  return std::string(ErrorCodeName(err.code)) + ": " + err.message;
}

}  // namespace chatbridge
