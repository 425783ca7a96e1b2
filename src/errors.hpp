#pragma once

#include <string>
#include <utility>

namespace chatbridge {

enum class ErrorCode {
  kNone = 0,
  kSpawn,
  kPipeClosed,
  kTimeout,
  kProtocolTimeout,
  kProtocolError,
  kMalformedMessage,
  kToolError,
  kArgumentParse,
  kGateway,
  kInvalidState,
  kConfig,
};

struct BridgeError {
  ErrorCode code = ErrorCode::kNone;
  std::string message;

  bool ok() const { return code == ErrorCode::kNone; }
};

const char* ErrorCodeName(ErrorCode code);

// Formats as "<code name>: <message>".
std::string Describe(const BridgeError& err);

inline void SetError(BridgeError* err, ErrorCode code, std::string message) {
  if (!err) return;
  err->code = code;
  err->message = std::move(message);
}

inline void ClearError(BridgeError* err) {
  if (!err) return;
  err->code = ErrorCode::kNone;
  err->message.clear();
}

}  // namespace chatbridge
