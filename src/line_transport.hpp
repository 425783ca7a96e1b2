#pragma once

#include "errors.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace chatbridge {

// A bidirectional newline-delimited text channel. The MCP client owns exactly one and
// is its only reader and writer.
class LineTransport {
 public:
  virtual ~LineTransport() = default;

  // Appends '\n' to `text` and writes it. Fails with kPipeClosed once the peer is gone.
  virtual bool WriteLine(const std::string& text, BridgeError* err) = 0;

  // Blocks until one complete line is available (returned without the terminator) or
  // `timeout` elapses (kTimeout). End of stream yields kPipeClosed.
  virtual std::optional<std::string> ReadLine(std::chrono::milliseconds timeout, BridgeError* err) = 0;

  // Tears down the peer. Idempotent.
  virtual void Stop() = 0;

  virtual bool IsRunning() const = 0;

  // Recent diagnostic output from the peer, oldest first. Empty when the channel has none.
  virtual std::vector<std::string> RecentDiagnostics() const { return {}; }
};

}  // namespace chatbridge
