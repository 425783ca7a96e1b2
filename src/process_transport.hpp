#pragma once

#include "line_transport.hpp"

#include <sys/types.h>

#include <chrono>
#include <deque>
#include <string>
#include <vector>

namespace chatbridge {

class Logger;

// Milliseconds to hand to poll(2) for a wait of `remaining`. Clamped to [0, INT_MAX] so a
// distant deadline never becomes a negative (infinite) timeout.
int PollTimeoutMillis(std::chrono::milliseconds remaining);

// Runs a child process with its stdin, stdout and stderr redirected to pipes. stdout
// carries the line protocol; stderr is drained opportunistically during reads so the
// child never stalls on a full pipe, and is logged under the "mcp-server" tag.
class ProcessTransport : public LineTransport {
 public:
  explicit ProcessTransport(std::vector<std::string> argv, Logger* log = nullptr);
  ~ProcessTransport() override;

  ProcessTransport(const ProcessTransport&) = delete;
  ProcessTransport& operator=(const ProcessTransport&) = delete;

  // Spawns the child. kSpawn when the argv is empty, pipes cannot be created, or the
  // executable cannot be launched.
  bool Start(BridgeError* err);

  bool WriteLine(const std::string& text, BridgeError* err) override;
  std::optional<std::string> ReadLine(std::chrono::milliseconds timeout, BridgeError* err) override;
  void Stop() override;
  bool IsRunning() const override;

  pid_t pid() const { return pid_; }
  // Exit status as reported by waitpid, or -1 while the child has not been reaped.
  int exit_status() const { return exit_status_; }

  // Last lines the child wrote to stderr, oldest first.
  std::vector<std::string> RecentDiagnostics() const override;

  void SetStopGracePeriod(std::chrono::milliseconds grace) { stop_grace_ = grace; }

 private:
  std::vector<std::string> argv_;
  Logger* log_;
  pid_t pid_ = -1;
  int stdin_fd_ = -1;
  int stdout_fd_ = -1;
  int stderr_fd_ = -1;
  int exit_status_ = -1;
  bool stopped_ = false;
  std::string stdout_buffer_;
  std::string stderr_buffer_;
  std::deque<std::string> stderr_tail_;
  std::chrono::milliseconds stop_grace_{2000};

  bool ChildExited() const;
  void DrainStderr();
  void PushStderrLine(std::string line);
  void CloseFds();
};

}  // namespace chatbridge
