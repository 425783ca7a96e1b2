#include "process_transport.hpp"

#include "logger.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <climits>
#include <cstdint>
#include <cstring>
#include <thread>
#include <utility>

namespace chatbridge {
namespace {

constexpr size_t kStderrTailLines = 50;

static void ClosePair(int fds[2]) {
  for (int i = 0; i < 2; i++) {
    if (fds[i] >= 0) {
      ::close(fds[i]);
      fds[i] = -1;
    }
  }
}

static std::string JoinArgv(const std::vector<std::string>& argv) {
  std::string out;
  for (const auto& a : argv) {
    if (!out.empty()) out += ' ';
    out += a;
  }
  return out;
}

static bool SetNonBlocking(int fd) {
  int flags = ::fcntl(fd, F_GETFL, 0);
  if (flags < 0) return false;
  return ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

static void IgnoreSigpipeOnce() {
  static const bool done = [] {
    struct sigaction sa {};
    sa.sa_handler = SIG_IGN;
    sigemptyset(&sa.sa_mask);
    ::sigaction(SIGPIPE, &sa, nullptr);
    return true;
  }();
  (void)done;
}

}  // namespace

int PollTimeoutMillis(std::chrono::milliseconds remaining) {
  return static_cast<int>(std::clamp<int64_t>(remaining.count(), 0, INT_MAX));
}

ProcessTransport::ProcessTransport(std::vector<std::string> argv, Logger* log)
    : argv_(std::move(argv)), log_(log) {}

ProcessTransport::~ProcessTransport() {
  Stop();
}

bool ProcessTransport::Start(BridgeError* err) {
  if (pid_ > 0 || stopped_) {
    SetError(err, ErrorCode::kInvalidState, "process transport already started");
    return false;
  }
  if (argv_.empty() || argv_[0].empty()) {
    SetError(err, ErrorCode::kSpawn, "empty command");
    return false;
  }

  IgnoreSigpipeOnce();

  int in_pipe[2] = {-1, -1};
  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  int status_pipe[2] = {-1, -1};
  auto close_all = [&]() {
    ClosePair(in_pipe);
    ClosePair(out_pipe);
    ClosePair(err_pipe);
    ClosePair(status_pipe);
  };

  if (::pipe2(in_pipe, O_CLOEXEC) == -1 || ::pipe2(out_pipe, O_CLOEXEC) == -1 ||
      ::pipe2(err_pipe, O_CLOEXEC) == -1 || ::pipe2(status_pipe, O_CLOEXEC) == -1) {
    SetError(err, ErrorCode::kSpawn, std::string("pipe: ") + std::strerror(errno));
    close_all();
    return false;
  }

  // Built before fork: only async-signal-safe calls are allowed in the child.
  std::vector<char*> argv;
  argv.reserve(argv_.size() + 1);
  for (auto& a : argv_) argv.push_back(const_cast<char*>(a.c_str()));
  argv.push_back(nullptr);

  pid_t pid = ::fork();
  if (pid == -1) {
    SetError(err, ErrorCode::kSpawn, std::string("fork: ") + std::strerror(errno));
    close_all();
    return false;
  }

  if (pid == 0) {
    ::dup2(in_pipe[0], STDIN_FILENO);
    ::dup2(out_pipe[1], STDOUT_FILENO);
    ::dup2(err_pipe[1], STDERR_FILENO);

    struct sigaction sa {};
    sa.sa_handler = SIG_DFL;
    sigemptyset(&sa.sa_mask);
    ::sigaction(SIGPIPE, &sa, nullptr);

    ::execvp(argv[0], argv.data());
    int exec_errno = errno;
    ssize_t ignored = ::write(status_pipe[1], &exec_errno, sizeof(exec_errno));
    (void)ignored;
    ::_exit(127);
  }

  ::close(in_pipe[0]);
  in_pipe[0] = -1;
  ::close(out_pipe[1]);
  out_pipe[1] = -1;
  ::close(err_pipe[1]);
  err_pipe[1] = -1;
  ::close(status_pipe[1]);
  status_pipe[1] = -1;

  int exec_errno = 0;
  ssize_t n = 0;
  do {
    n = ::read(status_pipe[0], &exec_errno, sizeof(exec_errno));
  } while (n < 0 && errno == EINTR);
  ClosePair(status_pipe);

  if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
    close_all();
    SetError(err, ErrorCode::kSpawn, "cannot execute '" + argv_[0] + "': " + std::strerror(exec_errno));
    return false;
  }

  pid_ = pid;
  stdin_fd_ = in_pipe[1];
  stdout_fd_ = out_pipe[0];
  stderr_fd_ = err_pipe[0];
  SetNonBlocking(stderr_fd_);

  if (log_) log_->Info("transport", "started pid=" + std::to_string(pid_) + " command=" + JoinArgv(argv_));
  return true;
}

bool ProcessTransport::ChildExited() const {
  if (pid_ <= 0) return true;
  siginfo_t info{};
  info.si_pid = 0;
  if (::waitid(P_PID, static_cast<id_t>(pid_), &info, WEXITED | WNOHANG | WNOWAIT) != 0) return true;
  return info.si_pid != 0;
}

bool ProcessTransport::IsRunning() const {
  return pid_ > 0 && !stopped_ && !ChildExited();
}

bool ProcessTransport::WriteLine(const std::string& text, BridgeError* err) {
  if (stopped_ || stdin_fd_ < 0) {
    SetError(err, ErrorCode::kPipeClosed, "process is not running");
    return false;
  }
  if (ChildExited()) {
    SetError(err, ErrorCode::kPipeClosed, "process has exited");
    return false;
  }

  std::string data = text;
  data.push_back('\n');
  size_t off = 0;
  while (off < data.size()) {
    ssize_t n = ::write(stdin_fd_, data.data() + off, data.size() - off);
    if (n < 0) {
      if (errno == EINTR) continue;
      SetError(err, ErrorCode::kPipeClosed, std::string("write: ") + std::strerror(errno));
      return false;
    }
    off += static_cast<size_t>(n);
  }
  return true;
}

std::optional<std::string> ProcessTransport::ReadLine(std::chrono::milliseconds timeout, BridgeError* err) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  for (;;) {
    auto pos = stdout_buffer_.find('\n');
    if (pos != std::string::npos) {
      std::string line = stdout_buffer_.substr(0, pos);
      stdout_buffer_.erase(0, pos + 1);
      if (!line.empty() && line.back() == '\r') line.pop_back();
      return line;
    }
    if (stdout_fd_ < 0) {
      if (!stdout_buffer_.empty()) {
        std::string line;
        line.swap(stdout_buffer_);
        return line;
      }
      SetError(err, ErrorCode::kPipeClosed, "end of stream");
      return std::nullopt;
    }

    auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      SetError(err, ErrorCode::kTimeout, "no line within " + std::to_string(timeout.count()) + " ms");
      return std::nullopt;
    }
    const int poll_ms =
        PollTimeoutMillis(std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now) + std::chrono::milliseconds(1));

    pollfd fds[2];
    fds[0].fd = stdout_fd_;
    fds[0].events = POLLIN;
    fds[0].revents = 0;
    fds[1].fd = stderr_fd_;
    fds[1].events = POLLIN;
    fds[1].revents = 0;
    int rc = ::poll(fds, 2, poll_ms);
    if (rc < 0) {
      if (errno == EINTR) continue;
      SetError(err, ErrorCode::kPipeClosed, std::string("poll: ") + std::strerror(errno));
      return std::nullopt;
    }
    if (rc == 0) continue;

    if (fds[1].revents & (POLLIN | POLLHUP | POLLERR)) DrainStderr();
    if (fds[0].revents & (POLLIN | POLLHUP | POLLERR)) {
      char buf[4096];
      ssize_t n = ::read(stdout_fd_, buf, sizeof(buf));
      if (n < 0) {
        if (errno == EINTR || errno == EAGAIN) continue;
        SetError(err, ErrorCode::kPipeClosed, std::string("read: ") + std::strerror(errno));
        return std::nullopt;
      }
      if (n == 0) {
        ::close(stdout_fd_);
        stdout_fd_ = -1;
        continue;
      }
      stdout_buffer_.append(buf, static_cast<size_t>(n));
    }
  }
}

void ProcessTransport::DrainStderr() {
  while (stderr_fd_ >= 0) {
    char buf[4096];
    ssize_t n = ::read(stderr_fd_, buf, sizeof(buf));
    if (n < 0) {
      if (errno == EINTR) continue;
      if (errno == EAGAIN || errno == EWOULDBLOCK) break;
      ::close(stderr_fd_);
      stderr_fd_ = -1;
      break;
    }
    if (n == 0) {
      ::close(stderr_fd_);
      stderr_fd_ = -1;
      break;
    }
    stderr_buffer_.append(buf, static_cast<size_t>(n));
    size_t pos;
    while ((pos = stderr_buffer_.find('\n')) != std::string::npos) {
      PushStderrLine(stderr_buffer_.substr(0, pos));
      stderr_buffer_.erase(0, pos + 1);
    }
  }
  if (stderr_fd_ < 0 && !stderr_buffer_.empty()) {
    std::string rest;
    rest.swap(stderr_buffer_);
    PushStderrLine(std::move(rest));
  }
}

void ProcessTransport::PushStderrLine(std::string line) {
  if (!line.empty() && line.back() == '\r') line.pop_back();
  if (log_) log_->Info("mcp-server", line);
  stderr_tail_.push_back(std::move(line));
  while (stderr_tail_.size() > kStderrTailLines) stderr_tail_.pop_front();
}

std::vector<std::string> ProcessTransport::RecentDiagnostics() const {
  return std::vector<std::string>(stderr_tail_.begin(), stderr_tail_.end());
}

void ProcessTransport::Stop() {
  if (stopped_) return;
  stopped_ = true;

  if (stdin_fd_ >= 0) {
    ::close(stdin_fd_);
    stdin_fd_ = -1;
  }

  if (pid_ > 0) {
    int status = 0;
    pid_t r = ::waitpid(pid_, &status, WNOHANG);
    if (r == 0) {
      ::kill(pid_, SIGTERM);
      const auto deadline = std::chrono::steady_clock::now() + stop_grace_;
      while (r == 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        r = ::waitpid(pid_, &status, WNOHANG);
        if (r < 0 && errno == EINTR) r = 0;
      }
      if (r == 0) {
        if (log_) log_->Warn("transport", "pid=" + std::to_string(pid_) + " ignored SIGTERM, sending SIGKILL");
        ::kill(pid_, SIGKILL);
        do {
          r = ::waitpid(pid_, &status, 0);
        } while (r < 0 && errno == EINTR);
      }
    }
    if (r == pid_) exit_status_ = status;
    if (log_) {
      log_->Info("transport", "stopped pid=" + std::to_string(pid_) + " status=" + std::to_string(exit_status_));
    }
  }

  DrainStderr();
  CloseFds();
}

void ProcessTransport::CloseFds() {
  for (int* fd : {&stdin_fd_, &stdout_fd_, &stderr_fd_}) {
    if (*fd >= 0) {
      ::close(*fd);
      *fd = -1;
    }
  }
}

}  // namespace chatbridge
