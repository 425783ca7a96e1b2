#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <fstream>
#include <mutex>
#include <ostream>
#include <string>

namespace chatbridge {

enum class LogLevel { kDebug = 0, kInfo, kWarn, kError };

const char* LogLevelName(LogLevel level);

// Writes "<timestamp> [LEVEL] [tag] message" lines to a stream and, when a log file is
// open, to the file as well. Safe to share between components of one session.
class Logger {
 public:
  explicit Logger(std::ostream* out, LogLevel min_level = LogLevel::kInfo);

  bool OpenFile(const std::string& path, std::string* err);
  void SetLevel(LogLevel level);
  LogLevel level() const;
  bool Enabled(LogLevel level) const;

  void Log(LogLevel level, const std::string& tag, const std::string& message);

  void Debug(const std::string& tag, const std::string& message) { Log(LogLevel::kDebug, tag, message); }
  void Info(const std::string& tag, const std::string& message) { Log(LogLevel::kInfo, tag, message); }
  void Warn(const std::string& tag, const std::string& message) { Log(LogLevel::kWarn, tag, message); }
  void Error(const std::string& tag, const std::string& message) { Log(LogLevel::kError, tag, message); }

 private:
  mutable std::mutex mu_;
  std::ostream* out_;
  std::ofstream file_;
  LogLevel min_level_;
};

std::string TruncateForLog(std::string s, size_t max_chars);
std::string SanitizeJsonForLog(const nlohmann::json& body);

}  // namespace chatbridge
