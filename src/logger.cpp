#include "logger.hpp"

#include <chrono>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace chatbridge {
namespace {

static std::string NowTimestamp() {
  auto now = std::chrono::system_clock::now();
  auto secs = std::chrono::system_clock::to_time_t(now);
  auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
  std::tm tm{};
  localtime_r(&secs, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << "," << std::setw(3) << std::setfill('0') << millis;
  return oss.str();
}

}  // namespace

const char* LogLevelName(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "DEBUG";
    case LogLevel::kInfo:
      return "INFO";
    case LogLevel::kWarn:
      return "WARNING";
    case LogLevel::kError:
      return "ERROR";
  }
  return "INFO";
}

Logger::Logger(std::ostream* out, LogLevel min_level) : out_(out), min_level_(min_level) {}

bool Logger::OpenFile(const std::string& path, std::string* err) {
  std::lock_guard<std::mutex> lock(mu_);
  if (file_.is_open()) file_.close();
  file_.open(path, std::ios::out | std::ios::app);
  if (!file_) {
    if (err) *err = "cannot open log file: " + path;
    return false;
  }
  return true;
}

void Logger::SetLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(mu_);
  min_level_ = level;
}

LogLevel Logger::level() const {
  std::lock_guard<std::mutex> lock(mu_);
  return min_level_;
}

bool Logger::Enabled(LogLevel level) const {
  std::lock_guard<std::mutex> lock(mu_);
  return static_cast<int>(level) >= static_cast<int>(min_level_);
}

void Logger::Log(LogLevel level, const std::string& tag, const std::string& message) {
  std::lock_guard<std::mutex> lock(mu_);
  if (static_cast<int>(level) < static_cast<int>(min_level_)) return;
  std::string line = NowTimestamp() + " [" + LogLevelName(level) + "] [" + tag + "] " + message + "\n";
  if (out_) {
    *out_ << line;
    out_->flush();
  }
  if (file_.is_open()) {
    file_ << line;
    file_.flush();
  }
}

std::string TruncateForLog(std::string s, size_t max_chars) {
  if (max_chars == 0) return {};
  if (s.size() <= max_chars) return s;
  constexpr const char* kSuffix = "...(truncated)";
  if (max_chars <= std::strlen(kSuffix)) return std::string(kSuffix).substr(0, max_chars);
  size_t cut = max_chars - std::strlen(kSuffix);
  // Never split a UTF-8 sequence: back off over continuation bytes.
  while (cut > 0 && (static_cast<unsigned char>(s[cut]) & 0xC0) == 0x80) cut--;
  s.resize(cut);
  s += kSuffix;
  return s;
}

std::string SanitizeJsonForLog(const nlohmann::json& body) {
  if (body.is_null()) return "null";
  constexpr auto kReplace = nlohmann::json::error_handler_t::replace;
  if (!body.is_object()) return body.dump(-1, ' ', false, kReplace);
  auto j = body;
  for (const auto& key : {"api_key", "api-key", "authorization", "apiKey", "password", "token"}) {
    if (j.contains(key)) j[key] = "<redacted>";
  }
  if (j.contains("headers") && j["headers"].is_object()) {
    auto& h = j["headers"];
    for (const auto& key : {"authorization", "proxy-authorization", "api-key", "api_key", "x-api-key"}) {
      if (h.contains(key)) h.erase(key);
    }
  }
  return j.dump(-1, ' ', false, kReplace);
}

}  // namespace chatbridge
