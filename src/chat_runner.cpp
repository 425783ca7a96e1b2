#include "chat_runner.hpp"

#include "logger.hpp"

#include <csignal>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <istream>
#include <new>
#include <ostream>
#include <stdexcept>

namespace chatbridge {
namespace {

volatile std::sig_atomic_t g_interrupted = 0;

static std::string Trim(const std::string& s) {
  size_t b = 0;
  size_t e = s.size();
  while (b < e && (s[b] == ' ' || s[b] == '\t' || s[b] == '\r' || s[b] == '\n')) b++;
  while (e > b && (s[e - 1] == ' ' || s[e - 1] == '\t' || s[e - 1] == '\r' || s[e - 1] == '\n')) e--;
  return s.substr(b, e - b);
}

static std::string JoinNames(const std::vector<std::string>& names) {
  if (names.empty()) return "None";
  std::string out;
  for (const auto& n : names) {
    if (!out.empty()) out += ", ";
    out += n;
  }
  return out;
}

static std::string DumpPretty(const nlohmann::json& j) {
  return j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace

void RequestInterrupt() {
  g_interrupted = 1;
}

bool InterruptRequested() {
  return g_interrupted != 0;
}

void ClearInterrupt() {
  g_interrupted = 0;
}

bool IsQuitCommand(const std::string& line) {
  std::string v = Trim(line);
  for (auto& c : v) {
    if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
  }
  return v == "quit" || v == "exit" || v == "bye";
}

std::string IsoTimestampNow() {
  const auto now = std::chrono::system_clock::now();
  const auto t = std::chrono::system_clock::to_time_t(now);
  const auto micros =
      std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()).count() % 1000000;
  std::tm tm{};
  localtime_r(&t, &tm);
  char date[32];
  std::strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &tm);
  char buf[48];
  std::snprintf(buf, sizeof(buf), "%s.%06lld", date, static_cast<long long>(micros));
  return buf;
}

nlohmann::json BuildStdioResponse(const std::string& response,
                                  const std::vector<std::string>& tools_used,
                                  const std::vector<std::string>& tools_available,
                                  const std::string& timestamp) {
  nlohmann::json j;
  j["response"] = response;
  j["timestamp"] = timestamp;
  j["metadata"] = {{"tools_available", tools_available}, {"tools_used", tools_used}};
  return j;
}

nlohmann::json BuildStdioError(const std::string& error,
                               const std::string& error_type,
                               const std::vector<std::string>& tools_available,
                               const std::string& timestamp) {
  nlohmann::json j;
  j["error"] = error;
  j["timestamp"] = timestamp;
  j["metadata"] = {{"tools_available", tools_available}, {"error_type", error_type}};
  return j;
}

std::string ExceptionTypeName(const std::exception& e) {
  if (dynamic_cast<const nlohmann::json::parse_error*>(&e)) return "json_parse_error";
  if (dynamic_cast<const nlohmann::json::type_error*>(&e)) return "json_type_error";
  if (dynamic_cast<const nlohmann::json::exception*>(&e)) return "json_error";
  if (dynamic_cast<const std::bad_alloc*>(&e)) return "bad_alloc";
  if (dynamic_cast<const std::invalid_argument*>(&e)) return "invalid_argument";
  if (dynamic_cast<const std::out_of_range*>(&e)) return "out_of_range";
  if (dynamic_cast<const std::runtime_error*>(&e)) return "runtime_error";
  if (dynamic_cast<const std::logic_error*>(&e)) return "logic_error";
  return "exception";
}

int RunInteractive(ChatOrchestrator& orchestrator, const ChatSession& session, std::istream& in, std::ostream& out,
                   Logger* log) {
  out << "Available tools: " << JoinNames(ExtractToolNames(session.available_tools)) << "\n";
  out << "Type 'quit', 'exit', or 'bye' to end the conversation\n\n";

  std::string line;
  while (!InterruptRequested()) {
    out << "You: " << std::flush;
    if (!std::getline(in, line)) break;

    const std::string user_text = Trim(line);
    if (IsQuitCommand(user_text)) {
      out << "\nGoodbye!\n";
      return 0;
    }
    if (user_text.empty()) continue;

    try {
      auto turn = orchestrator.ProcessTurn(user_text);
      out << "\nAssistant: " << turn.text << "\n\n";
    } catch (const std::exception& e) {
      if (log) log->Error("chat", std::string("error in interactive loop: ") + e.what());
      out << "\nError processing message: " << e.what() << "\n\n";
    }
  }

  if (InterruptRequested()) {
    out << "\nInterrupted by user\n";
    if (log) log->Info("chat", "interrupted");
  } else {
    out << "\n";
    if (log) log->Info("chat", "end of input");
  }
  return 0;
}

int RunStdio(ChatOrchestrator& orchestrator, const ChatSession& session, std::istream& in, std::ostream& out,
             Logger* log) {
  const auto tools_available = ExtractToolNames(session.available_tools);
  if (log) {
    log->Info("chat", "running in stdio mode");
    log->Info("chat", "available tools at startup: " + JoinNames(tools_available));
  }

  std::string line;
  while (!InterruptRequested() && std::getline(in, line)) {
    const std::string user_text = Trim(line);
    if (user_text.empty()) continue;
    if (log) log->Info("chat", "processing user input: " + TruncateForLog(user_text, 2000));

    try {
      auto turn = orchestrator.ProcessTurn(user_text);
      out << DumpPretty(BuildStdioResponse(turn.text, turn.tools_used, tools_available, IsoTimestampNow())) << "\n"
          << std::flush;
    } catch (const std::exception& e) {
      if (log) log->Error("chat", std::string("error processing stdio message: ") + e.what());
      out << DumpPretty(BuildStdioError(e.what(), ExceptionTypeName(e), tools_available, IsoTimestampNow())) << "\n"
          << std::flush;
    }
  }
  if (log) log->Info("chat", InterruptRequested() ? "interrupted" : "end of input");
  return 0;
}

}  // namespace chatbridge
