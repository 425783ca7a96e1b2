#include "config.hpp"

#include <cstdint>
#include <cstdlib>
#include <string>
#include <utility>
#include <vector>

namespace chatbridge {
namespace {

static bool StartsWith(const std::string& s, const std::string& prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

static std::string GetEnvStr(const char* name) {
  const char* v = std::getenv(name);
  return v ? std::string(v) : std::string();
}

static std::string ToLower(std::string s) {
  for (auto& c : s) {
    if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
  }
  return s;
}

static bool TryParseBool(const std::string& s, bool* out) {
  if (!out) return false;
  const std::string v = ToLower(s);
  if (v == "1" || v == "true" || v == "yes" || v == "y" || v == "on") {
    *out = true;
    return true;
  }
  if (v == "0" || v == "false" || v == "no" || v == "n" || v == "off") {
    *out = false;
    return true;
  }
  return false;
}

static bool TryParseInt(const std::string& s, int* out) {
  if (s.empty()) return false;
  char* end = nullptr;
  long n = std::strtol(s.c_str(), &end, 10);
  if (end == s.c_str() || *end != '\0') return false;
  if (n > INT32_MAX || n < INT32_MIN) return false;
  *out = static_cast<int>(n);
  return true;
}

static bool TryParseDouble(const std::string& s, double* out) {
  if (s.empty()) return false;
  char* end = nullptr;
  double d = std::strtod(s.c_str(), &end);
  if (end == s.c_str() || *end != '\0') return false;
  *out = d;
  return true;
}

static bool TryParseMode(const std::string& s, RunMode* out) {
  const auto v = ToLower(s);
  if (v == "interactive") {
    *out = RunMode::kInteractive;
    return true;
  }
  if (v == "stdio") {
    *out = RunMode::kStdio;
    return true;
  }
  return false;
}

}  // namespace

const char* RunModeName(RunMode mode) {
  return mode == RunMode::kStdio ? "stdio" : "interactive";
}

HttpEndpoint ParseHttpEndpoint(const std::string& url, int default_port) {
  HttpEndpoint ep;
  ep.port = 0;
  std::string s = url;
  if (StartsWith(s, "http://")) {
    ep.scheme = "http";
    s = s.substr(7);
  } else if (StartsWith(s, "https://")) {
    ep.scheme = "https";
    s = s.substr(8);
  }

  auto slash_pos = s.find('/');
  if (slash_pos != std::string::npos) {
    ep.base_path = s.substr(slash_pos);
    s = s.substr(0, slash_pos);
  }
  if (ep.base_path == "/") ep.base_path.clear();

  auto colon_pos = s.rfind(':');
  if (colon_pos != std::string::npos) {
    ep.host = s.substr(0, colon_pos);
    ep.port = std::atoi(s.substr(colon_pos + 1).c_str());
  } else if (!s.empty()) {
    ep.host = s;
  }
  if (ep.port == 0) ep.port = default_port;
  if (ep.host.empty()) ep.host = "127.0.0.1";
  return ep;
}

bool SplitCommandLine(const std::string& command, std::vector<std::string>* out, std::string* err) {
  std::vector<std::string> words;
  std::string cur;
  bool in_word = false;
  enum class Quote { kNone, kSingle, kDouble } quote = Quote::kNone;

  for (size_t i = 0; i < command.size(); i++) {
    const char ch = command[i];
    switch (quote) {
      case Quote::kSingle:
        if (ch == '\'') {
          quote = Quote::kNone;
        } else {
          cur.push_back(ch);
        }
        continue;
      case Quote::kDouble:
        if (ch == '"') {
          quote = Quote::kNone;
        } else if (ch == '\\' && i + 1 < command.size() &&
                   (command[i + 1] == '"' || command[i + 1] == '\\' || command[i + 1] == '$' || command[i + 1] == '`')) {
          cur.push_back(command[++i]);
        } else {
          cur.push_back(ch);
        }
        continue;
      case Quote::kNone:
        break;
    }

    if (ch == ' ' || ch == '\t' || ch == '\n') {
      if (in_word) {
        words.push_back(std::move(cur));
        cur.clear();
        in_word = false;
      }
      continue;
    }
    in_word = true;
    if (ch == '\'') {
      quote = Quote::kSingle;
    } else if (ch == '"') {
      quote = Quote::kDouble;
    } else if (ch == '\\') {
      if (i + 1 >= command.size()) {
        if (err) *err = "trailing backslash in command";
        return false;
      }
      cur.push_back(command[++i]);
    } else {
      cur.push_back(ch);
    }
  }

  if (quote != Quote::kNone) {
    if (err) *err = "unterminated quote in command";
    return false;
  }
  if (in_word) words.push_back(std::move(cur));
  if (out) *out = std::move(words);
  return true;
}

BridgeConfig LoadConfigFromEnv() {
  BridgeConfig cfg;

  if (auto cmd = GetEnvStr("CHATBRIDGE_MCP_COMMAND"); !cmd.empty()) cfg.mcp_command = cmd;
  if (auto url = GetEnvStr("CHATBRIDGE_GATEWAY_URL"); !url.empty()) cfg.gateway_url = url;
  if (auto mode = GetEnvStr("CHATBRIDGE_MODE"); !mode.empty()) {
    RunMode m;
    if (TryParseMode(mode, &m)) cfg.mode = m;
  }
  if (auto model = GetEnvStr("CHATBRIDGE_MODEL"); !model.empty()) cfg.model = model;
  if (auto t = GetEnvStr("CHATBRIDGE_TEMPERATURE"); !t.empty()) {
    double d = 0;
    if (TryParseDouble(t, &d)) cfg.temperature = d;
  }
  if (auto mt = GetEnvStr("CHATBRIDGE_MAX_TOKENS"); !mt.empty()) {
    int n = 0;
    if (TryParseInt(mt, &n)) cfg.max_tokens = n;
  }
  if (auto to = GetEnvStr("MCP_READ_TIMEOUT_S"); !to.empty()) {
    int n = 0;
    if (TryParseInt(to, &n) && n > 0) cfg.mcp_timeout_seconds = n;
  }
  // Set but empty disables the log file.
  if (const char* lf = std::getenv("CHATBRIDGE_LOG_FILE")) cfg.log_file = lf;
  if (auto v = GetEnvStr("CHATBRIDGE_VERBOSE"); !v.empty()) {
    bool b = false;
    if (TryParseBool(v, &b)) cfg.verbose = b;
  }
  return cfg;
}

bool ApplyCommandLine(int argc, const char* const* argv, BridgeConfig* cfg, std::string* err) {
  for (int i = 1; i < argc; i++) {
    std::string arg = argv[i];
    std::string value;
    bool has_inline_value = false;
    if (StartsWith(arg, "--")) {
      auto eq = arg.find('=');
      if (eq != std::string::npos) {
        value = arg.substr(eq + 1);
        arg = arg.substr(0, eq);
        has_inline_value = true;
      }
    }

    auto take_value = [&](std::string* out) -> bool {
      if (has_inline_value) {
        *out = value;
        return true;
      }
      if (i + 1 >= argc) {
        if (err) *err = "missing value for " + arg;
        return false;
      }
      *out = argv[++i];
      return true;
    };

    std::string v;
    if (arg == "-h" || arg == "--help") {
      cfg->show_help = true;
      return true;
    } else if (arg == "--mcp-command") {
      if (!take_value(&cfg->mcp_command)) return false;
    } else if (arg == "--gateway-url" || arg == "--lm-studio-url") {
      if (!take_value(&cfg->gateway_url)) return false;
    } else if (arg == "--mode") {
      if (!take_value(&v)) return false;
      if (!TryParseMode(v, &cfg->mode)) {
        if (err) *err = "invalid --mode: " + v + " (expected interactive or stdio)";
        return false;
      }
    } else if (arg == "--model") {
      if (!take_value(&cfg->model)) return false;
    } else if (arg == "--temperature") {
      if (!take_value(&v)) return false;
      if (!TryParseDouble(v, &cfg->temperature)) {
        if (err) *err = "invalid --temperature: " + v;
        return false;
      }
    } else if (arg == "--max-tokens") {
      if (!take_value(&v)) return false;
      if (!TryParseInt(v, &cfg->max_tokens)) {
        if (err) *err = "invalid --max-tokens: " + v;
        return false;
      }
    } else if (arg == "--timeout") {
      if (!take_value(&v)) return false;
      if (!TryParseInt(v, &cfg->mcp_timeout_seconds) || cfg->mcp_timeout_seconds <= 0) {
        if (err) *err = "invalid --timeout: " + v;
        return false;
      }
    } else if (arg == "--log-file") {
      if (!take_value(&cfg->log_file)) return false;
    } else if (arg == "--verbose" || arg == "-v") {
      cfg->verbose = true;
    } else {
      if (err) *err = "unknown argument: " + arg;
      return false;
    }
  }
  return FinalizeConfig(cfg, err);
}

bool FinalizeConfig(BridgeConfig* cfg, std::string* err) {
  if (cfg->mcp_command.empty()) {
    if (err) *err = "--mcp-command is required";
    return false;
  }
  std::string split_err;
  if (!SplitCommandLine(cfg->mcp_command, &cfg->mcp_argv, &split_err)) {
    if (err) *err = "invalid --mcp-command: " + split_err;
    return false;
  }
  if (cfg->mcp_argv.empty()) {
    if (err) *err = "--mcp-command is empty";
    return false;
  }
  cfg->gateway = ParseHttpEndpoint(cfg->gateway_url, 1234);
  return true;
}

std::string UsageText(const std::string& program) {
  std::string u;
  u += "usage: " + program + " --mcp-command CMD [options]\n\n";
  u += "Bridge an OpenAI-compatible chat completion endpoint with an MCP tool server.\n\n";
  u += "options:\n";
  u += "  --mcp-command CMD     command that starts the MCP server (e.g. 'java -jar server.jar')\n";
  u += "  --gateway-url URL     chat completion endpoint (default: http://localhost:1234)\n";
  u += "  --lm-studio-url URL   alias for --gateway-url\n";
  u += "  --mode MODE           interactive (console) or stdio (integration), default interactive\n";
  u += "  --model NAME          model name sent to the endpoint (default: local-model)\n";
  u += "  --temperature F       sampling temperature (default: 0.7)\n";
  u += "  --max-tokens N        completion token limit (default: 2000)\n";
  u += "  --timeout SECONDS     MCP response timeout (default: 10)\n";
  u += "  --log-file PATH       log file, empty to disable (default: chatbridge.log)\n";
  u += "  --verbose             log wire traffic\n";
  u += "  -h, --help            show this help\n";
  return u;
}

}  // namespace chatbridge
