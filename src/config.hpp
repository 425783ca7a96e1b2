#pragma once

#include <string>
#include <vector>

namespace chatbridge {

struct HttpEndpoint {
  std::string scheme = "http";
  std::string host = "127.0.0.1";
  int port = 1234;
  std::string base_path;
};

enum class RunMode { kInteractive, kStdio };

const char* RunModeName(RunMode mode);

struct BridgeConfig {
  std::string mcp_command;
  std::vector<std::string> mcp_argv;
  std::string gateway_url = "http://localhost:1234";
  HttpEndpoint gateway;
  RunMode mode = RunMode::kInteractive;
  std::string model = "local-model";
  double temperature = 0.7;
  int max_tokens = 2000;
  int mcp_timeout_seconds = 10;
  std::string log_file = "chatbridge.log";
  bool verbose = false;
  bool show_help = false;
};

HttpEndpoint ParseHttpEndpoint(const std::string& url, int default_port);

// Shell-style word splitting: whitespace separates words, single quotes are literal,
// double quotes allow backslash escapes, backslash escapes outside quotes.
bool SplitCommandLine(const std::string& command, std::vector<std::string>* out, std::string* err);

BridgeConfig LoadConfigFromEnv();

// Overrides `cfg` with flags from argv, then resolves derived fields (gateway endpoint,
// mcp argv) and validates. Returns false with `err` set on any problem.
bool ApplyCommandLine(int argc, const char* const* argv, BridgeConfig* cfg, std::string* err);

bool FinalizeConfig(BridgeConfig* cfg, std::string* err);

std::string UsageText(const std::string& program);

}  // namespace chatbridge
