#include "chat_runner.hpp"
#include "config.hpp"
#include "conversation.hpp"
#include "logger.hpp"
#include "mcp_client.hpp"
#include "openai_compatible_gateway.hpp"
#include "orchestrator.hpp"
#include "process_transport.hpp"

#include <signal.h>

#include <chrono>
#include <cstring>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

extern "C" void HandleTerminationSignal(int) {
  chatbridge::RequestInterrupt();
}

// No SA_RESTART so a blocked console read returns and the loop can exit cleanly.
static void InstallSignalHandlers() {
  struct sigaction sa;
  std::memset(&sa, 0, sizeof(sa));
  sa.sa_handler = HandleTerminationSignal;
  sigemptyset(&sa.sa_mask);
  sa.sa_flags = 0;
  sigaction(SIGINT, &sa, nullptr);
  sigaction(SIGTERM, &sa, nullptr);
}

static std::string EndpointToString(const chatbridge::HttpEndpoint& ep) {
  return ep.scheme + "://" + ep.host + ":" + std::to_string(ep.port) + ep.base_path;
}

static std::string JoinArgv(const std::vector<std::string>& argv) {
  std::string out;
  for (const auto& a : argv) {
    if (!out.empty()) out += " ";
    out += a;
  }
  return out;
}

static int RunSession(const chatbridge::BridgeConfig& cfg, chatbridge::Logger* log) {
  using namespace chatbridge;

  auto transport = std::make_unique<ProcessTransport>(cfg.mcp_argv, log);
  BridgeError err;
  if (!transport->Start(&err)) {
    log->Error("main", "failed to start mcp server: " + Describe(err));
    std::cerr << "error: " << err.message << "\n";
    return 1;
  }

  McpClient client(std::move(transport), log, std::chrono::seconds(cfg.mcp_timeout_seconds));
  if (!client.Initialize(&err)) {
    std::cerr << "error: " << err.message << "\n";
    client.Close();
    return 1;
  }
  const auto& server = client.server_info();
  log->Info("mcp", "server=" + (server.name.empty() ? std::string("-") : server.name) +
                       " version=" + (server.version.empty() ? std::string("-") : server.version) +
                       " protocol=" + (server.protocol_version.empty() ? std::string("-") : server.protocol_version));

  OpenAiCompatibleGateway gateway("lm-studio", cfg.gateway, log);
  BridgeError models_err;
  auto models = gateway.ListModels(&models_err);
  if (!models_err.ok()) {
    log->Warn("gateway", "could not list models at " + EndpointToString(cfg.gateway) + ": " + models_err.message);
  } else {
    log->Info("gateway", "endpoint=" + EndpointToString(cfg.gateway) + " models=" + std::to_string(models.size()));
  }

  ChatSession session(log);
  OrchestratorOptions opts;
  opts.model = cfg.model;
  opts.temperature = cfg.temperature;
  opts.max_tokens = cfg.max_tokens;
  ChatOrchestrator orchestrator(&session, &client, &gateway, opts);
  if (!orchestrator.Start(&err)) {
    log->Error("main", "failed to start orchestrator: " + Describe(err));
    client.Close();
    return 1;
  }

  int rc = 0;
  if (cfg.mode == RunMode::kStdio) {
    rc = RunStdio(orchestrator, session, std::cin, std::cout, log);
  } else {
    std::cout << "Connected to " << EndpointToString(cfg.gateway) << "\n";
    rc = RunInteractive(orchestrator, session, std::cin, std::cout, log);
  }

  log->Info("main", "stopping");
  client.Close();
  log->Info("main", "stopped");
  return rc;
}

}  // namespace

int main(int argc, char** argv) {
  auto cfg = chatbridge::LoadConfigFromEnv();
  std::string cfg_err;
  if (!chatbridge::ApplyCommandLine(argc, argv, &cfg, &cfg_err)) {
    std::cerr << "error: " << cfg_err << "\n\n" << chatbridge::UsageText(argv[0]);
    return 1;
  }
  if (cfg.show_help) {
    std::cout << chatbridge::UsageText(argv[0]);
    return 0;
  }

  chatbridge::Logger log(&std::cerr, cfg.verbose ? chatbridge::LogLevel::kDebug : chatbridge::LogLevel::kInfo);
  if (!cfg.log_file.empty()) {
    std::string log_err;
    if (!log.OpenFile(cfg.log_file, &log_err)) log.Warn("main", "log file disabled: " + log_err);
  }

  InstallSignalHandlers();
  log.Info("main", "mode=" + std::string(chatbridge::RunModeName(cfg.mode)) + " mcp_command=" + JoinArgv(cfg.mcp_argv) +
                       " model=" + cfg.model + " timeout_s=" + std::to_string(cfg.mcp_timeout_seconds));

  try {
    return RunSession(cfg, &log);
  } catch (const std::exception& e) {
    log.Error("main", std::string("fatal: ") + e.what());
    return 1;
  }
}
