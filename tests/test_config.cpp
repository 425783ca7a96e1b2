#include <gtest/gtest.h>
#include "config.hpp"

#include <cstdlib>

using namespace chatbridge;

class ConfigTest : public ::testing::Test {
 protected:
  void SetUp() override { ClearEnv(); }
  void TearDown() override { ClearEnv(); }

  static void ClearEnv() {
    for (const char* name : {"CHATBRIDGE_MCP_COMMAND", "CHATBRIDGE_GATEWAY_URL", "CHATBRIDGE_MODE", "CHATBRIDGE_MODEL",
                             "CHATBRIDGE_TEMPERATURE", "CHATBRIDGE_MAX_TOKENS", "MCP_READ_TIMEOUT_S",
                             "CHATBRIDGE_LOG_FILE", "CHATBRIDGE_VERBOSE"}) {
      ::unsetenv(name);
    }
  }

  static bool Apply(std::vector<const char*> args, BridgeConfig* cfg, std::string* err) {
    args.insert(args.begin(), "chatbridge");
    return ApplyCommandLine(static_cast<int>(args.size()), args.data(), cfg, err);
  }
};

TEST_F(ConfigTest, Defaults) {
  auto cfg = LoadConfigFromEnv();
  EXPECT_EQ(cfg.gateway_url, "http://localhost:1234");
  EXPECT_EQ(cfg.mode, RunMode::kInteractive);
  EXPECT_EQ(cfg.model, "local-model");
  EXPECT_DOUBLE_EQ(cfg.temperature, 0.7);
  EXPECT_EQ(cfg.max_tokens, 2000);
  EXPECT_EQ(cfg.mcp_timeout_seconds, 10);
  EXPECT_EQ(cfg.log_file, "chatbridge.log");
  EXPECT_FALSE(cfg.verbose);
}

TEST_F(ConfigTest, EnvironmentOverrides) {
  ::setenv("CHATBRIDGE_MCP_COMMAND", "java -jar server.jar", 1);
  ::setenv("CHATBRIDGE_MODE", "stdio", 1);
  ::setenv("MCP_READ_TIMEOUT_S", "3", 1);
  ::setenv("CHATBRIDGE_LOG_FILE", "", 1);
  ::setenv("CHATBRIDGE_VERBOSE", "yes", 1);
  auto cfg = LoadConfigFromEnv();
  EXPECT_EQ(cfg.mcp_command, "java -jar server.jar");
  EXPECT_EQ(cfg.mode, RunMode::kStdio);
  EXPECT_EQ(cfg.mcp_timeout_seconds, 3);
  EXPECT_TRUE(cfg.log_file.empty());
  EXPECT_TRUE(cfg.verbose);
}

TEST_F(ConfigTest, CommandLineOverridesAndResolves) {
  auto cfg = LoadConfigFromEnv();
  std::string err;
  ASSERT_TRUE(Apply({"--mcp-command", "java -jar 'my server.jar'", "--lm-studio-url=http://10.0.0.5:8080/api",
                     "--mode", "stdio", "--max-tokens", "512", "--temperature=0.2", "--verbose"},
                    &cfg, &err))
      << err;
  EXPECT_EQ(cfg.mcp_argv, (std::vector<std::string>{"java", "-jar", "my server.jar"}));
  EXPECT_EQ(cfg.gateway.host, "10.0.0.5");
  EXPECT_EQ(cfg.gateway.port, 8080);
  EXPECT_EQ(cfg.gateway.base_path, "/api");
  EXPECT_EQ(cfg.mode, RunMode::kStdio);
  EXPECT_EQ(cfg.max_tokens, 512);
  EXPECT_DOUBLE_EQ(cfg.temperature, 0.2);
  EXPECT_TRUE(cfg.verbose);
}

TEST_F(ConfigTest, MissingCommandIsAnError) {
  auto cfg = LoadConfigFromEnv();
  std::string err;
  EXPECT_FALSE(Apply({"--mode", "stdio"}, &cfg, &err));
  EXPECT_NE(err.find("--mcp-command"), std::string::npos);
}

TEST_F(ConfigTest, RejectsBadValues) {
  std::string err;
  auto cfg = LoadConfigFromEnv();
  EXPECT_FALSE(Apply({"--mcp-command", "x", "--mode", "batch"}, &cfg, &err));
  cfg = LoadConfigFromEnv();
  EXPECT_FALSE(Apply({"--mcp-command", "x", "--timeout", "0"}, &cfg, &err));
  cfg = LoadConfigFromEnv();
  EXPECT_FALSE(Apply({"--mcp-command", "x", "--max-tokens", "lots"}, &cfg, &err));
  cfg = LoadConfigFromEnv();
  EXPECT_FALSE(Apply({"--mcp-command"}, &cfg, &err));
  EXPECT_NE(err.find("missing value"), std::string::npos);
  cfg = LoadConfigFromEnv();
  EXPECT_FALSE(Apply({"--mcp-command", "x", "--frobnicate"}, &cfg, &err));
  EXPECT_NE(err.find("unknown argument"), std::string::npos);
}

TEST_F(ConfigTest, HelpShortCircuits) {
  auto cfg = LoadConfigFromEnv();
  std::string err;
  EXPECT_TRUE(Apply({"--help"}, &cfg, &err));
  EXPECT_TRUE(cfg.show_help);
  EXPECT_NE(UsageText("chatbridge").find("--mcp-command"), std::string::npos);
}

TEST(SplitCommandLineTest, HandlesQuotesAndEscapes) {
  std::vector<std::string> words;
  std::string err;
  ASSERT_TRUE(SplitCommandLine(R"(  node  "dist/index.js" --root 'a b' c\ d "say \"hi\""  )", &words, &err));
  EXPECT_EQ(words, (std::vector<std::string>{"node", "dist/index.js", "--root", "a b", "c d", "say \"hi\""}));
}

TEST(SplitCommandLineTest, RejectsUnterminatedQuote) {
  std::vector<std::string> words;
  std::string err;
  EXPECT_FALSE(SplitCommandLine("python 'server.py", &words, &err));
  EXPECT_NE(err.find("unterminated"), std::string::npos);
}

TEST(ParseHttpEndpointTest, DefaultsPortAndHost) {
  auto ep = ParseHttpEndpoint("http://localhost", 1234);
  EXPECT_EQ(ep.scheme, "http");
  EXPECT_EQ(ep.host, "localhost");
  EXPECT_EQ(ep.port, 1234);
  EXPECT_TRUE(ep.base_path.empty());

  auto bare = ParseHttpEndpoint("127.0.0.1:5000/", 1234);
  EXPECT_EQ(bare.host, "127.0.0.1");
  EXPECT_EQ(bare.port, 5000);
  EXPECT_TRUE(bare.base_path.empty());
}
