#pragma once

#include "mcp_client.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace chatbridge {

// A function the completion model may call.
struct ToolSchema {
  std::string name;
  std::string description;
  nlohmann::json parameters;
};

// A call requested by the model. `arguments_json` is the raw argument text as the model
// produced it.
struct ToolCall {
  std::string id;
  std::string name;
  std::string arguments_json;
};

ToolSchema ToToolSchema(const McpToolInfo& tool);

// Same order as `tools`. Missing descriptions become "" and missing input schemas {}.
std::vector<ToolSchema> BuildToolSchemas(const std::vector<McpToolInfo>& tools);

// OpenAI "tools" array: [{"type":"function","function":{name, description, parameters}}].
nlohmann::json ToOpenAiTools(const std::vector<ToolSchema>& tools);

std::vector<std::string> ExtractToolNames(const std::vector<ToolSchema>& tools);
std::vector<std::string> ExtractToolNames(const std::vector<McpToolInfo>& tools);

// System message describing the tools to the model.
std::string BuildToolSystemPrompt(const std::vector<McpToolInfo>& tools);

}  // namespace chatbridge
