#include "tool_bridge.hpp"

namespace chatbridge {

ToolSchema ToToolSchema(const McpToolInfo& tool) {
  ToolSchema schema;
  schema.name = tool.name;
  schema.description = tool.description.empty() ? tool.title : tool.description;
  schema.parameters = tool.input_schema.is_null() ? nlohmann::json::object() : tool.input_schema;
  return schema;
}

std::vector<ToolSchema> BuildToolSchemas(const std::vector<McpToolInfo>& tools) {
  std::vector<ToolSchema> out;
  out.reserve(tools.size());
  for (const auto& t : tools) out.push_back(ToToolSchema(t));
  return out;
}

nlohmann::json ToOpenAiTools(const std::vector<ToolSchema>& tools) {
  nlohmann::json out = nlohmann::json::array();
  for (const auto& t : tools) {
    nlohmann::json fn;
    fn["name"] = t.name;
    fn["description"] = t.description;
    fn["parameters"] = t.parameters.is_null() ? nlohmann::json::object() : t.parameters;
    out.push_back({{"type", "function"}, {"function", std::move(fn)}});
  }
  return out;
}

std::vector<std::string> ExtractToolNames(const std::vector<ToolSchema>& tools) {
  std::vector<std::string> out;
  out.reserve(tools.size());
  for (const auto& t : tools) out.push_back(t.name);
  return out;
}

std::vector<std::string> ExtractToolNames(const std::vector<McpToolInfo>& tools) {
  std::vector<std::string> out;
  out.reserve(tools.size());
  for (const auto& t : tools) out.push_back(t.name);
  return out;
}

std::string BuildToolSystemPrompt(const std::vector<McpToolInfo>& tools) {
  std::string tools_text;
  for (const auto& t : tools) {
    std::string line = "- " + t.name + ": ";
    line += t.description.empty() ? "No description available" : t.description;
    if (t.input_schema.is_object() && t.input_schema.contains("properties") &&
        t.input_schema["properties"].is_object() && !t.input_schema["properties"].empty()) {
      std::string params;
      for (const auto& [key, _] : t.input_schema["properties"].items()) {
        if (!params.empty()) params += ", ";
        params += key;
      }
      line += " (Parameters: " + params + ")";
    }
    if (!tools_text.empty()) tools_text += "\n";
    tools_text += line;
  }
  if (tools_text.empty()) tools_text = "No tools available";

  std::string prompt;
  prompt += "You are an AI assistant with access to MCP (Model Context Protocol) tools.\n";
  prompt += "You can use these tools to help answer questions and perform tasks.\n\n";
  prompt += "Available tools:\n";
  prompt += tools_text;
  prompt += "\n\n";
  prompt += "When you need to use a tool, respond with a function call. The tool will be executed and the results "
            "provided to you.\n";
  prompt += "Be helpful, accurate, and use the appropriate tools when needed to provide comprehensive answers.";
  return prompt;
}

}  // namespace chatbridge
