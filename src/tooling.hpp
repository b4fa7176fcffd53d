#pragma once

#include <nlohmann/json.hpp>

#include <functional>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace ask_continue {

struct ToolSchema {
  std::string name;
  std::string description;
  nlohmann::json input_schema;
};

struct ToolResult {
  std::string tool_call_id;
  std::string name;
  // MCP content items ({"type": "text", ...} / {"type": "image", ...}).
  nlohmann::json content = nlohmann::json::array();
  bool ok = true;
  std::string error;
};

using ToolHandler = std::function<ToolResult(const std::string& tool_call_id, const nlohmann::json& arguments)>;

class ToolRegistry {
 public:
  ToolRegistry() = default;
  ToolRegistry(const ToolRegistry&) = delete;
  ToolRegistry& operator=(const ToolRegistry&) = delete;

  void RegisterTool(ToolSchema schema, ToolHandler handler);
  bool HasTool(const std::string& name) const;
  std::optional<ToolSchema> GetSchema(const std::string& name) const;
  std::optional<ToolHandler> GetHandler(const std::string& name) const;

  // Sorted by tool name.
  std::vector<ToolSchema> ListSchemas() const;

 private:
  mutable std::shared_mutex mu_;
  std::unordered_map<std::string, ToolSchema> schemas_;
  std::unordered_map<std::string, ToolHandler> handlers_;
};

nlohmann::json TextContent(const std::string& text);
nlohmann::json ImageContent(const std::string& base64_data, const std::string& mime_type);

}  // namespace ask_continue
