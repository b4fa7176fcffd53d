#include "tooling.hpp"

#include <algorithm>
#include <mutex>
#include <utility>

namespace ask_continue {

void ToolRegistry::RegisterTool(ToolSchema schema, ToolHandler handler) {
  std::unique_lock<std::shared_mutex> lock(mu_);
  const auto name = schema.name;
  schemas_[name] = std::move(schema);
  handlers_[name] = std::move(handler);
}

bool ToolRegistry::HasTool(const std::string& name) const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  return schemas_.find(name) != schemas_.end() && handlers_.find(name) != handlers_.end();
}

std::optional<ToolSchema> ToolRegistry::GetSchema(const std::string& name) const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  auto it = schemas_.find(name);
  if (it == schemas_.end()) return std::nullopt;
  return it->second;
}

std::optional<ToolHandler> ToolRegistry::GetHandler(const std::string& name) const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  auto it = handlers_.find(name);
  if (it == handlers_.end()) return std::nullopt;
  return it->second;
}

std::vector<ToolSchema> ToolRegistry::ListSchemas() const {
  std::vector<ToolSchema> out;
  {
    std::shared_lock<std::shared_mutex> lock(mu_);
    out.reserve(schemas_.size());
    for (const auto& [_, schema] : schemas_) out.push_back(schema);
  }
  std::sort(out.begin(), out.end(), [](const ToolSchema& a, const ToolSchema& b) { return a.name < b.name; });
  return out;
}

nlohmann::json TextContent(const std::string& text) {
  return {{"type", "text"}, {"text", text}};
}

nlohmann::json ImageContent(const std::string& base64_data, const std::string& mime_type) {
  return {{"type", "image"}, {"data", base64_data}, {"mimeType", mime_type}};
}

}  // namespace ask_continue
