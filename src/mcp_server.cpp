#include "mcp_server.hpp"

#include <exception>
#include <iostream>
#include <string>
#include <thread>
#include <utility>

namespace ask_continue {
namespace {

constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kInternalError = -32603;

static std::string Trim(const std::string& s) {
  size_t start = 0;
  while (start < s.size() && (s[start] == ' ' || s[start] == '\t' || s[start] == '\r')) start++;
  size_t end = s.size();
  while (end > start && (s[end - 1] == ' ' || s[end - 1] == '\t' || s[end - 1] == '\r')) end--;
  return s.substr(start, end - start);
}

static nlohmann::json ToolCallResult(const ToolResult& r) {
  nlohmann::json content = r.content.is_array() ? r.content : nlohmann::json::array();
  if (!r.ok && content.empty()) content.push_back(TextContent(r.error.empty() ? "tool failed" : r.error));
  return {{"content", content}, {"isError", !r.ok}};
}

}  // namespace

nlohmann::json JsonRpcResult(const nlohmann::json& id, nlohmann::json result) {
  return {{"jsonrpc", "2.0"}, {"id", id}, {"result", std::move(result)}};
}

nlohmann::json JsonRpcError(const nlohmann::json& id, int code, const std::string& message) {
  return {{"jsonrpc", "2.0"}, {"id", id}, {"error", {{"code", code}, {"message", message}}}};
}

McpStdioServer::McpStdioServer(ToolRegistry* tools, std::string name, std::string version)
    : tools_(tools), name_(std::move(name)), version_(std::move(version)), shared_(std::make_shared<Shared>()) {}

void McpStdioServer::Run(std::istream& in, std::ostream& out) {
  std::string line;
  while (std::getline(in, line)) {
    HandleLine(line, out);
  }
  std::cerr << "[mcp] input closed in_flight=" << InFlight() << "\n";
}

void McpStdioServer::HandleLine(const std::string& line, std::ostream& out) {
  const auto text = Trim(line);
  if (text.empty()) return;
  auto msg = nlohmann::json::parse(text, nullptr, false);
  if (msg.is_discarded()) {
    Write(shared_.get(), out, JsonRpcError(nullptr, kParseError, "Parse error"));
    return;
  }
  auto reply = Dispatch(msg, out);
  if (reply) Write(shared_.get(), out, *reply);
}

std::optional<nlohmann::json> McpStdioServer::Dispatch(const nlohmann::json& msg, std::ostream& out) {
  if (!msg.is_object() || !msg.contains("method") || !msg["method"].is_string()) {
    const auto id = msg.is_object() && msg.contains("id") ? msg["id"] : nlohmann::json();
    return JsonRpcError(id, kInvalidRequest, "Invalid Request: missing 'method' field");
  }
  const auto method = msg["method"].get<std::string>();
  const bool is_notification = !msg.contains("id");
  const auto id = is_notification ? nlohmann::json() : msg["id"];

  if (is_notification) {
    std::cerr << "[mcp] notification method=" << method << "\n";
    return std::nullopt;
  }

  if (method == "initialize") {
    nlohmann::json result;
    result["protocolVersion"] = "2024-11-05";
    result["capabilities"] = {{"tools", {{"listChanged", false}}}};
    result["serverInfo"] = {{"name", name_}, {"version", version_}};
    return JsonRpcResult(id, std::move(result));
  }
  if (method == "ping") return JsonRpcResult(id, nlohmann::json::object());
  if (method == "tools/list") {
    nlohmann::json list = nlohmann::json::array();
    for (const auto& schema : tools_->ListSchemas()) {
      list.push_back({{"name", schema.name}, {"description", schema.description}, {"inputSchema", schema.input_schema}});
    }
    return JsonRpcResult(id, {{"tools", list}});
  }
  if (method == "tools/call") {
    const auto params = msg.contains("params") ? msg["params"] : nlohmann::json::object();
    if (!params.is_object() || !params.contains("name") || !params["name"].is_string()) {
      return JsonRpcError(id, kInvalidParams, "Invalid params: missing 'name' field");
    }
    const auto name = params["name"].get<std::string>();
    if (!tools_->HasTool(name)) return JsonRpcError(id, kInvalidParams, "Tool not found: " + name);
    StartToolCall(id, params, out);
    return std::nullopt;
  }
  return JsonRpcError(id, kMethodNotFound, "Method not found: " + method);
}

void McpStdioServer::StartToolCall(const nlohmann::json& id, const nlohmann::json& params, std::ostream& out) {
  const auto name = params["name"].get<std::string>();
  auto handler = tools_->GetHandler(name);
  if (!handler) {
    Write(shared_.get(), out, JsonRpcError(id, kInvalidParams, "Tool not found: " + name));
    return;
  }
  nlohmann::json arguments = params.contains("arguments") ? params["arguments"] : nlohmann::json::object();
  const std::string tool_call_id = id.is_string() ? id.get<std::string>() : id.dump();
  std::cerr << "[mcp] tools/call id=" << tool_call_id << " name=" << name << "\n";

  {
    std::lock_guard<std::mutex> lock(shared_->state_mu);
    shared_->in_flight++;
  }
  std::thread([shared = shared_, &out, id, tool_call_id, arguments = std::move(arguments),
               handler = std::move(*handler)]() {
    nlohmann::json reply;
    try {
      reply = JsonRpcResult(id, ToolCallResult(handler(tool_call_id, arguments)));
    } catch (const std::exception& e) {
      reply = JsonRpcError(id, kInternalError, std::string("Internal error: ") + e.what());
    }
    Write(shared.get(), out, reply);
    {
      std::lock_guard<std::mutex> lock(shared->state_mu);
      shared->in_flight--;
    }
    shared->idle_cv.notify_all();
  }).detach();
}

void McpStdioServer::Write(Shared* shared, std::ostream& out, const nlohmann::json& msg) {
  std::lock_guard<std::mutex> lock(shared->write_mu);
  out << msg.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
  out.flush();
}

int McpStdioServer::InFlight() const {
  std::lock_guard<std::mutex> lock(shared_->state_mu);
  return shared_->in_flight;
}

void McpStdioServer::WaitForIdle() const {
  std::unique_lock<std::mutex> lock(shared_->state_mu);
  shared_->idle_cv.wait(lock, [this]() { return shared_->in_flight == 0; });
}

}  // namespace ask_continue
