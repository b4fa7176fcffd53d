#pragma once

#include "tooling.hpp"

#include <nlohmann/json.hpp>

#include <condition_variable>
#include <iosfwd>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace ask_continue {

// Newline-delimited JSON-RPC 2.0 MCP server. tools/call runs on a detached
// worker per call so one long wait never blocks the stream.
class McpStdioServer {
 public:
  McpStdioServer(ToolRegistry* tools, std::string name, std::string version);
  McpStdioServer(const McpStdioServer&) = delete;
  McpStdioServer& operator=(const McpStdioServer&) = delete;

  // Returns at end of input without waiting for in-flight tool calls.
  void Run(std::istream& in, std::ostream& out);

  // Handles one raw line; synchronous replies are written immediately.
  void HandleLine(const std::string& line, std::ostream& out);

  int InFlight() const;
  void WaitForIdle() const;

 private:
  struct Shared {
    std::mutex write_mu;
    mutable std::mutex state_mu;
    mutable std::condition_variable idle_cv;
    int in_flight = 0;
  };

  ToolRegistry* tools_;
  std::string name_;
  std::string version_;
  std::shared_ptr<Shared> shared_;

  std::optional<nlohmann::json> Dispatch(const nlohmann::json& msg, std::ostream& out);
  void StartToolCall(const nlohmann::json& id, const nlohmann::json& params, std::ostream& out);
  static void Write(Shared* shared, std::ostream& out, const nlohmann::json& msg);
};

nlohmann::json JsonRpcResult(const nlohmann::json& id, nlohmann::json result);
nlohmann::json JsonRpcError(const nlohmann::json& id, int code, const std::string& message);

}  // namespace ask_continue
