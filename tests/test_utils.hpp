#pragma once

#include "config.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <mutex>
#include <random>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

namespace ask_continue::test {

// Scratch directory removed on destruction.
class TempDir {
 public:
  TempDir() {
    std::random_device rd;
    path_ = std::filesystem::temp_directory_path() /
            ("ask-continue-test-" + std::to_string(rd()) + "-" + std::to_string(rd()));
    std::filesystem::create_directories(path_);
  }
  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }
  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  const std::filesystem::path& path() const { return path_; }
  std::string str() const { return path_.string(); }

  void Write(const std::string& name, const std::string& content) const {
    std::ofstream out(path_ / name, std::ios::binary);
    out << content;
  }

 private:
  std::filesystem::path path_;
};

// Returns a loopback port that had no listener a moment ago.
inline int UnusedPort() {
  httplib::Server probe;
  const int port = probe.bind_to_any_port("127.0.0.1");
  probe.stop();
  return port;
}

// Picks a start for a callback port range so parallel test binaries rarely
// collide.
inline int CallbackPortBase() {
  std::random_device rd;
  return 40000 + static_cast<int>(rd() % 15000);
}

inline BridgeConfig TestConfig(const std::string& port_file_dir) {
  BridgeConfig cfg;
  cfg.port_file_dir = port_file_dir;
  cfg.default_companion_port = UnusedPort();
  cfg.callback_port_start = CallbackPortBase();
  cfg.callback_bind_attempts = 50;
  cfg.max_connect_rounds = 2;
  cfg.retry_interval = std::chrono::milliseconds(50);
  cfg.ask_timeout_seconds = 2;
  return cfg;
}

// Plays the companion side: serves POST /ask on a loopback port and can post
// replies back to the callback port it was given.
class FakeCompanion {
 public:
  using AskResponder = std::function<void(const nlohmann::json& ask, httplib::Response& res)>;

  FakeCompanion() {
    server_.Post("/ask", [this](const httplib::Request& req, httplib::Response& res) {
      auto body = nlohmann::json::parse(req.body, nullptr, false);
      AskResponder responder;
      {
        std::lock_guard<std::mutex> lock(mu_);
        asks_.push_back(body);
        responder = responder_;
      }
      if (responder) {
        responder(body, res);
        return;
      }
      res.status = 200;
      res.set_content(R"({"success": true})", "application/json");
    });
    port_ = server_.bind_to_any_port("127.0.0.1");
    thread_ = std::thread([this]() { server_.listen_after_bind(); });
    while (!server_.is_running()) std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }

  ~FakeCompanion() {
    server_.stop();
    if (thread_.joinable()) thread_.join();
  }

  FakeCompanion(const FakeCompanion&) = delete;
  FakeCompanion& operator=(const FakeCompanion&) = delete;

  int port() const { return port_; }

  void SetResponder(AskResponder responder) {
    std::lock_guard<std::mutex> lock(mu_);
    responder_ = std::move(responder);
  }

  std::vector<nlohmann::json> Asks() const {
    std::lock_guard<std::mutex> lock(mu_);
    return asks_;
  }

  // Blocks until at least `n` asks arrived or the timeout passes.
  bool WaitForAsks(size_t n, std::chrono::milliseconds timeout = std::chrono::seconds(10)) const {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
      {
        std::lock_guard<std::mutex> lock(mu_);
        if (asks_.size() >= n) return true;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return false;
  }

 private:
  httplib::Server server_;
  std::thread thread_;
  int port_ = 0;
  mutable std::mutex mu_;
  AskResponder responder_;
  std::vector<nlohmann::json> asks_;
};

// POSTs a /response body to a callback listener and returns the HTTP status
// (-1 on transport failure).
inline int PostResponse(int callback_port, const std::string& body, std::string* out_body = nullptr) {
  httplib::Client cli("127.0.0.1", callback_port);
  cli.set_connection_timeout(2);
  cli.set_read_timeout(5);
  auto res = cli.Post("/response", body, "application/json");
  if (!res) return -1;
  if (out_body) *out_body = res->body;
  return res->status;
}

inline std::string ResponseBody(const std::string& request_id, const std::string& user_input, bool cancelled) {
  nlohmann::json j;
  j["requestId"] = request_id;
  j["userInput"] = user_input;
  j["cancelled"] = cancelled;
  return j.dump();
}

}  // namespace ask_continue::test
