#include "callback_listener.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <exception>
#include <iostream>
#include <string>
#include <utility>

#ifdef _WIN32
#include <winsock2.h>
#include <ws2tcpip.h>
#pragma comment(lib, "Ws2_32.lib")
#else
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#endif

namespace ask_continue {
namespace {

constexpr int kPortFree = 0;
constexpr int kBadAddress = -1;

#ifdef _WIN32
constexpr int kAddrInUse = WSAEADDRINUSE;
#else
constexpr int kAddrInUse = EADDRINUSE;
#endif

static int LastSocketError() {
#ifdef _WIN32
  return WSAGetLastError();
#else
  return errno;
#endif
}

static std::string SocketErrorText(int code) {
  if (code == kBadAddress) return "invalid address";
#ifdef _WIN32
  char buf[256] = {0};
  const DWORD n = FormatMessageA(FORMAT_MESSAGE_FROM_SYSTEM | FORMAT_MESSAGE_IGNORE_INSERTS, nullptr,
                                 static_cast<DWORD>(code), 0, buf, sizeof(buf), nullptr);
  std::string text(buf, n);
  while (!text.empty() && (text.back() == '\r' || text.back() == '\n' || text.back() == '.')) text.pop_back();
  if (text.empty()) text = "socket error";
#else
  std::string text = std::strerror(code);
#endif
  return text + " (code " + std::to_string(code) + ")";
}

// Binds and immediately releases a throwaway socket on host:port. Returns
// kPortFree, kBadAddress or the socket error of the failed step.
static int ProbeBind(const std::string& host, int port) {
#ifdef _WIN32
  WSADATA wsa;
  WSAStartup(MAKEWORD(2, 2), &wsa);
  SOCKET fd = socket(AF_INET, SOCK_STREAM, IPPROTO_TCP);
  if (fd == INVALID_SOCKET) {
    const int e = LastSocketError();
    WSACleanup();
    return e;
  }
#else
  int fd = socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) return LastSocketError();
#endif
#ifndef _WIN32
  // Winsock lets SO_REUSEADDR bind over a live listener.
  int yes = 1;
  setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, reinterpret_cast<const char*>(&yes), sizeof(yes));
#endif

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(static_cast<uint16_t>(port));
  int result = kPortFree;
  if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) <= 0) {
    result = kBadAddress;
  } else if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
    result = LastSocketError();
  }
#ifdef _WIN32
  closesocket(fd);
  WSACleanup();
#else
  close(fd);
#endif
  return result;
}

static void JsonReply(httplib::Response& res, int status, const nlohmann::json& body) {
  res.status = status;
  res.set_content(body.dump(), "application/json");
}

static void JsonError(httplib::Response& res, int status, const std::string& message) {
  JsonReply(res, status, {{"error", message}});
}

}  // namespace

const char* ListenerStateName(ListenerState state) {
  switch (state) {
    case ListenerState::kBinding:
      return "binding";
    case ListenerState::kBound:
      return "bound";
    case ListenerState::kFailed:
      return "failed";
  }
  return "unknown";
}

CallbackListener::CallbackListener(BridgeConfig cfg, RequestRegistry* registry)
    : cfg_(std::move(cfg)), registry_(registry) {
  SetupRoutes();
}

CallbackListener::~CallbackListener() {
  Stop();
}

void CallbackListener::SetupRoutes() {
  server_.set_default_headers({{"Access-Control-Allow-Origin", "*"},
                               {"Access-Control-Allow-Methods", "POST, OPTIONS"},
                               {"Access-Control-Allow-Headers", "Content-Type"}});

  server_.Options(R"(.*)", [](const httplib::Request&, httplib::Response& res) { res.status = 200; });

  server_.Post("/response", [this](const httplib::Request& req, httplib::Response& res) { HandleResponse(req, res); });

  server_.set_exception_handler([](const httplib::Request&, httplib::Response& res, std::exception_ptr ep) {
    std::string message = "unknown exception";
    if (ep) {
      try {
        std::rethrow_exception(ep);
      } catch (const std::exception& e) {
        message = e.what();
      } catch (...) {
        message = "non-standard exception";
      }
    }
    std::cerr << "[listener] handler error: " << message << "\n";
    JsonError(res, 500, message);
  });

  server_.set_error_handler([](const httplib::Request&, httplib::Response& res) {
    if (!res.body.empty()) return;
    JsonError(res, res.status, res.status == 404 ? "not found" : "bad request");
  });

  server_.set_keep_alive_timeout(5);
  server_.set_read_timeout(30);
  server_.set_write_timeout(30);
}

void CallbackListener::HandleResponse(const httplib::Request& req, httplib::Response& res) {
  auto body = nlohmann::json::parse(req.body, nullptr, false);
  if (body.is_discarded() || !body.is_object()) {
    JsonError(res, 400, "invalid JSON body");
    return;
  }
  if (!body.contains("requestId") || !body["requestId"].is_string()) {
    JsonError(res, 400, "missing required field: requestId");
    return;
  }
  std::string user_input;
  if (body.contains("userInput") && !body["userInput"].is_null()) {
    if (!body["userInput"].is_string()) {
      JsonError(res, 400, "field userInput must be a string");
      return;
    }
    user_input = body["userInput"].get<std::string>();
  }
  bool cancelled = false;
  if (body.contains("cancelled") && !body["cancelled"].is_null()) {
    if (!body["cancelled"].is_boolean()) {
      JsonError(res, 400, "field cancelled must be a boolean");
      return;
    }
    cancelled = body["cancelled"].get<bool>();
  }

  const auto request_id = body["requestId"].get<std::string>();
  auto result = cancelled ? ResolvedResult::Cancelled() : ResolvedResult::Answered(std::move(user_input));
  if (!registry_->Resolve(request_id, std::move(result))) {
    std::cerr << "[listener] unknown request_id=" << request_id << "\n";
    JsonError(res, 404, "Request not found");
    return;
  }

  std::cerr << "[listener] resolved request_id=" << request_id << " cancelled=" << (cancelled ? 1 : 0) << "\n";
  JsonReply(res, 200, {{"success", true}});
}

void CallbackListener::Start() {
  std::lock_guard<std::mutex> lock(mu_);
  if (thread_.joinable()) return;
  thread_ = std::thread([this]() {
    Run();
    finished_ = true;
  });
}

void CallbackListener::Stop() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (!thread_.joinable()) return;
    stop_requested_ = true;
  }
  WaitUntilReady();
  // listen_after_bind may not have flipped the server to running yet.
  while (!finished_) {
    server_.stop();
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  thread_.join();
}

ListenerState CallbackListener::WaitUntilReady() const {
  std::unique_lock<std::mutex> lock(mu_);
  ready_cv_.wait(lock, [this]() { return state_ != ListenerState::kBinding; });
  return state_;
}

ListenerState CallbackListener::State() const {
  std::lock_guard<std::mutex> lock(mu_);
  return state_;
}

int CallbackListener::Port() const {
  std::lock_guard<std::mutex> lock(mu_);
  return port_;
}

std::string CallbackListener::FailureDetail() const {
  std::lock_guard<std::mutex> lock(mu_);
  return failure_;
}

void CallbackListener::MarkBound(int port) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    state_ = ListenerState::kBound;
    port_ = port;
  }
  ready_cv_.notify_all();
}

void CallbackListener::MarkFailed(std::string detail) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    state_ = ListenerState::kFailed;
    failure_ = std::move(detail);
  }
  ready_cv_.notify_all();
}

void CallbackListener::Run() {
  const int attempts = cfg_.callback_bind_attempts > 0 ? cfg_.callback_bind_attempts : 1;
  const int first = cfg_.callback_port_start;
  const int last = first + attempts - 1;

  for (int port = first; port <= last; port++) {
    const int probe = ProbeBind(cfg_.callback_host, port);
    if (probe == kAddrInUse) {
      std::cerr << "[listener] port " << port << " in use, trying " << (port + 1) << "\n";
      continue;
    }
    if (probe != kPortFree) {
      const std::string detail = "bind " + cfg_.callback_host + ":" + std::to_string(port) + " failed: " +
                                 SocketErrorText(probe);
      std::cerr << "[listener] " << detail << "\n";
      MarkFailed(detail);
      return;
    }
    // Lost a race with another process between probe and bind.
    if (!server_.bind_to_port(cfg_.callback_host, port)) {
      std::cerr << "[listener] port " << port << " taken during bind, trying " << (port + 1) << "\n";
      continue;
    }

    std::cerr << "[listener] bound host=" << cfg_.callback_host << " port=" << port << "\n";
    MarkBound(port);
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (stop_requested_) return;
    }
    const bool ok = server_.listen_after_bind();
    std::cerr << "[listener] listen returned ok=" << (ok ? 1 : 0) << "\n";
    return;
  }

  const std::string detail =
      "no free callback port in range " + std::to_string(first) + "-" + std::to_string(last);
  std::cerr << "[listener] " << detail << "\n";
  MarkFailed(detail);
}

}  // namespace ask_continue
