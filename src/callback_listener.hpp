#pragma once

#include "config.hpp"
#include "request_registry.hpp"

#include <httplib.h>

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

namespace ask_continue {

enum class ListenerState {
  kBinding,
  kBound,
  kFailed,
};

const char* ListenerStateName(ListenerState state);

// Receives the companion's POST /response on a dedicated thread and resolves
// the matching entry in the registry.
class CallbackListener {
 public:
  CallbackListener(BridgeConfig cfg, RequestRegistry* registry);
  ~CallbackListener();

  CallbackListener(const CallbackListener&) = delete;
  CallbackListener& operator=(const CallbackListener&) = delete;

  void Start();
  void Stop();

  // Blocks until binding has finished one way or the other.
  ListenerState WaitUntilReady() const;

  ListenerState State() const;
  int Port() const;
  std::string FailureDetail() const;

 private:
  BridgeConfig cfg_;
  RequestRegistry* registry_;
  httplib::Server server_;
  std::thread thread_;

  mutable std::mutex mu_;
  mutable std::condition_variable ready_cv_;
  ListenerState state_ = ListenerState::kBinding;
  int port_ = 0;
  std::string failure_;
  bool stop_requested_ = false;
  std::atomic<bool> finished_{false};

  void Run();
  void SetupRoutes();
  void MarkBound(int port);
  void MarkFailed(std::string detail);
  void HandleResponse(const httplib::Request& req, httplib::Response& res);
};

}  // namespace ask_continue
