#pragma once

#include "companion_client.hpp"
#include "config.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace ask_continue {

struct ConnectResult {
  bool ok = false;
  std::optional<std::string> last_error;
  int rounds = 0;
  int accepted_port = 0;
};

// Bounded, fixed-interval retry over freshly discovered companion candidates.
class CompanionConnector {
 public:
  using DiscoverFn = std::function<std::vector<int>()>;
  using AttemptFn = std::function<AttemptOutcome(int port,
                                                 const std::string& request_id,
                                                 const std::string& reason,
                                                 int callback_port)>;
  using SleepFn = std::function<void(std::chrono::milliseconds)>;

  explicit CompanionConnector(BridgeConfig cfg);
  CompanionConnector(BridgeConfig cfg, DiscoverFn discover, AttemptFn attempt, SleepFn sleep);
  CompanionConnector(const CompanionConnector&) = delete;
  CompanionConnector& operator=(const CompanionConnector&) = delete;

  ConnectResult Connect(const std::string& request_id, const std::string& reason, int callback_port);

  const BridgeConfig& config() const { return cfg_; }

 private:
  BridgeConfig cfg_;
  DiscoverFn discover_;
  AttemptFn attempt_;
  SleepFn sleep_;
};

}  // namespace ask_continue
