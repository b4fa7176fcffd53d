#include "companion_connector.hpp"

#include "port_discovery.hpp"

#include <iostream>
#include <sstream>
#include <thread>
#include <utility>

namespace ask_continue {
namespace {

static std::string JoinPorts(const std::vector<int>& ports) {
  std::ostringstream oss;
  for (size_t i = 0; i < ports.size(); i++) {
    if (i > 0) oss << ",";
    oss << ports[i];
  }
  return oss.str();
}

}  // namespace

CompanionConnector::CompanionConnector(BridgeConfig cfg) : cfg_(std::move(cfg)) {
  discover_ = [this]() { return DiscoverCompanionPorts(cfg_.port_file_dir, cfg_.default_companion_port); };
  attempt_ = [this](int port, const std::string& request_id, const std::string& reason, int callback_port) {
    return AskCompanion(cfg_.companion_host, port, request_id, reason, callback_port, cfg_.ask_timeout_seconds);
  };
  sleep_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
}

CompanionConnector::CompanionConnector(BridgeConfig cfg, DiscoverFn discover, AttemptFn attempt, SleepFn sleep)
    : cfg_(std::move(cfg)), discover_(std::move(discover)), attempt_(std::move(attempt)), sleep_(std::move(sleep)) {}

ConnectResult CompanionConnector::Connect(const std::string& request_id,
                                          const std::string& reason,
                                          int callback_port) {
  ConnectResult out;
  const int max_rounds = cfg_.max_connect_rounds > 0 ? cfg_.max_connect_rounds : 1;

  for (int round = 1; round <= max_rounds; round++) {
    out.rounds = round;
    std::cerr << "[retry] request_id=" << request_id << " round=" << round << "/" << max_rounds << "\n";

    const auto ports = discover_();
    std::cerr << "[discovery] ports=" << JoinPorts(ports) << "\n";

    for (int port : ports) {
      auto outcome = attempt_(port, request_id, reason, callback_port);
      std::cerr << "[connect] request_id=" << request_id << " port=" << port
                << " outcome=" << AttemptKindName(outcome.kind);
      if (!outcome.detail.empty()) std::cerr << " detail=" << outcome.detail;
      std::cerr << "\n";
      if (outcome.accepted()) {
        out.ok = true;
        out.accepted_port = port;
        out.last_error.reset();
        return out;
      }
      out.last_error = outcome.detail;
    }

    if (round < max_rounds) {
      std::cerr << "[retry] request_id=" << request_id << " sleeping_ms=" << cfg_.retry_interval.count() << "\n";
      sleep_(cfg_.retry_interval);
    } else {
      std::cerr << "[retry] request_id=" << request_id << " giving up after " << max_rounds << " rounds\n";
    }
  }
  return out;
}

}  // namespace ask_continue
