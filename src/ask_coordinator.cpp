#include "ask_coordinator.hpp"

#include "config.hpp"

#include <future>
#include <iostream>
#include <optional>
#include <string>
#include <utility>

namespace ask_continue {

const char* AskOutcomeKindName(AskOutcomeKind kind) {
  switch (kind) {
    case AskOutcomeKind::kAnswered:
      return "answered";
    case AskOutcomeKind::kCancelled:
      return "cancelled";
    case AskOutcomeKind::kConnectFailed:
      return "connect_failed";
  }
  return "unknown";
}

AskCoordinator::AskCoordinator(RequestRegistry* registry,
                               CompanionConnector* connector,
                               const CallbackListener* listener)
    : registry_(registry), connector_(connector), listener_(listener) {}

AskOutcome AskCoordinator::AskAndWait(const std::string& reason) {
  AskOutcome out;
  out.kind = AskOutcomeKind::kConnectFailed;

  if (listener_->State() != ListenerState::kBound) {
    const auto detail = listener_->FailureDetail();
    out.text = "callback listener is not available" + (detail.empty() ? std::string() : ": " + detail);
    std::cerr << "[ask] refused: " << out.text << "\n";
    return out;
  }
  const int callback_port = listener_->Port();

  std::optional<std::future<ResolvedResult>> fut;
  std::string request_id;
  while (!fut) {
    request_id = NewRequestId();
    fut = registry_->Register(request_id, reason);
  }
  out.request_id = request_id;
  std::cerr << "[ask] request_id=" << request_id << " reason=" << TruncateForLog(reason, 200) << "\n";

  auto connected = connector_->Connect(request_id, reason, callback_port);
  // A companion can still answer after reporting a failure; if the listener
  // already took the entry, its result wins.
  if (!connected.ok && registry_->Remove(request_id)) {
    out.text = "could not reach the companion after " + std::to_string(connected.rounds) + " attempts.";
    if (connected.last_error && !connected.last_error->empty()) out.text += " " + *connected.last_error;
    std::cerr << "[ask] request_id=" << request_id << " connect_failed detail=" << out.text << "\n";
    return out;
  }

  if (connected.ok) {
    std::cerr << "[ask] request_id=" << request_id << " accepted port=" << connected.accepted_port
              << ", waiting for reply\n";
  }
  auto resolved = fut->get();
  switch (resolved.kind) {
    case ResolvedKind::kAnswered:
      out.kind = AskOutcomeKind::kAnswered;
      out.text = std::move(resolved.text);
      break;
    case ResolvedKind::kCancelled:
      out.kind = AskOutcomeKind::kCancelled;
      break;
    case ResolvedKind::kFailed:
      out.kind = AskOutcomeKind::kConnectFailed;
      out.text = std::move(resolved.text);
      break;
  }
  std::cerr << "[ask] request_id=" << request_id << " outcome=" << AskOutcomeKindName(out.kind) << "\n";
  return out;
}

}  // namespace ask_continue
