#pragma once

#include "callback_listener.hpp"
#include "companion_connector.hpp"
#include "request_registry.hpp"

#include <string>

namespace ask_continue {

enum class AskOutcomeKind {
  kAnswered,
  kCancelled,
  kConnectFailed,
};

const char* AskOutcomeKindName(AskOutcomeKind kind);

struct AskOutcome {
  AskOutcomeKind kind = AskOutcomeKind::kConnectFailed;
  // User reply for kAnswered, failure detail for kConnectFailed.
  std::string text;
  std::string request_id;
};

class AskCoordinator {
 public:
  AskCoordinator(RequestRegistry* registry, CompanionConnector* connector, const CallbackListener* listener);

  // Hands `reason` to a companion and blocks until it answers or cancels.
  // Never times out once a companion has accepted the request.
  AskOutcome AskAndWait(const std::string& reason);

 private:
  RequestRegistry* registry_;
  CompanionConnector* connector_;
  const CallbackListener* listener_;
};

}  // namespace ask_continue
