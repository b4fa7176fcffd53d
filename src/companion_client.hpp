#pragma once

#include <string>

namespace ask_continue {

enum class AttemptKind {
  kAccepted,
  kRefused,
  kUnreachable,
  kTimedOut,
};

struct AttemptOutcome {
  AttemptKind kind = AttemptKind::kUnreachable;
  std::string detail;

  bool accepted() const { return kind == AttemptKind::kAccepted; }
};

const char* AttemptKindName(AttemptKind kind);

// One POST /ask to a companion candidate. Acceptance requires an explicit
// {"success": true} in a 2xx body.
AttemptOutcome AskCompanion(const std::string& host,
                            int port,
                            const std::string& request_id,
                            const std::string& reason,
                            int callback_port,
                            int timeout_seconds);

}  // namespace ask_continue
