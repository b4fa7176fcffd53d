#pragma once

#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

namespace ask_continue {

enum class ResolvedKind {
  kAnswered,
  kCancelled,
  kFailed,
};

struct ResolvedResult {
  ResolvedKind kind = ResolvedKind::kFailed;
  std::string text;

  static ResolvedResult Answered(std::string text) { return {ResolvedKind::kAnswered, std::move(text)}; }
  static ResolvedResult Cancelled() { return {ResolvedKind::kCancelled, {}}; }
  static ResolvedResult Failed(std::string detail) { return {ResolvedKind::kFailed, std::move(detail)}; }
};

// Single-assignment result container. The paired future is handed to the
// waiter once; Resolve() succeeds exactly once and may be called from any
// thread.
class ResultSlot {
 public:
  ResultSlot() = default;
  ResultSlot(const ResultSlot&) = delete;
  ResultSlot& operator=(const ResultSlot&) = delete;

  std::future<ResolvedResult> TakeFuture();
  bool Resolve(ResolvedResult result);
  bool IsResolved() const;

 private:
  mutable std::mutex mu_;
  std::promise<ResolvedResult> promise_;
  bool resolved_ = false;
};

struct PendingRequest {
  std::string id;
  std::string reason;
  ResultSlot slot;
};

class RequestRegistry {
 public:
  RequestRegistry() = default;
  ~RequestRegistry();
  RequestRegistry(const RequestRegistry&) = delete;
  RequestRegistry& operator=(const RequestRegistry&) = delete;

  // Returns nullopt when `id` is already pending.
  std::optional<std::future<ResolvedResult>> Register(const std::string& id, std::string reason);

  // Removes the entry and resolves its slot. False when `id` is unknown or
  // was already resolved.
  bool Resolve(const std::string& id, ResolvedResult result);

  bool Remove(const std::string& id);
  bool Contains(const std::string& id) const;
  size_t Size() const;

 private:
  mutable std::mutex mu_;
  std::unordered_map<std::string, std::unique_ptr<PendingRequest>> pending_;
};

std::string NewRequestId();

}  // namespace ask_continue
