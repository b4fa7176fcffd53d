#include "request_registry.hpp"

#include <cstdint>
#include <iomanip>
#include <memory>
#include <random>
#include <sstream>
#include <utility>

namespace ask_continue {
namespace {

static uint64_t Rand64() {
  static thread_local std::mt19937_64 rng(std::random_device{}());
  return rng();
}

static std::string Hex(uint64_t v, int width) {
  std::ostringstream oss;
  oss << std::hex << std::setw(width) << std::setfill('0') << v;
  return oss.str();
}

}  // namespace

std::future<ResolvedResult> ResultSlot::TakeFuture() {
  std::lock_guard<std::mutex> lock(mu_);
  return promise_.get_future();
}

bool ResultSlot::Resolve(ResolvedResult result) {
  std::lock_guard<std::mutex> lock(mu_);
  if (resolved_) return false;
  resolved_ = true;
  promise_.set_value(std::move(result));
  return true;
}

bool ResultSlot::IsResolved() const {
  std::lock_guard<std::mutex> lock(mu_);
  return resolved_;
}

RequestRegistry::~RequestRegistry() {
  std::unordered_map<std::string, std::unique_ptr<PendingRequest>> drained;
  {
    std::lock_guard<std::mutex> lock(mu_);
    drained.swap(pending_);
  }
  for (auto& [_, req] : drained) {
    req->slot.Resolve(ResolvedResult::Failed("shutting down"));
  }
}

std::optional<std::future<ResolvedResult>> RequestRegistry::Register(const std::string& id, std::string reason) {
  auto req = std::make_unique<PendingRequest>();
  req->id = id;
  req->reason = std::move(reason);
  auto fut = req->slot.TakeFuture();

  std::lock_guard<std::mutex> lock(mu_);
  if (pending_.count(id) > 0) return std::nullopt;
  pending_.emplace(id, std::move(req));
  return fut;
}

bool RequestRegistry::Resolve(const std::string& id, ResolvedResult result) {
  std::unique_ptr<PendingRequest> req;
  {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = pending_.find(id);
    if (it == pending_.end()) return false;
    req = std::move(it->second);
    pending_.erase(it);
  }
  return req->slot.Resolve(std::move(result));
}

bool RequestRegistry::Remove(const std::string& id) {
  std::lock_guard<std::mutex> lock(mu_);
  return pending_.erase(id) > 0;
}

bool RequestRegistry::Contains(const std::string& id) const {
  std::lock_guard<std::mutex> lock(mu_);
  return pending_.count(id) > 0;
}

size_t RequestRegistry::Size() const {
  std::lock_guard<std::mutex> lock(mu_);
  return pending_.size();
}

std::string NewRequestId() {
  const uint64_t hi = Rand64();
  const uint64_t lo = Rand64();
  return "req_" + Hex(hi, 16) + Hex(lo >> 32, 8);
}

}  // namespace ask_continue
