// Copyright (c) 2024 Chaincraft
// Distributed under the MIT software license

#include "gossip/deferred_pool.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"

namespace chaincraft {
namespace gossip {

const char *ParkResultName(DeferredPool::ParkResult result) {
  switch (result) {
  case DeferredPool::ParkResult::Parked:
    return "parked";
  case DeferredPool::ParkResult::AlreadyParked:
    return "already-parked";
  case DeferredPool::ParkResult::PoolFull:
    return "pool-full";
  case DeferredPool::ParkResult::RetriesExhausted:
    return "retries-exhausted";
  }
  return "unknown";
}

DeferredPool::DeferredPool(const Config &config) : config_(config) {}

DeferredPool::ParkResult DeferredPool::park(primitives::SharedObjectPtr object,
                                            const primitives::Digest &missing,
                                            uint32_t attempt) {
  if (attempt > config_.max_retries) {
    return ParkResult::RetriesExhausted;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (parked_.count(object->digest) > 0) {
    return ParkResult::AlreadyParked;
  }
  if (parked_.size() >= config_.max_entries) {
    return ParkResult::PoolFull;
  }

  parked_.emplace(object->digest, missing);
  DeferredEntry entry;
  entry.object = std::move(object);
  entry.missing = missing;
  entry.attempt = attempt;
  entry.parked_at = util::GetSteadyTime();
  by_dependency_[missing].push_back(std::move(entry));
  return ParkResult::Parked;
}

std::vector<DeferredEntry>
DeferredPool::release(const primitives::Digest &dependency) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = by_dependency_.find(dependency);
  if (it == by_dependency_.end()) {
    return {};
  }
  std::vector<DeferredEntry> released = std::move(it->second);
  by_dependency_.erase(it);
  for (const auto &entry : released) {
    parked_.erase(entry.object->digest);
  }
  LOG_GOSSIP_TRACE("released {} objects waiting on {}", released.size(),
                   dependency.ToShortString());
  return released;
}

std::vector<DeferredEntry> DeferredPool::expire() {
  const auto now = util::GetSteadyTime();
  std::vector<DeferredEntry> expired;

  std::lock_guard<std::mutex> lock(mutex_);
  for (auto it = by_dependency_.begin(); it != by_dependency_.end();) {
    auto &entries = it->second;
    for (auto e = entries.begin(); e != entries.end();) {
      if (now - e->parked_at >= config_.ttl) {
        parked_.erase(e->object->digest);
        expired.push_back(std::move(*e));
        e = entries.erase(e);
      } else {
        ++e;
      }
    }
    if (entries.empty()) {
      it = by_dependency_.erase(it);
    } else {
      ++it;
    }
  }
  return expired;
}

bool DeferredPool::contains(const primitives::Digest &digest) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return parked_.count(digest) > 0;
}

size_t DeferredPool::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return parked_.size();
}

size_t DeferredPool::waiting_on(const primitives::Digest &dependency) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = by_dependency_.find(dependency);
  return it == by_dependency_.end() ? 0 : it->second.size();
}

} // namespace gossip
} // namespace chaincraft
