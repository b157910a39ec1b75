// Copyright (c) 2024 Chaincraft
// Distributed under the MIT software license

#include "consensus/consensus_engine.hpp"
#include "util/logging.hpp"
#include <algorithm>
#include <stdexcept>

namespace chaincraft {
namespace consensus {

ConsensusEngine::ConsensusEngine(std::shared_ptr<const Validator> validator)
    : validator_(std::move(validator)) {
  if (!validator_) {
    throw std::invalid_argument("ConsensusEngine requires a validator");
  }
  LOG_CONSENSUS_INFO("Consensus engine using validator '{}'", validator_->name());
}

ConsensusDecision
ConsensusEngine::submit(const primitives::SharedObject &object) {
  std::lock_guard<std::mutex> lock(mutex_);
  return submit_locked(object);
}

ConsensusDecision
ConsensusEngine::submit_locked(const primitives::SharedObject &object) {
  validation_count_.fetch_add(1, std::memory_order_relaxed);
  ConsensusDecision decision = validator_->validate(object, state_);

  if (!decision.accepted()) {
    LOG_CONSENSUS_DEBUG("Object {} {}: {}", object.digest.ToShortString(),
                        OutcomeName(decision.outcome), decision.reason);
    return decision;
  }

  // A strategy that forgets to check history must still not commit twice
  if (state_.is_committed(object.digest)) {
    return ConsensusDecision::Reject("already committed");
  }

  auto key = validator_->conflict_key(object);
  if (key) {
    auto holder = state_.conflict_holder(*key);
    if (holder) {
      return ConsensusDecision::Reject("conflict on " + *key + " with " +
                                       holder->ToShortString());
    }
  }

  decision.order_index = next_order_index_++;
  state_.commit(object.digest, object.kind, decision.order_index, key);

  LOG_CONSENSUS_DEBUG("Committed {} ({}) at order_index={}",
                      object.digest.ToShortString(),
                      primitives::ObjectKindName(object.kind),
                      decision.order_index);
  return decision;
}

std::vector<std::pair<primitives::SharedObjectPtr, ConsensusDecision>>
ConsensusEngine::submit_round(
    std::vector<primitives::SharedObjectPtr> candidates) {
  candidates.erase(std::remove(candidates.begin(), candidates.end(), nullptr),
                   candidates.end());
  std::sort(candidates.begin(), candidates.end(),
            [](const primitives::SharedObjectPtr &a,
               const primitives::SharedObjectPtr &b) {
              return a->digest < b->digest;
            });

  std::vector<std::pair<primitives::SharedObjectPtr, ConsensusDecision>> results;
  results.reserve(candidates.size());

  std::lock_guard<std::mutex> lock(mutex_);
  for (auto &candidate : candidates) {
    ConsensusDecision decision = submit_locked(*candidate);
    results.emplace_back(std::move(candidate), std::move(decision));
  }
  return results;
}

bool ConsensusEngine::is_committed(const primitives::Digest &digest) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_.is_committed(digest);
}

std::optional<uint64_t>
ConsensusEngine::order_index_of(const primitives::Digest &digest) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_.order_index_of(digest);
}

std::optional<primitives::ObjectKind>
ConsensusEngine::kind_of(const primitives::Digest &digest) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_.kind_of(digest);
}

uint64_t ConsensusEngine::committed_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_.committed_count();
}

std::vector<primitives::Digest> ConsensusEngine::committed_history() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_.history();
}

} // namespace consensus
} // namespace chaincraft
