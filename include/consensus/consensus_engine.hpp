// Copyright (c) 2024 Chaincraft
// Distributed under the MIT software license

#ifndef CHAINCRAFT_CONSENSUS_CONSENSUS_ENGINE_HPP
#define CHAINCRAFT_CONSENSUS_CONSENSUS_ENGINE_HPP

#include "consensus/committed_state.hpp"
#include "consensus/validator.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace chaincraft {
namespace consensus {

// ConsensusEngine - applies the configured Validator and owns the committed
// history. Thread-safe; every submit is serialised so order indices are
// strictly increasing and a digest is Accepted at most once per node.
class ConsensusEngine {
public:
  // LIFETIME: validator is shared and must be non-null
  explicit ConsensusEngine(std::shared_ptr<const Validator> validator);

  ConsensusDecision submit(const primitives::SharedObject &object);

  // Candidates that arrived together. Processed in ascending digest order so
  // that among conflicting candidates the lowest digest wins. Results are
  // returned in that processing order.
  std::vector<std::pair<primitives::SharedObjectPtr, ConsensusDecision>>
  submit_round(std::vector<primitives::SharedObjectPtr> candidates);

  bool is_committed(const primitives::Digest &digest) const;
  std::optional<uint64_t> order_index_of(const primitives::Digest &digest) const;
  std::optional<primitives::ObjectKind>
  kind_of(const primitives::Digest &digest) const;
  uint64_t committed_count() const;

  // Committed digests in order_index order
  std::vector<primitives::Digest> committed_history() const;

  // Number of validator invocations (tests use it to prove idempotence)
  uint64_t validation_count() const { return validation_count_.load(); }

  const Validator &validator() const { return *validator_; }

private:
  ConsensusDecision submit_locked(const primitives::SharedObject &object);

  std::shared_ptr<const Validator> validator_;

  mutable std::mutex mutex_;
  CommittedState state_;
  uint64_t next_order_index_{1};

  std::atomic<uint64_t> validation_count_{0};
};

} // namespace consensus
} // namespace chaincraft

#endif // CHAINCRAFT_CONSENSUS_CONSENSUS_ENGINE_HPP
