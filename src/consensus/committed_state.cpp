// Copyright (c) 2024 Chaincraft
// Distributed under the MIT software license

#include "consensus/committed_state.hpp"

namespace chaincraft {
namespace consensus {

ConsensusDecision ConsensusDecision::Accept(uint64_t order_index) {
  ConsensusDecision d;
  d.outcome = Outcome::Accepted;
  d.order_index = order_index;
  return d;
}

ConsensusDecision ConsensusDecision::Reject(std::string reason) {
  ConsensusDecision d;
  d.outcome = Outcome::Rejected;
  d.reason = std::move(reason);
  return d;
}

ConsensusDecision ConsensusDecision::Defer(const primitives::Digest &missing) {
  ConsensusDecision d;
  d.outcome = Outcome::Deferred;
  d.missing_dependency = missing;
  d.reason = "missing dependency " + missing.ToShortString();
  return d;
}

const char *OutcomeName(ConsensusDecision::Outcome outcome) {
  switch (outcome) {
  case ConsensusDecision::Outcome::Accepted:
    return "accepted";
  case ConsensusDecision::Outcome::Rejected:
    return "rejected";
  case ConsensusDecision::Outcome::Deferred:
    return "deferred";
  }
  return "unknown";
}

bool CommittedState::is_committed(const primitives::Digest &digest) const {
  return entries_.find(digest) != entries_.end();
}

std::optional<uint64_t>
CommittedState::order_index_of(const primitives::Digest &digest) const {
  auto it = entries_.find(digest);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  return it->second.order_index;
}

std::optional<primitives::Digest>
CommittedState::conflict_holder(const std::string &key) const {
  auto it = conflict_keys_.find(key);
  if (it == conflict_keys_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<primitives::ObjectKind>
CommittedState::kind_of(const primitives::Digest &digest) const {
  auto it = entries_.find(digest);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  return it->second.kind;
}

void CommittedState::commit(const primitives::Digest &digest,
                            primitives::ObjectKind kind, uint64_t order_index,
                            const std::optional<std::string> &conflict_key) {
  entries_[digest] = Entry{order_index, kind};
  order_.push_back(digest);
  if (conflict_key) {
    conflict_keys_.emplace(*conflict_key, digest);
  }
}

} // namespace consensus
} // namespace chaincraft
