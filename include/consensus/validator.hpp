// Copyright (c) 2024 Chaincraft
// Distributed under the MIT software license

#ifndef CHAINCRAFT_CONSENSUS_VALIDATOR_HPP
#define CHAINCRAFT_CONSENSUS_VALIDATOR_HPP

#include "primitives/digest.hpp"
#include "primitives/shared_object.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace chaincraft {
namespace consensus {

/**
 * ConsensusDecision - outcome of validating one candidate object
 *
 * Accepted  -> order_index is stamped by the engine at commit time
 * Rejected  -> reason explains the semantic failure (terminal)
 * Deferred  -> missing_dependency names the first digest that must be
 *              committed before the object can be re-validated
 */
struct ConsensusDecision {
  enum class Outcome { Accepted, Rejected, Deferred };

  Outcome outcome{Outcome::Rejected};
  uint64_t order_index{0};
  std::string reason;
  primitives::Digest missing_dependency;

  static ConsensusDecision Accept(uint64_t order_index = 0);
  static ConsensusDecision Reject(std::string reason);
  static ConsensusDecision Defer(const primitives::Digest &missing);

  bool accepted() const { return outcome == Outcome::Accepted; }
  bool rejected() const { return outcome == Outcome::Rejected; }
  bool deferred() const { return outcome == Outcome::Deferred; }
};

const char *OutcomeName(ConsensusDecision::Outcome outcome);

/**
 * StateView - read-only view of the committed history handed to validators
 */
class StateView {
public:
  virtual ~StateView() = default;

  virtual bool is_committed(const primitives::Digest &digest) const = 0;
  virtual std::optional<uint64_t>
  order_index_of(const primitives::Digest &digest) const = 0;
  virtual uint64_t committed_count() const = 0;

  // Digest currently holding an exclusive conflict key, if any
  virtual std::optional<primitives::Digest>
  conflict_holder(const std::string &key) const = 0;
};

/**
 * Validator - pluggable consensus strategy
 *
 * validate() must be a pure function of (object, committed view): two nodes
 * with the same committed prefix reach the same decision class. Strategies
 * hold no mutable state; the engine serialises calls, but implementations
 * must still be const-correct so one instance can be shared.
 */
class Validator {
public:
  virtual ~Validator() = default;

  virtual ConsensusDecision validate(const primitives::SharedObject &object,
                                     const StateView &view) const = 0;

  // Mutual-exclusion key. Two objects with the same key can never both be
  // committed; within a round the lower digest wins.
  virtual std::optional<std::string>
  conflict_key(const primitives::SharedObject &object) const {
    (void)object;
    return std::nullopt;
  }

  virtual std::string name() const = 0;
};

} // namespace consensus
} // namespace chaincraft

#endif // CHAINCRAFT_CONSENSUS_VALIDATOR_HPP
