// Copyright (c) 2024 Chaincraft
// Distributed under the MIT software license

#ifndef CHAINCRAFT_CONSENSUS_VALIDATORS_HPP
#define CHAINCRAFT_CONSENSUS_VALIDATORS_HPP

#include "consensus/validator.hpp"
#include "crypto/crypto_provider.hpp"
#include <memory>

namespace chaincraft {
namespace consensus {

// Default upper bound on a single object payload (1 MiB)
constexpr size_t DEFAULT_MAX_OBJECT_SIZE = 1024 * 1024;

/**
 * AppendOnlyValidator - accepts every non-empty object within the size limit
 * that is not already committed. Payloads are opaque.
 */
class AppendOnlyValidator : public Validator {
public:
  explicit AppendOnlyValidator(size_t max_object_size = DEFAULT_MAX_OBJECT_SIZE)
      : max_object_size_(max_object_size) {}

  ConsensusDecision validate(const primitives::SharedObject &object,
                             const StateView &view) const override;
  std::string name() const override { return "append-only"; }

protected:
  // Shared structural checks; nullopt means "passes"
  std::optional<ConsensusDecision>
  check_basic(const primitives::SharedObject &object,
              const StateView &view) const;

private:
  size_t max_object_size_;
};

/**
 * DependencyValidator - interprets payloads as ObjectEnvelopes
 *
 * - malformed envelope          -> Rejected
 * - self reference              -> Rejected
 * - first uncommitted dependency -> Deferred(dependency)
 * - slot already held           -> Rejected
 *
 * Objects carrying a slot conflict with every other object for that slot.
 */
class DependencyValidator : public AppendOnlyValidator {
public:
  explicit DependencyValidator(size_t max_object_size = DEFAULT_MAX_OBJECT_SIZE)
      : AppendOnlyValidator(max_object_size) {}

  ConsensusDecision validate(const primitives::SharedObject &object,
                             const StateView &view) const override;
  std::optional<std::string>
  conflict_key(const primitives::SharedObject &object) const override;
  std::string name() const override { return "dependency"; }

  static std::string SlotKey(uint64_t slot);
};

/**
 * SignedEnvelopeValidator - requires a valid envelope signature, then
 * delegates to the wrapped strategy.
 */
class SignedEnvelopeValidator : public Validator {
public:
  SignedEnvelopeValidator(std::shared_ptr<const crypto::CryptoProvider> crypto,
                          std::shared_ptr<const Validator> inner);

  ConsensusDecision validate(const primitives::SharedObject &object,
                             const StateView &view) const override;
  std::optional<std::string>
  conflict_key(const primitives::SharedObject &object) const override {
    return inner_->conflict_key(object);
  }
  std::string name() const override { return "signed(" + inner_->name() + ")"; }

private:
  std::shared_ptr<const crypto::CryptoProvider> crypto_;
  std::shared_ptr<const Validator> inner_;
};

// Factory used by configuration: "append-only", "dependency",
// "signed-dependency". Returns nullptr for unknown names.
std::shared_ptr<const Validator>
CreateValidator(const std::string &name,
                std::shared_ptr<const crypto::CryptoProvider> crypto,
                size_t max_object_size = DEFAULT_MAX_OBJECT_SIZE);

} // namespace consensus
} // namespace chaincraft

#endif // CHAINCRAFT_CONSENSUS_VALIDATORS_HPP
