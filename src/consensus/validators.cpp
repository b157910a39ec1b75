// Copyright (c) 2024 Chaincraft
// Distributed under the MIT software license

#include "consensus/validators.hpp"
#include "primitives/object_envelope.hpp"
#include <stdexcept>

namespace chaincraft {
namespace consensus {

std::optional<ConsensusDecision>
AppendOnlyValidator::check_basic(const primitives::SharedObject &object,
                                 const StateView &view) const {
  if (object.payload.empty()) {
    return ConsensusDecision::Reject("empty payload");
  }
  if (object.payload.size() > max_object_size_) {
    return ConsensusDecision::Reject("oversized payload (" +
                                     std::to_string(object.payload.size()) +
                                     " bytes)");
  }
  if (view.is_committed(object.digest)) {
    return ConsensusDecision::Reject("already committed");
  }
  return std::nullopt;
}

ConsensusDecision
AppendOnlyValidator::validate(const primitives::SharedObject &object,
                              const StateView &view) const {
  if (auto failed = check_basic(object, view)) {
    return *failed;
  }
  return ConsensusDecision::Accept();
}

std::string DependencyValidator::SlotKey(uint64_t slot) {
  return "slot:" + std::to_string(slot);
}

ConsensusDecision
DependencyValidator::validate(const primitives::SharedObject &object,
                              const StateView &view) const {
  if (auto failed = check_basic(object, view)) {
    return *failed;
  }

  auto envelope = primitives::DecodeEnvelope(object.payload);
  if (!envelope) {
    return ConsensusDecision::Reject("malformed envelope");
  }

  for (const auto &dep : envelope->dependencies) {
    if (dep == object.digest) {
      return ConsensusDecision::Reject("self dependency");
    }
  }
  // Dependencies are checked in declaration order so every node reports the
  // same missing digest for the same committed prefix
  for (const auto &dep : envelope->dependencies) {
    if (!view.is_committed(dep)) {
      return ConsensusDecision::Defer(dep);
    }
  }

  if (envelope->slot) {
    auto holder = view.conflict_holder(SlotKey(*envelope->slot));
    if (holder) {
      return ConsensusDecision::Reject("slot " + std::to_string(*envelope->slot) +
                                       " held by " + holder->ToShortString());
    }
  }

  return ConsensusDecision::Accept();
}

std::optional<std::string>
DependencyValidator::conflict_key(const primitives::SharedObject &object) const {
  auto envelope = primitives::DecodeEnvelope(object.payload);
  if (!envelope || !envelope->slot) {
    return std::nullopt;
  }
  return SlotKey(*envelope->slot);
}

SignedEnvelopeValidator::SignedEnvelopeValidator(
    std::shared_ptr<const crypto::CryptoProvider> crypto,
    std::shared_ptr<const Validator> inner)
    : crypto_(std::move(crypto)), inner_(std::move(inner)) {
  if (!crypto_ || !inner_) {
    throw std::invalid_argument(
        "SignedEnvelopeValidator requires a crypto provider and an inner validator");
  }
}

ConsensusDecision
SignedEnvelopeValidator::validate(const primitives::SharedObject &object,
                                  const StateView &view) const {
  auto envelope = primitives::DecodeEnvelope(object.payload);
  if (!envelope) {
    return ConsensusDecision::Reject("malformed envelope");
  }
  if (!envelope->has_signature()) {
    return ConsensusDecision::Reject("unsigned envelope");
  }
  if (!crypto_->verify(envelope->public_key, envelope->signature,
                       envelope->body)) {
    return ConsensusDecision::Reject("bad signature");
  }
  return inner_->validate(object, view);
}

std::shared_ptr<const Validator>
CreateValidator(const std::string &name,
                std::shared_ptr<const crypto::CryptoProvider> crypto,
                size_t max_object_size) {
  if (name == "append-only") {
    return std::make_shared<AppendOnlyValidator>(max_object_size);
  }
  if (name == "dependency") {
    return std::make_shared<DependencyValidator>(max_object_size);
  }
  if (name == "signed-dependency") {
    if (!crypto) {
      return nullptr;
    }
    return std::make_shared<SignedEnvelopeValidator>(
        std::move(crypto), std::make_shared<DependencyValidator>(max_object_size));
  }
  return nullptr;
}

} // namespace consensus
} // namespace chaincraft
