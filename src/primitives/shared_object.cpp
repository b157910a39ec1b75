// Copyright (c) 2024 Chaincraft
// Distributed under the MIT software license

#include "primitives/shared_object.hpp"

namespace chaincraft {
namespace primitives {

const char *ObjectKindName(ObjectKind kind) {
  switch (kind) {
  case ObjectKind::Transaction:
    return "transaction";
  case ObjectKind::Block:
    return "block";
  case ObjectKind::Vote:
    return "vote";
  case ObjectKind::Custom:
    return "custom";
  }
  return "unknown";
}

std::optional<ObjectKind> ObjectKindFromByte(uint8_t value) {
  if (value > static_cast<uint8_t>(ObjectKind::Custom)) {
    return std::nullopt;
  }
  return static_cast<ObjectKind>(value);
}

SharedObjectPtr MakeSharedObject(const Digest &digest, ObjectKind kind,
                                 std::vector<uint8_t> payload,
                                 std::optional<PeerId> origin_peer,
                                 int64_t received_at) {
  auto obj = std::make_shared<SharedObject>();
  obj->digest = digest;
  obj->kind = kind;
  obj->payload = std::move(payload);
  obj->origin_peer = origin_peer;
  obj->received_at = received_at;
  return obj;
}

} // namespace primitives
} // namespace chaincraft
