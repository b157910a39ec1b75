// Copyright (c) 2024 Chaincraft
// Distributed under the MIT software license

#ifndef CHAINCRAFT_CONSENSUS_COMMITTED_STATE_HPP
#define CHAINCRAFT_CONSENSUS_COMMITTED_STATE_HPP

#include "consensus/validator.hpp"
#include <map>
#include <unordered_map>
#include <vector>

namespace chaincraft {
namespace consensus {

/**
 * CommittedState - the local node's accepted history
 *
 * Not internally synchronised; ConsensusEngine owns the only instance and
 * guards it with its own mutex.
 */
class CommittedState : public StateView {
public:
  struct Entry {
    uint64_t order_index{0};
    primitives::ObjectKind kind{primitives::ObjectKind::Custom};
  };

  bool is_committed(const primitives::Digest &digest) const override;
  std::optional<uint64_t>
  order_index_of(const primitives::Digest &digest) const override;
  uint64_t committed_count() const override { return order_.size(); }
  std::optional<primitives::Digest>
  conflict_holder(const std::string &key) const override;

  std::optional<primitives::ObjectKind>
  kind_of(const primitives::Digest &digest) const;

  // Caller guarantees digest is not yet committed and order_index is larger
  // than every existing index
  void commit(const primitives::Digest &digest, primitives::ObjectKind kind,
              uint64_t order_index,
              const std::optional<std::string> &conflict_key);

  // Digests in commit order
  const std::vector<primitives::Digest> &history() const { return order_; }

private:
  std::unordered_map<primitives::Digest, Entry, primitives::DigestHasher>
      entries_;
  std::vector<primitives::Digest> order_;
  std::map<std::string, primitives::Digest> conflict_keys_;
};

} // namespace consensus
} // namespace chaincraft

#endif // CHAINCRAFT_CONSENSUS_COMMITTED_STATE_HPP
