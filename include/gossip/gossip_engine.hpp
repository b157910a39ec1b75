// Copyright (c) 2024 Chaincraft
// Distributed under the MIT software license

#ifndef CHAINCRAFT_GOSSIP_ENGINE_HPP
#define CHAINCRAFT_GOSSIP_ENGINE_HPP

/*
 GossipEngine - pull-based dissemination of shared objects

 Wire flow
   A --announce(d)--> B      B does not know d
   A <--request(d)--- B
   A --object(d,p)--> B      B checks d == hash(p), dedups, validates,
                             persists, then announces d to everyone but A

 Ordering and threading
 - Inbound messages are handled in per-peer lanes. A lane is a FIFO drained
   by at most one ThreadPool task at a time, so one peer's messages are
   processed in arrival order while different peers run in parallel.
   worker_threads == 0 processes everything inline on the caller's thread.
 - An object's digest is checked and inserted into the dedup cache when the
   message arrives; validation happens in the lane. If the peer disconnects
   first, its queued objects are dropped and their digests forgotten.
 - Sends never block: a full peer backlog drops the message and costs the
   peer a small misbehavior penalty.

 Errors
 - Integrity failures (digest mismatch) are logged and penalized, never
   thrown.
 - storage::StoreUnavailableError is caught here and reported once through
   the fatal-error callback; the engine stops processing afterwards.
*/

#include "consensus/consensus_engine.hpp"
#include "crypto/crypto_provider.hpp"
#include "gossip/dedup_cache.hpp"
#include "gossip/deferred_pool.hpp"
#include "network/message.hpp"
#include "network/peer.hpp"
#include "primitives/shared_object.hpp"
#include "storage/object_store.hpp"
#include "util/threadpool.hpp"
#include <atomic>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace chaincraft {
namespace network {
class PeerManager;
}

namespace gossip {

using FatalErrorCallback = std::function<void(const std::string &what)>;

struct GossipStats {
  std::atomic<uint64_t> objects_received{0};
  std::atomic<uint64_t> duplicates{0};
  std::atomic<uint64_t> integrity_failures{0};
  std::atomic<uint64_t> accepted{0};
  std::atomic<uint64_t> rejected{0};
  std::atomic<uint64_t> deferred{0};
  std::atomic<uint64_t> deferred_dropped{0};
  std::atomic<uint64_t> announcements_sent{0};
  std::atomic<uint64_t> requests_sent{0};
  std::atomic<uint64_t> objects_served{0};
  std::atomic<uint64_t> send_queue_drops{0};
  std::atomic<uint64_t> lane_tasks_cancelled{0};
};

class GossipEngine {
public:
  struct Config {
    size_t worker_threads; // 0 = inline
    DeferredPool::Config deferred;

    Config() : worker_threads(0) {}
  };

  GossipEngine(network::PeerManager &peer_manager,
               consensus::ConsensusEngine &consensus,
               storage::ObjectStore &store,
               const crypto::CryptoProvider &crypto, DedupCache &dedup,
               const Config &config = Config{});
  ~GossipEngine();

  GossipEngine(const GossipEngine &) = delete;
  GossipEngine &operator=(const GossipEngine &) = delete;

  bool start();
  // Finishes every queued lane task, then refuses new work
  void stop();

  // Announce, request or object from a connected peer. Returns false for
  // any other message type.
  bool on_receive(network::PeerPtr from,
                  std::unique_ptr<message::Message> msg);

  // Act on a consensus decision: persist and announce, log, or park
  void on_consensus_result(const primitives::SharedObjectPtr &object,
                           const consensus::ConsensusDecision &decision);

  // Same path as a received object, originating from the local node
  primitives::Digest
  submit_local(std::vector<uint8_t> payload,
               primitives::ObjectKind kind = primitives::ObjectKind::Custom);

  // Drops the peer's queued lane work
  void on_peer_disconnected(PeerId peer_id);

  // Deferred TTL expiry and dedup age pruning
  void maintenance();

  void set_fatal_error_callback(FatalErrorCallback cb);
  bool has_fatal_error() const { return fatal_; }

  const GossipStats &stats() const { return stats_; }
  const DeferredPool &deferred_pool() const { return deferred_; }
  size_t lane_count() const;

private:
  struct LaneTask {
    std::unique_ptr<message::Message> msg;
    primitives::SharedObjectPtr object; // set for pre-checked objects
  };

  struct Lane {
    network::PeerPtr peer;
    std::deque<LaneTask> tasks;
    uint64_t generation{0};
    bool draining{false};
  };

  // Runs on the receiving thread: digest check and dedup insert. nullptr if
  // the object must be dropped.
  primitives::SharedObjectPtr
  admit_object(const network::PeerPtr &from,
               const message::ObjectMessage &msg);

  void enqueue(const network::PeerPtr &from, LaneTask task);
  void drain_lane(PeerId peer_id, uint64_t generation);
  void process_task(const network::PeerPtr &from, LaneTask &task);

  void handle_announce(const network::PeerPtr &from,
                       const message::AnnounceMessage &msg);
  void handle_request(const network::PeerPtr &from,
                      const message::RequestMessage &msg);
  void validate_object(const primitives::SharedObjectPtr &object);

  // Applies one decision; accepted digests are appended to unlocked so the
  // caller can release their dependents without recursion
  void apply_decision(const primitives::SharedObjectPtr &object,
                      const consensus::ConsensusDecision &decision,
                      uint32_t attempt,
                      std::deque<primitives::Digest> &unlocked);
  void release_dependents(std::deque<primitives::Digest> &unlocked);

  void announce(const primitives::SharedObjectPtr &object);
  void request_dependency(const primitives::SharedObjectPtr &object,
                          const primitives::Digest &missing);
  network::SendResult send_to(const network::PeerPtr &peer,
                              std::unique_ptr<message::Message> msg);

  void report_fatal(const std::string &what);

  network::PeerManager &peer_manager_;
  consensus::ConsensusEngine &consensus_;
  storage::ObjectStore &store_;
  const crypto::CryptoProvider &crypto_;
  DedupCache &dedup_;
  Config config_;
  DeferredPool deferred_;

  std::unique_ptr<util::ThreadPool> pool_;
  std::atomic<bool> running_{false};
  std::atomic<bool> fatal_{false};

  mutable std::mutex lanes_mutex_;
  std::map<PeerId, Lane> lanes_;
  uint64_t next_generation_{1};

  std::mutex fatal_mutex_;
  FatalErrorCallback fatal_cb_;

  GossipStats stats_;
};

} // namespace gossip
} // namespace chaincraft

#endif // CHAINCRAFT_GOSSIP_ENGINE_HPP
