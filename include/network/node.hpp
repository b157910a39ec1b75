// Copyright (c) 2024 Chaincraft
// Distributed under the MIT software license

#ifndef CHAINCRAFT_NODE_HPP
#define CHAINCRAFT_NODE_HPP

#include "consensus/consensus_engine.hpp"
#include "consensus/validators.hpp"
#include "crypto/openssl_crypto.hpp"
#include "gossip/dedup_cache.hpp"
#include "gossip/gossip_engine.hpp"
#include "network/banman.hpp"
#include "network/message_router.hpp"
#include "network/peer_manager.hpp"
#include "network/protocol.hpp"
#include "network/transport.hpp"
#include "storage/object_store.hpp"
#include <atomic>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace chaincraft {
namespace network {

struct NodeConfig {
  uint32_t network_magic;
  uint16_t port;          // 0 = don't listen
  bool listen_enabled;
  size_t io_threads;      // 0 = caller drives the io_context (tests)
  size_t worker_threads;  // gossip validation pool, 0 = inline

  size_t max_peers;
  size_t min_peers;
  std::vector<protocol::NetworkAddress> bootstrap_addresses;

  size_t dedup_capacity;
  std::chrono::seconds dedup_ttl;
  size_t dedup_shards;

  std::chrono::seconds peer_timeout;
  std::chrono::seconds heartbeat_interval;
  std::chrono::seconds handshake_timeout;
  std::chrono::seconds maintenance_interval;
  std::chrono::seconds backoff_base;
  std::chrono::seconds backoff_max;
  uint32_t ban_threshold;
  int64_t ban_duration; // seconds
  size_t send_queue_limit;

  uint32_t deferred_max_retries;
  std::chrono::seconds deferred_ttl;
  size_t deferred_max_entries;

  size_t max_object_size;
  std::string datadir;   // empty = nothing persisted
  std::string validator; // see consensus::CreateValidator

  NodeConfig()
      : network_magic(protocol::magic::MAINNET),
        port(protocol::DEFAULT_PORT), listen_enabled(true), io_threads(2),
        worker_threads(4), max_peers(protocol::DEFAULT_MAX_PEERS),
        min_peers(protocol::DEFAULT_MIN_PEERS),
        dedup_capacity(gossip::DedupCache::DEFAULT_CAPACITY),
        dedup_ttl(gossip::DedupCache::DEFAULT_TTL),
        dedup_shards(gossip::DedupCache::DEFAULT_SHARDS),
        peer_timeout(protocol::PEER_TIMEOUT_SEC),
        heartbeat_interval(protocol::HEARTBEAT_INTERVAL_SEC),
        handshake_timeout(protocol::VERSION_HANDSHAKE_TIMEOUT_SEC),
        maintenance_interval(protocol::MAINTENANCE_INTERVAL_SEC),
        backoff_base(protocol::DEFAULT_BACKOFF_BASE_SEC),
        backoff_max(protocol::DEFAULT_BACKOFF_MAX_SEC),
        ban_threshold(protocol::DEFAULT_BAN_THRESHOLD),
        ban_duration(protocol::DEFAULT_BAN_DURATION_SEC),
        send_queue_limit(protocol::DEFAULT_SEND_QUEUE_LIMIT),
        deferred_max_retries(gossip::DeferredPool::DEFAULT_MAX_RETRIES),
        deferred_ttl(gossip::DeferredPool::DEFAULT_TTL),
        deferred_max_entries(gossip::DeferredPool::DEFAULT_MAX_ENTRIES),
        max_object_size(consensus::DEFAULT_MAX_OBJECT_SIZE),
        validator("append-only") {}
};

// Node - one gossip participant. Owns the io_context (unless one is
// injected), the peer table, dedup cache, consensus engine and gossip engine,
// and wires them together. Several Nodes can share a process.
class Node {
public:
  // transport: nullptr = RealTransport (TCP)
  // store: nullptr = MemoryObjectStore
  // validator: nullptr = consensus::CreateValidator(config.validator)
  // Throws std::invalid_argument for an unknown validator name.
  explicit Node(const NodeConfig &config,
                std::shared_ptr<Transport> transport = nullptr,
                boost::asio::io_context *external_io_context = nullptr,
                std::shared_ptr<storage::ObjectStore> store = nullptr,
                std::shared_ptr<const consensus::Validator> validator = nullptr);
  ~Node();

  Node(const Node &) = delete;
  Node &operator=(const Node &) = delete;

  // Load bans, listen, dial bootstrap peers, start timers
  bool start();
  // Stop accepting, drain validations, close connections, save bans
  void stop();
  bool is_running() const { return running_; }

  // Hash, validate and gossip a locally produced object. Returns its digest.
  primitives::Digest
  submit_local(std::vector<uint8_t> payload,
               primitives::ObjectKind kind = primitives::ObjectKind::Custom);

  ConnectResult connect_to(const protocol::NetworkAddress &address);
  bool disconnect_from(PeerId peer_id);

  // Set once a fatal error (store unavailable) was reported
  bool has_fatal_error() const { return fatal_; }
  std::string fatal_error() const;
  void set_fatal_error_callback(gossip::FatalErrorCallback cb);

  uint64_t get_local_nonce() const { return local_nonce_; }
  const NodeConfig &config() const { return config_; }

  // Component access
  PeerManager &peer_manager() { return *peer_manager_; }
  gossip::GossipEngine &gossip() { return *gossip_; }
  consensus::ConsensusEngine &consensus() { return *consensus_; }
  gossip::DedupCache &dedup() { return *dedup_; }
  storage::ObjectStore &store() { return *store_; }
  BanMan &ban_man() { return *ban_man_; }
  const crypto::CryptoProvider &crypto() const { return *crypto_; }

  // Test-only hooks: timers are not armed when io_threads == 0
  void test_hook_maintenance() { run_maintenance(); }
  void test_hook_heartbeat() { peer_manager_->send_heartbeats(); }

private:
  void on_fatal_error(const std::string &what);

  // Dial known addresses until connected + connecting reaches target
  void attempt_outbound_connections(size_t target);

  void run_maintenance();
  void schedule_next_maintenance();
  void schedule_next_heartbeat();

  // Disconnected records untouched for this long are forgotten
  static constexpr std::chrono::hours STALE_RECORD_AGE{3};

  NodeConfig config_;
  std::atomic<bool> running_{false};
  std::atomic<bool> fatal_{false};
  mutable std::mutex start_stop_mutex_;

  uint64_t local_nonce_;

  std::shared_ptr<Transport> transport_;

  std::unique_ptr<boost::asio::io_context> owned_io_context_;
  boost::asio::io_context &io_context_;
  std::unique_ptr<
      boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
      work_guard_;
  std::vector<std::thread> io_threads_;

  std::shared_ptr<const crypto::CryptoProvider> crypto_;
  std::shared_ptr<storage::ObjectStore> store_;
  std::unique_ptr<BanMan> ban_man_;
  std::unique_ptr<PeerManager> peer_manager_;
  std::unique_ptr<gossip::DedupCache> dedup_;
  std::unique_ptr<consensus::ConsensusEngine> consensus_;
  std::unique_ptr<gossip::GossipEngine> gossip_;
  std::unique_ptr<MessageRouter> message_router_;

  std::unique_ptr<boost::asio::steady_timer> maintenance_timer_;
  std::unique_ptr<boost::asio::steady_timer> heartbeat_timer_;

  mutable std::mutex fatal_mutex_;
  std::string fatal_what_;
  gossip::FatalErrorCallback fatal_cb_;
};

} // namespace network
} // namespace chaincraft

#endif // CHAINCRAFT_NODE_HPP
