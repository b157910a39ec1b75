// Copyright (c) 2024 Chaincraft
// Distributed under the MIT software license

#ifndef CHAINCRAFT_PEER_MANAGER_HPP
#define CHAINCRAFT_PEER_MANAGER_HPP

/*
 PeerManager - peer connection lifecycle for one node

 Purpose
 - Keep a PeerRecord for every address we know about (bootstrap, learned via
   PEERS, or inbound) and the live Peer for the ones we are connected to
 - Dial with exponential backoff; ban an address after ban_threshold
   consecutive failures
 - Enforce max_peers by evicting the lowest-scoring connection
 - Drop peers that go silent (peer_timeout) or never finish the handshake
 - Track misbehavior and discourage hosts that cross the threshold

 Record lifecycle
   Discovered -> Connecting -> Connected -> Disconnected -> (Connecting ...)
                      \-> Disconnected (failure, backoff) -> ... -> Banned
   Disconnected records are deleted by prune_stale(); explicit bans delete
   the record immediately.

 Peer ids
 - Allocated once per record, starting at 1, and reused when the same
   address is redialed. 0 is the local node. -1 means "no peer".

 Eviction score
   last_useful (steady seconds) - failure_penalty * failure_count - misbehavior
 Lowest score goes first; ties evict the older connection, then the lower id.
 The most recently connected peer is never chosen, and eviction stops at
 min_peers.

 Threading
 - One mutex guards the record table. Peer callbacks and the listener
   callbacks are always invoked with it released.
 - Misbehavior disconnects are posted to the io_context because they are
   usually reported from inside the offending peer's receive path.
*/

#include "network/banman.hpp"
#include "network/message.hpp"
#include "network/peer.hpp"
#include "network/protocol.hpp"
#include "network/transport.hpp"
#include "primitives/shared_object.hpp"
#include <atomic>
#include <utility>  // Boost 1.74 asio/awaitable.hpp needs std::exchange
#include <boost/asio.hpp>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace chaincraft {
namespace network {

// Misbehavior score at which a peer is disconnected and its host discouraged
static constexpr int DISCOURAGEMENT_THRESHOLD = 100;

namespace MisbehaviorPenalty {
static constexpr int INTEGRITY_VIOLATION = 20; // digest != hash(payload)
static constexpr int PROTOCOL_VIOLATION = 10;  // malformed or unexpected message
static constexpr int SEND_QUEUE_FULL = 1;      // not draining its backlog
} // namespace MisbehaviorPenalty

enum class PeerRecordState { Discovered, Connecting, Connected, Disconnected, Banned };

enum class ConnError {
  None,
  Banned,
  BackingOff,
  AlreadyConnected,
  TransportFailed,
  HandshakeFailed,
  NotRunning,
  CapacityExceeded
};

enum class DisconnectReason {
  Requested,
  Timeout,
  Evicted,
  Misbehavior,
  Shutdown,
  TransportClosed
};

const char *PeerRecordStateName(PeerRecordState state);
const char *ConnErrorName(ConnError error);
const char *DisconnectReasonName(DisconnectReason reason);

struct ConnectResult {
  PeerId peer_id{NO_PEER_ID};
  ConnError error{ConnError::None};

  bool ok() const { return error == ConnError::None; }
};

struct PeerRecord {
  PeerId peer_id{NO_PEER_ID};
  // Dialable address for outbound records, socket remote end for inbound
  protocol::NetworkAddress address;
  // Inbound only: host + the listen port the remote advertised in VERSION
  std::optional<protocol::NetworkAddress> listen_address;
  PeerRecordState state{PeerRecordState::Discovered};
  bool inbound{false};
  int64_t last_seen{0}; // unix seconds
  uint32_t failure_count{0};
  int misbehavior{0};
  bool should_disconnect{false};
  std::chrono::steady_clock::time_point next_attempt{};
  std::chrono::steady_clock::time_point connected_at{};
  std::chrono::seconds last_useful{0};
};

using PeerConnectedCallback = std::function<void(PeerId)>;
using PeerDisconnectedCallback = std::function<void(PeerId, DisconnectReason)>;

class PeerManager {
public:
  struct Config {
    uint32_t network_magic;
    uint16_t listen_port;  // advertised in VERSION, 0 if not listening
    uint64_t local_nonce;
    size_t max_peers;
    size_t min_peers;
    size_t max_connecting; // handshakes in flight
    size_t send_queue_limit;
    std::vector<protocol::NetworkAddress> bootstrap_addresses;
    std::chrono::seconds peer_timeout;
    std::chrono::seconds handshake_timeout;
    std::chrono::seconds backoff_base;
    std::chrono::seconds backoff_max;
    uint32_t ban_threshold;
    int64_t ban_duration; // seconds
    int failure_penalty;

    Config()
        : network_magic(protocol::magic::MAINNET), listen_port(0),
          local_nonce(0), max_peers(protocol::DEFAULT_MAX_PEERS),
          min_peers(protocol::DEFAULT_MIN_PEERS), max_connecting(8),
          send_queue_limit(protocol::DEFAULT_SEND_QUEUE_LIMIT),
          peer_timeout(protocol::PEER_TIMEOUT_SEC),
          handshake_timeout(protocol::VERSION_HANDSHAKE_TIMEOUT_SEC),
          backoff_base(protocol::DEFAULT_BACKOFF_BASE_SEC),
          backoff_max(protocol::DEFAULT_BACKOFF_MAX_SEC),
          ban_threshold(protocol::DEFAULT_BAN_THRESHOLD),
          ban_duration(protocol::DEFAULT_BAN_DURATION_SEC),
          failure_penalty(10) {}
  };

  // Learned addresses kept between discover() calls
  static constexpr size_t MAX_LEARNED_ADDRESSES = 10000;

  PeerManager(boost::asio::io_context &io_context,
              std::shared_ptr<Transport> transport, BanMan &banman,
              const Config &config = Config{});
  ~PeerManager();

  PeerManager(const PeerManager &) = delete;
  PeerManager &operator=(const PeerManager &) = delete;

  bool start();
  // Disconnects everything with DisconnectReason::Shutdown
  void stop();
  bool is_running() const { return running_; }

  int allocate_peer_id();

  // Merge bootstrap and learned addresses into the table. Returns every
  // known, non-banned dialable address.
  std::set<protocol::NetworkAddress> discover();

  // Queue addresses for the next discover()
  void add_known_addresses(const std::vector<protocol::NetworkAddress> &addrs);

  ConnectResult connect(const protocol::NetworkAddress &address);

  // Transport accept callback. False if the connection was refused.
  bool accept_inbound(TransportConnectionPtr connection);

  // False if the peer had no live connection
  bool disconnect(PeerId peer_id, DisconnectReason reason);
  void disconnect_all(DisconnectReason reason);

  // Returns the number of peers evicted
  size_t enforce_capacity(size_t max_peers);

  void send_heartbeats();
  // Returns the number of peers dropped for silence or a stalled handshake
  size_t check_liveness();
  // Returns the number of records deleted
  size_t prune_stale(std::chrono::seconds max_age);

  // Operator ban: disconnects matching peers and deletes their records
  void ban_address(const std::string &address, int64_t ban_time_offset,
                   const std::string &reason);

  // Peer exchange
  void handle_getpeers(PeerPtr peer);
  void handle_peers(PeerPtr peer, const message::PeersMessage &msg);

  // === Misbehavior ===
  void ReportIntegrityViolation(PeerId peer_id, const std::string &detail);
  void ReportProtocolViolation(PeerId peer_id, const std::string &detail);
  void ReportSendQueueFull(PeerId peer_id);
  int GetMisbehaviorScore(PeerId peer_id) const;
  bool ShouldDisconnect(PeerId peer_id) const;

  // === Queries ===
  PeerPtr get_peer(PeerId peer_id) const;
  std::vector<PeerPtr> get_connected_peers() const;
  std::optional<PeerRecord> get_record(PeerId peer_id) const;
  std::optional<PeerRecord> find_record(const protocol::NetworkAddress &address) const;
  std::vector<PeerRecord> get_records() const;
  size_t connected_count() const;
  size_t record_count() const;

  // Must be set before start()
  void set_message_handler(MessageHandler handler);
  void set_peer_connected_callback(PeerConnectedCallback cb);
  void set_peer_disconnected_callback(PeerDisconnectedCallback cb);

  const Config &config() const { return config_; }

private:
  struct PeerEntry {
    PeerRecord record;
    PeerPtr peer;
    // Outbound dial in progress: the connection and the transport's verdict
    // may arrive in either order
    TransportConnectionPtr pending_connection;
    std::optional<bool> connect_outcome;
    std::chrono::steady_clock::time_point attempt_started{};
    bool replied_getpeers{false};
  };

  bool Misbehaving(PeerId peer_id, int penalty, const std::string &reason);

  PeerEntry &get_or_create_locked(const protocol::NetworkAddress &address);
  bool is_banned_address(const protocol::NetworkAddress &address) const;
  bool listen_address_connected_locked(const protocol::NetworkAddress &address) const;
  size_t connecting_count_locked() const;
  void record_failure_locked(PeerEntry &entry, ConnError error);

  void on_connect_outcome(PeerId peer_id, bool success);
  void finish_outbound(PeerId peer_id);
  void attach_peer(PeerPtr peer);
  void on_peer_ready(PeerPtr peer);
  void on_peer_closed(PeerPtr peer);
  bool drop_peer(PeerId peer_id, DisconnectReason reason, bool count_failure);

  Peer::Options peer_options() const;

  boost::asio::io_context &io_context_;
  std::shared_ptr<Transport> transport_;
  BanMan &banman_;
  Config config_;

  std::atomic<bool> running_{false};
  std::atomic<int> next_peer_id_{1};

  mutable std::mutex mutex_;
  std::map<PeerId, PeerEntry> peers_;
  std::map<std::string, PeerId> address_index_;
  std::set<protocol::NetworkAddress> learned_addresses_;

  MessageHandler message_handler_;
  PeerConnectedCallback connected_cb_;
  PeerDisconnectedCallback disconnected_cb_;
};

} // namespace network
} // namespace chaincraft

#endif // CHAINCRAFT_PEER_MANAGER_HPP
