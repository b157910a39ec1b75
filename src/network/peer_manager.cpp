// Copyright (c) 2024 Chaincraft
// Distributed under the MIT software license

#include "network/peer_manager.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"
#include <algorithm>
#include <limits>

namespace chaincraft {
namespace network {

const char *PeerRecordStateName(PeerRecordState state) {
  switch (state) {
  case PeerRecordState::Discovered:
    return "discovered";
  case PeerRecordState::Connecting:
    return "connecting";
  case PeerRecordState::Connected:
    return "connected";
  case PeerRecordState::Disconnected:
    return "disconnected";
  case PeerRecordState::Banned:
    return "banned";
  }
  return "unknown";
}

const char *ConnErrorName(ConnError error) {
  switch (error) {
  case ConnError::None:
    return "none";
  case ConnError::Banned:
    return "banned";
  case ConnError::BackingOff:
    return "backing-off";
  case ConnError::AlreadyConnected:
    return "already-connected";
  case ConnError::TransportFailed:
    return "transport-failed";
  case ConnError::HandshakeFailed:
    return "handshake-failed";
  case ConnError::NotRunning:
    return "not-running";
  case ConnError::CapacityExceeded:
    return "capacity-exceeded";
  }
  return "unknown";
}

const char *DisconnectReasonName(DisconnectReason reason) {
  switch (reason) {
  case DisconnectReason::Requested:
    return "requested";
  case DisconnectReason::Timeout:
    return "timeout";
  case DisconnectReason::Evicted:
    return "evicted";
  case DisconnectReason::Misbehavior:
    return "misbehavior";
  case DisconnectReason::Shutdown:
    return "shutdown";
  case DisconnectReason::TransportClosed:
    return "transport-closed";
  }
  return "unknown";
}

static std::chrono::seconds steady_seconds_now() {
  return std::chrono::duration_cast<std::chrono::seconds>(
      util::GetSteadyTime().time_since_epoch());
}

PeerManager::PeerManager(boost::asio::io_context &io_context,
                         std::shared_ptr<Transport> transport, BanMan &banman,
                         const Config &config)
    : io_context_(io_context), transport_(std::move(transport)),
      banman_(banman), config_(config) {}

PeerManager::~PeerManager() { stop(); }

bool PeerManager::start() {
  if (!transport_) {
    LOG_NET_ERROR("PeerManager: no transport configured");
    return false;
  }
  if (running_.exchange(true)) {
    return false;
  }
  LOG_NET_DEBUG("PeerManager started (max_peers={}, min_peers={}, "
                "bootstrap={})",
                config_.max_peers, config_.min_peers,
                config_.bootstrap_addresses.size());
  return true;
}

void PeerManager::stop() {
  if (!running_.exchange(false)) {
    return;
  }
  disconnect_all(DisconnectReason::Shutdown);
}

int PeerManager::allocate_peer_id() {
  return next_peer_id_.fetch_add(1, std::memory_order_relaxed);
}

Peer::Options PeerManager::peer_options() const {
  Peer::Options opts;
  opts.network_magic = config_.network_magic;
  opts.local_nonce = config_.local_nonce;
  opts.listen_port = config_.listen_port;
  opts.send_queue_limit = config_.send_queue_limit;
  return opts;
}

PeerManager::PeerEntry &
PeerManager::get_or_create_locked(const protocol::NetworkAddress &address) {
  const std::string key = address.to_string();
  auto idx = address_index_.find(key);
  if (idx != address_index_.end()) {
    auto it = peers_.find(idx->second);
    if (it != peers_.end()) {
      return it->second;
    }
  }
  PeerId id = allocate_peer_id();
  PeerEntry &entry = peers_[id];
  entry.record.peer_id = id;
  entry.record.address = address;
  entry.record.state = PeerRecordState::Discovered;
  entry.record.last_seen = util::GetTime();
  address_index_[key] = id;
  return entry;
}

bool PeerManager::is_banned_address(
    const protocol::NetworkAddress &address) const {
  return banman_.IsBanned(address.to_string()) ||
         banman_.IsBanned(address.host) || banman_.IsDiscouraged(address.host);
}

bool PeerManager::listen_address_connected_locked(
    const protocol::NetworkAddress &address) const {
  for (const auto &[id, entry] : peers_) {
    if (entry.record.state == PeerRecordState::Connected &&
        entry.record.listen_address && *entry.record.listen_address == address) {
      return true;
    }
  }
  return false;
}

size_t PeerManager::connecting_count_locked() const {
  size_t n = 0;
  for (const auto &[id, entry] : peers_) {
    if (entry.record.state == PeerRecordState::Connecting) {
      ++n;
    }
  }
  return n;
}

void PeerManager::record_failure_locked(PeerEntry &entry, ConnError error) {
  PeerRecord &rec = entry.record;
  rec.failure_count++;
  rec.last_seen = util::GetTime();

  // base * 2^(failures-1), capped at backoff_max
  auto delay = config_.backoff_max;
  uint32_t exponent = rec.failure_count - 1;
  if (exponent < 31) {
    std::chrono::seconds scaled = config_.backoff_base * (int64_t{1} << exponent);
    delay = std::min(scaled, config_.backoff_max);
  }
  rec.next_attempt = util::GetSteadyTime() + delay;

  if (config_.ban_threshold > 0 && rec.failure_count >= config_.ban_threshold) {
    rec.state = PeerRecordState::Banned;
    LOG_NET_WARN("peer={} {} banned after {} consecutive failures (last: {})",
                 rec.peer_id, rec.address.to_string(), rec.failure_count,
                 ConnErrorName(error));
    banman_.Ban(rec.address.to_string(), config_.ban_duration,
                std::to_string(rec.failure_count) + " consecutive connection failures");
    return;
  }

  rec.state = PeerRecordState::Disconnected;
  LOG_NET_DEBUG("peer={} {} connection failed ({}), failure {} - next attempt "
                "in {}s",
                rec.peer_id, rec.address.to_string(), ConnErrorName(error),
                rec.failure_count, delay.count());
}

std::set<protocol::NetworkAddress> PeerManager::discover() {
  std::lock_guard<std::mutex> lock(mutex_);

  std::vector<protocol::NetworkAddress> candidates(
      config_.bootstrap_addresses.begin(), config_.bootstrap_addresses.end());
  candidates.insert(candidates.end(), learned_addresses_.begin(),
                    learned_addresses_.end());
  learned_addresses_.clear();

  size_t added = 0;
  for (const auto &addr : candidates) {
    if (!addr.is_valid() || is_banned_address(addr)) {
      continue;
    }
    if (address_index_.count(addr.to_string()) == 0) {
      get_or_create_locked(addr);
      ++added;
    }
  }

  std::set<protocol::NetworkAddress> known;
  for (const auto &[id, entry] : peers_) {
    const PeerRecord &rec = entry.record;
    if (rec.inbound || rec.state == PeerRecordState::Banned ||
        is_banned_address(rec.address)) {
      continue;
    }
    known.insert(rec.address);
  }

  if (added > 0) {
    LOG_NET_DEBUG("discover: {} new addresses, {} known", added, known.size());
  }
  return known;
}

void PeerManager::add_known_addresses(
    const std::vector<protocol::NetworkAddress> &addrs) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto &addr : addrs) {
    if (learned_addresses_.size() >= MAX_LEARNED_ADDRESSES) {
      break;
    }
    if (addr.is_valid()) {
      learned_addresses_.insert(addr);
    }
  }
}

ConnectResult PeerManager::connect(const protocol::NetworkAddress &address) {
  if (!address.is_valid()) {
    LOG_NET_WARN("connect: invalid address '{}'", address.to_string());
    return {NO_PEER_ID, ConnError::TransportFailed};
  }

  PeerId peer_id = NO_PEER_ID;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_) {
      return {NO_PEER_ID, ConnError::NotRunning};
    }

    auto idx = address_index_.find(address.to_string());
    if (is_banned_address(address)) {
      PeerId known = NO_PEER_ID;
      if (idx != address_index_.end()) {
        known = idx->second;
        auto it = peers_.find(known);
        if (it != peers_.end() && !it->second.peer) {
          it->second.record.state = PeerRecordState::Banned;
        }
      }
      LOG_NET_DEBUG("connect: {} is banned", address.to_string());
      return {known, ConnError::Banned};
    }

    PeerEntry &entry = get_or_create_locked(address);
    PeerRecord &rec = entry.record;
    peer_id = rec.peer_id;

    if (rec.state == PeerRecordState::Banned) {
      // BanMan no longer bans it: the ban expired or was lifted
      LOG_NET_DEBUG("connect: ban on {} lifted, resetting record",
                    address.to_string());
      rec.state = PeerRecordState::Disconnected;
      rec.failure_count = 0;
      rec.next_attempt = {};
    }

    if (rec.state == PeerRecordState::Connecting ||
        rec.state == PeerRecordState::Connected ||
        listen_address_connected_locked(address)) {
      return {peer_id, ConnError::AlreadyConnected};
    }

    auto now = util::GetSteadyTime();
    if (now < rec.next_attempt) {
      return {peer_id, ConnError::BackingOff};
    }

    if (connecting_count_locked() >= config_.max_connecting) {
      return {peer_id, ConnError::CapacityExceeded};
    }

    rec.state = PeerRecordState::Connecting;
    rec.misbehavior = 0;
    rec.should_disconnect = false;
    entry.attempt_started = now;
    entry.replied_getpeers = false;
    entry.connect_outcome.reset();
    entry.pending_connection.reset();
  }

  LOG_NET_DEBUG("trying connection {} peer={}", address.to_string(), peer_id);

  // The transport may report before connect() returns; both halves meet in
  // finish_outbound()
  auto conn = transport_->connect(
      address.host, address.port, [this, peer_id](bool success) {
        boost::asio::post(io_context_, [this, peer_id, success]() {
          on_connect_outcome(peer_id, success);
        });
      });

  bool ready = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = peers_.find(peer_id);
    if (it == peers_.end() ||
        it->second.record.state != PeerRecordState::Connecting) {
      // Dropped while we were dialing (stop(), ban)
      if (conn) {
        conn->close();
      }
      return {peer_id, ConnError::TransportFailed};
    }
    if (!conn) {
      record_failure_locked(it->second, ConnError::TransportFailed);
      return {peer_id, ConnError::TransportFailed};
    }
    it->second.pending_connection = conn;
    ready = it->second.connect_outcome.has_value();
  }

  if (ready) {
    finish_outbound(peer_id);
  }
  return {peer_id, ConnError::None};
}

void PeerManager::on_connect_outcome(PeerId peer_id, bool success) {
  bool ready = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = peers_.find(peer_id);
    if (it == peers_.end() ||
        it->second.record.state != PeerRecordState::Connecting ||
        it->second.peer) {
      return;
    }
    it->second.connect_outcome = success;
    ready = it->second.pending_connection != nullptr;
  }
  if (ready) {
    finish_outbound(peer_id);
  }
}

void PeerManager::finish_outbound(PeerId peer_id) {
  PeerPtr peer;
  TransportConnectionPtr failed;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = peers_.find(peer_id);
    if (it == peers_.end()) {
      return;
    }
    PeerEntry &entry = it->second;
    TransportConnectionPtr conn = std::move(entry.pending_connection);
    entry.pending_connection.reset();
    bool success = entry.connect_outcome.value_or(false);
    entry.connect_outcome.reset();

    if (!conn) {
      return;
    }
    if (!success || !running_) {
      record_failure_locked(entry, ConnError::TransportFailed);
      failed = std::move(conn);
    } else {
      peer = Peer::create_outbound(io_context_, conn, peer_options(),
                                   entry.record.address.host,
                                   entry.record.address.port);
      peer->set_id(peer_id);
      entry.peer = peer;
    }
  }

  if (failed) {
    failed->close();
    return;
  }
  attach_peer(peer);
  peer->start();
}

bool PeerManager::accept_inbound(TransportConnectionPtr connection) {
  if (!connection) {
    return false;
  }
  protocol::NetworkAddress remote(connection->remote_address(),
                                  connection->remote_port());

  PeerPtr peer;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_) {
      connection->close();
      return false;
    }
    if (banman_.IsBanned(remote.host) || banman_.IsDiscouraged(remote.host)) {
      LOG_NET_DEBUG("rejecting inbound from banned/discouraged {}",
                    remote.to_string());
      connection->close();
      return false;
    }
    if (connecting_count_locked() >= config_.max_connecting) {
      LOG_NET_DEBUG("rejecting inbound from {}: too many handshakes in flight",
                    remote.to_string());
      connection->close();
      return false;
    }

    PeerEntry &entry = get_or_create_locked(remote);
    if (entry.peer) {
      // Same host:port still attached; the transport reused a port
      LOG_NET_WARN("inbound {} collides with live peer={}", remote.to_string(),
                   entry.record.peer_id);
      connection->close();
      return false;
    }
    entry.record.inbound = true;
    entry.record.state = PeerRecordState::Connecting;
    entry.record.misbehavior = 0;
    entry.record.should_disconnect = false;
    entry.replied_getpeers = false;
    entry.record.last_seen = util::GetTime();
    entry.attempt_started = util::GetSteadyTime();

    peer = Peer::create_inbound(io_context_, connection, peer_options());
    peer->set_id(entry.record.peer_id);
    entry.peer = peer;
  }

  LOG_NET_DEBUG("accepted inbound connection from {} peer={}",
                remote.to_string(), peer->id());
  attach_peer(peer);
  peer->start();
  return true;
}

void PeerManager::attach_peer(PeerPtr peer) {
  MessageHandler handler;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    handler = message_handler_;
  }
  peer->set_message_handler(std::move(handler));
  peer->set_ready_handler([this](PeerPtr p) { on_peer_ready(p); });
  peer->set_disconnect_handler([this](PeerPtr p) { on_peer_closed(p); });
}

void PeerManager::on_peer_ready(PeerPtr peer) {
  PeerConnectedCallback cb;
  bool outbound = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = peers_.find(peer->id());
    if (it == peers_.end() || it->second.peer != peer) {
      return;
    }
    PeerRecord &rec = it->second.record;
    rec.state = PeerRecordState::Connected;
    rec.failure_count = 0;
    rec.next_attempt = {};
    rec.connected_at = util::GetSteadyTime();
    rec.last_useful = steady_seconds_now();
    rec.last_seen = util::GetTime();
    if (rec.inbound && peer->peer_listen_port() != 0) {
      rec.listen_address =
          protocol::NetworkAddress(rec.address.host, peer->peer_listen_port());
    }
    outbound = !rec.inbound;
    cb = connected_cb_;
    LOG_NET_INFO("peer={} connected ({} {}, agent {})", rec.peer_id,
                 rec.inbound ? "inbound" : "outbound", rec.address.to_string(),
                 peer->user_agent());
  }

  // Ask new outbound peers who else they know
  if (outbound) {
    peer->send_message(std::make_unique<message::GetPeersMessage>());
  }

  if (cb) {
    cb(peer->id());
  }
  enforce_capacity(config_.max_peers);
}

void PeerManager::on_peer_closed(PeerPtr peer) {
  PeerDisconnectedCallback cb;
  PeerId id = peer->id();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = peers_.find(id);
    // Already detached by disconnect(); that path notified listeners
    if (it == peers_.end() || it->second.peer != peer) {
      return;
    }
    PeerEntry &entry = it->second;
    entry.peer.reset();
    if (entry.record.state == PeerRecordState::Connecting && !entry.record.inbound) {
      record_failure_locked(entry, ConnError::HandshakeFailed);
    } else if (entry.record.state != PeerRecordState::Banned) {
      entry.record.state = PeerRecordState::Disconnected;
    }
    entry.record.last_seen = util::GetTime();
    cb = disconnected_cb_;
  }
  LOG_NET_DEBUG("peer={} closed by remote", id);
  if (cb) {
    cb(id, DisconnectReason::TransportClosed);
  }
}

bool PeerManager::drop_peer(PeerId peer_id, DisconnectReason reason,
                            bool count_failure) {
  PeerPtr peer;
  TransportConnectionPtr pending;
  PeerDisconnectedCallback cb;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = peers_.find(peer_id);
    if (it == peers_.end()) {
      return false;
    }
    PeerEntry &entry = it->second;
    PeerRecordState state = entry.record.state;
    if (!entry.peer && !entry.pending_connection &&
        state != PeerRecordState::Connecting && state != PeerRecordState::Connected) {
      return false;
    }
    peer = std::move(entry.peer);
    entry.peer.reset();
    pending = std::move(entry.pending_connection);
    entry.pending_connection.reset();
    entry.connect_outcome.reset();

    if (count_failure && !entry.record.inbound) {
      record_failure_locked(entry, ConnError::HandshakeFailed);
    } else if (state != PeerRecordState::Banned) {
      entry.record.state = PeerRecordState::Disconnected;
    }
    entry.record.last_seen = util::GetTime();
    cb = disconnected_cb_;
  }

  LOG_NET_DEBUG("disconnecting peer={} ({})", peer_id,
                DisconnectReasonName(reason));
  if (pending) {
    pending->close();
  }
  // Detached above, so the peer's own disconnect handler is a no-op
  if (peer) {
    peer->disconnect();
  }
  if (cb) {
    cb(peer_id, reason);
  }
  return true;
}

bool PeerManager::disconnect(PeerId peer_id, DisconnectReason reason) {
  return drop_peer(peer_id, reason, false);
}

void PeerManager::disconnect_all(DisconnectReason reason) {
  std::vector<PeerId> ids;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto &[id, entry] : peers_) {
      if (entry.peer || entry.pending_connection ||
          entry.record.state == PeerRecordState::Connecting ||
          entry.record.state == PeerRecordState::Connected) {
        ids.push_back(id);
      }
    }
  }
  for (PeerId id : ids) {
    drop_peer(id, reason, false);
  }
}

size_t PeerManager::enforce_capacity(size_t max_peers) {
  size_t evicted = 0;
  const size_t floor = std::max(max_peers, config_.min_peers);

  while (true) {
    PeerId victim = NO_PEER_ID;
    {
      std::lock_guard<std::mutex> lock(mutex_);

      struct Candidate {
        PeerId id;
        int64_t score;
        std::chrono::steady_clock::time_point connected_at;
      };
      std::vector<Candidate> connected;
      for (const auto &[id, entry] : peers_) {
        if (entry.record.state != PeerRecordState::Connected || !entry.peer) {
          continue;
        }
        const PeerRecord &rec = entry.record;
        int64_t useful = entry.peer->stats().last_useful.load().count();
        int64_t score = useful -
                        int64_t{config_.failure_penalty} * rec.failure_count -
                        rec.misbehavior;
        connected.push_back({id, score, rec.connected_at});
      }
      if (connected.size() <= floor) {
        break;
      }

      // Protect the newest connection
      auto newest = std::max_element(
          connected.begin(), connected.end(),
          [](const Candidate &a, const Candidate &b) {
            if (a.connected_at != b.connected_at)
              return a.connected_at < b.connected_at;
            return a.id < b.id;
          });
      PeerId protected_id = newest->id;

      const Candidate *worst = nullptr;
      for (const auto &c : connected) {
        if (c.id == protected_id) {
          continue;
        }
        if (!worst || c.score < worst->score ||
            (c.score == worst->score &&
             (c.connected_at < worst->connected_at ||
              (c.connected_at == worst->connected_at && c.id < worst->id)))) {
          worst = &c;
        }
      }
      if (!worst) {
        break;
      }
      victim = worst->id;
      LOG_NET_DEBUG("capacity {}/{}: evicting peer={} (score {})",
                    connected.size(), max_peers, victim, worst->score);
    }

    if (!disconnect(victim, DisconnectReason::Evicted)) {
      break;
    }
    ++evicted;
  }
  return evicted;
}

void PeerManager::send_heartbeats() {
  for (const auto &peer : get_connected_peers()) {
    peer->send_ping();
  }
}

size_t PeerManager::check_liveness() {
  const auto now = util::GetSteadyTime();
  const auto now_secs = steady_seconds_now();
  const int64_t wall_now = util::GetTime();

  std::vector<PeerId> silent;
  std::vector<PeerId> stalled;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto &[id, entry] : peers_) {
      PeerRecord &rec = entry.record;
      if (rec.state == PeerRecordState::Connected && entry.peer) {
        auto idle = now_secs - entry.peer->stats().last_recv.load();
        rec.last_seen = wall_now - idle.count();
        if (idle > config_.peer_timeout) {
          LOG_NET_INFO("peer={} silent for {}s, disconnecting", id, idle.count());
          silent.push_back(id);
        }
      } else if (rec.state == PeerRecordState::Connecting &&
                 now - entry.attempt_started > config_.handshake_timeout) {
        LOG_NET_INFO("peer={} handshake timed out", id);
        stalled.push_back(id);
      }
    }
  }

  size_t dropped = 0;
  for (PeerId id : silent) {
    if (drop_peer(id, DisconnectReason::Timeout, false))
      ++dropped;
  }
  for (PeerId id : stalled) {
    if (drop_peer(id, DisconnectReason::Timeout, true))
      ++dropped;
  }
  return dropped;
}

size_t PeerManager::prune_stale(std::chrono::seconds max_age) {
  std::lock_guard<std::mutex> lock(mutex_);
  const int64_t cutoff = util::GetTime() - max_age.count();
  size_t removed = 0;
  for (auto it = peers_.begin(); it != peers_.end();) {
    const PeerEntry &entry = it->second;
    if (entry.record.state == PeerRecordState::Disconnected && !entry.peer &&
        !entry.pending_connection && entry.record.last_seen < cutoff) {
      address_index_.erase(entry.record.address.to_string());
      it = peers_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  if (removed > 0) {
    LOG_NET_DEBUG("pruned {} stale peer records", removed);
  }
  return removed;
}

void PeerManager::ban_address(const std::string &address,
                              int64_t ban_time_offset,
                              const std::string &reason) {
  banman_.Ban(address, ban_time_offset, reason);

  std::vector<PeerId> matches;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto &[id, entry] : peers_) {
      if (entry.record.address.to_string() == address ||
          entry.record.address.host == address) {
        matches.push_back(id);
      }
    }
  }
  for (PeerId id : matches) {
    disconnect(id, DisconnectReason::Requested);
  }

  std::lock_guard<std::mutex> lock(mutex_);
  for (PeerId id : matches) {
    auto it = peers_.find(id);
    if (it != peers_.end() && !it->second.peer) {
      address_index_.erase(it->second.record.address.to_string());
      peers_.erase(it);
    }
  }
}

void PeerManager::handle_getpeers(PeerPtr peer) {
  auto reply = std::make_unique<message::PeersMessage>();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto self = peers_.find(peer->id());
    if (self == peers_.end() || self->second.peer != peer) {
      return;
    }
    if (self->second.replied_getpeers) {
      LOG_NET_TRACE("ignoring repeated getpeers from peer={}", peer->id());
      return;
    }
    self->second.replied_getpeers = true;

    for (const auto &[id, entry] : peers_) {
      if (id == peer->id() || entry.record.state != PeerRecordState::Connected) {
        continue;
      }
      if (reply->addresses.size() >= protocol::MAX_PEERS_ADDRESSES) {
        break;
      }
      if (!entry.record.inbound) {
        reply->addresses.push_back(entry.record.address);
      } else if (entry.record.listen_address) {
        reply->addresses.push_back(*entry.record.listen_address);
      }
    }
  }
  LOG_NET_TRACE("sending {} addresses to peer={}", reply->addresses.size(),
                peer->id());
  if (peer->send_message(std::move(reply)) == SendResult::QueueFull) {
    ReportSendQueueFull(peer->id());
  }
}

void PeerManager::handle_peers(PeerPtr peer, const message::PeersMessage &msg) {
  LOG_NET_TRACE("received {} addresses from peer={}", msg.addresses.size(),
                peer->id());
  add_known_addresses(msg.addresses);
}

void PeerManager::ReportIntegrityViolation(PeerId peer_id,
                                           const std::string &detail) {
  Misbehaving(peer_id, MisbehaviorPenalty::INTEGRITY_VIOLATION,
              "integrity violation: " + detail);
}

void PeerManager::ReportProtocolViolation(PeerId peer_id,
                                          const std::string &detail) {
  Misbehaving(peer_id, MisbehaviorPenalty::PROTOCOL_VIOLATION,
              "protocol violation: " + detail);
}

void PeerManager::ReportSendQueueFull(PeerId peer_id) {
  Misbehaving(peer_id, MisbehaviorPenalty::SEND_QUEUE_FULL, "send queue full");
}

bool PeerManager::Misbehaving(PeerId peer_id, int penalty,
                              const std::string &reason) {
  std::string host;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = peers_.find(peer_id);
    if (it == peers_.end()) {
      LOG_NET_TRACE("Misbehaving() peer={} not found", peer_id);
      return false;
    }
    PeerRecord &rec = it->second.record;
    int old_score = rec.misbehavior;
    rec.misbehavior += penalty;
    LOG_NET_DEBUG("peer={} ({}) misbehavior +{}: {} (total score: {})", peer_id,
                  rec.address.to_string(), penalty, reason, rec.misbehavior);

    if (rec.misbehavior < DISCOURAGEMENT_THRESHOLD ||
        old_score >= DISCOURAGEMENT_THRESHOLD || rec.should_disconnect) {
      return false;
    }
    rec.should_disconnect = true;
    host = rec.address.host;
  }

  LOG_NET_WARN("peer={} crossed misbehavior threshold, discouraging {}",
               peer_id, host);
  banman_.Discourage(host);
  // Usually reported from inside this peer's receive path; disconnect later
  boost::asio::post(io_context_, [this, peer_id]() {
    disconnect(peer_id, DisconnectReason::Misbehavior);
  });
  return true;
}

int PeerManager::GetMisbehaviorScore(PeerId peer_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = peers_.find(peer_id);
  return it == peers_.end() ? 0 : it->second.record.misbehavior;
}

bool PeerManager::ShouldDisconnect(PeerId peer_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = peers_.find(peer_id);
  return it != peers_.end() && it->second.record.should_disconnect;
}

PeerPtr PeerManager::get_peer(PeerId peer_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = peers_.find(peer_id);
  return it == peers_.end() ? nullptr : it->second.peer;
}

std::vector<PeerPtr> PeerManager::get_connected_peers() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<PeerPtr> result;
  for (const auto &[id, entry] : peers_) {
    if (entry.record.state == PeerRecordState::Connected && entry.peer) {
      result.push_back(entry.peer);
    }
  }
  return result;
}

std::optional<PeerRecord> PeerManager::get_record(PeerId peer_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = peers_.find(peer_id);
  if (it == peers_.end()) {
    return std::nullopt;
  }
  PeerRecord rec = it->second.record;
  if (it->second.peer) {
    rec.last_useful = it->second.peer->stats().last_useful.load();
  }
  return rec;
}

std::optional<PeerRecord>
PeerManager::find_record(const protocol::NetworkAddress &address) const {
  PeerId id = NO_PEER_ID;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto idx = address_index_.find(address.to_string());
    if (idx == address_index_.end()) {
      return std::nullopt;
    }
    id = idx->second;
  }
  return get_record(id);
}

std::vector<PeerRecord> PeerManager::get_records() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<PeerRecord> result;
  result.reserve(peers_.size());
  for (const auto &[id, entry] : peers_) {
    result.push_back(entry.record);
  }
  return result;
}

size_t PeerManager::connected_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return std::count_if(peers_.begin(), peers_.end(), [](const auto &kv) {
    return kv.second.record.state == PeerRecordState::Connected &&
           kv.second.peer != nullptr;
  });
}

size_t PeerManager::record_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return peers_.size();
}

void PeerManager::set_message_handler(MessageHandler handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  message_handler_ = std::move(handler);
}

void PeerManager::set_peer_connected_callback(PeerConnectedCallback cb) {
  std::lock_guard<std::mutex> lock(mutex_);
  connected_cb_ = std::move(cb);
}

void PeerManager::set_peer_disconnected_callback(PeerDisconnectedCallback cb) {
  std::lock_guard<std::mutex> lock(mutex_);
  disconnected_cb_ = std::move(cb);
}

} // namespace network
} // namespace chaincraft
