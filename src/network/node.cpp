// Copyright (c) 2024 Chaincraft
// Distributed under the MIT software license

#include "network/node.hpp"
#include "consensus/validators.hpp"
#include "network/real_transport.hpp"
#include "storage/memory_object_store.hpp"
#include "util/logging.hpp"
#include <random>
#include <stdexcept>

namespace chaincraft {
namespace network {

static uint64_t generate_nonce() {
  static std::random_device rd;
  static std::mt19937_64 gen(rd());
  static std::uniform_int_distribution<uint64_t> dis;
  return dis(gen);
}

Node::Node(const NodeConfig &config, std::shared_ptr<Transport> transport,
           boost::asio::io_context *external_io_context,
           std::shared_ptr<storage::ObjectStore> store,
           std::shared_ptr<const consensus::Validator> validator)
    : config_(config), local_nonce_(generate_nonce()), transport_(transport),
      owned_io_context_(external_io_context
                            ? nullptr
                            : std::make_unique<boost::asio::io_context>()),
      io_context_(external_io_context ? *external_io_context
                                      : *owned_io_context_),
      crypto_(std::make_shared<crypto::OpenSslCrypto>()), store_(store) {

  if (!transport_) {
    transport_ = std::make_shared<RealTransport>(config_.io_threads);
  }
  if (!store_) {
    store_ = std::make_shared<storage::MemoryObjectStore>();
  }
  if (!validator) {
    validator = consensus::CreateValidator(config_.validator, crypto_,
                                           config_.max_object_size);
    if (!validator) {
      throw std::invalid_argument("unknown validator '" + config_.validator +
                                  "'");
    }
  }

  LOG_NET_TRACE("Node initialized (local nonce: {}, external_io_context: {})",
                local_nonce_, external_io_context ? "yes" : "no");

  ban_man_ = std::make_unique<BanMan>(config_.datadir);

  PeerManager::Config pm_config;
  pm_config.network_magic = config_.network_magic;
  pm_config.listen_port = config_.listen_enabled ? config_.port : 0;
  pm_config.local_nonce = local_nonce_;
  pm_config.max_peers = config_.max_peers;
  pm_config.min_peers = config_.min_peers;
  pm_config.send_queue_limit = config_.send_queue_limit;
  pm_config.bootstrap_addresses = config_.bootstrap_addresses;
  pm_config.peer_timeout = config_.peer_timeout;
  pm_config.handshake_timeout = config_.handshake_timeout;
  pm_config.backoff_base = config_.backoff_base;
  pm_config.backoff_max = config_.backoff_max;
  pm_config.ban_threshold = config_.ban_threshold;
  pm_config.ban_duration = config_.ban_duration;
  peer_manager_ = std::make_unique<PeerManager>(io_context_, transport_,
                                                *ban_man_, pm_config);

  gossip::DedupCache::Config dedup_config;
  dedup_config.capacity = config_.dedup_capacity;
  dedup_config.ttl = config_.dedup_ttl;
  dedup_config.shards = config_.dedup_shards;
  dedup_ = std::make_unique<gossip::DedupCache>(dedup_config);

  consensus_ = std::make_unique<consensus::ConsensusEngine>(validator);

  gossip::GossipEngine::Config gossip_config;
  gossip_config.worker_threads = config_.worker_threads;
  gossip_config.deferred.max_retries = config_.deferred_max_retries;
  gossip_config.deferred.ttl = config_.deferred_ttl;
  gossip_config.deferred.max_entries = config_.deferred_max_entries;
  gossip_ = std::make_unique<gossip::GossipEngine>(
      *peer_manager_, *consensus_, *store_, *crypto_, *dedup_, gossip_config);

  message_router_ =
      std::make_unique<MessageRouter>(peer_manager_.get(), gossip_.get());

  peer_manager_->set_message_handler(
      [this](PeerPtr peer, std::unique_ptr<message::Message> msg) {
        return message_router_->RouteMessage(std::move(peer), std::move(msg));
      });
  peer_manager_->set_peer_disconnected_callback(
      [this](PeerId peer_id, DisconnectReason reason) {
        LOG_NET_DEBUG("peer={} gone ({})", peer_id,
                      DisconnectReasonName(reason));
        gossip_->on_peer_disconnected(peer_id);
      });
  gossip_->set_fatal_error_callback(
      [this](const std::string &what) { on_fatal_error(what); });
}

Node::~Node() {
  stop();
  // Nothing may call back into a half-destroyed Node
  peer_manager_->set_peer_disconnected_callback({});
  peer_manager_->set_message_handler({});
  gossip_->set_fatal_error_callback({});
}

bool Node::start() {
  if (running_.load(std::memory_order_acquire)) {
    return false;
  }

  std::lock_guard<std::mutex> lock(start_stop_mutex_);
  if (running_.load(std::memory_order_acquire)) {
    return false;
  }
  if (fatal_) {
    LOG_NET_ERROR("refusing to start after a fatal error: {}", fatal_error());
    return false;
  }

  if (!config_.datadir.empty() && !ban_man_->Load()) {
    LOG_NET_WARN("could not load ban list from {}", ban_man_->GetBanlistPath());
  }

  running_.store(true, std::memory_order_release);

  transport_->run();
  gossip_->start();
  peer_manager_->start();

  // When using an external io_context (tests), the caller drives events and
  // calls the test hooks instead of timers
  if (config_.io_threads > 0) {
    work_guard_ = std::make_unique<
        boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>(
        boost::asio::make_work_guard(io_context_));
    maintenance_timer_ = std::make_unique<boost::asio::steady_timer>(io_context_);
    heartbeat_timer_ = std::make_unique<boost::asio::steady_timer>(io_context_);
  }

  for (size_t i = 0; i < config_.io_threads; ++i) {
    io_threads_.emplace_back([this]() { io_context_.run(); });
  }

  if (config_.listen_enabled && config_.port > 0) {
    bool success = transport_->listen(
        config_.port, [this](TransportConnectionPtr connection) {
          if (running_.load(std::memory_order_acquire)) {
            peer_manager_->accept_inbound(connection);
          } else {
            connection->close();
          }
        });
    if (success) {
      LOG_NET_INFO("listening on port {}", config_.port);
    } else {
      LOG_NET_ERROR("Failed to start listener on port {}", config_.port);
      // Continue anyway - we can still make outbound connections
    }
  }

  attempt_outbound_connections(config_.max_peers);

  if (config_.io_threads > 0) {
    schedule_next_maintenance();
    schedule_next_heartbeat();
  }

  LOG_NET_INFO("node started (validator {}, max_peers={}, min_peers={})",
               consensus_->validator().name(), config_.max_peers,
               config_.min_peers);
  return true;
}

void Node::stop() {
  if (!running_.load(std::memory_order_acquire)) {
    return;
  }

  std::lock_guard<std::mutex> lock(start_stop_mutex_);
  if (!running_.load(std::memory_order_acquire)) {
    return;
  }

  running_.store(false, std::memory_order_release);

  if (maintenance_timer_) {
    maintenance_timer_->cancel();
  }
  if (heartbeat_timer_) {
    heartbeat_timer_->cancel();
  }

  transport_->stop_listening();

  // Finish in-flight validations while peers are still attached so that
  // accepted objects are persisted before the connections go away
  gossip_->stop();

  peer_manager_->stop();

  io_context_.stop();
  work_guard_.reset();

  transport_->stop();

  for (auto &thread : io_threads_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
  io_threads_.clear();

  // Reset io_context for potential restart
  io_context_.restart();

  if (!config_.datadir.empty() && !ban_man_->Save()) {
    LOG_NET_ERROR("failed to save ban list to {}", ban_man_->GetBanlistPath());
  }
  LOG_NET_INFO("node stopped");
}

primitives::Digest Node::submit_local(std::vector<uint8_t> payload,
                                      primitives::ObjectKind kind) {
  if (!running_.load(std::memory_order_acquire)) {
    LOG_NET_DEBUG("submit_local while stopped; object will not be announced");
  }
  return gossip_->submit_local(std::move(payload), kind);
}

ConnectResult Node::connect_to(const protocol::NetworkAddress &address) {
  ConnectResult result = peer_manager_->connect(address);
  if (!result.ok()) {
    LOG_NET_DEBUG("connect to {} failed: {}", address.to_string(),
                  ConnErrorName(result.error));
  }
  return result;
}

bool Node::disconnect_from(PeerId peer_id) {
  return peer_manager_->disconnect(peer_id, DisconnectReason::Requested);
}

std::string Node::fatal_error() const {
  std::lock_guard<std::mutex> lock(fatal_mutex_);
  return fatal_what_;
}

void Node::set_fatal_error_callback(gossip::FatalErrorCallback cb) {
  std::lock_guard<std::mutex> lock(fatal_mutex_);
  fatal_cb_ = std::move(cb);
}

void Node::on_fatal_error(const std::string &what) {
  gossip::FatalErrorCallback cb;
  {
    std::lock_guard<std::mutex> lock(fatal_mutex_);
    if (fatal_.exchange(true)) {
      return;
    }
    fatal_what_ = what;
    cb = fatal_cb_;
  }
  LOG_NET_ERROR("fatal error, node must shut down: {}", what);
  if (cb) {
    cb(what);
  }
}

void Node::attempt_outbound_connections(size_t target) {
  if (!running_.load(std::memory_order_acquire)) {
    return;
  }

  auto active = [this]() {
    size_t n = 0;
    for (const auto &rec : peer_manager_->get_records()) {
      if (rec.state == PeerRecordState::Connected ||
          rec.state == PeerRecordState::Connecting) {
        ++n;
      }
    }
    return n;
  };

  size_t current = active();
  if (current >= target) {
    return;
  }

  for (const auto &addr : peer_manager_->discover()) {
    if (current >= target) {
      break;
    }
    ConnectResult result = peer_manager_->connect(addr);
    if (result.ok()) {
      ++current;
    } else if (result.error == ConnError::CapacityExceeded) {
      break;
    } else if (result.error != ConnError::AlreadyConnected &&
               result.error != ConnError::BackingOff) {
      LOG_NET_TRACE("dial {} skipped: {}", addr.to_string(),
                    ConnErrorName(result.error));
    }
  }
}

void Node::run_maintenance() {
  if (!running_.load(std::memory_order_acquire)) {
    return;
  }

  peer_manager_->check_liveness();
  peer_manager_->enforce_capacity(config_.max_peers);
  peer_manager_->prune_stale(STALE_RECORD_AGE);

  ban_man_->SweepBanned();
  ban_man_->SweepDiscouraged();

  gossip_->maintenance();

  attempt_outbound_connections(config_.min_peers);
}

void Node::schedule_next_maintenance() {
  if (!running_.load(std::memory_order_acquire) || !maintenance_timer_) {
    return;
  }

  maintenance_timer_->expires_after(config_.maintenance_interval);
  maintenance_timer_->async_wait([this](const boost::system::error_code &ec) {
    if (!ec && running_.load(std::memory_order_acquire)) {
      run_maintenance();
      schedule_next_maintenance();
    }
  });
}

void Node::schedule_next_heartbeat() {
  if (!running_.load(std::memory_order_acquire) || !heartbeat_timer_) {
    return;
  }

  heartbeat_timer_->expires_after(config_.heartbeat_interval);
  heartbeat_timer_->async_wait([this](const boost::system::error_code &ec) {
    if (!ec && running_.load(std::memory_order_acquire)) {
      peer_manager_->send_heartbeats();
      schedule_next_heartbeat();
    }
  });
}

} // namespace network
} // namespace chaincraft
