// Copyright (c) 2024 Chaincraft
// Distributed under the MIT software license

#include "network/peer.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"
#include <random>

namespace chaincraft {
namespace network {

// thread_local so peers created on different threads never share generator state
static uint64_t generate_ping_nonce() {
  thread_local std::random_device rd;
  thread_local std::mt19937_64 gen(rd());
  thread_local std::uniform_int_distribution<uint64_t> dis(1);
  return dis(gen);
}

static std::chrono::seconds steady_seconds() {
  return std::chrono::duration_cast<std::chrono::seconds>(
      util::GetSteadyTime().time_since_epoch());
}

Peer::Peer(boost::asio::io_context &io_context,
           TransportConnectionPtr connection, const Options &options,
           bool is_inbound, const std::string &target_address,
           uint16_t target_port)
    : io_context_(io_context), connection_(connection),
      network_magic_(options.network_magic), local_nonce_(options.local_nonce),
      local_listen_port_(options.listen_port),
      send_queue_limit_(options.send_queue_limit), is_inbound_(is_inbound),
      target_address_(target_address), target_port_(target_port),
      state_(connection && connection->is_open()
                 ? PeerState::CONNECTED
                 : (connection ? PeerState::CONNECTING
                               : PeerState::DISCONNECTED)) {}

Peer::~Peer() {
  // Cleanup belongs in disconnect(), while a shared_ptr is still alive
  if (state_ != PeerState::DISCONNECTED) {
    LOG_NET_ERROR("Peer destructor called without prior disconnect() - peer={}, "
                  "state={}, address={}",
                  id_, static_cast<int>(state_.load()), target_address_);
  }
}

PeerPtr Peer::create_outbound(boost::asio::io_context &io_context,
                              TransportConnectionPtr connection,
                              const Options &options,
                              const std::string &target_address,
                              uint16_t target_port) {
  return PeerPtr(new Peer(io_context, connection, options, false,
                          target_address, target_port));
}

PeerPtr Peer::create_inbound(boost::asio::io_context &io_context,
                             TransportConnectionPtr connection,
                             const Options &options) {
  std::string addr = connection ? connection->remote_address() : "";
  uint16_t port = connection ? connection->remote_port() : 0;
  return PeerPtr(new Peer(io_context, connection, options, true, addr, port));
}

void Peer::start() {
  LOG_NET_TRACE("Peer::start() peer={} state={} is_inbound={} address={}", id_,
                static_cast<int>(state_.load()), is_inbound_, address());

  // start() runs once: CONNECTING/CONNECTED -> handshake
  PeerState s = state_;
  if (s != PeerState::CONNECTING && s != PeerState::CONNECTED) {
    if (s == PeerState::DISCONNECTED) {
      LOG_NET_ERROR("Cannot start disconnected peer - id:{}, address:{}", id_,
                    address());
    } else {
      LOG_NET_TRACE("Peer {} already started (state={}), ignoring", id_,
                    static_cast<int>(s));
    }
    return;
  }

  auto conn = connection();
  if (!conn || !conn->is_open()) {
    LOG_NET_ERROR("Cannot start peer {} - connection not open", id_);
    return;
  }
  state_ = PeerState::CONNECTED;

  auto now = steady_seconds();
  stats_.connected_time.store(now, std::memory_order_relaxed);
  stats_.last_send.store(now, std::memory_order_relaxed);
  stats_.last_recv.store(now, std::memory_order_relaxed);
  stats_.last_useful.store(now, std::memory_order_relaxed);

  // Callbacks hold a shared_ptr so the peer outlives any callback in flight
  PeerPtr self = shared_from_this();
  conn->set_receive_callback([self](const std::vector<uint8_t> &data) {
    self->on_transport_receive(data);
  });
  conn->set_disconnect_callback([self]() { self->on_transport_disconnect(); });

  conn->start();

  if (!is_inbound_) {
    send_version();
  }
}

void Peer::disconnect() {
  if (closed_.exchange(true)) {
    LOG_NET_TRACE("Peer {} already disconnected/disconnecting, skipping", id_);
    return;
  }

  state_ = PeerState::DISCONNECTING;
  LOG_NET_DEBUG("disconnecting peer={} address={}", id_, address());

  TransportConnectionPtr conn;
  {
    std::lock_guard<std::mutex> lock(connection_mutex_);
    conn = std::move(connection_);
    connection_.reset();
  }
  if (conn) {
    // Clear callbacks before closing so nothing re-enters this peer
    conn->set_receive_callback({});
    conn->set_disconnect_callback({});
    conn->close();
  }

  on_disconnect();
}

void Peer::post_disconnect() {
  // Deferred so a caller holding the last shared_ptr is not destroyed mid-call
  auto self = shared_from_this();
  boost::asio::post(io_context_, [self]() { self->disconnect(); });
}

SendResult Peer::send_message(std::unique_ptr<message::Message> msg) {
  const std::string command = msg->command();

  PeerState s = state_;
  if (closed_ || s == PeerState::DISCONNECTED ||
      s == PeerState::DISCONNECTING) {
    LOG_NET_TRACE("Cannot send {} to peer {} - peer is disconnected", command,
                  id_);
    return SendResult::Disconnected;
  }

  auto conn = connection();
  if (!conn) {
    return SendResult::Disconnected;
  }

  if (conn->pending_sends() >= send_queue_limit_) {
    stats_.messages_dropped.fetch_add(1, std::memory_order_relaxed);
    LOG_NET_DEBUG("send queue full for peer={} ({} pending), dropping {}", id_,
                  conn->pending_sends(), command);
    return SendResult::QueueFull;
  }

  auto frame = message::frame_message(network_magic_, *msg);
  LOG_NET_TRACE("Sending {} to {} (size: {} bytes)", command, address(),
                frame.size());

  if (!conn->send(frame)) {
    LOG_NET_WARN("Failed to send {} to peer={}", command, id_);
    post_disconnect();
    return SendResult::Disconnected;
  }

  stats_.messages_sent.fetch_add(1, std::memory_order_relaxed);
  stats_.bytes_sent.fetch_add(frame.size(), std::memory_order_relaxed);
  stats_.last_send.store(steady_seconds(), std::memory_order_relaxed);
  return SendResult::Sent;
}

void Peer::send_ping() {
  if (state_ != PeerState::READY) {
    return;
  }
  // Still waiting for PONG; keep the outstanding nonce
  if (last_ping_nonce_ != 0) {
    return;
  }
  uint64_t nonce = generate_ping_nonce();
  ping_sent_time_ = util::GetSteadyTime();
  last_ping_nonce_ = nonce;
  send_message(std::make_unique<message::PingMessage>(nonce));
}

void Peer::mark_useful() {
  stats_.last_useful.store(steady_seconds(), std::memory_order_relaxed);
}

void Peer::set_message_handler(MessageHandler handler) {
  std::lock_guard<std::mutex> lock(handler_mutex_);
  message_handler_ = std::move(handler);
}

void Peer::set_ready_handler(PeerEventHandler handler) {
  std::lock_guard<std::mutex> lock(handler_mutex_);
  ready_handler_ = std::move(handler);
}

void Peer::set_disconnect_handler(PeerEventHandler handler) {
  std::lock_guard<std::mutex> lock(handler_mutex_);
  disconnect_handler_ = std::move(handler);
}

std::string Peer::address() const {
  if (!target_address_.empty())
    return target_address_;
  auto conn = connection();
  return conn ? conn->remote_address() : "unknown";
}

uint16_t Peer::port() const {
  if (target_port_ != 0)
    return target_port_;
  auto conn = connection();
  return conn ? conn->remote_port() : 0;
}

TransportConnectionPtr Peer::connection() const {
  std::lock_guard<std::mutex> lock(connection_mutex_);
  return connection_;
}

void Peer::on_disconnect() {
  state_ = PeerState::DISCONNECTED;
  LOG_NET_TRACE("peer disconnected: {}:{}", address(), port());

  PeerEventHandler handler;
  {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    handler = std::move(disconnect_handler_);
    disconnect_handler_ = nullptr;
    message_handler_ = nullptr;
    ready_handler_ = nullptr;
  }
  if (handler) {
    handler(shared_from_this());
  }
}

void Peer::on_transport_receive(const std::vector<uint8_t> &data) {
  if (closed_) {
    return;
  }

  // Check the chunk before allocating anything for it
  if (data.size() > protocol::DEFAULT_RECV_FLOOD_SIZE) {
    LOG_NET_WARN("Oversized chunk received ({} bytes, limit: {} bytes), "
                 "disconnecting from {}",
                 data.size(), protocol::DEFAULT_RECV_FLOOD_SIZE, address());
    post_disconnect();
    return;
  }

  size_t usable_bytes = recv_buffer_.size() - recv_buffer_offset_;
  if (usable_bytes + data.size() > protocol::DEFAULT_RECV_FLOOD_SIZE) {
    LOG_NET_WARN("Receive buffer overflow (usable: {} bytes, incoming: {} "
                 "bytes), disconnecting from {}",
                 usable_bytes, data.size(), address());
    post_disconnect();
    return;
  }

  // Compact once the consumed prefix is at least half the buffer
  if (recv_buffer_offset_ > 0 &&
      recv_buffer_offset_ >= recv_buffer_.size() / 2) {
    recv_buffer_.erase(recv_buffer_.begin(),
                       recv_buffer_.begin() + recv_buffer_offset_);
    recv_buffer_offset_ = 0;
  }

  recv_buffer_.insert(recv_buffer_.end(), data.begin(), data.end());

  stats_.bytes_received.fetch_add(data.size(), std::memory_order_relaxed);
  stats_.last_recv.store(steady_seconds(), std::memory_order_relaxed);

  process_received_data();
}

void Peer::on_transport_disconnect() {
  LOG_NET_TRACE("Transport disconnected: {}:{}", address(), port());
  // Remote side closed; the connection is already down so only our state moves
  if (closed_.exchange(true)) {
    return;
  }
  {
    std::lock_guard<std::mutex> lock(connection_mutex_);
    connection_.reset();
  }
  on_disconnect();
}

void Peer::send_version() {
  auto version_msg = std::make_unique<message::VersionMessage>();
  version_msg->version = protocol::PROTOCOL_VERSION;
  version_msg->timestamp = util::GetTime();
  version_msg->nonce = local_nonce_;
  version_msg->listen_port = local_listen_port_;
  version_msg->user_agent = protocol::GetUserAgent();

  state_ = PeerState::VERSION_SENT;
  send_message(std::move(version_msg));
}

void Peer::handle_version(const message::VersionMessage &msg) {
  LOG_NET_TRACE("handle_version() peer={} version={} user_agent={} nonce={}",
                id_, msg.version, msg.user_agent, msg.nonce);

  if (peer_version_ != 0) {
    LOG_NET_WARN("duplicate version message from peer={}, ignoring", id_);
    return;
  }

  if (msg.version < protocol::MIN_PROTOCOL_VERSION) {
    LOG_NET_WARN("peer={} using obsolete protocol version {} (min: {}), "
                 "disconnecting",
                 id_, msg.version, protocol::MIN_PROTOCOL_VERSION);
    post_disconnect();
    return;
  }

  if (msg.nonce == local_nonce_) {
    LOG_NET_WARN("self connection detected, disconnecting peer={}", id_);
    post_disconnect();
    return;
  }

  peer_version_ = msg.version;
  peer_user_agent_ = msg.user_agent;
  peer_nonce_ = msg.nonce;
  peer_listen_port_ = msg.listen_port;

  // Inbound: our VERSION must reach the remote before our VERACK
  if (is_inbound_ && state_ == PeerState::CONNECTED) {
    send_version();
  }

  send_message(std::make_unique<message::VerackMessage>());
}

void Peer::handle_verack() {
  if (successfully_connected_) {
    LOG_NET_WARN("Duplicate VERACK from peer {}, ignoring", id_);
    return;
  }
  if (state_ != PeerState::VERSION_SENT) {
    LOG_NET_WARN("VERACK from peer={} before our VERSION, disconnecting", id_);
    post_disconnect();
    return;
  }

  state_ = PeerState::READY;
  successfully_connected_ = true;
  LOG_NET_DEBUG("handshake complete peer={} address={}:{} agent={}", id_,
                address(), port(), peer_user_agent_);

  PeerEventHandler handler;
  {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    handler = ready_handler_;
  }
  if (handler) {
    handler(shared_from_this());
  }
}

void Peer::process_received_data() {
  while (!closed_ &&
         recv_buffer_.size() - recv_buffer_offset_ >=
             protocol::MESSAGE_HEADER_SIZE) {
    const uint8_t *read_ptr = recv_buffer_.data() + recv_buffer_offset_;
    size_t available = recv_buffer_.size() - recv_buffer_offset_;

    protocol::MessageHeader header;
    if (!message::deserialize_header(read_ptr, protocol::MESSAGE_HEADER_SIZE,
                                     header)) {
      LOG_NET_ERROR("invalid message header peer={}", id_);
      post_disconnect();
      return;
    }

    if (header.magic != network_magic_) {
      LOG_NET_ERROR("invalid network magic peer={}", id_);
      post_disconnect();
      return;
    }

    size_t total_message_size = protocol::MESSAGE_HEADER_SIZE + header.length;
    if (available < total_message_size) {
      return;
    }

    const uint8_t *payload_ptr = read_ptr + protocol::MESSAGE_HEADER_SIZE;
    std::vector<uint8_t> payload(payload_ptr, payload_ptr + header.length);

    if (message::compute_checksum(payload) != header.checksum) {
      LOG_NET_ERROR("checksum mismatch peer={}", id_);
      post_disconnect();
      return;
    }

    // Only VERACK and GETPEERS carry no payload
    if (header.length == 0) {
      std::string cmd = header.get_command();
      if (cmd != protocol::commands::VERACK &&
          cmd != protocol::commands::GETPEERS) {
        LOG_NET_ERROR("unexpected zero-length payload for {} message peer={}",
                      cmd, id_);
        post_disconnect();
        return;
      }
    }

    // Advance before dispatch; handlers may disconnect us
    recv_buffer_offset_ += total_message_size;
    process_message(header, payload);
  }
}

void Peer::process_message(const protocol::MessageHeader &header,
                           const std::vector<uint8_t> &payload) {
  stats_.messages_received.fetch_add(1, std::memory_order_relaxed);

  std::string command = header.get_command();

  if (peer_version_ == 0 && command != protocol::commands::VERSION) {
    LOG_NET_WARN("received {} before VERSION from peer={}, disconnecting",
                 command, id_);
    post_disconnect();
    return;
  }

  auto msg = message::create_message(command);
  if (!msg) {
    LOG_NET_WARN("unknown message type: {} peer={}", command, id_);
    return;
  }

  if (!msg->deserialize(payload.data(), payload.size())) {
    LOG_NET_ERROR("failed to deserialize message: {} - disconnecting peer={}",
                  command, id_);
    post_disconnect();
    return;
  }

  if (command == protocol::commands::VERSION) {
    handle_version(static_cast<const message::VersionMessage &>(*msg));
  } else if (command == protocol::commands::VERACK) {
    handle_verack();
  } else if (command == protocol::commands::PING) {
    auto &ping = static_cast<const message::PingMessage &>(*msg);
    send_message(std::make_unique<message::PongMessage>(ping.nonce));
  } else if (command == protocol::commands::PONG) {
    handle_pong(static_cast<const message::PongMessage &>(*msg));
  } else if (!successfully_connected_) {
    LOG_NET_DEBUG("ignoring {} from peer={} before handshake completed",
                  command, id_);
  } else {
    MessageHandler handler;
    {
      std::lock_guard<std::mutex> lock(handler_mutex_);
      handler = message_handler_;
    }
    if (handler) {
      handler(shared_from_this(), std::move(msg));
    }
  }
}

void Peer::handle_pong(const message::PongMessage &msg) {
  uint64_t expected = last_ping_nonce_;
  if (expected == 0 || msg.nonce != expected) {
    LOG_NET_TRACE("unsolicited pong from peer={}", id_);
    return;
  }
  auto ping_time = std::chrono::duration_cast<std::chrono::milliseconds>(
      util::GetSteadyTime() - ping_sent_time_.load());
  stats_.ping_time_ms.store(ping_time, std::memory_order_relaxed);
  LOG_NET_TRACE("Ping time for peer={}: {}ms", id_, ping_time.count());
  last_ping_nonce_ = 0;
}

} // namespace network
} // namespace chaincraft
