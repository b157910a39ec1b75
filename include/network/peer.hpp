// Copyright (c) 2024 Chaincraft
// Distributed under the MIT software license

#ifndef CHAINCRAFT_PEER_HPP
#define CHAINCRAFT_PEER_HPP

#include "network/message.hpp"
#include "network/protocol.hpp"
#include "network/transport.hpp"
#include <atomic>
#include <utility>  // Boost 1.74 asio/awaitable.hpp needs std::exchange
#include <boost/asio.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>

namespace chaincraft {
namespace network {

class Peer;
using PeerPtr = std::shared_ptr<Peer>;

// Peer connection states
enum class PeerState {
  DISCONNECTED,  // Not connected
  CONNECTING,    // TCP connection in progress
  CONNECTED,     // Transport open, handshake not started
  VERSION_SENT,  // Sent VERSION message
  READY,         // Received VERACK, gossip allowed
  DISCONNECTING  // Shutting down
};

// Outcome of queueing one message
enum class SendResult {
  Sent,         // handed to the transport
  QueueFull,    // outbound backlog at its limit, message dropped
  Disconnected  // peer is gone
};

// Peer connection statistics. Atomics so PeerManager can read them without
// taking the peer table lock on the message path.
struct PeerStats {
  std::atomic<uint64_t> bytes_sent{0};
  std::atomic<uint64_t> bytes_received{0};
  std::atomic<uint64_t> messages_sent{0};
  std::atomic<uint64_t> messages_received{0};
  std::atomic<uint64_t> messages_dropped{0}; // QueueFull
  // Steady-clock seconds (util::GetSteadyTime)
  std::atomic<std::chrono::seconds> connected_time{std::chrono::seconds{0}};
  std::atomic<std::chrono::seconds> last_send{std::chrono::seconds{0}};
  std::atomic<std::chrono::seconds> last_recv{std::chrono::seconds{0}};
  // Last message that carried new information (gossip, not keep-alive)
  std::atomic<std::chrono::seconds> last_useful{std::chrono::seconds{0}};
  std::atomic<std::chrono::milliseconds> ping_time_ms{std::chrono::milliseconds{-1}};
};

// Message handler callback type (returns true if message handled successfully)
using MessageHandler =
    std::function<bool(PeerPtr peer, std::unique_ptr<message::Message> msg)>;
using PeerEventHandler = std::function<void(PeerPtr peer)>;

// Peer - one remote connection
// Handles message framing/parsing, the VERSION/VERACK handshake, PING/PONG
// replies and a bounded outbound backlog. Liveness and handshake deadlines
// are enforced by PeerManager, not by per-peer timers.
class Peer : public std::enable_shared_from_this<Peer> {
public:
  struct Options {
    uint32_t network_magic{protocol::magic::MAINNET};
    uint64_t local_nonce{0};
    uint16_t listen_port{0}; // advertised in VERSION
    size_t send_queue_limit{protocol::DEFAULT_SEND_QUEUE_LIMIT};
  };

  // Create outbound peer (we initiate connection)
  static PeerPtr create_outbound(boost::asio::io_context &io_context,
                                 TransportConnectionPtr connection,
                                 const Options &options,
                                 const std::string &target_address,
                                 uint16_t target_port);

  // Create inbound peer (they connected to us)
  static PeerPtr create_inbound(boost::asio::io_context &io_context,
                                TransportConnectionPtr connection,
                                const Options &options);

  ~Peer();

  Peer(const Peer &) = delete;
  Peer &operator=(const Peer &) = delete;

  // Outbound: sends VERSION. Inbound: waits for VERSION.
  void start();

  // Close the connection. Idempotent; the disconnect handler fires once.
  void disconnect();

  // Same as disconnect(), deferred to the io_context
  void post_disconnect();

  SendResult send_message(std::unique_ptr<message::Message> msg);

  // Heartbeat. Skipped while a previous ping is unanswered.
  void send_ping();

  // Record that the remote sent something worth keeping it for
  void mark_useful();

  void set_message_handler(MessageHandler handler);
  void set_ready_handler(PeerEventHandler handler);
  void set_disconnect_handler(PeerEventHandler handler);

  void set_id(int id) { id_ = id; }

  PeerState state() const { return state_; }
  bool is_connected() const {
    auto s = state_.load();
    return s != PeerState::DISCONNECTED && s != PeerState::DISCONNECTING;
  }
  bool successfully_connected() const { return successfully_connected_; }
  const PeerStats &stats() const { return stats_; }
  std::string address() const;
  uint16_t port() const;

  const std::string &target_address() const { return target_address_; }
  uint16_t target_port() const { return target_port_; }
  bool is_inbound() const { return is_inbound_; }
  int id() const { return id_; }
  size_t send_queue_limit() const { return send_queue_limit_; }

  // Peer information from VERSION message
  uint32_t version() const { return peer_version_; }
  const std::string &user_agent() const { return peer_user_agent_; }
  uint64_t peer_nonce() const { return peer_nonce_; }
  uint16_t peer_listen_port() const { return peer_listen_port_; }

private:
  Peer(boost::asio::io_context &io_context, TransportConnectionPtr connection,
       const Options &options, bool is_inbound,
       const std::string &target_address, uint16_t target_port);

  void on_disconnect();
  void on_transport_receive(const std::vector<uint8_t> &data);
  void on_transport_disconnect();

  // Handshake
  void send_version();
  void handle_version(const message::VersionMessage &msg);
  void handle_verack();

  // Message I/O
  void process_received_data();
  void process_message(const protocol::MessageHeader &header,
                       const std::vector<uint8_t> &payload);
  void handle_pong(const message::PongMessage &msg);

  TransportConnectionPtr connection() const;

  boost::asio::io_context &io_context_;

  mutable std::mutex connection_mutex_;
  TransportConnectionPtr connection_;

  uint32_t network_magic_;
  uint64_t local_nonce_;
  uint16_t local_listen_port_;
  size_t send_queue_limit_;
  bool is_inbound_;
  int id_{-1};

  // For outbound: the address we dialed. For inbound: the socket's remote end.
  std::string target_address_;
  uint16_t target_port_{0};

  std::atomic<PeerState> state_;
  std::atomic<bool> closed_{false};
  PeerStats stats_;
  std::atomic<bool> successfully_connected_{false};

  std::mutex handler_mutex_;
  MessageHandler message_handler_;
  PeerEventHandler ready_handler_;
  PeerEventHandler disconnect_handler_;

  // Peer info from VERSION
  uint32_t peer_version_{0};
  std::string peer_user_agent_;
  uint64_t peer_nonce_{0};
  uint16_t peer_listen_port_{0};

  // Receive buffer; consumed bytes are skipped via offset and compacted lazily
  std::vector<uint8_t> recv_buffer_;
  size_t recv_buffer_offset_{0};

  // Ping tracking
  std::atomic<uint64_t> last_ping_nonce_{0};
  std::atomic<std::chrono::steady_clock::time_point> ping_sent_time_{};
};

} // namespace network
} // namespace chaincraft

#endif // CHAINCRAFT_PEER_HPP
