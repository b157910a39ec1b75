// Copyright (c) 2024 Chaincraft
// Distributed under the MIT software license

#ifndef CHAINCRAFT_SIMULATED_TRANSPORT_HPP
#define CHAINCRAFT_SIMULATED_TRANSPORT_HPP

#include "network/transport.hpp"
#include <atomic>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <set>

namespace chaincraft {
namespace network {

class SimulatedNetwork;

/**
 * SimulatedTransportConnection - one end of an in-memory link
 *
 * Sends are queued on the SimulatedNetwork and delivered when the test pumps
 * it with process_messages(). A blocked connection holds its outbound frames
 * locally, which models a peer that stopped reading.
 */
class SimulatedTransportConnection
    : public TransportConnection,
      public std::enable_shared_from_this<SimulatedTransportConnection> {
public:
  SimulatedTransportConnection(uint64_t id, bool is_inbound,
                               const std::string &remote_addr,
                               uint16_t remote_port,
                               std::weak_ptr<SimulatedNetwork> network);

  ~SimulatedTransportConnection() override;

  void start() override {}
  bool send(const std::vector<uint8_t> &data) override;
  void close() override;
  bool is_open() const override { return open_; }
  size_t pending_sends() const override;
  std::string remote_address() const override { return remote_addr_; }
  uint16_t remote_port() const override { return remote_port_; }
  bool is_inbound() const override { return is_inbound_; }
  uint64_t connection_id() const override { return id_; }
  void set_receive_callback(ReceiveCallback callback) override;
  void set_disconnect_callback(DisconnectCallback callback) override;

  // Hold (true) or release (false) outbound frames
  void set_send_blocked(bool blocked);

  // Called by SimulatedNetwork
  void deliver_data(const std::vector<uint8_t> &data);
  void deliver_remote_close();
  void set_remote_id(uint64_t id) { remote_id_ = id; }
  uint64_t remote_id() const { return remote_id_; }

private:
  uint64_t id_;
  uint64_t remote_id_{0};
  bool is_inbound_;
  std::string remote_addr_;
  uint16_t remote_port_;
  std::weak_ptr<SimulatedNetwork> network_;
  std::atomic<bool> open_{true};

  mutable std::mutex mutex_;
  ReceiveCallback receive_callback_;
  DisconnectCallback disconnect_callback_;
  bool send_blocked_{false};
  std::deque<std::vector<uint8_t>> held_;
};

/**
 * SimulatedNetwork - shared hub linking any number of SimulatedTransports
 *
 * Listeners are keyed by "host:port", so many nodes can listen on the same
 * port number under distinct hosts. Delivery is explicit: nothing moves until
 * process_messages() is called, which keeps multi-node tests deterministic.
 */
class SimulatedNetwork : public std::enable_shared_from_this<SimulatedNetwork> {
public:
  static std::shared_ptr<SimulatedNetwork> Create();

  // Deliver queued frames (including ones queued during delivery) until the
  // queue is empty or max_messages were delivered. Returns frames delivered.
  size_t process_messages(size_t max_messages = 100000);

  size_t pending_messages() const;

  // Used by SimulatedTransport / SimulatedTransportConnection
  bool register_listener(const std::string &host, uint16_t port,
                         AcceptCallback callback);
  void unregister_listener(const std::string &host, uint16_t port);
  std::shared_ptr<SimulatedTransportConnection>
  open_link(const std::string &from_host, const std::string &to_host,
            uint16_t to_port);
  void route(uint64_t from_conn_id, const std::vector<uint8_t> &data);
  void route_close(uint64_t from_conn_id);

private:
  SimulatedNetwork() = default;

  struct PendingMessage {
    uint64_t to_conn_id;
    std::vector<uint8_t> data;
    bool is_close;
  };

  std::shared_ptr<SimulatedTransportConnection> find(uint64_t id);

  mutable std::mutex mutex_;
  std::map<std::string, AcceptCallback> listeners_;
  std::map<uint64_t, std::weak_ptr<SimulatedTransportConnection>> connections_;
  std::deque<PendingMessage> pending_;
  uint64_t next_connection_id_{1};
  uint16_t next_ephemeral_port_{40000};
};

/**
 * SimulatedTransport - one node's view of a SimulatedNetwork
 */
class SimulatedTransport : public Transport {
public:
  SimulatedTransport(std::shared_ptr<SimulatedNetwork> network,
                     std::string local_host);
  ~SimulatedTransport() override;

  TransportConnectionPtr connect(const std::string &address, uint16_t port,
                                 ConnectCallback callback) override;
  bool listen(uint16_t port, AcceptCallback accept_callback) override;
  void stop_listening() override;
  void run() override { running_ = true; }
  void stop() override;
  bool is_running() const override { return running_; }

  const std::string &local_host() const { return local_host_; }

  // Hold outbound frames on every connection to remote_host
  void set_send_blocked(const std::string &remote_host, bool blocked);

  // Number of open connections created by this transport
  size_t connection_count() const;

private:
  void track(const std::shared_ptr<SimulatedTransportConnection> &conn);

  std::shared_ptr<SimulatedNetwork> network_;
  std::string local_host_;
  std::atomic<bool> running_{false};

  mutable std::mutex mutex_;
  uint16_t listen_port_{0};
  std::set<std::string> blocked_hosts_;
  std::vector<std::weak_ptr<SimulatedTransportConnection>> connections_;
};

} // namespace network
} // namespace chaincraft

#endif // CHAINCRAFT_SIMULATED_TRANSPORT_HPP
