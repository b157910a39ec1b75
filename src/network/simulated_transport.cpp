// Copyright (c) 2024 Chaincraft
// Distributed under the MIT software license

#include "network/simulated_transport.hpp"
#include "util/logging.hpp"
#include <algorithm>

namespace chaincraft {
namespace network {

namespace {
std::string listener_key(const std::string &host, uint16_t port) {
  return host + ":" + std::to_string(port);
}
} // namespace

// ============================================================================
// SimulatedTransportConnection
// ============================================================================

SimulatedTransportConnection::SimulatedTransportConnection(
    uint64_t id, bool is_inbound, const std::string &remote_addr,
    uint16_t remote_port, std::weak_ptr<SimulatedNetwork> network)
    : id_(id), is_inbound_(is_inbound), remote_addr_(remote_addr),
      remote_port_(remote_port), network_(std::move(network)) {}

SimulatedTransportConnection::~SimulatedTransportConnection() { close(); }

bool SimulatedTransportConnection::send(const std::vector<uint8_t> &data) {
  if (!open_) {
    return false;
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (send_blocked_) {
      held_.push_back(data);
      return true;
    }
  }

  auto network = network_.lock();
  if (!network) {
    return false;
  }
  network->route(id_, data);
  return true;
}

void SimulatedTransportConnection::close() {
  if (!open_.exchange(false)) {
    return;
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    receive_callback_ = {};
    disconnect_callback_ = {};
    held_.clear();
  }

  if (auto network = network_.lock()) {
    network->route_close(id_);
  }
}

size_t SimulatedTransportConnection::pending_sends() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return held_.size();
}

void SimulatedTransportConnection::set_receive_callback(
    ReceiveCallback callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  receive_callback_ = std::move(callback);
}

void SimulatedTransportConnection::set_disconnect_callback(
    DisconnectCallback callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  disconnect_callback_ = std::move(callback);
}

void SimulatedTransportConnection::set_send_blocked(bool blocked) {
  std::deque<std::vector<uint8_t>> release;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    send_blocked_ = blocked;
    if (!blocked) {
      release.swap(held_);
    }
  }

  if (release.empty() || !open_) {
    return;
  }
  auto network = network_.lock();
  if (!network) {
    return;
  }
  for (const auto &frame : release) {
    network->route(id_, frame);
  }
}

void SimulatedTransportConnection::deliver_data(
    const std::vector<uint8_t> &data) {
  if (!open_) {
    return;
  }
  ReceiveCallback cb;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    cb = receive_callback_;
  }
  if (cb) {
    cb(data);
  }
}

void SimulatedTransportConnection::deliver_remote_close() {
  if (!open_.exchange(false)) {
    return;
  }
  DisconnectCallback cb;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    cb = std::move(disconnect_callback_);
    receive_callback_ = {};
    disconnect_callback_ = {};
    held_.clear();
  }
  if (cb) {
    cb();
  }
}

// ============================================================================
// SimulatedNetwork
// ============================================================================

std::shared_ptr<SimulatedNetwork> SimulatedNetwork::Create() {
  return std::shared_ptr<SimulatedNetwork>(new SimulatedNetwork());
}

bool SimulatedNetwork::register_listener(const std::string &host, uint16_t port,
                                         AcceptCallback callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto key = listener_key(host, port);
  if (listeners_.count(key)) {
    return false;
  }
  listeners_[key] = std::move(callback);
  return true;
}

void SimulatedNetwork::unregister_listener(const std::string &host,
                                           uint16_t port) {
  std::lock_guard<std::mutex> lock(mutex_);
  listeners_.erase(listener_key(host, port));
}

std::shared_ptr<SimulatedTransportConnection>
SimulatedNetwork::open_link(const std::string &from_host,
                            const std::string &to_host, uint16_t to_port) {
  std::shared_ptr<SimulatedTransportConnection> outbound;
  std::shared_ptr<SimulatedTransportConnection> inbound;
  AcceptCallback accept;

  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = listeners_.find(listener_key(to_host, to_port));
    if (it == listeners_.end()) {
      return nullptr; // connection refused
    }
    accept = it->second;

    uint64_t out_id = next_connection_id_++;
    uint64_t in_id = next_connection_id_++;
    uint16_t ephemeral = next_ephemeral_port_++;
    if (next_ephemeral_port_ == 0) {
      next_ephemeral_port_ = 40000;
    }

    auto self = weak_from_this();
    outbound = std::make_shared<SimulatedTransportConnection>(
        out_id, false, to_host, to_port, self);
    inbound = std::make_shared<SimulatedTransportConnection>(
        in_id, true, from_host, ephemeral, self);
    outbound->set_remote_id(in_id);
    inbound->set_remote_id(out_id);

    connections_[out_id] = outbound;
    connections_[in_id] = inbound;
  }

  if (accept) {
    accept(inbound);
  }
  return outbound;
}

void SimulatedNetwork::route(uint64_t from_conn_id,
                             const std::vector<uint8_t> &data) {
  auto from = find(from_conn_id);
  if (!from) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  pending_.push_back({from->remote_id(), data, false});
}

void SimulatedNetwork::route_close(uint64_t from_conn_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = connections_.find(from_conn_id);
  if (it == connections_.end()) {
    return;
  }
  // The closing end may already be mid-destruction; read the remote id from
  // the peer entry instead of locking the weak_ptr
  for (const auto &[id, weak] : connections_) {
    auto conn = weak.lock();
    if (conn && conn->remote_id() == from_conn_id) {
      pending_.push_back({id, {}, true});
      break;
    }
  }
  connections_.erase(it);
}

std::shared_ptr<SimulatedTransportConnection>
SimulatedNetwork::find(uint64_t id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = connections_.find(id);
  if (it == connections_.end()) {
    return nullptr;
  }
  return it->second.lock();
}

size_t SimulatedNetwork::process_messages(size_t max_messages) {
  size_t delivered = 0;
  while (delivered < max_messages) {
    PendingMessage msg;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (pending_.empty()) {
        break;
      }
      msg = std::move(pending_.front());
      pending_.pop_front();
    }

    auto conn = find(msg.to_conn_id);
    if (!conn) {
      continue;
    }
    if (msg.is_close) {
      conn->deliver_remote_close();
      std::lock_guard<std::mutex> lock(mutex_);
      connections_.erase(msg.to_conn_id);
    } else {
      conn->deliver_data(msg.data);
    }
    ++delivered;
  }
  return delivered;
}

size_t SimulatedNetwork::pending_messages() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_.size();
}

// ============================================================================
// SimulatedTransport
// ============================================================================

SimulatedTransport::SimulatedTransport(std::shared_ptr<SimulatedNetwork> network,
                                       std::string local_host)
    : network_(std::move(network)), local_host_(std::move(local_host)) {}

SimulatedTransport::~SimulatedTransport() { stop(); }

TransportConnectionPtr SimulatedTransport::connect(const std::string &address,
                                                   uint16_t port,
                                                   ConnectCallback callback) {
  auto conn = network_->open_link(local_host_, address, port);
  if (!conn) {
    LOG_NET_TRACE("simulated connect {} -> {}:{} refused", local_host_,
                  address, port);
    return nullptr;
  }

  track(conn);
  if (callback) {
    callback(true);
  }
  return conn;
}

bool SimulatedTransport::listen(uint16_t port, AcceptCallback accept_callback) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (listen_port_ != 0) {
      return false;
    }
  }

  bool ok = network_->register_listener(
      local_host_, port,
      [this, accept_callback](TransportConnectionPtr conn) {
        auto sim = std::dynamic_pointer_cast<SimulatedTransportConnection>(conn);
        if (sim) {
          track(sim);
        }
        if (accept_callback) {
          accept_callback(conn);
        }
      });
  if (!ok) {
    LOG_NET_ERROR("simulated listen on {}:{} failed (address in use)",
                  local_host_, port);
    return false;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  listen_port_ = port;
  return true;
}

void SimulatedTransport::stop_listening() {
  uint16_t port;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    port = listen_port_;
    listen_port_ = 0;
  }
  if (port != 0) {
    network_->unregister_listener(local_host_, port);
  }
}

void SimulatedTransport::stop() {
  running_ = false;
  stop_listening();

  std::vector<std::weak_ptr<SimulatedTransportConnection>> conns;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    conns.swap(connections_);
  }
  for (auto &weak : conns) {
    if (auto conn = weak.lock()) {
      conn->close();
    }
  }
}

void SimulatedTransport::set_send_blocked(const std::string &remote_host,
                                          bool blocked) {
  std::vector<std::shared_ptr<SimulatedTransportConnection>> targets;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (blocked) {
      blocked_hosts_.insert(remote_host);
    } else {
      blocked_hosts_.erase(remote_host);
    }
    for (auto &weak : connections_) {
      auto conn = weak.lock();
      if (conn && conn->remote_address() == remote_host) {
        targets.push_back(conn);
      }
    }
  }
  for (auto &conn : targets) {
    conn->set_send_blocked(blocked);
  }
}

size_t SimulatedTransport::connection_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return std::count_if(connections_.begin(), connections_.end(),
                       [](const auto &weak) {
                         auto conn = weak.lock();
                         return conn && conn->is_open();
                       });
}

void SimulatedTransport::track(
    const std::shared_ptr<SimulatedTransportConnection> &conn) {
  bool blocked;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    // Drop expired entries so long-running tests do not accumulate them
    connections_.erase(std::remove_if(connections_.begin(), connections_.end(),
                                      [](const auto &w) { return w.expired(); }),
                       connections_.end());
    connections_.push_back(conn);
    blocked = blocked_hosts_.count(conn->remote_address()) > 0;
  }
  if (blocked) {
    conn->set_send_blocked(true);
  }
}

} // namespace network
} // namespace chaincraft
