// Copyright (c) 2024 Chaincraft
// Distributed under the MIT software license

#include "network/real_transport.hpp"
#include "network/protocol.hpp"
#include "util/logging.hpp"

namespace chaincraft {
namespace network {

// ============================================================================
// RealTransportConnection
// ============================================================================

std::atomic<uint64_t> RealTransportConnection::next_id_{1};

TransportConnectionPtr RealTransportConnection::create_outbound(
    boost::asio::io_context &io_context, const std::string &address,
    uint16_t port, ConnectCallback callback) {
  auto conn = std::shared_ptr<RealTransportConnection>(
      new RealTransportConnection(io_context, false));
  conn->do_connect(address, port, std::move(callback));
  return conn;
}

TransportConnectionPtr
RealTransportConnection::create_inbound(boost::asio::io_context &io_context,
                                        boost::asio::ip::tcp::socket socket) {
  auto conn = std::shared_ptr<RealTransportConnection>(
      new RealTransportConnection(io_context, true));
  conn->socket_ = std::move(socket);
  conn->open_ = true;

  boost::system::error_code ec;
  auto remote_ep = conn->socket_.remote_endpoint(ec);
  if (!ec) {
    conn->remote_addr_ = remote_ep.address().to_string();
    conn->remote_port_ = remote_ep.port();
  } else {
    LOG_NET_TRACE("failed to get remote endpoint: {}", ec.message());
  }
  return conn;
}

RealTransportConnection::RealTransportConnection(
    boost::asio::io_context &io_context, bool is_inbound)
    : io_context_(io_context), socket_(io_context), is_inbound_(is_inbound),
      id_(next_id_++), recv_buffer_(RECV_BUFFER_SIZE) {}

RealTransportConnection::~RealTransportConnection() {
  // Cleanup belongs in close() while a shared_ptr is still alive; pending
  // handlers would otherwise run against a destroyed object
  if (open_.load()) {
    LOG_NET_ERROR("RealTransportConnection destroyed without close() - {}:{}",
                  remote_addr_, remote_port_);
  }
}

void RealTransportConnection::do_connect(const std::string &address,
                                         uint16_t port,
                                         ConnectCallback callback) {
  remote_addr_ = address;
  remote_port_ = port;

  auto resolver = std::make_shared<boost::asio::ip::tcp::resolver>(io_context_);
  resolver->async_resolve(
      address, std::to_string(port),
      [this, self = shared_from_this(), callback,
       resolver](const boost::system::error_code &ec,
                 boost::asio::ip::tcp::resolver::results_type results) {
        if (ec) {
          LOG_NET_TRACE("failed to resolve {}: {}", remote_addr_, ec.message());
          if (callback) {
            callback(false);
          }
          return;
        }

        boost::asio::async_connect(
            socket_, results,
            [this, self, callback](const boost::system::error_code &ec,
                                   const boost::asio::ip::tcp::endpoint &) {
              if (ec) {
                LOG_NET_TRACE("failed to connect to {}:{}: {}", remote_addr_,
                              remote_port_, ec.message());
                if (callback) {
                  callback(false);
                }
                return;
              }

              open_ = true;

              boost::system::error_code opt_ec;
              socket_.set_option(boost::asio::ip::tcp::no_delay(true), opt_ec);
              socket_.set_option(boost::asio::socket_base::keep_alive(true),
                                 opt_ec);

              LOG_NET_TRACE("connected to {}:{}", remote_addr_, remote_port_);
              if (callback) {
                callback(true);
              }
            });
      });
}

void RealTransportConnection::start() {
  if (!open_)
    return;
  start_read();
}

void RealTransportConnection::start_read() {
  if (!open_)
    return;

  socket_.async_read_some(
      boost::asio::buffer(recv_buffer_),
      [this, self = shared_from_this()](const boost::system::error_code &ec,
                                        size_t bytes_transferred) {
        if (ec) {
          if (ec != boost::asio::error::eof &&
              ec != boost::asio::error::operation_aborted) {
            LOG_NET_TRACE("read error from {}:{}: {}", remote_addr_,
                          remote_port_, ec.message());
          }
          close_and_notify();
          return;
        }

        if (bytes_transferred > 0) {
          ReceiveCallback cb;
          {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            cb = receive_callback_;
          }
          if (cb) {
            std::vector<uint8_t> data(recv_buffer_.begin(),
                                      recv_buffer_.begin() + bytes_transferred);
            cb(data);
          }
        }

        start_read();
      });
}

bool RealTransportConnection::send(const std::vector<uint8_t> &data) {
  if (!open_)
    return false;

  {
    std::lock_guard<std::mutex> lock(send_mutex_);

    // A peer that stops reading must not exhaust memory
    if (send_queue_bytes_ + data.size() > protocol::DEFAULT_SEND_QUEUE_SIZE) {
      LOG_NET_WARN("send queue overflow ({} + {} bytes, limit {}), "
                   "disconnecting slow reader {}:{}",
                   send_queue_bytes_, data.size(),
                   protocol::DEFAULT_SEND_QUEUE_SIZE, remote_addr_, remote_port_);
      boost::asio::post(io_context_,
                        [self = shared_from_this()]() { self->close_and_notify(); });
      return false;
    }

    send_queue_.push(data);
    send_queue_bytes_ += data.size();
  }

  boost::asio::post(io_context_,
                    [this, self = shared_from_this()]() { do_write(); });
  return true;
}

void RealTransportConnection::do_write() {
  if (!open_)
    return;

  std::lock_guard<std::mutex> lock(send_mutex_);
  if (writing_ || send_queue_.empty()) {
    return;
  }

  writing_ = true;
  auto &data = send_queue_.front();

  boost::asio::async_write(
      socket_, boost::asio::buffer(data),
      [this, self = shared_from_this()](const boost::system::error_code &ec,
                                        size_t) {
        bool more = false;
        {
          std::lock_guard<std::mutex> lock(send_mutex_);
          writing_ = false;
          if (!ec && !send_queue_.empty()) {
            send_queue_bytes_ -= send_queue_.front().size();
            send_queue_.pop();
            more = !send_queue_.empty();
          }
        }

        if (ec) {
          LOG_NET_TRACE("write error to {}:{}: {}", remote_addr_, remote_port_,
                        ec.message());
          close_and_notify();
          return;
        }

        // Posted rather than called: do_write() takes send_mutex_
        if (more) {
          boost::asio::post(io_context_,
                            [this, self]() { do_write(); });
        }
      });
}

size_t RealTransportConnection::pending_sends() const {
  std::lock_guard<std::mutex> lock(send_mutex_);
  return send_queue_.size();
}

void RealTransportConnection::close_and_notify() {
  DisconnectCallback cb;
  {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    cb = disconnect_callback_;
  }
  bool was_open = open_.load();
  close();
  if (was_open && cb) {
    cb();
  }
}

void RealTransportConnection::close() {
  if (!open_.exchange(false)) {
    return;
  }

  // Clear callbacks before the socket goes away so late handlers are inert
  {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    receive_callback_ = {};
    disconnect_callback_ = {};
  }

  boost::system::error_code ec;
  socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
  socket_.close(ec);

  std::lock_guard<std::mutex> lock(send_mutex_);
  writing_ = false;
  std::queue<std::vector<uint8_t>> empty;
  std::swap(send_queue_, empty);
  send_queue_bytes_ = 0;
}

void RealTransportConnection::set_receive_callback(ReceiveCallback callback) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  receive_callback_ = std::move(callback);
}

void RealTransportConnection::set_disconnect_callback(
    DisconnectCallback callback) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  disconnect_callback_ = std::move(callback);
}

// ============================================================================
// RealTransport
// ============================================================================

RealTransport::RealTransport(size_t io_threads)
    : desired_io_threads_(io_threads == 0 ? 1 : io_threads) {}

RealTransport::~RealTransport() { stop(); }

TransportConnectionPtr RealTransport::connect(const std::string &address,
                                              uint16_t port,
                                              ConnectCallback callback) {
  return RealTransportConnection::create_outbound(io_context_, address, port,
                                                  std::move(callback));
}

bool RealTransport::listen(uint16_t port, AcceptCallback accept_callback) {
  if (acceptor_) {
    LOG_NET_TRACE("already listening");
    return false;
  }

  accept_callback_ = std::move(accept_callback);

  using tcp = boost::asio::ip::tcp;
  boost::system::error_code ec;
  acceptor_ = std::make_unique<tcp::acceptor>(io_context_);

  // Dual-stack first, IPv4-only as fallback
  acceptor_->open(tcp::v6(), ec);
  if (!ec)
    acceptor_->set_option(boost::asio::ip::v6_only(false), ec);
  if (!ec)
    acceptor_->set_option(tcp::acceptor::reuse_address(true), ec);
  if (!ec)
    acceptor_->bind(tcp::endpoint(tcp::v6(), port), ec);
  if (!ec)
    acceptor_->listen(boost::asio::socket_base::max_listen_connections, ec);

  if (ec) {
    LOG_NET_DEBUG("dual-stack listen failed ({}), trying IPv4", ec.message());
    boost::system::error_code close_ec;
    acceptor_->close(close_ec);
    ec.clear();
    acceptor_->open(tcp::v4(), ec);
    if (!ec)
      acceptor_->set_option(tcp::acceptor::reuse_address(true), ec);
    if (!ec)
      acceptor_->bind(tcp::endpoint(tcp::v4(), port), ec);
    if (!ec)
      acceptor_->listen(boost::asio::socket_base::max_listen_connections, ec);
  }

  if (ec) {
    LOG_NET_ERROR("failed to listen on port {}: {}", port, ec.message());
    acceptor_.reset();
    return false;
  }

  LOG_NET_INFO("listening on port {}", port);
  start_accept();
  return true;
}

void RealTransport::start_accept() {
  if (!acceptor_)
    return;

  acceptor_->async_accept([this](const boost::system::error_code &ec,
                                 boost::asio::ip::tcp::socket socket) {
    handle_accept(ec, std::move(socket));
  });
}

void RealTransport::handle_accept(const boost::system::error_code &ec,
                                  boost::asio::ip::tcp::socket socket) {
  if (ec) {
    if (ec != boost::asio::error::operation_aborted) {
      LOG_NET_TRACE("accept error: {}", ec.message());
      start_accept();
    }
    return;
  }

  boost::system::error_code opt_ec;
  socket.set_option(boost::asio::ip::tcp::no_delay(true), opt_ec);
  socket.set_option(boost::asio::socket_base::keep_alive(true), opt_ec);

  auto conn =
      RealTransportConnection::create_inbound(io_context_, std::move(socket));
  if (accept_callback_) {
    accept_callback_(conn);
  }

  start_accept();
}

void RealTransport::stop_listening() {
  if (acceptor_) {
    boost::system::error_code ec;
    acceptor_->close(ec);
    acceptor_.reset();
  }
}

void RealTransport::run() {
  if (running_.exchange(true)) {
    return;
  }
  io_context_.restart();
  work_guard_ = std::make_unique<boost::asio::executor_work_guard<
      boost::asio::io_context::executor_type>>(
      boost::asio::make_work_guard(io_context_));
  for (size_t i = 0; i < desired_io_threads_; i++) {
    io_threads_.emplace_back([this]() { io_context_.run(); });
  }
}

void RealTransport::stop() {
  if (!running_.exchange(false) && io_threads_.empty()) {
    stop_listening();
    return;
  }

  LOG_NET_TRACE("stopping transport");
  stop_listening();

  work_guard_.reset();
  io_context_.stop();

  for (auto &thread : io_threads_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
  io_threads_.clear();
}

} // namespace network
} // namespace chaincraft
