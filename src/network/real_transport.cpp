// Copyright (c) 2024 StakeNode
// Distributed under the MIT software license

#include "network/real_transport.hpp"
#include "network/protocol.hpp"
#include "util/logging.hpp"

namespace stakenode {
namespace network {

// ============================================================================
// RealTransportConnection
// ============================================================================

std::atomic<uint64_t> RealTransportConnection::next_id_{1};

std::shared_ptr<RealTransportConnection>
RealTransportConnection::create_outbound(boost::asio::io_context &io_context,
                                         const std::string &address,
                                         uint16_t port,
                                         ConnectCallback callback) {
  auto conn = std::shared_ptr<RealTransportConnection>(
      new RealTransportConnection(io_context, false));
  conn->do_connect(address, port, std::move(callback));
  return conn;
}

std::shared_ptr<RealTransportConnection>
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
  // close() must run while a shared_ptr is still alive; pending handlers
  // hold one, so reaching here open means nobody closed us
  if (open_.load()) {
    LOG_NET_ERROR("connection {}:{} destroyed without close()", remote_addr_,
                  remote_port_);
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
                                   const boost::asio::ip::tcp::endpoint &ep) {
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
              remote_addr_ = ep.address().to_string();
              remote_port_ = ep.port();

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
          fail();
          return;
        }

        ReceiveCallback cb;
        {
          std::lock_guard<std::mutex> lock(callback_mutex_);
          cb = receive_callback_;
        }
        if (bytes_transferred > 0 && cb) {
          std::vector<uint8_t> data(recv_buffer_.begin(),
                                    recv_buffer_.begin() + bytes_transferred);
          cb(data);
        }

        start_read();
      });
}

bool RealTransportConnection::send(const std::vector<uint8_t> &data) {
  if (!open_)
    return false;

  {
    std::lock_guard<std::mutex> lock(send_mutex_);
    // A peer that does not read is dropped rather than buffered forever
    if (send_queue_bytes_ + data.size() > protocol::DEFAULT_SEND_QUEUE_LIMIT) {
      LOG_NET_WARN("send queue overflow ({} + {} bytes), dropping {}:{}",
                   send_queue_bytes_, data.size(), remote_addr_, remote_port_);
      boost::asio::post(io_context_,
                        [this, self = shared_from_this()]() { fail(); });
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

  // The front element stays in the queue (and alive) until the write ends
  boost::asio::async_write(
      socket_, boost::asio::buffer(send_queue_.front()),
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
          fail();
          return;
        }
        if (more) {
          do_write();
        }
      });
}

void RealTransportConnection::fail() {
  DisconnectCallback cb;
  {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    cb = disconnect_callback_;
  }
  if (!open_) {
    return;
  }
  close();
  if (cb) {
    cb();
  }
}

void RealTransportConnection::close() {
  if (!open_.exchange(false)) {
    return;
  }

  {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    receive_callback_ = {};
    disconnect_callback_ = {};
  }

  boost::system::error_code ec;
  socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
  socket_.close(ec);

  std::lock_guard<std::mutex> lock(send_mutex_);
  if (!writing_) {
    std::queue<std::vector<uint8_t>> empty;
    std::swap(send_queue_, empty);
    send_queue_bytes_ = 0;
  }
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

RealTransport::RealTransport(boost::asio::io_context &io_context)
    : io_context_(io_context) {}

RealTransport::~RealTransport() { stop(); }

TransportConnectionPtr RealTransport::connect(const std::string &address,
                                              uint16_t port,
                                              ConnectCallback callback) {
  auto conn = RealTransportConnection::create_outbound(io_context_, address,
                                                       port, std::move(callback));
  track(conn);
  return conn;
}

void RealTransport::track(const std::shared_ptr<RealTransportConnection> &conn) {
  std::lock_guard<std::mutex> lock(connections_mutex_);
  for (auto it = connections_.begin(); it != connections_.end();) {
    if (it->second.expired()) {
      it = connections_.erase(it);
    } else {
      ++it;
    }
  }
  connections_[conn->connection_id()] = conn;
}

bool RealTransport::listen(uint16_t port, AcceptCallback accept_callback) {
  if (acceptor_) {
    LOG_NET_TRACE("already listening");
    return false;
  }
  accept_callback_ = std::move(accept_callback);

  using tcp = boost::asio::ip::tcp;
  acceptor_ = std::make_unique<tcp::acceptor>(io_context_);
  boost::system::error_code ec;

  // Dual-stack first, IPv4-only if the host has no IPv6
  acceptor_->open(tcp::v6(), ec);
  if (!ec) {
    acceptor_->set_option(boost::asio::ip::v6_only(false), ec);
    acceptor_->set_option(tcp::acceptor::reuse_address(true), ec);
    acceptor_->bind(tcp::endpoint(tcp::v6(), port), ec);
  }
  if (ec) {
    boost::system::error_code close_ec;
    acceptor_->close(close_ec);
    ec.clear();
    acceptor_->open(tcp::v4(), ec);
    if (!ec) {
      acceptor_->set_option(tcp::acceptor::reuse_address(true), ec);
      acceptor_->bind(tcp::endpoint(tcp::v4(), port), ec);
    }
  }
  if (!ec) {
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
  track(conn);
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

void RealTransport::run() { running_ = true; }

void RealTransport::stop() {
  if (!running_.exchange(false) && !acceptor_) {
    return;
  }
  LOG_NET_TRACE("stopping transport");
  stop_listening();

  std::vector<std::shared_ptr<RealTransportConnection>> open;
  {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    for (auto &[id, weak_conn] : connections_) {
      if (auto conn = weak_conn.lock()) {
        open.push_back(conn);
      }
    }
    connections_.clear();
  }
  for (auto &conn : open) {
    conn->close();
  }
}

} // namespace network
} // namespace stakenode
