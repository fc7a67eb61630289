// Copyright (c) 2024 StakeNode
// Distributed under the MIT software license

#include "network/simulated_transport.hpp"
#include <algorithm>

namespace stakenode {
namespace network {

// ============================================================================
// SimulatedTransportConnection
// ============================================================================

SimulatedTransportConnection::SimulatedTransportConnection(
    uint64_t id, bool is_inbound, const std::string &remote_addr,
    uint16_t remote_port, SimulatedTransport *transport)
    : id_(id), is_inbound_(is_inbound), remote_addr_(remote_addr),
      remote_port_(remote_port), transport_(transport) {}

SimulatedTransportConnection::~SimulatedTransportConnection() {
  open_ = false;
}

void SimulatedTransportConnection::start() {}

bool SimulatedTransportConnection::send(const std::vector<uint8_t> &data) {
  if (!open_) {
    return false;
  }
  if (transport_) {
    transport_->route_message(id_, data);
  }
  return true;
}

void SimulatedTransportConnection::close() {
  if (!open_.exchange(false)) {
    return;
  }
  {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    receive_callback_ = {};
    disconnect_callback_ = {};
  }
  if (transport_) {
    transport_->route_close(id_);
  }
}

void SimulatedTransportConnection::set_receive_callback(
    ReceiveCallback callback) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  receive_callback_ = std::move(callback);
}

void SimulatedTransportConnection::set_disconnect_callback(
    DisconnectCallback callback) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  disconnect_callback_ = std::move(callback);
}

void SimulatedTransportConnection::deliver_data(
    const std::vector<uint8_t> &data) {
  ReceiveCallback cb;
  {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    cb = receive_callback_;
  }
  if (open_ && cb) {
    cb(data);
  }
}

void SimulatedTransportConnection::remote_closed() {
  if (!open_.exchange(false)) {
    return;
  }
  DisconnectCallback cb;
  {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    cb = std::move(disconnect_callback_);
    receive_callback_ = {};
    disconnect_callback_ = {};
  }
  if (cb) {
    cb();
  }
}

void SimulatedTransportConnection::set_peer_connection(
    std::weak_ptr<SimulatedTransportConnection> peer) {
  peer_connection_ = std::move(peer);
}

// ============================================================================
// SimulatedTransport
// ============================================================================

SimulatedTransport::SimulatedTransport() = default;

SimulatedTransport::~SimulatedTransport() { stop(); }

TransportConnectionPtr SimulatedTransport::connect(const std::string &address,
                                                   uint16_t port,
                                                   ConnectCallback callback) {
  const uint64_t conn_id = next_connection_id_++;
  auto connection = std::make_shared<SimulatedTransportConnection>(
      conn_id, false, address, port, this);
  {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    connections_[conn_id] = connection;
  }

  AcceptCallback accept;
  {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    auto it = listeners_.find(port);
    if (it != listeners_.end()) {
      accept = it->second;
    }
  }

  if (!accept) {
    connection->close();
    if (callback) {
      callback(false);
    }
    return connection;
  }

  const uint64_t peer_conn_id = next_connection_id_++;
  auto peer_connection = std::make_shared<SimulatedTransportConnection>(
      peer_conn_id, true, "127.0.0.1",
      static_cast<uint16_t>(40000 + (conn_id % 20000)), this);
  {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    connections_[peer_conn_id] = peer_connection;
  }
  connection->set_peer_connection(peer_connection);
  peer_connection->set_peer_connection(connection);

  if (callback) {
    callback(true);
  }
  accept(peer_connection);
  return connection;
}

bool SimulatedTransport::listen(uint16_t port, AcceptCallback accept_callback) {
  std::lock_guard<std::mutex> lock(listeners_mutex_);
  if (listeners_.count(port)) {
    return false;
  }
  listeners_[port] = std::move(accept_callback);
  return true;
}

void SimulatedTransport::stop_listening() {
  std::lock_guard<std::mutex> lock(listeners_mutex_);
  listeners_.clear();
}

void SimulatedTransport::run() { running_ = true; }

void SimulatedTransport::stop() {
  running_ = false;
  stop_listening();

  std::vector<std::shared_ptr<SimulatedTransportConnection>> open;
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
  std::lock_guard<std::mutex> lock(messages_mutex_);
  pending_messages_.clear();
}

void SimulatedTransport::set_network_conditions(
    const NetworkConditions &conditions) {
  conditions_ = conditions;
}

std::shared_ptr<SimulatedTransportConnection>
SimulatedTransport::find(uint64_t id) {
  std::lock_guard<std::mutex> lock(connections_mutex_);
  auto it = connections_.find(id);
  return it == connections_.end() ? nullptr : it->second.lock();
}

void SimulatedTransport::enqueue(uint64_t from_conn_id,
                                 std::vector<uint8_t> data, bool close) {
  auto from = find(from_conn_id);
  if (!from) {
    return;
  }
  auto peer = from->get_peer_connection().lock();
  if (!peer) {
    return;
  }
  std::lock_guard<std::mutex> lock(messages_mutex_);
  pending_messages_.push_back({current_time_ms_ + conditions_.latency_ms,
                               peer->connection_id(), std::move(data), close});
}

void SimulatedTransport::route_message(uint64_t from_conn_id,
                                       const std::vector<uint8_t> &data) {
  enqueue(from_conn_id, data, false);
}

void SimulatedTransport::route_close(uint64_t from_conn_id) {
  enqueue(from_conn_id, {}, true);
}

size_t SimulatedTransport::pending_count() const {
  std::lock_guard<std::mutex> lock(messages_mutex_);
  return pending_messages_.size();
}

size_t SimulatedTransport::advance_time(uint64_t ms) {
  current_time_ms_ += ms;

  std::vector<PendingMessage> ready;
  {
    std::lock_guard<std::mutex> lock(messages_mutex_);
    auto it = std::stable_partition(
        pending_messages_.begin(), pending_messages_.end(),
        [this](const PendingMessage &m) {
          return m.delivery_time_ms <= current_time_ms_;
        });
    ready.assign(std::make_move_iterator(pending_messages_.begin()),
                 std::make_move_iterator(it));
    pending_messages_.erase(pending_messages_.begin(), it);
  }

  for (auto &msg : ready) {
    auto conn = find(msg.to_conn_id);
    if (!conn) {
      continue;
    }
    if (msg.close) {
      conn->remote_closed();
    } else {
      conn->deliver_data(msg.data);
    }
  }
  return ready.size();
}

} // namespace network
} // namespace stakenode
