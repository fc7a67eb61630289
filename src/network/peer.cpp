// Copyright (c) 2024 StakeNode
// Distributed under the MIT software license

#include "network/peer.hpp"
#include "crypto/hash.hpp"
#include "network/request_handler.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"
#include <algorithm>

namespace stakenode {
namespace network {

const char *PeerStateName(PeerState state) {
  switch (state) {
  case PeerState::CONNECTING:
    return "connecting";
  case PeerState::HANDSHAKING:
    return "handshaking";
  case PeerState::BOOTSTRAPPING:
    return "bootstrapping";
  case PeerState::SYNCED:
    return "synced";
  case PeerState::CLOSING:
    return "closing";
  case PeerState::CLOSED:
    return "closed";
  case PeerState::BANNED:
    return "banned";
  }
  return "unknown";
}

const char *DisconnectReasonName(DisconnectReason reason) {
  switch (reason) {
  case DisconnectReason::NONE:
    return "none";
  case DisconnectReason::HANDSHAKE_FAILED:
    return "handshake-failed";
  case DisconnectReason::HANDSHAKE_TIMEOUT:
    return "handshake-timeout";
  case DisconnectReason::INACTIVITY:
    return "inactivity";
  case DisconnectReason::RATE_LIMIT:
    return "rate-limit";
  case DisconnectReason::PROTOCOL_VIOLATION:
    return "protocol-violation";
  case DisconnectReason::REFUSED:
    return "refused";
  case DisconnectReason::NACKED:
    return "nacked";
  case DisconnectReason::BANNED:
    return "banned";
  case DisconnectReason::TRANSPORT_CLOSED:
    return "transport-closed";
  case DisconnectReason::SHUTDOWN:
    return "shutdown";
  }
  return "unknown";
}

// Granularity of the outstanding-request timeout scan
static constexpr std::chrono::seconds REQUEST_CHECK_INTERVAL{1};
static constexpr std::chrono::seconds INACTIVITY_CHECK_INTERVAL{60};

Peer::Peer(boost::asio::io_context &io_context,
           TransportConnectionPtr connection,
           std::shared_ptr<const PeerConfig> config,
           const RequestHandler *requests, bool is_inbound,
           const std::string &target_address, uint16_t target_port)
    : io_context_(io_context), strand_(boost::asio::make_strand(io_context)),
      connection_(std::move(connection)), config_(std::move(config)),
      requests_(requests), handshake_timer_(strand_),
      inactivity_timer_(strand_), request_timer_(strand_),
      refresh_timer_(strand_), is_inbound_(is_inbound),
      target_address_(target_address), target_port_(target_port),
      state_(PeerState::CONNECTING), tokens_(config_->message_burst),
      last_refill_(util::GetSteadyTime()), last_recv_(util::GetSteadyTime()) {}

Peer::~Peer() {
  PeerState s = state_;
  if (s != PeerState::CLOSED && s != PeerState::BANNED && started_) {
    LOG_NET_ERROR("peer={} destroyed in state {} without close()", id_,
                  PeerStateName(s));
  }
}

PeerPtr Peer::create_outbound(boost::asio::io_context &io_context,
                              TransportConnectionPtr connection,
                              std::shared_ptr<const PeerConfig> config,
                              const RequestHandler *requests,
                              const std::string &target_address,
                              uint16_t target_port) {
  return PeerPtr(new Peer(io_context, std::move(connection), std::move(config),
                          requests, false, target_address, target_port));
}

PeerPtr Peer::create_inbound(boost::asio::io_context &io_context,
                             TransportConnectionPtr connection,
                             std::shared_ptr<const PeerConfig> config,
                             const RequestHandler *requests) {
  std::string addr = connection ? connection->remote_address() : "";
  uint16_t port = connection ? connection->remote_port() : 0;
  return PeerPtr(new Peer(io_context, std::move(connection), std::move(config),
                          requests, true, addr, port));
}

void Peer::set_callbacks(PeerCallbacks callbacks) {
  callbacks_ = std::move(callbacks);
}

std::string Peer::address() const {
  if (!target_address_.empty())
    return target_address_;
  return "unknown";
}

uint16_t Peer::port() const { return target_port_; }

// ============================================================================
// Lifecycle
// ============================================================================

void Peer::start() {
  auto self = shared_from_this();
  boost::asio::post(strand_, [self]() {
    if (self->started_ || self->state_ != PeerState::CONNECTING) {
      LOG_NET_TRACE("peer={} already started, ignoring start()", self->id_);
      return;
    }
    self->started_ = true;

    if (!self->connection_ || !self->connection_->is_open()) {
      LOG_NET_DEBUG("peer={} connection closed before start", self->id_);
      self->close(DisconnectReason::TRANSPORT_CLOSED);
      return;
    }

    // Transport callbacks hop onto the strand; the shared_ptr keeps the
    // session alive until close() clears them
    self->connection_->set_receive_callback(
        [self](const std::vector<uint8_t> &data) {
          boost::asio::post(self->strand_,
                            [self, data]() { self->on_transport_receive(data); });
        });
    self->connection_->set_disconnect_callback([self]() {
      boost::asio::post(self->strand_,
                        [self]() { self->on_transport_disconnect(); });
    });

    self->state_ = PeerState::HANDSHAKING;
    self->last_recv_ = util::GetSteadyTime();
    self->connection_->start();
    self->send_connection_message();
    self->start_handshake_timeout();
    LOG_NET_TRACE("peer={} {} session started with {}:{}", self->id_,
                  self->is_inbound_ ? "inbound" : "outbound", self->address(),
                  self->port());
  });
}

void Peer::disconnect(DisconnectReason reason, bool ban) {
  auto self = shared_from_this();
  boost::asio::post(strand_, [self, reason, ban]() { self->close(reason, ban); });
}

void Peer::close(DisconnectReason reason, bool ban) {
  PeerState s = state_;
  if (s == PeerState::CLOSING || s == PeerState::CLOSED ||
      s == PeerState::BANNED) {
    return;
  }
  state_ = PeerState::CLOSING;
  disconnect_reason_ = reason;
  LOG_NET_DEBUG("disconnecting peer={} ({}:{}): {}", id_, address(), port(),
                DisconnectReasonName(reason));

  cancel_all_timers();

  if (connection_) {
    connection_->set_receive_callback({});
    connection_->set_disconnect_callback({});
    connection_->close();
  }

  // Outstanding work goes back to the chain manager before the peer leaves
  if (announced_) {
    for (const auto &entry : outstanding_) {
      emit(sync::FetchFailed{id_, entry.request,
                             sync::FetchFailure::PEER_DISCONNECTED});
    }
    emit(sync::PeerDisconnected{id_});
  }
  outstanding_.clear();
  outstanding_count_ = 0;

  state_ = ban ? PeerState::BANNED : PeerState::CLOSED;

  auto on_closed = std::move(callbacks_.on_closed);
  callbacks_ = {};
  if (on_closed) {
    on_closed(shared_from_this());
  }
}

void Peer::on_transport_disconnect() {
  LOG_NET_TRACE("transport disconnected: peer={} {}:{}", id_, address(),
                port());
  close(DisconnectReason::TRANSPORT_CLOSED);
}

// ============================================================================
// Receive path
// ============================================================================

void Peer::on_transport_receive(const std::vector<uint8_t> &data) {
  PeerState s = state_;
  if (s == PeerState::CLOSING || s == PeerState::CLOSED ||
      s == PeerState::BANNED) {
    return;
  }

  if (reader_.Buffered() + data.size() > protocol::DEFAULT_RECV_FLOOD_SIZE) {
    LOG_NET_WARN("receive buffer overflow ({} + {} bytes) from peer={}",
                 reader_.Buffered(), data.size(), id_);
    violation("receive-flood");
    return;
  }

  last_recv_ = util::GetSteadyTime();
  reader_.Feed(data);
  try {
    process_frames();
  } catch (const std::exception &e) {
    LOG_NET_ERROR("error processing data from peer={}: {}", id_, e.what());
    close(DisconnectReason::PROTOCOL_VIOLATION);
  }
}

void Peer::process_frames() {
  std::vector<uint8_t> frame;
  while (reader_.Next(frame)) {
    bool ok = false;
    switch (stage_) {
    case HandshakeStage::AWAIT_CONNECTION:
      ok = handle_connection_message(frame);
      break;
    case HandshakeStage::AWAIT_METADATA:
      ok = handle_metadata(frame);
      break;
    case HandshakeStage::AWAIT_ACK:
      ok = handle_ack(frame);
      break;
    case HandshakeStage::DONE:
      ok = handle_message(frame);
      break;
    }
    PeerState s = state_;
    if (!ok || s == PeerState::CLOSING || s == PeerState::CLOSED ||
        s == PeerState::BANNED) {
      return;
    }
  }
  if (reader_.HasError()) {
    LOG_NET_WARN("oversized frame from peer={}", id_);
    violation("oversized-frame");
  }
}

// ============================================================================
// Handshake
// ============================================================================

void Peer::send_connection_message() {
  message::ConnectionMessage msg;
  msg.port = config_->listen_port;
  msg.public_key = config_->identity.keys.public_key;
  msg.proof_of_work_stamp = config_->identity.stamp;
  if (!crypto::GetRandomBytes(msg.message_nonce)) {
    LOG_NET_ERROR("RNG failure building connection message");
    close(DisconnectReason::HANDSHAKE_FAILED);
    return;
  }
  msg.versions.push_back(config_->version);

  sent_connection_msg_ = msg.Serialize();
  send_plain(sent_connection_msg_);
}

bool Peer::handle_connection_message(const std::vector<uint8_t> &payload) {
  if (callbacks_.on_replay) {
    callbacks_.on_replay(*this, "connection", payload);
  }

  message::ConnectionMessage msg;
  if (!msg.Deserialize(payload)) {
    LOG_NET_DEBUG("malformed connection message from {}:{}", address(), port());
    close(DisconnectReason::HANDSHAKE_FAILED);
    return false;
  }

  const message::NetworkVersion &ours = config_->version;
  auto compatible = std::find_if(
      msg.versions.begin(), msg.versions.end(),
      [&ours](const message::NetworkVersion &v) {
        return v.chain_name == ours.chain_name &&
               v.distributed_db_version == ours.distributed_db_version;
      });
  if (compatible == msg.versions.end()) {
    LOG_NET_DEBUG("no compatible version with {}:{}", address(), port());
    close(DisconnectReason::HANDSHAKE_FAILED);
    return false;
  }

  if (!crypto::CheckProofOfWork(msg.public_key, msg.proof_of_work_stamp,
                                config_->pow_difficulty)) {
    LOG_NET_DEBUG("insufficient identity proof-of-work from {}:{}", address(),
                  port());
    close(DisconnectReason::HANDSHAKE_FAILED);
    return false;
  }

  if (msg.public_key == config_->identity.keys.public_key) {
    LOG_NET_DEBUG("self connection detected, disconnecting peer={}", id_);
    close(DisconnectReason::HANDSHAKE_FAILED);
    return false;
  }

  remote_public_key_ = msg.public_key;
  remote_identity_ = crypto::PeerIdFromPublicKey(msg.public_key);
  remote_listen_port_ = msg.port;
  p2p_version_ = std::min(compatible->p2p_version, ours.p2p_version);

  if (callbacks_.is_banned && callbacks_.is_banned(remote_identity_)) {
    LOG_NET_DEBUG("identity {} is cooling down after a ban",
                  remote_identity_.substr(0, 16));
    close(DisconnectReason::HANDSHAKE_FAILED);
    return false;
  }

  // Initiator = the side that dialed; its connection message comes first
  // in the key transcript
  cipher_ = crypto::SessionCipher::Establish(
      config_->identity.keys.secret_key, remote_public_key_,
      sent_connection_msg_, payload, !is_inbound_);
  if (!cipher_) {
    LOG_NET_DEBUG("key agreement failed with {}:{}", address(), port());
    close(DisconnectReason::HANDSHAKE_FAILED);
    return false;
  }

  message::MetadataMessage meta;
  meta.chain_id = config_->chain_id;
  meta.disable_mempool = config_->disable_mempool;
  meta.private_node = config_->private_node;
  stage_ = HandshakeStage::AWAIT_METADATA;
  return send_encrypted(meta.Serialize());
}

bool Peer::handle_metadata(const std::vector<uint8_t> &frame) {
  std::vector<uint8_t> payload;
  if (!cipher_->Decrypt(frame, payload)) {
    LOG_NET_DEBUG("metadata decryption failed from peer={}", id_);
    close(DisconnectReason::HANDSHAKE_FAILED);
    return false;
  }
  if (callbacks_.on_replay) {
    callbacks_.on_replay(*this, "metadata", payload);
  }

  message::MetadataMessage meta;
  if (!meta.Deserialize(payload)) {
    close(DisconnectReason::HANDSHAKE_FAILED);
    return false;
  }
  if (meta.chain_id != config_->chain_id) {
    LOG_NET_DEBUG("peer={} is on chain {:08x}, we are on {:08x}", id_,
                  meta.chain_id, config_->chain_id);
    close(DisconnectReason::HANDSHAKE_FAILED);
    return false;
  }
  remote_private_node_ = meta.private_node;

  message::AckMessage ack;
  if (callbacks_.admit &&
      !callbacks_.admit(shared_from_this(), ack.alternative_peers)) {
    ack.ack = false;
    if (ack.alternative_peers.size() > protocol::MAX_NACK_ADDRESSES) {
      ack.alternative_peers.resize(protocol::MAX_NACK_ADDRESSES);
    }
    LOG_NET_DEBUG("refusing peer={} with {} alternatives", id_,
                  ack.alternative_peers.size());
    send_encrypted(ack.Serialize());
    close(DisconnectReason::REFUSED);
    return false;
  }

  ack.alternative_peers.clear();
  stage_ = HandshakeStage::AWAIT_ACK;
  return send_encrypted(ack.Serialize());
}

bool Peer::handle_ack(const std::vector<uint8_t> &frame) {
  std::vector<uint8_t> payload;
  if (!cipher_->Decrypt(frame, payload)) {
    LOG_NET_DEBUG("ack decryption failed from peer={}", id_);
    close(DisconnectReason::HANDSHAKE_FAILED);
    return false;
  }
  if (callbacks_.on_replay) {
    callbacks_.on_replay(*this, "ack", payload);
  }

  message::AckMessage ack;
  if (!ack.Deserialize(payload)) {
    close(DisconnectReason::HANDSHAKE_FAILED);
    return false;
  }
  if (!ack.ack) {
    LOG_NET_DEBUG("peer={} refused us, {} alternatives offered", id_,
                  ack.alternative_peers.size());
    if (callbacks_.on_addresses && !ack.alternative_peers.empty()) {
      callbacks_.on_addresses(ack.alternative_peers);
    }
    close(DisconnectReason::NACKED);
    return false;
  }

  on_established();
  return true;
}

void Peer::on_established() {
  stage_ = HandshakeStage::DONE;
  state_ = PeerState::BOOTSTRAPPING;
  handshake_timer_.cancel();
  LOG_NET_DEBUG("peer={} {} {}:{} established (p2p version {})", id_,
                is_inbound_ ? "inbound" : "outbound", address(), port(),
                p2p_version_);

  announced_ = true;
  emit(sync::PeerConnected{id_, remote_identity_,
                           address() + ":" + std::to_string(port()),
                           is_inbound_});
  send_message(message::GetCurrentBranchMessage{config_->chain_id});

  schedule_inactivity_check();
  schedule_request_check();
  schedule_branch_refresh();
}

// ============================================================================
// Established traffic
// ============================================================================

bool Peer::consume_rate_token() {
  auto now = util::GetSteadyTime();
  std::chrono::duration<double> elapsed = now - last_refill_;
  last_refill_ = now;
  tokens_ = std::min(config_->message_burst,
                     tokens_ + elapsed.count() * config_->message_rate);
  if (tokens_ < 1.0) {
    return false;
  }
  tokens_ -= 1.0;
  return true;
}

bool Peer::handle_message(const std::vector<uint8_t> &frame) {
  std::vector<uint8_t> payload;
  if (!cipher_->Decrypt(frame, payload)) {
    LOG_NET_DEBUG("frame authentication failed from peer={}", id_);
    violation("decryption-failure");
    return false;
  }

  if (!consume_rate_token()) {
    LOG_NET_WARN("peer={} exceeded message rate, disconnecting", id_);
    emit(sync::ProtocolViolation{id_, "rate-limit"});
    close(DisconnectReason::RATE_LIMIT);
    return false;
  }

  if (callbacks_.on_replay) {
    callbacks_.on_replay(*this, "message", payload);
  }

  message::PeerMessage msg;
  switch (message::DecodeMessage(payload, msg)) {
  case message::DecodeStatus::OK:
    break;
  case message::DecodeStatus::UNKNOWN_TAG:
    LOG_NET_TRACE("ignoring unknown message from peer={}", id_);
    return true;
  case message::DecodeStatus::MALFORMED:
    LOG_NET_DEBUG("malformed message from peer={}", id_);
    violation("malformed-message");
    return false;
  }

  LOG_NET_TRACE("received {} from peer={}", message::MessageName(msg), id_);

  if (auto *m = std::get_if<message::AdvertiseMessage>(&msg)) {
    if (callbacks_.on_addresses) {
      callbacks_.on_addresses(m->addresses);
    }
  } else if (auto *m = std::get_if<message::GetCurrentBranchMessage>(&msg)) {
    if (m->chain_id != config_->chain_id) {
      violation("wrong-chain-id");
      return false;
    }
    if (requests_) {
      if (auto reply = requests_->CurrentBranch()) {
        send_message(*reply);
      }
    }
  } else if (auto *m = std::get_if<message::GetBlockHeadersMessage>(&msg)) {
    if (requests_) {
      for (auto &reply : requests_->BlockHeaders(*m)) {
        send_message(reply);
      }
    }
  } else if (auto *m =
                 std::get_if<message::GetOperationsForBlocksMessage>(&msg)) {
    if (requests_) {
      for (auto &reply : requests_->Operations(*m)) {
        send_message(reply);
      }
    }
  } else if (auto *m = std::get_if<message::CurrentBranchMessage>(&msg)) {
    if (m->chain_id != config_->chain_id) {
      violation("wrong-chain-id");
      return false;
    }
    emit(sync::BranchAdvertised{id_, std::move(m->branch)});
  } else if (auto *m = std::get_if<message::BlockHeaderMessage>(&msg)) {
    clear_outstanding({sync::FetchKind::HEADER, m->header.GetHash(), 0});
    emit(sync::HeaderReceived{id_, std::move(m->header)});
  } else if (auto *m =
                 std::get_if<message::OperationsForBlocksMessage>(&msg)) {
    clear_outstanding(
        {sync::FetchKind::OPERATIONS, m->key.block_hash, m->key.pass});
    emit(sync::OperationsReceived{id_, m->key.block_hash, m->key.pass,
                                  std::move(m->operations)});
  }
  return true;
}

void Peer::clear_outstanding(const sync::FetchRequest &request) {
  auto it = std::find_if(outstanding_.begin(), outstanding_.end(),
                         [&request](const Outstanding &o) {
                           return o.request == request;
                         });
  if (it != outstanding_.end()) {
    outstanding_.erase(it);
    outstanding_count_ = outstanding_.size();
  }
}

// ============================================================================
// Outbound instructions
// ============================================================================

void Peer::request_fetch(const sync::FetchRequest &request) {
  auto self = shared_from_this();
  boost::asio::post(strand_, [self, request]() {
    if (!self->is_established()) {
      return;
    }
    if (self->outstanding_.size() >= self->config_->max_outstanding) {
      LOG_NET_TRACE("peer={} at outstanding cap, refusing fetch of {}",
                    self->id_, request.block_hash.ToShortString());
      self->emit(sync::FetchFailed{self->id_, request,
                                   sync::FetchFailure::OVER_CAP});
      return;
    }
    auto duplicate = std::find_if(
        self->outstanding_.begin(), self->outstanding_.end(),
        [&request](const Outstanding &o) { return o.request == request; });
    if (duplicate != self->outstanding_.end()) {
      return;
    }

    self->outstanding_.push_back({request, util::GetSteadyTime()});
    self->outstanding_count_ = self->outstanding_.size();
    if (request.kind == sync::FetchKind::HEADER) {
      self->send_message(message::GetBlockHeadersMessage{{request.block_hash}});
    } else {
      self->send_message(message::GetOperationsForBlocksMessage{
          {{request.block_hash, request.pass}}});
    }
  });
}

void Peer::send_branch(const chain::Branch &branch) {
  auto self = shared_from_this();
  boost::asio::post(strand_, [self, branch]() {
    if (!self->is_established()) {
      return;
    }
    self->send_message(
        message::CurrentBranchMessage{self->config_->chain_id, branch});
  });
}

void Peer::mark_synced() {
  auto self = shared_from_this();
  boost::asio::post(strand_, [self]() {
    PeerState expected = PeerState::BOOTSTRAPPING;
    if (self->state_.compare_exchange_strong(expected, PeerState::SYNCED)) {
      LOG_NET_DEBUG("peer={} synced", self->id_);
    }
  });
}

void Peer::mark_bootstrapping() {
  auto self = shared_from_this();
  boost::asio::post(strand_, [self]() {
    PeerState expected = PeerState::SYNCED;
    if (self->state_.compare_exchange_strong(expected,
                                             PeerState::BOOTSTRAPPING)) {
      LOG_NET_DEBUG("peer={} bootstrapping again", self->id_);
    }
  });
}

// ============================================================================
// Send path
// ============================================================================

bool Peer::send_plain(const std::vector<uint8_t> &payload) {
  if (!connection_ || !connection_->send(message::FrameMessage(payload))) {
    LOG_NET_DEBUG("send to peer={} failed", id_);
    auto self = shared_from_this();
    boost::asio::post(strand_, [self]() {
      self->close(DisconnectReason::TRANSPORT_CLOSED);
    });
    return false;
  }
  return true;
}

bool Peer::send_encrypted(const std::vector<uint8_t> &payload) {
  std::vector<uint8_t> sealed;
  if (!cipher_ || !cipher_->Encrypt(payload, sealed)) {
    LOG_NET_ERROR("encryption failed for peer={}", id_);
    close(DisconnectReason::HANDSHAKE_FAILED);
    return false;
  }
  return send_plain(sealed);
}

bool Peer::send_message(const message::PeerMessage &msg) {
  LOG_NET_TRACE("sending {} to peer={}", message::MessageName(msg), id_);
  return send_encrypted(message::EncodeMessage(msg));
}

void Peer::emit(sync::PeerEvent event) {
  if (callbacks_.on_event) {
    callbacks_.on_event(std::move(event));
  }
}

void Peer::violation(const std::string &reason) {
  if (announced_) {
    emit(sync::ProtocolViolation{id_, reason});
  }
  close(DisconnectReason::PROTOCOL_VIOLATION);
}

// ============================================================================
// Timers
// ============================================================================

void Peer::start_handshake_timeout() {
  auto self = shared_from_this();
  handshake_timer_.expires_after(config_->handshake_timeout);
  handshake_timer_.async_wait([self](const boost::system::error_code &ec) {
    if (ec || self->state_ != PeerState::HANDSHAKING) {
      return;
    }
    LOG_NET_DEBUG("handshake timeout peer={}", self->id_);
    self->close(DisconnectReason::HANDSHAKE_TIMEOUT);
  });
}

void Peer::schedule_inactivity_check() {
  auto self = shared_from_this();
  inactivity_timer_.expires_after(
      std::min<std::chrono::steady_clock::duration>(INACTIVITY_CHECK_INTERVAL,
                                                    config_->inactivity_timeout));
  inactivity_timer_.async_wait([self](const boost::system::error_code &ec) {
    if (ec || !self->is_established()) {
      return;
    }
    auto idle = util::GetSteadyTime() - self->last_recv_;
    if (idle > self->config_->inactivity_timeout) {
      LOG_NET_DEBUG("inactivity timeout peer={}", self->id_);
      self->emit(sync::ProtocolViolation{self->id_, "inactivity"});
      self->close(DisconnectReason::INACTIVITY);
      return;
    }
    self->schedule_inactivity_check();
  });
}

void Peer::schedule_request_check() {
  auto self = shared_from_this();
  request_timer_.expires_after(REQUEST_CHECK_INTERVAL);
  request_timer_.async_wait([self](const boost::system::error_code &ec) {
    if (ec || !self->is_established()) {
      return;
    }
    auto now = util::GetSteadyTime();
    std::vector<sync::FetchRequest> expired;
    auto &outstanding = self->outstanding_;
    for (auto it = outstanding.begin(); it != outstanding.end();) {
      if (now - it->sent_at >= self->config_->request_timeout) {
        expired.push_back(it->request);
        it = outstanding.erase(it);
      } else {
        ++it;
      }
    }
    self->outstanding_count_ = outstanding.size();
    for (const auto &request : expired) {
      LOG_NET_DEBUG("request for {} timed out at peer={}",
                    request.block_hash.ToShortString(), self->id_);
      self->emit(
          sync::FetchFailed{self->id_, request, sync::FetchFailure::TIMEOUT});
    }
    self->schedule_request_check();
  });
}

void Peer::schedule_branch_refresh() {
  auto self = shared_from_this();
  refresh_timer_.expires_after(config_->branch_refresh_interval);
  refresh_timer_.async_wait([self](const boost::system::error_code &ec) {
    if (ec || !self->is_established()) {
      return;
    }
    if (self->state_ == PeerState::SYNCED) {
      self->send_message(
          message::GetCurrentBranchMessage{self->config_->chain_id});
    }
    self->schedule_branch_refresh();
  });
}

void Peer::cancel_all_timers() {
  handshake_timer_.cancel();
  inactivity_timer_.cancel();
  request_timer_.cancel();
  refresh_timer_.cancel();
}

} // namespace network
} // namespace stakenode
