// Copyright (c) 2024 StakeNode
// Distributed under the MIT software license

#ifndef STAKENODE_NETWORK_PEER_HPP
#define STAKENODE_NETWORK_PEER_HPP

#include "crypto/identity.hpp"
#include "crypto/session.hpp"
#include "network/message.hpp"
#include "network/protocol.hpp"
#include "network/transport.hpp"
#include "sync/peer_events.hpp"
#include <atomic>
#include <utility> // boost 1.74 asio uses std::exchange without including it
#include <boost/asio.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace stakenode {
namespace network {

class Peer;
class RequestHandler;
using PeerPtr = std::shared_ptr<Peer>;

// Session state machine; CLOSED and BANNED are terminal
enum class PeerState {
  CONNECTING,    // transport not yet established
  HANDSHAKING,   // connection/metadata/ack exchange
  BOOTSTRAPPING, // established, branch not yet reconciled
  SYNCED,        // chain manager reconciled the peer's branch
  CLOSING,
  CLOSED,
  BANNED
};

enum class DisconnectReason {
  NONE,
  HANDSHAKE_FAILED,
  HANDSHAKE_TIMEOUT,
  INACTIVITY,
  RATE_LIMIT,
  PROTOCOL_VIOLATION,
  REFUSED,     // we sent a Nack
  NACKED,      // the peer sent a Nack
  BANNED,      // chain manager instruction
  TRANSPORT_CLOSED,
  SHUTDOWN
};

const char *PeerStateName(PeerState state);
const char *DisconnectReasonName(DisconnectReason reason);

/**
 * Settings shared by every session of a node. Built once by the network
 * manager; sessions hold it by shared_ptr.
 */
struct PeerConfig {
  crypto::NodeIdentity identity;
  message::NetworkVersion version;
  chain::ChainId chain_id{0};
  uint16_t listen_port{0};
  unsigned int pow_difficulty{0};
  bool disable_mempool{false};
  bool private_node{false};

  size_t max_outstanding{protocol::DEFAULT_MAX_OUTSTANDING_REQUESTS};
  std::chrono::seconds handshake_timeout{protocol::HANDSHAKE_TIMEOUT_SEC};
  std::chrono::seconds inactivity_timeout{protocol::INACTIVITY_TIMEOUT_SEC};
  std::chrono::seconds request_timeout{protocol::DEFAULT_REQUEST_TIMEOUT_SEC};
  std::chrono::seconds branch_refresh_interval{
      protocol::BRANCH_REFRESH_INTERVAL_SEC};
  double message_rate{protocol::DEFAULT_MESSAGE_RATE};
  double message_burst{protocol::DEFAULT_MESSAGE_BURST};
};

/**
 * Hooks into the rest of the node. All are invoked on the session's strand;
 * any may be left empty.
 */
struct PeerCallbacks {
  // Events for the chain manager (post them, do not run them inline)
  std::function<void(sync::PeerEvent)> on_event;
  // Admission after the metadata exchange; false refuses the peer and
  // `alternatives` go out in the Nack
  std::function<bool(const PeerPtr &, std::vector<std::string> &alternatives)>
      admit;
  std::function<bool(const std::string &identity)> is_banned;
  // Advertise messages and addresses from a received Nack
  std::function<void(const std::vector<std::string> &)> on_addresses;
  // Deterministic replay: plaintext of every received frame
  std::function<void(const Peer &, const char *kind,
                     const std::vector<uint8_t> &payload)>
      on_replay;
  std::function<void(const PeerPtr &)> on_closed;
};

/**
 * Peer - one authenticated session over a TransportConnection
 *
 * Runs the handshake (plaintext connection message, then encrypted
 * metadata and ack), deframes and decrypts traffic, translates messages
 * into sync::PeerEvent, serves requests through the RequestHandler and
 * enforces the outstanding-request cap, a message rate limit and the
 * handshake, request and inactivity timeouts.
 *
 * All state is touched only on the session strand; the public methods may
 * be called from any thread and post to it.
 */
class Peer : public std::enable_shared_from_this<Peer> {
public:
  static PeerPtr create_outbound(boost::asio::io_context &io_context,
                                 TransportConnectionPtr connection,
                                 std::shared_ptr<const PeerConfig> config,
                                 const RequestHandler *requests,
                                 const std::string &target_address,
                                 uint16_t target_port);

  static PeerPtr create_inbound(boost::asio::io_context &io_context,
                                TransportConnectionPtr connection,
                                std::shared_ptr<const PeerConfig> config,
                                const RequestHandler *requests);

  ~Peer();

  Peer(const Peer &) = delete;
  Peer &operator=(const Peer &) = delete;

  // Must be called once, after set_id() and set_callbacks()
  void start();

  void set_id(sync::PeerId id) { id_ = id; }
  void set_callbacks(PeerCallbacks callbacks);

  // === Instructions from the chain manager (thread-safe) ===

  void request_fetch(const sync::FetchRequest &request);
  void send_branch(const chain::Branch &branch);
  void mark_synced();
  void mark_bootstrapping();
  void disconnect(DisconnectReason reason, bool ban = false);

  // === Accessors ===

  sync::PeerId id() const { return id_; }
  PeerState state() const { return state_; }
  bool is_established() const {
    PeerState s = state_;
    return s == PeerState::BOOTSTRAPPING || s == PeerState::SYNCED;
  }
  bool is_inbound() const { return is_inbound_; }
  std::string address() const;
  uint16_t port() const;
  const std::string &target_address() const { return target_address_; }
  uint16_t target_port() const { return target_port_; }

  // Valid once the connection message has been accepted
  const std::string &identity() const { return remote_identity_; }
  uint16_t remote_listen_port() const { return remote_listen_port_; }
  uint16_t negotiated_p2p_version() const { return p2p_version_; }
  bool remote_private_node() const { return remote_private_node_; }
  DisconnectReason disconnect_reason() const { return disconnect_reason_; }
  size_t outstanding_requests() const { return outstanding_count_; }

private:
  enum class HandshakeStage {
    AWAIT_CONNECTION,
    AWAIT_METADATA,
    AWAIT_ACK,
    DONE
  };

  struct Outstanding {
    sync::FetchRequest request;
    std::chrono::steady_clock::time_point sent_at;
  };

  Peer(boost::asio::io_context &io_context, TransportConnectionPtr connection,
       std::shared_ptr<const PeerConfig> config,
       const RequestHandler *requests, bool is_inbound,
       const std::string &target_address, uint16_t target_port);

  void on_transport_receive(const std::vector<uint8_t> &data);
  void on_transport_disconnect();
  void process_frames();

  // Handshake
  void send_connection_message();
  bool handle_connection_message(const std::vector<uint8_t> &payload);
  bool handle_metadata(const std::vector<uint8_t> &payload);
  bool handle_ack(const std::vector<uint8_t> &payload);
  void on_established();

  // Established traffic
  bool handle_message(const std::vector<uint8_t> &payload);
  bool consume_rate_token();
  void clear_outstanding(const sync::FetchRequest &request);

  // Output
  bool send_plain(const std::vector<uint8_t> &payload);
  bool send_encrypted(const std::vector<uint8_t> &payload);
  bool send_message(const message::PeerMessage &msg);

  void emit(sync::PeerEvent event);
  void violation(const std::string &reason);
  void close(DisconnectReason reason, bool ban = false);

  // Timers
  void start_handshake_timeout();
  void schedule_inactivity_check();
  void schedule_request_check();
  void schedule_branch_refresh();
  void cancel_all_timers();

  boost::asio::io_context &io_context_;
  boost::asio::strand<boost::asio::io_context::executor_type> strand_;
  TransportConnectionPtr connection_;
  std::shared_ptr<const PeerConfig> config_;
  const RequestHandler *requests_;
  PeerCallbacks callbacks_;

  boost::asio::steady_timer handshake_timer_;
  boost::asio::steady_timer inactivity_timer_;
  boost::asio::steady_timer request_timer_;
  boost::asio::steady_timer refresh_timer_;

  bool is_inbound_;
  sync::PeerId id_{0};
  std::string target_address_;
  uint16_t target_port_{0};

  std::atomic<PeerState> state_;
  HandshakeStage stage_{HandshakeStage::AWAIT_CONNECTION};
  DisconnectReason disconnect_reason_{DisconnectReason::NONE};
  bool started_{false};
  bool announced_{false}; // PeerConnected was emitted

  message::FrameReader reader_;
  std::vector<uint8_t> sent_connection_msg_;
  std::optional<crypto::SessionCipher> cipher_;

  std::string remote_identity_;
  crypto::PublicKey remote_public_key_{};
  uint16_t remote_listen_port_{0};
  uint16_t p2p_version_{0};
  bool remote_private_node_{false};

  std::vector<Outstanding> outstanding_;
  std::atomic<size_t> outstanding_count_{0};

  double tokens_;
  std::chrono::steady_clock::time_point last_refill_;
  std::chrono::steady_clock::time_point last_recv_;
};

} // namespace network
} // namespace stakenode

#endif // STAKENODE_NETWORK_PEER_HPP
