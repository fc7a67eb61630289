// Copyright (c) 2024 StakeNode
// Distributed under the MIT software license

#ifndef STAKENODE_NETWORK_MESSAGE_HPP
#define STAKENODE_NETWORK_MESSAGE_HPP

#include "chain/block.hpp"
#include "chain/chainparams.hpp"
#include "crypto/pow.hpp"
#include "crypto/session.hpp"
#include "util/uint.hpp"
#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace stakenode {
namespace message {

// ============================================================================
// Handshake messages
// ============================================================================

struct NetworkVersion {
  std::string chain_name;
  uint16_t distributed_db_version{0};
  uint16_t p2p_version{0};

  friend bool operator==(const NetworkVersion &a, const NetworkVersion &b) {
    return a.chain_name == b.chain_name &&
           a.distributed_db_version == b.distributed_db_version &&
           a.p2p_version == b.p2p_version;
  }
};

static constexpr size_t CONNECTION_NONCE_SIZE = 24;

// Sent in plaintext by both sides as the first frame
struct ConnectionMessage {
  uint16_t port{0};
  crypto::PublicKey public_key{};
  crypto::PowStamp proof_of_work_stamp{};
  std::array<uint8_t, CONNECTION_NONCE_SIZE> message_nonce{};
  std::vector<NetworkVersion> versions;

  std::vector<uint8_t> Serialize() const;
  bool Deserialize(std::span<const uint8_t> data);
};

// First encrypted frame in each direction
struct MetadataMessage {
  chain::ChainId chain_id{0};
  bool disable_mempool{false};
  bool private_node{false};

  std::vector<uint8_t> Serialize() const;
  bool Deserialize(std::span<const uint8_t> data);
};

// Final handshake frame; a Nack carries other peers to try and is followed
// by a close
struct AckMessage {
  bool ack{true};
  std::vector<std::string> alternative_peers;

  std::vector<uint8_t> Serialize() const;
  bool Deserialize(std::span<const uint8_t> data);
};

// ============================================================================
// Peer messages (after the handshake)
// ============================================================================

struct AdvertiseMessage {
  std::vector<std::string> addresses; // host:port
};

struct GetCurrentBranchMessage {
  chain::ChainId chain_id{0};
};

struct CurrentBranchMessage {
  chain::ChainId chain_id{0};
  chain::Branch branch;
};

struct GetBlockHeadersMessage {
  std::vector<uint256> hashes;
};

struct BlockHeaderMessage {
  chain::BlockHeader header;
};

struct OperationsKey {
  uint256 block_hash;
  uint8_t pass{0};

  friend bool operator==(const OperationsKey &a, const OperationsKey &b) {
    return a.block_hash == b.block_hash && a.pass == b.pass;
  }
};

struct GetOperationsForBlocksMessage {
  std::vector<OperationsKey> keys;
};

struct OperationsForBlocksMessage {
  OperationsKey key;
  chain::OperationsList operations;
};

// Closed set of post-handshake messages; handled with std::visit
using PeerMessage =
    std::variant<AdvertiseMessage, GetCurrentBranchMessage,
                 CurrentBranchMessage, GetBlockHeadersMessage,
                 BlockHeaderMessage, GetOperationsForBlocksMessage,
                 OperationsForBlocksMessage>;

enum class DecodeStatus {
  OK,
  UNKNOWN_TAG, // well-framed message of a kind we do not handle
  MALFORMED    // known tag, bad body
};

// tag (uint16) followed by the message body
std::vector<uint8_t> EncodeMessage(const PeerMessage &msg);
DecodeStatus DecodeMessage(std::span<const uint8_t> payload, PeerMessage &out);

uint16_t MessageTag(const PeerMessage &msg);

// ============================================================================
// Framing
// ============================================================================

// 4-byte big-endian length prefix followed by the payload
std::vector<uint8_t> FrameMessage(std::span<const uint8_t> payload);

/**
 * Incremental deframer for a byte stream. Feed arbitrary chunks, then pull
 * complete frames with Next(). A length above MAX_FRAME_SIZE poisons the
 * reader; the connection must be dropped.
 */
class FrameReader {
public:
  void Feed(std::span<const uint8_t> data);

  // Next complete payload, or false if none is buffered yet
  bool Next(std::vector<uint8_t> &payload);

  bool HasError() const { return error_; }
  size_t Buffered() const { return buffer_.size() - offset_; }

private:
  std::vector<uint8_t> buffer_;
  size_t offset_{0};
  bool error_{false};
};

const char *MessageName(const PeerMessage &msg);
// Name for a raw tag, "unknown" if not one of ours
const char *TagName(uint16_t tag);

} // namespace message
} // namespace stakenode

#endif // STAKENODE_NETWORK_MESSAGE_HPP
