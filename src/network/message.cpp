// Copyright (c) 2024 StakeNode
// Distributed under the MIT software license

#include "network/message.hpp"
#include "network/protocol.hpp"
#include "util/endian.hpp"
#include "util/serialize.hpp"
#include <algorithm>
#include <iterator>
#include <string_view>
#include <type_traits>

namespace stakenode {
namespace message {

using util::Deserializer;
using util::Serializer;

// ============================================================================
// Handshake messages
// ============================================================================

std::vector<uint8_t> ConnectionMessage::Serialize() const {
  Serializer s;
  s.write_uint16(port);
  s.write_bytes(public_key);
  s.write_bytes(proof_of_work_stamp);
  s.write_bytes(message_nonce);
  s.write_uint32(static_cast<uint32_t>(versions.size()));
  for (const auto &v : versions) {
    s.write_string(v.chain_name);
    s.write_uint16(v.distributed_db_version);
    s.write_uint16(v.p2p_version);
  }
  return s.release();
}

bool ConnectionMessage::Deserialize(std::span<const uint8_t> data) {
  Deserializer d(data);
  port = d.read_uint16();

  auto read_fixed = [&d](auto &out) {
    auto bytes = d.read_bytes(out.size());
    if (!d.has_error()) {
      std::copy(bytes.begin(), bytes.end(), out.begin());
    }
  };
  read_fixed(public_key);
  read_fixed(proof_of_work_stamp);
  read_fixed(message_nonce);

  // string length (2) + two uint16 versions
  uint32_t count = d.read_count(protocol::MAX_SUPPORTED_VERSIONS, 6);
  versions.clear();
  for (uint32_t i = 0; i < count && !d.has_error(); ++i) {
    NetworkVersion v;
    v.chain_name = d.read_string(protocol::MAX_CHAIN_NAME_LENGTH);
    v.distributed_db_version = d.read_uint16();
    v.p2p_version = d.read_uint16();
    versions.push_back(std::move(v));
  }
  return d.at_end();
}

std::vector<uint8_t> MetadataMessage::Serialize() const {
  Serializer s;
  s.write_uint32(chain_id);
  s.write_bool(disable_mempool);
  s.write_bool(private_node);
  return s.release();
}

bool MetadataMessage::Deserialize(std::span<const uint8_t> data) {
  Deserializer d(data);
  chain_id = d.read_uint32();
  disable_mempool = d.read_bool();
  private_node = d.read_bool();
  return d.at_end();
}

std::vector<uint8_t> AckMessage::Serialize() const {
  Serializer s;
  s.write_bool(ack);
  if (!ack) {
    s.write_uint32(static_cast<uint32_t>(alternative_peers.size()));
    for (const auto &addr : alternative_peers) {
      s.write_string(addr);
    }
  }
  return s.release();
}

bool AckMessage::Deserialize(std::span<const uint8_t> data) {
  Deserializer d(data);
  ack = d.read_bool();
  alternative_peers.clear();
  if (!ack && !d.has_error()) {
    uint32_t count = d.read_count(protocol::MAX_NACK_ADDRESSES, 2);
    for (uint32_t i = 0; i < count && !d.has_error(); ++i) {
      alternative_peers.push_back(d.read_string(protocol::MAX_ADDRESS_LENGTH));
    }
  }
  return d.at_end();
}

// ============================================================================
// Peer messages
// ============================================================================

namespace {

template <class> inline constexpr bool always_false_v = false;

void WriteAddresses(Serializer &s, const std::vector<std::string> &addrs) {
  s.write_uint32(static_cast<uint32_t>(addrs.size()));
  for (const auto &a : addrs) {
    s.write_string(a);
  }
}

void WriteKey(Serializer &s, const OperationsKey &key) {
  s.write_hash(key.block_hash);
  s.write_uint8(key.pass);
}

OperationsKey ReadKey(Deserializer &d) {
  OperationsKey key;
  key.block_hash = d.read_hash();
  key.pass = d.read_uint8();
  return key;
}

void EncodeBody(Serializer &s, const PeerMessage &msg) {
  std::visit(
      [&s](const auto &m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, AdvertiseMessage>) {
          WriteAddresses(s, m.addresses);
        } else if constexpr (std::is_same_v<T, GetCurrentBranchMessage>) {
          s.write_uint32(m.chain_id);
        } else if constexpr (std::is_same_v<T, CurrentBranchMessage>) {
          s.write_uint32(m.chain_id);
          m.branch.Serialize(s);
        } else if constexpr (std::is_same_v<T, GetBlockHeadersMessage>) {
          s.write_uint32(static_cast<uint32_t>(m.hashes.size()));
          for (const auto &h : m.hashes) {
            s.write_hash(h);
          }
        } else if constexpr (std::is_same_v<T, BlockHeaderMessage>) {
          m.header.Serialize(s);
        } else if constexpr (std::is_same_v<T,
                                            GetOperationsForBlocksMessage>) {
          s.write_uint32(static_cast<uint32_t>(m.keys.size()));
          for (const auto &k : m.keys) {
            WriteKey(s, k);
          }
        } else if constexpr (std::is_same_v<T, OperationsForBlocksMessage>) {
          WriteKey(s, m.key);
          chain::SerializeOperationsList(s, m.operations);
        } else {
          static_assert(always_false_v<T>, "unhandled peer message");
        }
      },
      msg);
}

bool DecodeBody(uint16_t tag, Deserializer &d, PeerMessage &out) {
  switch (tag) {
  case protocol::tags::ADVERTISE: {
    AdvertiseMessage m;
    uint32_t count = d.read_count(protocol::MAX_ADVERTISE_ADDRESSES, 2);
    for (uint32_t i = 0; i < count && !d.has_error(); ++i) {
      m.addresses.push_back(d.read_string(protocol::MAX_ADDRESS_LENGTH));
    }
    out = std::move(m);
    break;
  }
  case protocol::tags::GET_CURRENT_BRANCH: {
    GetCurrentBranchMessage m;
    m.chain_id = d.read_uint32();
    out = m;
    break;
  }
  case protocol::tags::CURRENT_BRANCH: {
    CurrentBranchMessage m;
    m.chain_id = d.read_uint32();
    if (!chain::Branch::Deserialize(d, m.branch)) {
      return false;
    }
    out = std::move(m);
    break;
  }
  case protocol::tags::GET_BLOCK_HEADERS: {
    GetBlockHeadersMessage m;
    uint32_t count =
        d.read_count(protocol::MAX_GET_BLOCK_HEADERS, uint256::size());
    for (uint32_t i = 0; i < count && !d.has_error(); ++i) {
      m.hashes.push_back(d.read_hash());
    }
    out = std::move(m);
    break;
  }
  case protocol::tags::BLOCK_HEADER: {
    BlockHeaderMessage m;
    if (!chain::BlockHeader::Deserialize(d, m.header)) {
      return false;
    }
    out = std::move(m);
    break;
  }
  case protocol::tags::GET_OPERATIONS_FOR_BLOCKS: {
    GetOperationsForBlocksMessage m;
    uint32_t count =
        d.read_count(protocol::MAX_GET_OPERATIONS, uint256::size() + 1);
    for (uint32_t i = 0; i < count && !d.has_error(); ++i) {
      m.keys.push_back(ReadKey(d));
    }
    out = std::move(m);
    break;
  }
  case protocol::tags::OPERATIONS_FOR_BLOCKS: {
    OperationsForBlocksMessage m;
    m.key = ReadKey(d);
    if (d.has_error() || !chain::DeserializeOperationsList(d, m.operations)) {
      return false;
    }
    out = std::move(m);
    break;
  }
  default:
    return false;
  }
  return d.at_end();
}

} // namespace

uint16_t MessageTag(const PeerMessage &msg) {
  static constexpr uint16_t kTags[] = {
      protocol::tags::ADVERTISE,
      protocol::tags::GET_CURRENT_BRANCH,
      protocol::tags::CURRENT_BRANCH,
      protocol::tags::GET_BLOCK_HEADERS,
      protocol::tags::BLOCK_HEADER,
      protocol::tags::GET_OPERATIONS_FOR_BLOCKS,
      protocol::tags::OPERATIONS_FOR_BLOCKS,
  };
  static_assert(std::size(kTags) == std::variant_size_v<PeerMessage>);
  return kTags[msg.index()];
}

const char *TagName(uint16_t tag) {
  switch (tag) {
  case protocol::tags::ADVERTISE:
    return "advertise";
  case protocol::tags::GET_CURRENT_BRANCH:
    return "get_current_branch";
  case protocol::tags::CURRENT_BRANCH:
    return "current_branch";
  case protocol::tags::GET_BLOCK_HEADERS:
    return "get_block_headers";
  case protocol::tags::BLOCK_HEADER:
    return "block_header";
  case protocol::tags::GET_OPERATIONS_FOR_BLOCKS:
    return "get_operations_for_blocks";
  case protocol::tags::OPERATIONS_FOR_BLOCKS:
    return "operations_for_blocks";
  }
  return "unknown";
}

const char *MessageName(const PeerMessage &msg) {
  return TagName(MessageTag(msg));
}

std::vector<uint8_t> EncodeMessage(const PeerMessage &msg) {
  Serializer s;
  s.write_uint16(MessageTag(msg));
  EncodeBody(s, msg);
  return s.release();
}

DecodeStatus DecodeMessage(std::span<const uint8_t> payload, PeerMessage &out) {
  Deserializer d(payload);
  uint16_t tag = d.read_uint16();
  if (d.has_error()) {
    return DecodeStatus::MALFORMED;
  }
  if (std::string_view(TagName(tag)) == "unknown") {
    return DecodeStatus::UNKNOWN_TAG;
  }
  return DecodeBody(tag, d, out) ? DecodeStatus::OK : DecodeStatus::MALFORMED;
}

// ============================================================================
// Framing
// ============================================================================

std::vector<uint8_t> FrameMessage(std::span<const uint8_t> payload) {
  std::vector<uint8_t> frame(protocol::FRAME_HEADER_SIZE + payload.size());
  endian::WriteBE32(frame.data(), static_cast<uint32_t>(payload.size()));
  std::copy(payload.begin(), payload.end(),
            frame.begin() + protocol::FRAME_HEADER_SIZE);
  return frame;
}

void FrameReader::Feed(std::span<const uint8_t> data) {
  if (error_) {
    return;
  }
  // Compact once the consumed prefix dominates the buffer
  if (offset_ > 0 && offset_ >= buffer_.size() / 2) {
    buffer_.erase(buffer_.begin(), buffer_.begin() + offset_);
    offset_ = 0;
  }
  buffer_.insert(buffer_.end(), data.begin(), data.end());
}

bool FrameReader::Next(std::vector<uint8_t> &payload) {
  if (error_ || Buffered() < protocol::FRAME_HEADER_SIZE) {
    return false;
  }
  const uint32_t length = endian::ReadBE32(buffer_.data() + offset_);
  if (length > protocol::MAX_FRAME_SIZE) {
    error_ = true;
    return false;
  }
  if (Buffered() < protocol::FRAME_HEADER_SIZE + length) {
    return false;
  }
  auto start = buffer_.begin() + offset_ + protocol::FRAME_HEADER_SIZE;
  payload.assign(start, start + length);
  offset_ += protocol::FRAME_HEADER_SIZE + length;
  if (offset_ == buffer_.size()) {
    buffer_.clear();
    offset_ = 0;
  }
  return true;
}

} // namespace message
} // namespace stakenode
