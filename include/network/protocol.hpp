// Copyright (c) 2024 StakeNode
// Distributed under the MIT software license

#ifndef STAKENODE_NETWORK_PROTOCOL_HPP
#define STAKENODE_NETWORK_PROTOCOL_HPP

#include <cstddef>
#include <cstdint>

namespace stakenode {
namespace protocol {

// Frames: 4-byte big-endian length, then the payload (encrypted after the
// connection message exchange)
constexpr size_t FRAME_HEADER_SIZE = 4;
constexpr size_t MAX_FRAME_SIZE = 2 * 1024 * 1024;

// Message tags (uint16, first two bytes of a decrypted payload)
namespace tags {
constexpr uint16_t ADVERTISE = 0x03;
constexpr uint16_t GET_CURRENT_BRANCH = 0x10;
constexpr uint16_t CURRENT_BRANCH = 0x11;
constexpr uint16_t GET_BLOCK_HEADERS = 0x20;
constexpr uint16_t BLOCK_HEADER = 0x21;
constexpr uint16_t GET_OPERATIONS_FOR_BLOCKS = 0x60;
constexpr uint16_t OPERATIONS_FOR_BLOCKS = 0x61;
} // namespace tags

// ============================================================================
// Collection limits
// ============================================================================

constexpr size_t MAX_SUPPORTED_VERSIONS = 8;
constexpr size_t MAX_CHAIN_NAME_LENGTH = 128;
constexpr size_t MAX_ADDRESS_LENGTH = 64;
constexpr uint32_t MAX_ADVERTISE_ADDRESSES = 100;
constexpr uint32_t MAX_NACK_ADDRESSES = 100;
constexpr uint32_t MAX_GET_BLOCK_HEADERS = 10;
constexpr uint32_t MAX_GET_OPERATIONS = 10;

// ============================================================================
// Timeouts and intervals (seconds)
// ============================================================================

constexpr int HANDSHAKE_TIMEOUT_SEC = 30;
constexpr int INACTIVITY_TIMEOUT_SEC = 20 * 60;
constexpr int DEFAULT_REQUEST_TIMEOUT_SEC = 30;
// Synced sessions ask for the current branch this often
constexpr int BRANCH_REFRESH_INTERVAL_SEC = 120;

// ============================================================================
// Per-peer limits
// ============================================================================

constexpr size_t DEFAULT_MAX_OUTSTANDING_REQUESTS = 16;
// Token bucket: sustained rate and burst, in messages
constexpr double DEFAULT_MESSAGE_RATE = 200.0;
constexpr double DEFAULT_MESSAGE_BURST = 400.0;
// Unread bytes allowed to accumulate before the peer is dropped
constexpr size_t DEFAULT_RECV_FLOOD_SIZE = 2 * MAX_FRAME_SIZE + 1024;
// Bytes queued for sending before the peer is considered stuck
constexpr size_t DEFAULT_SEND_QUEUE_LIMIT = 16 * 1024 * 1024;

// ============================================================================
// Connection management defaults
// ============================================================================

constexpr size_t DEFAULT_MIN_CONNECTIONS = 10;
constexpr size_t DEFAULT_MAX_CONNECTIONS = 50;
constexpr size_t DEFAULT_MAX_MISSING_BLOCKS = 10000;

} // namespace protocol
} // namespace stakenode

#endif // STAKENODE_NETWORK_PROTOCOL_HPP
