// Copyright (c) 2024 StakeNode
// Distributed under the MIT software license

#ifndef STAKENODE_SYNC_PEER_EVENTS_HPP
#define STAKENODE_SYNC_PEER_EVENTS_HPP

#include "chain/block.hpp"
#include "util/uint.hpp"
#include <cstdint>
#include <string>
#include <variant>

namespace stakenode {
namespace sync {

// Connection-scoped handle; never reused within a process
using PeerId = uint64_t;

enum class FetchKind : uint8_t { HEADER, OPERATIONS };

struct FetchRequest {
  FetchKind kind{FetchKind::HEADER};
  uint256 block_hash;
  uint8_t pass{0}; // OPERATIONS only

  friend bool operator==(const FetchRequest &a, const FetchRequest &b) {
    return a.kind == b.kind && a.block_hash == b.block_hash &&
           a.pass == b.pass;
  }
};

enum class FetchFailure : uint8_t {
  TIMEOUT,
  PEER_DISCONNECTED,
  OVER_CAP // session refused: outstanding-request cap reached
};

// === Events posted by peer sessions to the chain manager ===

struct PeerConnected {
  PeerId peer{0};
  std::string identity; // hex peer id derived from the public key
  std::string address;
  bool inbound{false};
};

struct BranchAdvertised {
  PeerId peer{0};
  chain::Branch branch;
};

struct HeaderReceived {
  PeerId peer{0};
  chain::BlockHeader header;
};

struct OperationsReceived {
  PeerId peer{0};
  uint256 block_hash;
  uint8_t pass{0};
  chain::OperationsList operations;
};

struct FetchFailed {
  PeerId peer{0};
  FetchRequest request;
  FetchFailure reason{FetchFailure::TIMEOUT};
};

struct ProtocolViolation {
  PeerId peer{0};
  std::string reason;
};

struct PeerDisconnected {
  PeerId peer{0};
};

using PeerEvent =
    std::variant<PeerConnected, BranchAdvertised, HeaderReceived,
                 OperationsReceived, FetchFailed, ProtocolViolation,
                 PeerDisconnected>;

inline const char *FetchFailureName(FetchFailure reason) {
  switch (reason) {
  case FetchFailure::TIMEOUT:
    return "timeout";
  case FetchFailure::PEER_DISCONNECTED:
    return "peer-disconnected";
  case FetchFailure::OVER_CAP:
    return "over-cap";
  }
  return "unknown";
}

} // namespace sync
} // namespace stakenode

#endif // STAKENODE_SYNC_PEER_EVENTS_HPP
