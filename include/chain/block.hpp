// Copyright (c) 2024 StakeNode
// Distributed under the MIT software license

#ifndef STAKENODE_CHAIN_BLOCK_HPP
#define STAKENODE_CHAIN_BLOCK_HPP

#include "util/serialize.hpp"
#include "util/uint.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace stakenode {
namespace chain {

// Structural limits enforced by the codec
static constexpr uint8_t MAX_VALIDATION_PASSES = 4;
static constexpr size_t MAX_FITNESS_ELEMENTS = 8;
static constexpr size_t MAX_FITNESS_ELEMENT_SIZE = 64;
static constexpr size_t MAX_SIGNATURE_SIZE = 128;
static constexpr size_t MAX_OPERATION_DATA_SIZE = 32 * 1024;
static constexpr uint32_t MAX_OPERATIONS_PER_PASS = 2048;
static constexpr size_t MAX_BRANCH_HISTORY = 200;

/**
 * Operation: opaque protocol payload anchored to a branch (a recent block
 * hash). The core never interprets `data`.
 */
struct Operation {
  uint256 branch;
  std::vector<uint8_t> data;

  uint256 GetHash() const;

  void Serialize(util::Serializer &s) const;
  static bool Deserialize(util::Deserializer &d, Operation &out);

  friend bool operator==(const Operation &a, const Operation &b) {
    return a.branch == b.branch && a.data == b.data;
  }
};

// Operations of one (block, validation pass)
using OperationsList = std::vector<Operation>;

// SHA256(count || hash(op_0) || ... || hash(op_n-1))
uint256 ComputeOperationsListHash(const OperationsList &ops);

void SerializeOperationsList(util::Serializer &s, const OperationsList &ops);
bool DeserializeOperationsList(util::Deserializer &d, OperationsList &out);

/**
 * BlockHeader
 *
 * Wire layout (all integers big-endian):
 *   level             int32
 *   proto             uint8
 *   predecessor       32 bytes
 *   timestamp         int64 (unix seconds)
 *   validation_passes uint8, followed by that many 32-byte operations hashes
 *   fitness           uint8 count, each element uint32 length + bytes
 *   priority          uint16
 *   signature         uint32 length + bytes
 *
 * Identity is SHA-256 of exactly these bytes. Never mutated after receipt.
 */
class BlockHeader {
public:
  int32_t level{0};
  uint8_t proto{0};
  uint256 predecessor;
  int64_t timestamp{0};
  uint8_t validation_passes{0};
  std::vector<uint256> operations_hashes;
  std::vector<std::vector<uint8_t>> fitness;
  uint16_t priority{0};
  std::vector<uint8_t> signature;

  uint256 GetHash() const;

  std::vector<uint8_t> Serialize() const;
  void Serialize(util::Serializer &s) const;

  // Rejects trailing bytes and any over-limit collection
  bool Deserialize(const uint8_t *data, size_t size);
  static bool Deserialize(util::Deserializer &d, BlockHeader &out);

  /**
   * Context-free structure checks: validation pass count matches the number
   * of operations hashes and is within MAX_VALIDATION_PASSES, level >= 1
   * unless this is a genesis header. `reason` names the failed check.
   */
  bool CheckStructure(std::string &reason, bool allow_genesis = false) const;

  std::string ToString() const;

  friend bool operator==(const BlockHeader &a, const BlockHeader &b) {
    return a.Serialize() == b.Serialize();
  }
};

/**
 * Branch: a peer's claimed head plus a sparse list of ancestor hashes,
 * most recent first (the head itself is not repeated). Used to locate the
 * common ancestor with local history.
 */
struct Branch {
  BlockHeader head;
  std::vector<uint256> history;

  void Serialize(util::Serializer &s) const;
  static bool Deserialize(util::Deserializer &d, Branch &out);

  friend bool operator==(const Branch &a, const Branch &b) {
    return a.head == b.head && a.history == b.history;
  }
};

} // namespace chain
} // namespace stakenode

#endif // STAKENODE_CHAIN_BLOCK_HPP
