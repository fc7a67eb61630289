// Copyright (c) 2024 StakeNode
// Distributed under the MIT software license

#ifndef STAKENODE_STORAGE_CHAIN_STORAGE_HPP
#define STAKENODE_STORAGE_CHAIN_STORAGE_HPP

#include "chain/block.hpp"
#include "chain/chainparams.hpp"
#include "storage/kv_store.hpp"
#include "util/uint.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace stakenode {
namespace storage {

// Filled once, inside the application batch
struct BlockMetadata {
  bool applied{false};
  int64_t applied_time{0};
  std::vector<std::string> operation_results;
};

struct StoredBlock {
  chain::BlockHeader header;
  BlockMetadata metadata;
};

struct ChainState {
  uint256 head_hash;
  int32_t head_level{0};
  int32_t checkpoint_level{0};

  friend bool operator==(const ChainState &a, const ChainState &b) {
    return a.head_hash == b.head_hash && a.head_level == b.head_level &&
           a.checkpoint_level == b.checkpoint_level;
  }
};

// Everything one successful application persists
struct BlockCommit {
  chain::BlockHeader header;
  std::vector<chain::OperationsList> operations; // one list per pass
  uint256 context_hash;
  BlockMetadata metadata;
  // Keep this many levels of operations below the head; 0 = archive
  int32_t history_window{0};
};

struct CommitOutcome {
  bool head_advanced{false};
  ChainState state;
};

/**
 * ChainStorage - block, operations, chain-state, context-head and level
 * index stores over one KeyValueStore.
 *
 * Key layout (single-byte prefix):
 *   'B' hash          -> header + metadata
 *   'O' hash pass     -> operations list
 *   'S' chain_id      -> chain state
 *   'C' hash          -> context hash
 *   'L' level(BE32)   -> canonical block hash at that level
 *
 * Headers and operations are written once, on receipt. Chain state is only
 * ever changed by CommitApplication(), whose writes form one atomic batch.
 */
class ChainStorage {
public:
  ChainStorage(KeyValueStore &store, chain::ChainId chain_id);

  /**
   * Bootstrap an empty store with the genesis block in one batch, or check
   * that an existing store belongs to this genesis. False on mismatch or
   * write failure.
   */
  bool Initialize(const chain::ChainParams &params);

  chain::ChainId GetChainId() const { return chain_id_; }

  std::optional<ChainState> GetChainState() const;

  // === Block store ===
  bool HasBlock(const uint256 &hash) const;
  std::optional<StoredBlock> GetBlock(const uint256 &hash) const;
  std::optional<chain::BlockHeader> GetHeader(const uint256 &hash) const;
  bool IsApplied(const uint256 &hash) const;

  // Write-once; storing an existing header is a successful no-op
  bool StoreHeader(const chain::BlockHeader &header);

  // === Operations store ===
  bool HasOperations(const uint256 &hash, uint8_t pass) const;
  std::optional<chain::OperationsList> GetOperations(const uint256 &hash,
                                                      uint8_t pass) const;
  bool StoreOperations(const uint256 &hash, uint8_t pass,
                       const chain::OperationsList &ops);

  // === Context heads ===
  std::optional<uint256> GetContext(const uint256 &hash) const;

  // === Level index ===
  std::optional<uint256> GetCanonicalHash(int32_t level) const;
  bool IsCanonical(const uint256 &hash, int32_t level) const;

  /**
   * Sparse ancestor list from the head: head-1, head-2, head-4, ... down
   * to genesis, at most max_entries hashes.
   */
  std::vector<uint256> GetBranchHistory(size_t max_entries) const;

  // Head header plus its sparse history; nullopt before Initialize()
  std::optional<chain::Branch> GetCurrentBranch(size_t max_history) const;

  /**
   * Persist an applied block atomically: metadata, operations, context
   * head, and (when its level is above the current head) the new chain
   * state plus the rewritten level index. Returns nullopt when the batch
   * could not be committed; nothing is visible in that case.
   */
  std::optional<CommitOutcome> CommitApplication(const BlockCommit &commit);

  /**
   * Stored headers that are not applied and sit above the checkpoint.
   * Used to rebuild the pending set after a restart.
   */
  std::vector<chain::BlockHeader> LoadUnappliedHeaders() const;

  /**
   * Delete operations and context heads of canonical blocks below
   * `level`. Never touches the chain state; `level` is clamped to the
   * stored checkpoint. Returns the number of blocks pruned, or -1 on a
   * write failure.
   */
  int PruneBelow(int32_t level);

  static std::string BlockKey(const uint256 &hash);
  static std::string OperationsKey(const uint256 &hash, uint8_t pass);
  static std::string ContextKey(const uint256 &hash);
  static std::string LevelKey(int32_t level);
  std::string ChainStateKey() const;

private:
  static std::string EncodeBlock(const StoredBlock &block);
  static bool DecodeBlock(const std::string &value, StoredBlock &out);

  KeyValueStore &store_;
  chain::ChainId chain_id_;
};

} // namespace storage
} // namespace stakenode

#endif // STAKENODE_STORAGE_CHAIN_STORAGE_HPP
