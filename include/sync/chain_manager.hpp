// Copyright (c) 2024 StakeNode
// Distributed under the MIT software license

#ifndef STAKENODE_SYNC_CHAIN_MANAGER_HPP
#define STAKENODE_SYNC_CHAIN_MANAGER_HPP

#include "chain/block.hpp"
#include "storage/chain_storage.hpp"
#include "sync/known_invalid.hpp"
#include "sync/missing_block_index.hpp"
#include "sync/peer_channel.hpp"
#include "sync/peer_events.hpp"
#include "validation/validation_dispatcher.hpp"
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace stakenode {
namespace sync {

/**
 * Trust score penalties. Scores start at 0 and only move down through
 * these; reaching the ban threshold closes the session and bans the
 * identity.
 */
namespace MisbehaviorPenalty {
static constexpr int PROTOCOL_VIOLATION = 20;  // malformed or inconsistent data
static constexpr int INVALID_HEADER = 50;      // structurally invalid header
static constexpr int OPERATIONS_MISMATCH = 25; // ops do not match header hash
static constexpr int UNCONNECTABLE_BRANCH = 20; // beyond lookback/checkpoint
static constexpr int INVALID_BLOCK = 100;      // engine rejected the block
} // namespace MisbehaviorPenalty

static constexpr int DEFAULT_BAN_THRESHOLD = -100;

struct ChainManagerConfig {
  size_t max_missing_blocks{10000};
  int32_t max_lookback{4096};
  size_t max_outstanding_per_peer{16};
  std::chrono::milliseconds fetch_timeout{std::chrono::seconds(30)};
  int ban_threshold{DEFAULT_BAN_THRESHOLD};
  std::chrono::seconds invalid_block_ttl{std::chrono::hours(1)};
  size_t branch_history_size{chain::MAX_BRANCH_HISTORY};
};

/**
 * ChainManager - decides what we need next and from whom
 *
 * Consumes peer events, maintains the missing-header and
 * missing-operations indices, scores peers, and hands ready blocks to
 * the validation dispatcher strictly ancestor-before-descendant.
 *
 * THREAD SAFETY:
 * ---------------
 * None. Every method must be called from one logical thread (the chain
 * manager strand in production, the test body in tests). Dispatcher
 * outcomes arrive through OnApplyOutcome(), posted back to that thread.
 */
class ChainManager {
public:
  struct PeerInfo {
    std::string identity;
    std::string address;
    bool inbound{false};
    std::optional<chain::Branch> branch;
    int score{0};
    bool synced{false};
    bool disconnecting{false};
  };

  ChainManager(storage::ChainStorage &storage,
               validation::ValidationDispatcher &dispatcher,
               PeerChannel &channel, const ChainManagerConfig &config);

  /**
   * Load the head snapshot and re-queue stored-but-unapplied headers
   * (restart recovery). Must be called once before the first event.
   */
  bool Start();

  // Routes a session event to its handler
  void HandleEvent(const PeerEvent &event);

  void OnPeerConnected(const PeerConnected &event);
  void OnBranchAdvertised(PeerId peer, const chain::Branch &branch);
  void OnHeaderReceived(PeerId peer, const chain::BlockHeader &header);
  void OnOperationsReceived(PeerId peer, const uint256 &block_hash,
                            uint8_t pass, const chain::OperationsList &ops);
  void OnFetchFailed(PeerId peer, const FetchRequest &request,
                     FetchFailure reason);
  void OnProtocolViolation(PeerId peer, const std::string &reason);
  void OnPeerDisconnected(PeerId peer);

  // Result of a dispatcher job
  void OnApplyOutcome(const validation::ApplyOutcome &outcome);

  // Fetch timeouts, rescheduling of idle entries, invalid-set expiry
  void ProcessTimers(std::chrono::steady_clock::time_point now);

  // === Inspection ===
  const storage::ChainState &Head() const { return head_; }
  bool IsHalted() const { return halted_; }
  std::optional<int> GetPeerScore(PeerId peer) const;
  bool IsPeerSynced(PeerId peer) const;
  size_t PeerCount() const { return peers_.size(); }
  size_t PendingCount() const { return pending_.size(); }
  bool IsPending(const uint256 &hash) const { return pending_.count(hash) > 0; }
  bool IsKnownInvalid(const uint256 &hash) const {
    return known_invalid_.Contains(hash);
  }
  const MissingBlockIndex &MissingHeaders() const { return missing_headers_; }
  const MissingBlockIndex &MissingOperations() const {
    return missing_operations_;
  }

private:
  struct PendingBlock {
    chain::BlockHeader header;
    std::set<PeerId> sources;     // delivered header or operations
    std::set<PeerId> advertisers; // announced a branch containing it
    int32_t lookback_floor{0};
  };

  // Header acceptance shared by solicited deliveries and branch heads
  void AcceptHeader(PeerId peer, const chain::BlockHeader &header,
                    const std::set<PeerId> &advertisers,
                    int32_t lookback_floor);
  void RequestMissingPasses(const uint256 &hash);
  void ConnectPredecessor(PeerId peer, const uint256 &hash);
  // Brings a stored, unapplied header back into the pending set
  void RestoreStored(const uint256 &hash, int32_t lookback_floor,
                     const std::set<PeerId> &advertisers);
  void RequestHeader(const uint256 &hash, int32_t level_hint,
                     int32_t lookback_floor,
                     const std::set<PeerId> &advertisers);

  void PropagateAdvertiser(PeerId peer, const uint256 &head_hash);

  void ScheduleHeader(const uint256 &hash);
  void ScheduleOperations(const uint256 &hash);
  bool PeerHasCapacity(PeerId peer) const;

  void TryEnqueue(const uint256 &hash);
  bool IsReady(const uint256 &hash) const;

  // Level of the predecessor if it is pending or stored
  std::optional<int32_t> PredecessorLevel(const chain::BlockHeader &header) const;
  // Rejects pending children whose level does not follow `hash`
  void CheckChildLevels(const uint256 &hash);
  void RejectMisplaced(const uint256 &hash);

  void OnBlockApplied(const validation::ApplyOutcome &outcome);
  void OnBlockRejected(const validation::ApplyOutcome &outcome);

  void DropPending(const uint256 &hash);
  void DropDescendants(const uint256 &hash, bool mark_invalid);
  void PruneSuperseded();
  void ReconcilePeers();
  bool IsReconciled(const PeerInfo &info) const;
  void UpdateSyncState();

  void Penalize(PeerId peer, int penalty, const std::string &reason);

  storage::ChainStorage &storage_;
  validation::ValidationDispatcher &dispatcher_;
  PeerChannel &channel_;
  ChainManagerConfig config_;

  storage::ChainState head_;
  bool halted_{false};
  bool reported_synced_{false};

  std::map<PeerId, PeerInfo> peers_;
  std::unordered_map<uint256, PendingBlock, Uint256Hasher> pending_;
  // predecessor -> pending children
  std::unordered_map<uint256, std::set<uint256>, Uint256Hasher> children_;
  // handed to the dispatcher, outcome not yet seen
  std::unordered_set<uint256, Uint256Hasher> enqueued_;

  MissingBlockIndex missing_headers_;
  MissingBlockIndex missing_operations_;
  KnownInvalidSet known_invalid_;
};

} // namespace sync
} // namespace stakenode

#endif // STAKENODE_SYNC_CHAIN_MANAGER_HPP
