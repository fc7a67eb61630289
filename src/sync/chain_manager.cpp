// Copyright (c) 2024 StakeNode
// Distributed under the MIT software license

#include "sync/chain_manager.hpp"
#include "notifications.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"
#include <algorithm>
#include <vector>

namespace stakenode {
namespace sync {

namespace {

// Level of the i-th entry of a branch history built with exponential steps
int32_t HistoryLevelHint(int32_t head_level, size_t index) {
  const int shift = static_cast<int>(std::min<size_t>(index, 30));
  const int64_t hint = static_cast<int64_t>(head_level) - (int64_t{1} << shift);
  return hint < 0 ? 0 : static_cast<int32_t>(hint);
}

const char *const MISSING_PRED_CONTEXT = "missing-predecessor-context";

} // namespace

ChainManager::ChainManager(storage::ChainStorage &storage,
                           validation::ValidationDispatcher &dispatcher,
                           PeerChannel &channel,
                           const ChainManagerConfig &config)
    : storage_(storage), dispatcher_(dispatcher), channel_(channel),
      config_(config), missing_headers_(config.max_missing_blocks),
      missing_operations_(config.max_missing_blocks),
      known_invalid_(config.invalid_block_ttl) {}

bool ChainManager::Start() {
  auto state = storage_.GetChainState();
  if (!state) {
    LOG_SYNC_ERROR("Chain manager started on uninitialized storage");
    return false;
  }
  head_ = *state;

  // Headers persisted before a restart but never applied
  auto headers = storage_.LoadUnappliedHeaders();
  for (const auto &header : headers) {
    const uint256 hash = header.GetHash();
    PendingBlock block;
    block.header = header;
    block.lookback_floor = std::max(0, header.level - config_.max_lookback);
    pending_.emplace(hash, std::move(block));
    children_[header.predecessor].insert(hash);
  }

  for (const auto &header : headers) {
    const auto pred_level = PredecessorLevel(header);
    if (pred_level && header.level != *pred_level + 1) {
      RejectMisplaced(header.GetHash());
    }
  }

  for (const auto &header : headers) {
    const uint256 hash = header.GetHash();
    RequestMissingPasses(hash);
    ConnectPredecessor(0, hash);
  }
  for (const auto &header : headers) {
    TryEnqueue(header.GetHash());
  }

  LOG_SYNC_INFO("Chain manager started: head {} at level {}, checkpoint {}, "
                "{} unapplied headers recovered",
                head_.head_hash.ToShortString(), head_.head_level,
                head_.checkpoint_level, headers.size());
  return true;
}

// ============================================================================
// Event routing
// ============================================================================

namespace {

struct EventVisitor {
  ChainManager &manager;

  void operator()(const PeerConnected &e) { manager.OnPeerConnected(e); }
  void operator()(const BranchAdvertised &e) {
    manager.OnBranchAdvertised(e.peer, e.branch);
  }
  void operator()(const HeaderReceived &e) {
    manager.OnHeaderReceived(e.peer, e.header);
  }
  void operator()(const OperationsReceived &e) {
    manager.OnOperationsReceived(e.peer, e.block_hash, e.pass, e.operations);
  }
  void operator()(const FetchFailed &e) {
    manager.OnFetchFailed(e.peer, e.request, e.reason);
  }
  void operator()(const ProtocolViolation &e) {
    manager.OnProtocolViolation(e.peer, e.reason);
  }
  void operator()(const PeerDisconnected &e) {
    manager.OnPeerDisconnected(e.peer);
  }
};

} // namespace

void ChainManager::HandleEvent(const PeerEvent &event) {
  std::visit(EventVisitor{*this}, event);
}

// ============================================================================
// Peer lifecycle
// ============================================================================

void ChainManager::OnPeerConnected(const PeerConnected &event) {
  PeerInfo info;
  info.identity = event.identity;
  info.address = event.address;
  info.inbound = event.inbound;
  peers_[event.peer] = std::move(info);
  LOG_SYNC_DEBUG("Peer {} ({}) registered, {} peers", event.peer,
                 event.address, peers_.size());
  UpdateSyncState();
}

void ChainManager::OnPeerDisconnected(PeerId peer) {
  if (peers_.erase(peer) == 0) {
    return;
  }

  // Outstanding requests go back to the pool for another candidate
  auto headers = missing_headers_.RemovePeer(peer);
  auto operations = missing_operations_.RemovePeer(peer);
  for (auto &block : pending_) {
    block.second.advertisers.erase(peer);
  }
  for (const auto &hash : headers) {
    ScheduleHeader(hash);
  }
  for (const auto &hash : operations) {
    ScheduleOperations(hash);
  }

  LOG_SYNC_DEBUG("Peer {} gone, {} requests released", peer,
                 headers.size() + operations.size());
  UpdateSyncState();
}

void ChainManager::OnProtocolViolation(PeerId peer,
                                       const std::string &reason) {
  Penalize(peer, MisbehaviorPenalty::PROTOCOL_VIOLATION, reason);
}

// ============================================================================
// Branches and headers
// ============================================================================

void ChainManager::OnBranchAdvertised(PeerId peer,
                                      const chain::Branch &branch) {
  auto pit = peers_.find(peer);
  if (pit == peers_.end()) {
    LOG_SYNC_DEBUG("Branch from unknown peer {} ignored", peer);
    return;
  }
  PeerInfo &info = pit->second;
  if (info.branch && *info.branch == branch) {
    return;
  }

  const bool changed = info.branch.has_value();
  const bool was_synced = info.synced;
  info.branch = branch;
  info.synced = false;
  if (changed) {
    missing_headers_.ClearTried(peer);
    missing_operations_.ClearTried(peer);
  }

  const uint256 head_hash = branch.head.GetHash();
  LOG_SYNC_DEBUG("Peer {} advertises {} at level {} ({} history)", peer,
                 head_hash.ToShortString(), branch.head.level,
                 branch.history.size());

  if (IsReconciled(info)) {
    info.synced = was_synced;
    ReconcilePeers();
    UpdateSyncState();
    return;
  }
  if (was_synced) {
    // The session stops branch refreshes until this one is reconciled
    channel_.MarkBootstrapping(peer);
  }
  UpdateSyncState();

  const int32_t floor = std::max(0, branch.head.level - config_.max_lookback);

  if (pending_.count(head_hash)) {
    PropagateAdvertiser(peer, head_hash);
    return;
  }

  AcceptHeader(peer, branch.head, {peer}, floor);
  if (!pending_.count(head_hash)) {
    return;
  }

  // Locate-ancestor walk: ask for unknown history, newest first, until a
  // block we already store
  for (size_t i = 0; i < branch.history.size(); ++i) {
    const uint256 &hash = branch.history[i];
    if (storage_.HasBlock(hash) || pending_.count(hash) ||
        known_invalid_.Contains(hash)) {
      break;
    }
    const int32_t hint = HistoryLevelHint(branch.head.level, i);
    if (hint < floor || hint <= head_.checkpoint_level) {
      break;
    }
    RequestHeader(hash, hint, floor, {peer});
  }
}

void ChainManager::OnHeaderReceived(PeerId peer,
                                    const chain::BlockHeader &header) {
  const uint256 hash = header.GetHash();
  MissingEntry *entry = missing_headers_.Get(hash);
  if (!entry) {
    LOG_SYNC_DEBUG("Unsolicited header {} from peer {} ignored",
                   hash.ToShortString(), peer);
    return;
  }

  std::set<PeerId> advertisers = entry->advertisers;
  advertisers.insert(peer);
  const int32_t floor = entry->lookback_floor;
  missing_headers_.Release(hash, false);

  AcceptHeader(peer, header, advertisers, floor);

  if (missing_headers_.Contains(hash)) {
    ScheduleHeader(hash);
  }
}

void ChainManager::AcceptHeader(PeerId peer, const chain::BlockHeader &header,
                                const std::set<PeerId> &advertisers,
                                int32_t lookback_floor) {
  const uint256 hash = header.GetHash();

  if (known_invalid_.Contains(hash)) {
    missing_headers_.Remove(hash);
    return;
  }

  auto existing = pending_.find(hash);
  if (existing != pending_.end()) {
    existing->second.sources.insert(peer);
    existing->second.advertisers.insert(advertisers.begin(),
                                        advertisers.end());
    missing_headers_.Remove(hash);
    return;
  }

  const bool stored = storage_.HasBlock(hash);
  if (stored && storage_.IsApplied(hash)) {
    missing_headers_.Remove(hash);
    return;
  }

  std::string reason;
  if (!header.CheckStructure(reason)) {
    missing_headers_.Remove(hash);
    known_invalid_.Insert(hash, reason, util::GetSteadyTime());
    Penalize(peer, MisbehaviorPenalty::INVALID_HEADER,
             "invalid header: " + reason);
    return;
  }

  if (header.level <= head_.checkpoint_level) {
    // Not ours (ours is applied), and nothing below the checkpoint may change
    missing_headers_.Remove(hash);
    Penalize(peer, MisbehaviorPenalty::UNCONNECTABLE_BRANCH,
             "header at or below checkpoint");
    return;
  }

  if (known_invalid_.Contains(header.predecessor)) {
    missing_headers_.Remove(hash);
    known_invalid_.Insert(hash, "invalid-ancestor", util::GetSteadyTime());
    return;
  }

  const auto pred_level = PredecessorLevel(header);
  if (pred_level && header.level != *pred_level + 1) {
    missing_headers_.Remove(hash);
    known_invalid_.Insert(hash, "bad-level", util::GetSteadyTime());
    Penalize(peer, MisbehaviorPenalty::INVALID_HEADER,
             "level does not follow predecessor");
    return;
  }

  if (!stored && !storage_.StoreHeader(header)) {
    LOG_SYNC_ERROR("Failed to persist header {}", hash.ToShortString());
    return;
  }

  missing_headers_.Remove(hash);

  PendingBlock block;
  block.header = header;
  block.sources.insert(peer);
  block.advertisers = advertisers;
  block.advertisers.insert(peer);
  block.lookback_floor = lookback_floor;
  pending_.emplace(hash, std::move(block));
  children_[header.predecessor].insert(hash);

  LOG_SYNC_DEBUG("Accepted header {} at level {} from peer {}",
                 hash.ToShortString(), header.level, peer);

  // Children that arrived first were accepted without a level check
  CheckChildLevels(hash);
  RequestMissingPasses(hash);
  ConnectPredecessor(peer, hash);
  TryEnqueue(hash);
}

void ChainManager::ConnectPredecessor(PeerId peer, const uint256 &hash) {
  auto it = pending_.find(hash);
  if (it == pending_.end()) {
    return;
  }
  const chain::BlockHeader &header = it->second.header;
  const uint256 pred = header.predecessor;
  const int32_t pred_level = header.level - 1;

  if (pending_.count(pred) || storage_.IsApplied(pred)) {
    return;
  }

  if (known_invalid_.Contains(pred)) {
    DropDescendants(hash, true);
    return;
  }

  if (pred_level < it->second.lookback_floor ||
      pred_level <= head_.checkpoint_level) {
    LOG_SYNC_INFO("Branch through {} cannot connect within lookback "
                  "(level {}, floor {}, checkpoint {})",
                  hash.ToShortString(), header.level,
                  it->second.lookback_floor, head_.checkpoint_level);
    DropDescendants(hash, false);
    if (peer != 0) {
      Penalize(peer, MisbehaviorPenalty::UNCONNECTABLE_BRANCH,
               "unconnectable branch");
    }
    return;
  }

  const int32_t floor = it->second.lookback_floor;
  const std::set<PeerId> advertisers = it->second.advertisers;
  if (storage_.HasBlock(pred)) {
    // Stored but never applied, e.g. rejected once and since expired
    RestoreStored(pred, floor, advertisers);
    return;
  }
  RequestHeader(pred, pred_level, floor, advertisers);
}

void ChainManager::RestoreStored(const uint256 &hash, int32_t lookback_floor,
                                 const std::set<PeerId> &advertisers) {
  auto header = storage_.GetHeader(hash);
  if (!header) {
    LOG_SYNC_ERROR("Stored header {} could not be read", hash.ToShortString());
    return;
  }

  PendingBlock block;
  block.header = *header;
  block.advertisers = advertisers;
  block.lookback_floor = lookback_floor;
  pending_.emplace(hash, std::move(block));
  children_[header->predecessor].insert(hash);

  LOG_SYNC_DEBUG("Stored header {} at level {} is pending again",
                 hash.ToShortString(), header->level);

  CheckChildLevels(hash);
  RequestMissingPasses(hash);
  ConnectPredecessor(0, hash);
  TryEnqueue(hash);
}

void ChainManager::RequestHeader(const uint256 &hash, int32_t level_hint,
                                 int32_t lookback_floor,
                                 const std::set<PeerId> &advertisers) {
  if (!missing_headers_.Add(hash, level_hint, lookback_floor)) {
    LOG_SYNC_DEBUG("Missing-header index full ({}), {} deferred",
                   missing_headers_.Size(), hash.ToShortString());
    return;
  }
  for (PeerId peer : advertisers) {
    missing_headers_.AddAdvertiser(hash, peer);
  }
  ScheduleHeader(hash);
}

void ChainManager::PropagateAdvertiser(PeerId peer, const uint256 &head_hash) {
  uint256 hash = head_hash;
  size_t steps = 0;
  for (auto it = pending_.find(hash); it != pending_.end() &&
                                      steps <= pending_.size();
       it = pending_.find(hash), ++steps) {
    it->second.advertisers.insert(peer);
    if (missing_operations_.Contains(hash)) {
      missing_operations_.AddAdvertiser(hash, peer);
      ScheduleOperations(hash);
    }
    hash = it->second.header.predecessor;
  }
  if (missing_headers_.Contains(hash)) {
    missing_headers_.AddAdvertiser(hash, peer);
    ScheduleHeader(hash);
  }
}

// ============================================================================
// Operations
// ============================================================================

void ChainManager::RequestMissingPasses(const uint256 &hash) {
  auto it = pending_.find(hash);
  if (it == pending_.end() || missing_operations_.Contains(hash)) {
    return;
  }
  const chain::BlockHeader &header = it->second.header;

  std::set<uint8_t> passes;
  for (uint8_t pass = 0; pass < header.validation_passes; ++pass) {
    if (!storage_.HasOperations(hash, pass)) {
      passes.insert(pass);
    }
  }
  if (passes.empty()) {
    return;
  }

  if (!missing_operations_.Add(hash, header.level,
                               it->second.lookback_floor)) {
    LOG_SYNC_DEBUG("Missing-operations index full ({}), {} deferred",
                   missing_operations_.Size(), hash.ToShortString());
    return;
  }
  MissingEntry *entry = missing_operations_.Get(hash);
  entry->pending_passes = std::move(passes);
  entry->advertisers = it->second.advertisers;
  ScheduleOperations(hash);
}

void ChainManager::OnOperationsReceived(PeerId peer, const uint256 &block_hash,
                                        uint8_t pass,
                                        const chain::OperationsList &ops) {
  MissingEntry *entry = missing_operations_.Get(block_hash);
  if (!entry || !entry->pending_passes.count(pass)) {
    LOG_SYNC_DEBUG("Unsolicited operations {}/{} from peer {} ignored",
                   block_hash.ToShortString(), pass, peer);
    return;
  }
  auto it = pending_.find(block_hash);
  if (it == pending_.end()) {
    missing_operations_.Remove(block_hash);
    return;
  }

  const bool was_in_flight = entry->in_flight && *entry->in_flight == peer &&
                             entry->in_flight_pass == pass;
  const chain::BlockHeader &header = it->second.header;

  if (chain::ComputeOperationsListHash(ops) !=
      header.operations_hashes[pass]) {
    LOG_SYNC_INFO("Operations {}/{} from peer {} do not match the header",
                  block_hash.ToShortString(), pass, peer);
    if (was_in_flight) {
      missing_operations_.Release(block_hash, true);
    } else {
      entry->tried.insert(peer);
    }
    Penalize(peer, MisbehaviorPenalty::OPERATIONS_MISMATCH,
             "operations hash mismatch");
    ScheduleOperations(block_hash);
    return;
  }

  if (!storage_.StoreOperations(block_hash, pass, ops)) {
    LOG_SYNC_ERROR("Failed to persist operations {}/{}",
                   block_hash.ToShortString(), pass);
    if (was_in_flight) {
      missing_operations_.Release(block_hash, false);
    }
    ScheduleOperations(block_hash);
    return;
  }

  it->second.sources.insert(peer);
  entry->pending_passes.erase(pass);
  if (was_in_flight) {
    missing_operations_.Release(block_hash, false);
  }

  if (entry->pending_passes.empty()) {
    missing_operations_.Remove(block_hash);
    TryEnqueue(block_hash);
  } else {
    ScheduleOperations(block_hash);
  }
}

// ============================================================================
// Fetch scheduling
// ============================================================================

bool ChainManager::PeerHasCapacity(PeerId peer) const {
  auto it = peers_.find(peer);
  if (it == peers_.end() || it->second.disconnecting) {
    return false;
  }
  return missing_headers_.InFlightFor(peer) +
             missing_operations_.InFlightFor(peer) <
         config_.max_outstanding_per_peer;
}

void ChainManager::ScheduleHeader(const uint256 &hash) {
  auto peer = missing_headers_.PickCandidate(
      hash, [this](PeerId p) { return PeerHasCapacity(p); });
  if (!peer) {
    return;
  }
  missing_headers_.MarkInFlight(hash, *peer, util::GetSteadyTime());
  channel_.RequestFetch(*peer, FetchRequest{FetchKind::HEADER, hash, 0});
}

void ChainManager::ScheduleOperations(const uint256 &hash) {
  const MissingEntry *entry = missing_operations_.Get(hash);
  if (!entry || entry->pending_passes.empty()) {
    return;
  }
  const uint8_t pass = *entry->pending_passes.begin();
  auto peer = missing_operations_.PickCandidate(
      hash, [this](PeerId p) { return PeerHasCapacity(p); });
  if (!peer) {
    return;
  }
  missing_operations_.MarkInFlight(hash, *peer, util::GetSteadyTime(), pass);
  channel_.RequestFetch(*peer,
                        FetchRequest{FetchKind::OPERATIONS, hash, pass});
}

void ChainManager::OnFetchFailed(PeerId peer, const FetchRequest &request,
                                 FetchFailure reason) {
  const bool header = request.kind == FetchKind::HEADER;
  MissingBlockIndex &index = header ? missing_headers_ : missing_operations_;
  const MissingEntry *entry = index.Get(request.block_hash);
  if (!entry || !entry->in_flight || *entry->in_flight != peer) {
    return;
  }
  if (!header && entry->in_flight_pass != request.pass) {
    return;
  }

  LOG_SYNC_DEBUG("Fetch of {} from peer {} failed: {}",
                 request.block_hash.ToShortString(), peer,
                 FetchFailureName(reason));
  index.Release(request.block_hash, true);
  if (header) {
    ScheduleHeader(request.block_hash);
  } else {
    ScheduleOperations(request.block_hash);
  }
}

void ChainManager::ProcessTimers(std::chrono::steady_clock::time_point now) {
  for (const auto &hash : missing_headers_.TimedOut(now, config_.fetch_timeout)) {
    auto peer = missing_headers_.Release(hash, true);
    LOG_SYNC_DEBUG("Header {} timed out at peer {}", hash.ToShortString(),
                   peer.value_or(0));
  }
  for (const auto &hash :
       missing_operations_.TimedOut(now, config_.fetch_timeout)) {
    auto peer = missing_operations_.Release(hash, true);
    LOG_SYNC_DEBUG("Operations {} timed out at peer {}", hash.ToShortString(),
                   peer.value_or(0));
  }

  for (const auto &hash : missing_headers_.Unassigned()) {
    ScheduleHeader(hash);
  }
  for (const auto &hash : missing_operations_.Unassigned()) {
    ScheduleOperations(hash);
  }

  // Blocks whose operations entry could not be created while the index
  // was full
  std::vector<uint256> waiting;
  for (const auto &[hash, block] : pending_) {
    if (!enqueued_.count(hash) && !missing_operations_.Contains(hash)) {
      waiting.push_back(hash);
    }
  }
  for (const auto &hash : waiting) {
    RequestMissingPasses(hash);
    TryEnqueue(hash);
  }

  // Predecessor requests deferred the same way
  std::vector<uint256> detached;
  for (const auto &[hash, block] : pending_) {
    const uint256 &pred = block.header.predecessor;
    if (!pending_.count(pred) && !missing_headers_.Contains(pred) &&
        !storage_.IsApplied(pred)) {
      detached.push_back(hash);
    }
  }
  for (const auto &hash : detached) {
    ConnectPredecessor(0, hash);
  }

  const size_t expired = known_invalid_.Expire(now);
  if (expired > 0) {
    LOG_SYNC_DEBUG("{} known-invalid entries expired", expired);
  }
}

// ============================================================================
// Hand-off to the dispatcher
// ============================================================================

bool ChainManager::IsReady(const uint256 &hash) const {
  auto it = pending_.find(hash);
  if (it == pending_.end() || missing_operations_.Contains(hash)) {
    return false;
  }
  const chain::BlockHeader &header = it->second.header;
  for (uint8_t pass = 0; pass < header.validation_passes; ++pass) {
    if (!storage_.HasOperations(hash, pass)) {
      return false;
    }
  }
  return enqueued_.count(header.predecessor) > 0 ||
         storage_.IsApplied(header.predecessor);
}

void ChainManager::TryEnqueue(const uint256 &hash) {
  std::vector<uint256> work{hash};
  while (!work.empty() && !halted_) {
    const uint256 current = work.back();
    work.pop_back();
    if (enqueued_.count(current) || !IsReady(current)) {
      continue;
    }

    const PendingBlock &block = pending_.at(current);
    // The commit path assumes consecutive levels
    const auto pred_level = PredecessorLevel(block.header);
    if (!pred_level || block.header.level != *pred_level + 1) {
      RejectMisplaced(current);
      continue;
    }

    validation::ApplyJob job;
    job.header = block.header;
    job.sources = block.sources;
    bool complete = true;
    for (uint8_t pass = 0; pass < block.header.validation_passes; ++pass) {
      auto ops = storage_.GetOperations(current, pass);
      if (!ops) {
        complete = false;
        break;
      }
      job.operations.push_back(std::move(*ops));
    }
    if (!complete) {
      LOG_SYNC_ERROR("Operations of {} vanished from storage",
                     current.ToShortString());
      continue;
    }

    if (!dispatcher_.Enqueue(std::move(job))) {
      if (dispatcher_.IsHalted()) {
        halted_ = true;
      }
      continue;
    }
    enqueued_.insert(current);

    auto cit = children_.find(current);
    if (cit != children_.end()) {
      work.insert(work.end(), cit->second.begin(), cit->second.end());
    }
  }
}

std::optional<int32_t>
ChainManager::PredecessorLevel(const chain::BlockHeader &header) const {
  if (auto pred = pending_.find(header.predecessor); pred != pending_.end()) {
    return pred->second.header.level;
  }
  if (auto pred_header = storage_.GetHeader(header.predecessor)) {
    return pred_header->level;
  }
  return std::nullopt;
}

void ChainManager::CheckChildLevels(const uint256 &hash) {
  auto pit = pending_.find(hash);
  auto cit = children_.find(hash);
  if (pit == pending_.end() || cit == children_.end()) {
    return;
  }
  const int32_t level = pit->second.header.level;
  std::vector<uint256> misplaced;
  for (const auto &child : cit->second) {
    auto it = pending_.find(child);
    if (it != pending_.end() && it->second.header.level != level + 1) {
      misplaced.push_back(child);
    }
  }
  for (const auto &child : misplaced) {
    RejectMisplaced(child);
  }
}

void ChainManager::RejectMisplaced(const uint256 &hash) {
  auto it = pending_.find(hash);
  if (it == pending_.end() || enqueued_.count(hash)) {
    return;
  }
  const std::set<PeerId> sources = it->second.sources;
  LOG_SYNC_INFO("Header {} at level {} does not follow its predecessor",
                hash.ToShortString(), it->second.header.level);

  known_invalid_.Insert(hash, "bad-level", util::GetSteadyTime());
  DropDescendants(hash, true);
  for (PeerId peer : sources) {
    Penalize(peer, MisbehaviorPenalty::INVALID_HEADER,
             "level does not follow predecessor");
  }
}

void ChainManager::OnApplyOutcome(const validation::ApplyOutcome &outcome) {
  switch (outcome.status) {
  case validation::ApplyStatus::APPLIED:
    OnBlockApplied(outcome);
    break;
  case validation::ApplyStatus::REJECTED:
    OnBlockRejected(outcome);
    break;
  case validation::ApplyStatus::FATAL:
    enqueued_.erase(outcome.hash);
    if (!halted_) {
      LOG_SYNC_ERROR("Block application halted: {}", outcome.reason);
    }
    halted_ = true;
    break;
  }
}

void ChainManager::OnBlockApplied(const validation::ApplyOutcome &outcome) {
  enqueued_.erase(outcome.hash);

  std::set<uint256> children;
  if (auto cit = children_.find(outcome.hash); cit != children_.end()) {
    children = cit->second;
  }
  DropPending(outcome.hash);

  if (outcome.commit && outcome.commit->head_advanced) {
    head_ = outcome.commit->state;
    PruneSuperseded();
    if (auto branch = storage_.GetCurrentBranch(config_.branch_history_size)) {
      channel_.BroadcastBranch(*branch);
    }
  }

  for (const auto &child : children) {
    TryEnqueue(child);
  }

  ReconcilePeers();
  UpdateSyncState();
}

void ChainManager::OnBlockRejected(const validation::ApplyOutcome &outcome) {
  enqueued_.erase(outcome.hash);
  known_invalid_.Insert(outcome.hash, outcome.reason, util::GetSteadyTime());

  // A block built on a rejected block says nothing new about its sources
  if (outcome.reason != MISSING_PRED_CONTEXT) {
    for (PeerId peer : outcome.sources) {
      Penalize(peer, MisbehaviorPenalty::INVALID_BLOCK,
               "invalid block: " + outcome.reason);
    }
  }
  DropDescendants(outcome.hash, true);
  ReconcilePeers();
  UpdateSyncState();
}

// ============================================================================
// Bookkeeping
// ============================================================================

void ChainManager::DropPending(const uint256 &hash) {
  auto it = pending_.find(hash);
  if (it != pending_.end()) {
    auto cit = children_.find(it->second.header.predecessor);
    if (cit != children_.end()) {
      cit->second.erase(hash);
      if (cit->second.empty()) {
        children_.erase(cit);
      }
    }
    pending_.erase(it);
  }
  missing_operations_.Remove(hash);
  missing_headers_.Remove(hash);
}

void ChainManager::DropDescendants(const uint256 &hash, bool mark_invalid) {
  std::vector<uint256> work{hash};
  std::vector<uint256> doomed;
  while (!work.empty()) {
    const uint256 current = work.back();
    work.pop_back();
    doomed.push_back(current);
    auto cit = children_.find(current);
    if (cit != children_.end()) {
      work.insert(work.end(), cit->second.begin(), cit->second.end());
    }
  }

  const auto now = util::GetSteadyTime();
  for (const auto &h : doomed) {
    if (mark_invalid && h != hash) {
      known_invalid_.Insert(h, "invalid-ancestor", now);
    }
    DropPending(h);
  }
  if (mark_invalid) {
    known_invalid_.Insert(hash, known_invalid_.Contains(hash)
                                    ? known_invalid_.Reason(hash)
                                    : "invalid-ancestor",
                          now);
  }
}

void ChainManager::PruneSuperseded() {
  for (const auto &hash : missing_headers_.Hashes()) {
    const MissingEntry *entry = missing_headers_.Get(hash);
    if (storage_.HasBlock(hash) ||
        (entry && entry->level_hint <= head_.checkpoint_level)) {
      missing_headers_.Remove(hash);
    }
  }

  std::vector<uint256> stale;
  for (const auto &[hash, block] : pending_) {
    if (block.header.level <= head_.checkpoint_level &&
        !enqueued_.count(hash)) {
      stale.push_back(hash);
    }
  }
  for (const auto &hash : stale) {
    if (pending_.count(hash)) {
      DropDescendants(hash, false);
    }
  }
}

bool ChainManager::IsReconciled(const PeerInfo &info) const {
  if (!info.branch) {
    return false;
  }
  const uint256 head = info.branch->head.GetHash();
  return head == head_.head_hash || known_invalid_.Contains(head) ||
         storage_.IsApplied(head);
}

void ChainManager::ReconcilePeers() {
  for (auto &[peer, info] : peers_) {
    if (!info.synced && IsReconciled(info)) {
      info.synced = true;
      LOG_SYNC_DEBUG("Peer {} reconciled", peer);
      channel_.MarkSynced(peer);
    }
  }
}

void ChainManager::UpdateSyncState() {
  bool synced = !peers_.empty() && pending_.empty();
  for (const auto &[peer, info] : peers_) {
    if (info.branch && !info.synced) {
      synced = false;
      break;
    }
  }
  if (synced != reported_synced_) {
    reported_synced_ = synced;
    LOG_SYNC_INFO("Chain {} (head level {})",
                  synced ? "synchronized" : "synchronizing", head_.head_level);
    Notifications().NotifySyncState(synced);
  }
}

void ChainManager::Penalize(PeerId peer, int penalty,
                            const std::string &reason) {
  auto it = peers_.find(peer);
  if (it == peers_.end()) {
    return;
  }
  PeerInfo &info = it->second;
  info.score -= penalty;
  LOG_SYNC_INFO("Peer {} misbehaving (-{}): {} (score now {})", peer, penalty,
                reason, info.score);

  if (info.score <= config_.ban_threshold && !info.disconnecting) {
    info.disconnecting = true;
    LOG_SYNC_WARN("Banning peer {} ({}): trust score {}", peer, info.identity,
                  info.score);
    channel_.DisconnectPeer(peer, reason, true);
  }
}

std::optional<int> ChainManager::GetPeerScore(PeerId peer) const {
  auto it = peers_.find(peer);
  if (it == peers_.end()) {
    return std::nullopt;
  }
  return it->second.score;
}

bool ChainManager::IsPeerSynced(PeerId peer) const {
  auto it = peers_.find(peer);
  return it != peers_.end() && it->second.synced;
}

} // namespace sync
} // namespace stakenode
