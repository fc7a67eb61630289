// Copyright (c) 2024 StakeNode
// Distributed under the MIT software license

#include "validation/validation_dispatcher.hpp"
#include "notifications.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"

namespace stakenode {
namespace validation {

ValidationDispatcher::ValidationDispatcher(storage::ChainStorage &storage,
                                           EngineHandle &engine,
                                           const DispatcherConfig &config,
                                           ResultHandler handler)
    : storage_(storage), engine_(engine), config_(config),
      handler_(std::move(handler)), pool_(config.worker_threads) {}

ValidationDispatcher::~ValidationDispatcher() { Shutdown(); }

bool ValidationDispatcher::Enqueue(ApplyJob job) {
  const uint256 hash = job.header.GetHash();
  bool start_drain = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (halted_ || shutdown_) {
      LOG_CHAIN_DEBUG("Dispatcher not accepting block {}",
                      hash.ToShortString());
      return false;
    }
    if (!queued_.insert(hash).second) {
      return false;
    }
    queue_.push_back(std::move(job));
    if (!draining_) {
      draining_ = true;
      start_drain = true;
    }
  }

  if (start_drain) {
    try {
      pool_.enqueue([this]() { Drain(); });
    } catch (const std::exception &e) {
      LOG_CHAIN_ERROR("Failed to schedule dispatcher drain: {}", e.what());
      std::lock_guard<std::mutex> lock(mutex_);
      draining_ = false;
      queued_.erase(hash);
      queue_.pop_back();
      idle_cv_.notify_all();
      return false;
    }
  }
  return true;
}

bool ValidationDispatcher::IsQueued(const uint256 &hash) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queued_.count(hash) > 0;
}

void ValidationDispatcher::WaitForIdle() {
  std::unique_lock<std::mutex> lock(mutex_);
  idle_cv_.wait(lock, [this] { return !draining_; });
}

bool ValidationDispatcher::IsHalted() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return halted_;
}

size_t ValidationDispatcher::QueueDepth() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

uint64_t ValidationDispatcher::applied_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return applied_;
}

uint64_t ValidationDispatcher::rejected_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return rejected_;
}

void ValidationDispatcher::Shutdown() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutdown_) {
      return;
    }
    shutdown_ = true;
    if (!queue_.empty()) {
      LOG_CHAIN_INFO("Dispatcher shutting down with {} queued blocks",
                     queue_.size());
    }
    // Jobs not yet started are dropped; their data stays in storage
    queue_.clear();
    queued_.clear();
  }
  WaitForIdle();
}

void ValidationDispatcher::Drain() {
  for (;;) {
    ApplyJob job;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (queue_.empty() || halted_ || shutdown_) {
        draining_ = false;
        queue_.clear();
        queued_.clear();
        idle_cv_.notify_all();
        return;
      }
      job = std::move(queue_.front());
      queue_.pop_front();
    }

    ApplyOutcome outcome;
    try {
      outcome = Process(job);
    } catch (const std::exception &e) {
      outcome.hash = job.header.GetHash();
      outcome.level = job.header.level;
      outcome.status = ApplyStatus::FATAL;
      outcome.reason = std::string("exception: ") + e.what();
      outcome.sources = job.sources;
    }

    {
      std::lock_guard<std::mutex> lock(mutex_);
      queued_.erase(outcome.hash);
      switch (outcome.status) {
      case ApplyStatus::APPLIED:
        ++applied_;
        break;
      case ApplyStatus::REJECTED:
        ++rejected_;
        break;
      case ApplyStatus::FATAL:
        halted_ = true;
        break;
      }
    }

    switch (outcome.status) {
    case ApplyStatus::APPLIED:
      if (outcome.commit && outcome.commit->head_advanced) {
        Notifications().NotifyHeadAdvanced(outcome.commit->state.head_hash,
                                           outcome.commit->state.head_level);
      }
      break;
    case ApplyStatus::REJECTED:
      Notifications().NotifyBlockRejected(outcome.hash, outcome.reason);
      break;
    case ApplyStatus::FATAL:
      LOG_CHAIN_CRITICAL("Block application halted at {} (level {}): {}",
                         outcome.hash.ToShortString(), outcome.level,
                         outcome.reason);
      Notifications().NotifyFatalError(outcome.reason);
      break;
    }

    if (handler_) {
      handler_(outcome);
    }
  }
}

ApplyOutcome ValidationDispatcher::Process(const ApplyJob &job) {
  ApplyOutcome outcome;
  outcome.hash = job.header.GetHash();
  outcome.level = job.header.level;
  outcome.sources = job.sources;

  if (storage_.IsApplied(outcome.hash)) {
    // Already committed (e.g. enqueued twice across a restart)
    outcome.status = ApplyStatus::APPLIED;
    outcome.commit = storage::CommitOutcome{false, {}};
    if (auto state = storage_.GetChainState()) {
      outcome.commit->state = *state;
    }
    return outcome;
  }

  auto pred_context = storage_.GetContext(job.header.predecessor);
  if (!pred_context) {
    outcome.status = ApplyStatus::REJECTED;
    outcome.reason = "missing-predecessor-context";
    LOG_CHAIN_DEBUG("Rejecting {}: predecessor {} has no context",
                    outcome.hash.ToShortString(),
                    job.header.predecessor.ToShortString());
    return outcome;
  }

  ApplyRequest request;
  request.chain_id = storage_.GetChainId();
  request.header = job.header;
  request.operations = job.operations;
  request.predecessor_context = *pred_context;

  ApplyResult result;
  ValidationState state;
  if (!engine_.Apply(request, result, state)) {
    if (state.IsInvalid()) {
      outcome.status = ApplyStatus::REJECTED;
      outcome.reason = state.GetRejectReason();
      LOG_CHAIN_INFO("Block {} at level {} rejected: {}",
                     outcome.hash.ToShortString(), outcome.level,
                     state.ToString());
    } else {
      outcome.status = ApplyStatus::FATAL;
      outcome.reason = "engine-call-failure: " + state.ToString();
    }
    return outcome;
  }

  storage::BlockCommit commit;
  commit.header = job.header;
  commit.operations = job.operations;
  commit.context_hash = result.context_hash;
  commit.metadata.applied = true;
  commit.metadata.applied_time = util::GetTime();
  commit.metadata.operation_results = std::move(result.operation_results);
  commit.history_window = config_.history_window;

  auto committed = storage_.CommitApplication(commit);
  if (!committed) {
    outcome.status = ApplyStatus::FATAL;
    outcome.reason = "storage-commit-failure";
    return outcome;
  }

  // Operations and contexts below the checkpoint are no longer needed
  if (config_.history_window > 0 && committed->head_advanced &&
      storage_.PruneBelow(committed->state.checkpoint_level) < 0) {
    LOG_CHAIN_WARN("Pruning below level {} failed; old data kept",
                   committed->state.checkpoint_level);
  }

  outcome.status = ApplyStatus::APPLIED;
  outcome.commit = *committed;
  LOG_CHAIN_DEBUG("Applied {} at level {}{}", outcome.hash.ToShortString(),
                  outcome.level,
                  committed->head_advanced ? " (new head)" : "");
  return outcome;
}

} // namespace validation
} // namespace stakenode
