// Copyright (c) 2024 StakeNode
// Distributed under the MIT software license

#ifndef STAKENODE_VALIDATION_VALIDATION_DISPATCHER_HPP
#define STAKENODE_VALIDATION_VALIDATION_DISPATCHER_HPP

#include "chain/block.hpp"
#include "storage/chain_storage.hpp"
#include "util/threadpool.hpp"
#include "validation/engine_handle.hpp"
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_set>

namespace stakenode {
namespace validation {

// A block whose header and every operations pass are present
struct ApplyJob {
  chain::BlockHeader header;
  std::vector<chain::OperationsList> operations;
  // Peers that delivered the header or operations
  std::set<uint64_t> sources;
};

enum class ApplyStatus {
  APPLIED,  // committed
  REJECTED, // engine said invalid; nothing persisted
  FATAL     // engine exhausted its restarts or the commit failed
};

struct ApplyOutcome {
  uint256 hash;
  int32_t level{0};
  ApplyStatus status{ApplyStatus::APPLIED};
  std::optional<storage::CommitOutcome> commit;
  std::string reason;
  std::set<uint64_t> sources;
};

struct DispatcherConfig {
  // 0 = one worker per core
  size_t worker_threads{0};
  // Levels kept below the head; older operations and contexts are pruned.
  // 0 keeps everything.
  int32_t history_window{0};
};

/**
 * ValidationDispatcher - single writer of the chain head
 *
 * Jobs are applied strictly in FIFO order, one at a time, on a worker
 * pool separate from the network loop. The caller is responsible for
 * enqueuing ancestors before descendants.
 *
 * After a FATAL outcome the dispatcher is halted: queued jobs are
 * dropped and Enqueue() refuses new work.
 *
 * The result handler runs on a worker thread; production code posts it
 * back to the chain manager strand.
 */
class ValidationDispatcher {
public:
  using ResultHandler = std::function<void(const ApplyOutcome &)>;

  ValidationDispatcher(storage::ChainStorage &storage, EngineHandle &engine,
                       const DispatcherConfig &config, ResultHandler handler);
  ~ValidationDispatcher();

  ValidationDispatcher(const ValidationDispatcher &) = delete;
  ValidationDispatcher &operator=(const ValidationDispatcher &) = delete;

  // False when halted, shut down, or the block is already queued
  bool Enqueue(ApplyJob job);

  bool IsQueued(const uint256 &hash) const;

  // Block until the queue is empty and no job is running
  void WaitForIdle();

  bool IsHalted() const;
  size_t QueueDepth() const;

  // Stop accepting work and wait for the running job
  void Shutdown();

  uint64_t applied_count() const;
  uint64_t rejected_count() const;

private:
  void Drain();
  ApplyOutcome Process(const ApplyJob &job);

  storage::ChainStorage &storage_;
  EngineHandle &engine_;
  DispatcherConfig config_;
  ResultHandler handler_;

  mutable std::mutex mutex_;
  std::condition_variable idle_cv_;
  std::deque<ApplyJob> queue_;
  std::unordered_set<uint256, Uint256Hasher> queued_;
  bool draining_{false};
  bool halted_{false};
  bool shutdown_{false};
  uint64_t applied_{0};
  uint64_t rejected_{0};

  // Declared last so workers are joined before the state above dies
  util::ThreadPool pool_;
};

} // namespace validation
} // namespace stakenode

#endif // STAKENODE_VALIDATION_VALIDATION_DISPATCHER_HPP
