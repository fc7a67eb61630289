// Copyright (c) 2024 StakeNode
// Distributed under the MIT software license

#ifndef STAKENODE_VALIDATION_ENGINE_HANDLE_HPP
#define STAKENODE_VALIDATION_ENGINE_HANDLE_HPP

#include "validation/validation_engine.hpp"
#include <cstdint>
#include <functional>
#include <memory>

namespace stakenode {
namespace validation {

using EngineFactory = std::function<std::unique_ptr<ValidationEngine>()>;

struct EngineHandleConfig {
  // Issue CollectGarbage() after every N calls on one engine (0 = never)
  uint32_t gc_interval{100};
  // Restart-and-retry attempts per call before the failure is final
  uint32_t max_restarts{3};
};

/**
 * EngineHandle - owns the external engine across calls
 *
 * - Creates the engine lazily through the factory.
 * - Counts every call that reaches an engine, failed attempts included,
 *   and triggers reclamation every gc_interval calls. A restart starts
 *   the count again for the fresh engine.
 * - On a call failure (state.IsError()) drops the engine, creates a fresh
 *   one and retries, up to max_restarts times. Exhausting the retries
 *   leaves `state` in the ERROR state; the caller treats that as fatal.
 *
 * Not thread-safe: the dispatcher makes one call at a time.
 */
class EngineHandle {
public:
  EngineHandle(EngineFactory factory, const EngineHandleConfig &config);

  bool Apply(const ApplyRequest &request, ApplyResult &result,
             ValidationState &state);

  uint64_t call_count() const { return calls_; }
  uint64_t gc_count() const { return gc_runs_; }
  uint32_t restart_count() const { return restarts_; }
  bool has_engine() const { return engine_ != nullptr; }

private:
  bool EnsureEngine();
  void Restart();
  void MaybeCollectGarbage();

  EngineFactory factory_;
  EngineHandleConfig config_;
  std::unique_ptr<ValidationEngine> engine_;

  uint64_t calls_{0};
  uint64_t calls_since_gc_{0};
  uint64_t gc_runs_{0};
  uint32_t restarts_{0};
};

} // namespace validation
} // namespace stakenode

#endif // STAKENODE_VALIDATION_ENGINE_HANDLE_HPP
