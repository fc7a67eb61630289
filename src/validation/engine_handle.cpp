// Copyright (c) 2024 StakeNode
// Distributed under the MIT software license

#include "validation/engine_handle.hpp"
#include "util/logging.hpp"

namespace stakenode {
namespace validation {

EngineHandle::EngineHandle(EngineFactory factory,
                           const EngineHandleConfig &config)
    : factory_(std::move(factory)), config_(config) {}

bool EngineHandle::EnsureEngine() {
  if (engine_) {
    return true;
  }
  try {
    engine_ = factory_();
  } catch (const std::exception &e) {
    LOG_CHAIN_ERROR("Validation engine creation failed: {}", e.what());
    engine_.reset();
  }
  if (engine_) {
    LOG_CHAIN_DEBUG("Validation engine '{}' ready", engine_->Name());
  }
  return engine_ != nullptr;
}

void EngineHandle::Restart() {
  engine_.reset();
  calls_since_gc_ = 0;
  ++restarts_;
}

bool EngineHandle::Apply(const ApplyRequest &request, ApplyResult &result,
                         ValidationState &state) {
  for (uint32_t attempt = 0; attempt <= config_.max_restarts; ++attempt) {
    if (attempt > 0) {
      LOG_CHAIN_WARN("Restarting validation engine (attempt {}/{}) after: {}",
                     attempt, config_.max_restarts, state.ToString());
      Restart();
    }
    state.Reset();

    if (!EnsureEngine()) {
      state.Error("engine-unavailable");
      continue;
    }

    ++calls_;
    ++calls_since_gc_;
    bool ok = engine_->ApplyBlock(request, result, state);
    if (!ok && state.IsError()) {
      continue;
    }

    MaybeCollectGarbage();
    if (!ok && state.IsValid()) {
      // Engine returned false without a reason
      state.Invalid("rejected");
    }
    return ok;
  }

  LOG_CHAIN_ERROR("Validation engine failed after {} restarts: {}",
                  config_.max_restarts, state.ToString());
  if (!state.IsError()) {
    state.Error("engine-unavailable");
  }
  return false;
}

void EngineHandle::MaybeCollectGarbage() {
  if (config_.gc_interval == 0 || calls_since_gc_ < config_.gc_interval) {
    return;
  }
  calls_since_gc_ = 0;
  ValidationState gc_state;
  if (engine_->CollectGarbage(gc_state)) {
    ++gc_runs_;
    LOG_CHAIN_DEBUG("Validation engine garbage collection #{} after {} calls",
                    gc_runs_, calls_);
  } else {
    // The next Apply() starts with a fresh engine
    LOG_CHAIN_WARN("Validation engine garbage collection failed: {}",
                   gc_state.ToString());
    Restart();
  }
}

} // namespace validation
} // namespace stakenode
