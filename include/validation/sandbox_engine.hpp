// Copyright (c) 2024 StakeNode
// Distributed under the MIT software license

#ifndef STAKENODE_VALIDATION_SANDBOX_ENGINE_HPP
#define STAKENODE_VALIDATION_SANDBOX_ENGINE_HPP

#include "validation/validation_engine.hpp"
#include <atomic>

namespace stakenode {
namespace validation {

/**
 * In-process deterministic engine for sandbox networks and tests.
 *
 * Rules:
 *   - one operations list per validation pass, each matching the header's
 *     declared list hash
 *   - every operation carries a non-empty payload
 * The resulting context is SHA256(predecessor_context || block_hash).
 */
class SandboxEngine : public ValidationEngine {
public:
  bool ApplyBlock(const ApplyRequest &request, ApplyResult &result,
                  ValidationState &state) override;
  bool CollectGarbage(ValidationState &state) override;
  std::string Name() const override { return "sandbox"; }

  static uint256 ComputeContext(const uint256 &predecessor_context,
                                const uint256 &block_hash);

  uint64_t gc_requests() const { return gc_requests_.load(); }

private:
  std::atomic<uint64_t> gc_requests_{0};
};

} // namespace validation
} // namespace stakenode

#endif // STAKENODE_VALIDATION_SANDBOX_ENGINE_HPP
