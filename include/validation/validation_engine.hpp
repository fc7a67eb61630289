// Copyright (c) 2024 StakeNode
// Distributed under the MIT software license

#ifndef STAKENODE_VALIDATION_VALIDATION_ENGINE_HPP
#define STAKENODE_VALIDATION_VALIDATION_ENGINE_HPP

#include "chain/block.hpp"
#include "chain/chainparams.hpp"
#include "util/uint.hpp"
#include "validation/validation.hpp"
#include <string>
#include <vector>

namespace stakenode {
namespace validation {

struct ApplyRequest {
  chain::ChainId chain_id{0};
  chain::BlockHeader header;
  std::vector<chain::OperationsList> operations; // one list per pass
  uint256 predecessor_context;
};

struct ApplyResult {
  uint256 context_hash;
  // One status string per operation, pass by pass
  std::vector<std::string> operation_results;
};

/**
 * ValidationEngine - boundary to the protocol-specific validator
 *
 * ApplyBlock() returns true and fills `result` on success. On failure it
 * returns false with `state`:
 *   state.IsInvalid() - the engine rejected the block
 *   state.IsError()   - the call itself failed (engine unreachable, crashed,
 *                       garbled reply); the caller may restart and retry
 *
 * Calls may be long-running and are never made concurrently on one engine.
 */
class ValidationEngine {
public:
  virtual ~ValidationEngine() = default;

  virtual bool ApplyBlock(const ApplyRequest &request, ApplyResult &result,
                          ValidationState &state) = 0;

  // Ask the engine to release memory held across calls
  virtual bool CollectGarbage(ValidationState &state) = 0;

  virtual std::string Name() const = 0;
};

} // namespace validation
} // namespace stakenode

#endif // STAKENODE_VALIDATION_VALIDATION_ENGINE_HPP
