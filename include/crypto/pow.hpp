// Copyright (c) 2024 StakeNode
// Distributed under the MIT software license

#ifndef STAKENODE_CRYPTO_POW_HPP
#define STAKENODE_CRYPTO_POW_HPP

#include "util/uint.hpp"
#include <array>
#include <cstdint>
#include <optional>
#include <span>

namespace stakenode {
namespace crypto {

/**
 * Identity proof-of-work stamp
 *
 * A peer proves it spent work creating its identity by publishing a stamp
 * such that SHA256(public_key || stamp) has at least `difficulty` leading
 * zero bits. Checked once during the handshake before any key agreement.
 */
static constexpr size_t POW_STAMP_SIZE = 24;
using PowStamp = std::array<uint8_t, POW_STAMP_SIZE>;

// Number of leading zero bits in a hash
unsigned int CountLeadingZeroBits(const uint256 &hash);

uint256 PowHash(std::span<const uint8_t> public_key, const PowStamp &stamp);

bool CheckProofOfWork(std::span<const uint8_t> public_key,
                      const PowStamp &stamp, unsigned int difficulty);

/**
 * Search for a stamp meeting `difficulty`. Starts from a random stamp and
 * counts upward. Returns nullopt after max_attempts (0 = unbounded) or on
 * RNG failure.
 */
std::optional<PowStamp> GenerateProofOfWork(std::span<const uint8_t> public_key,
                                            unsigned int difficulty,
                                            uint64_t max_attempts = 0);

} // namespace crypto
} // namespace stakenode

#endif // STAKENODE_CRYPTO_POW_HPP
