// Copyright (c) 2024 StakeNode
// Distributed under the MIT software license

#include "crypto/pow.hpp"
#include "crypto/hash.hpp"
#include "util/logging.hpp"

namespace stakenode {
namespace crypto {

unsigned int CountLeadingZeroBits(const uint256 &hash) {
  unsigned int bits = 0;
  for (uint8_t b : hash) {
    if (b == 0) {
      bits += 8;
      continue;
    }
    for (int i = 7; i >= 0; --i) {
      if (b & (1u << i))
        return bits;
      ++bits;
    }
  }
  return bits;
}

uint256 PowHash(std::span<const uint8_t> public_key, const PowStamp &stamp) {
  HashWriter hw;
  hw.Write(public_key);
  hw.Write(std::span<const uint8_t>(stamp.data(), stamp.size()));
  return hw.GetHash();
}

bool CheckProofOfWork(std::span<const uint8_t> public_key,
                      const PowStamp &stamp, unsigned int difficulty) {
  if (difficulty == 0) {
    return true;
  }
  return CountLeadingZeroBits(PowHash(public_key, stamp)) >= difficulty;
}

namespace {

// Big-endian increment of the whole stamp
void IncrementStamp(PowStamp &stamp) {
  for (size_t i = stamp.size(); i-- > 0;) {
    if (++stamp[i] != 0)
      break;
  }
}

} // namespace

std::optional<PowStamp> GenerateProofOfWork(std::span<const uint8_t> public_key,
                                            unsigned int difficulty,
                                            uint64_t max_attempts) {
  PowStamp stamp{};
  if (!GetRandomBytes(stamp)) {
    LOG_CRYPTO_ERROR("RNG failure while seeding proof-of-work stamp");
    return std::nullopt;
  }

  for (uint64_t attempt = 0; max_attempts == 0 || attempt < max_attempts;
       ++attempt) {
    if (CheckProofOfWork(public_key, stamp, difficulty)) {
      LOG_CRYPTO_DEBUG("Found proof-of-work stamp after {} attempts (difficulty={})",
                       attempt + 1, difficulty);
      return stamp;
    }
    IncrementStamp(stamp);
  }
  return std::nullopt;
}

} // namespace crypto
} // namespace stakenode
