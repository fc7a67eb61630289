// Copyright (c) 2024 StakeNode
// Distributed under the MIT software license

#ifndef STAKENODE_CRYPTO_HASH_HPP
#define STAKENODE_CRYPTO_HASH_HPP

#include "util/uint.hpp"
#include <cstdint>
#include <memory>
#include <span>
#include <string_view>
#include <vector>

struct evp_md_ctx_st;

namespace stakenode {
namespace crypto {

// SHA-256 of a byte range (OpenSSL EVP)
uint256 Sha256(std::span<const uint8_t> data);

/**
 * Incremental SHA-256.
 *
 *   HashWriter hw;
 *   hw.Write(a).Write(b);
 *   uint256 h = hw.GetHash();
 *
 * GetHash() finalizes; the writer must not be reused afterwards.
 */
class HashWriter {
public:
  HashWriter();
  ~HashWriter();

  HashWriter(const HashWriter &) = delete;
  HashWriter &operator=(const HashWriter &) = delete;

  HashWriter &Write(std::span<const uint8_t> data);
  HashWriter &Write(std::string_view label);
  HashWriter &Write(const uint256 &hash) {
    return Write(std::span<const uint8_t>(hash.begin(), hash.end()));
  }

  uint256 GetHash();

private:
  struct CtxDeleter {
    void operator()(evp_md_ctx_st *ctx) const;
  };
  std::unique_ptr<evp_md_ctx_st, CtxDeleter> ctx_;
  bool finalized_{false};
};

// Fill buffer from the OpenSSL CSPRNG; false on RNG failure
bool GetRandomBytes(std::span<uint8_t> out);

} // namespace crypto
} // namespace stakenode

#endif // STAKENODE_CRYPTO_HASH_HPP
