// Copyright (c) 2024 StakeNode
// Distributed under the MIT software license

#include "crypto/hash.hpp"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <stdexcept>

namespace stakenode {
namespace crypto {

uint256 Sha256(std::span<const uint8_t> data) {
  uint256 out;
  unsigned int out_len = 0;
  if (EVP_Digest(data.data(), data.size(), out.data(), &out_len, EVP_sha256(),
                 nullptr) != 1 ||
      out_len != uint256::size()) {
    throw std::runtime_error("EVP_Digest(sha256) failed");
  }
  return out;
}

void HashWriter::CtxDeleter::operator()(evp_md_ctx_st *ctx) const {
  if (ctx) {
    EVP_MD_CTX_free(ctx);
  }
}

HashWriter::HashWriter() : ctx_(EVP_MD_CTX_new()) {
  if (!ctx_ || EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
    throw std::runtime_error("EVP_DigestInit_ex(sha256) failed");
  }
}

HashWriter::~HashWriter() = default;

HashWriter &HashWriter::Write(std::span<const uint8_t> data) {
  if (finalized_) {
    throw std::logic_error("HashWriter used after GetHash()");
  }
  if (!data.empty() &&
      EVP_DigestUpdate(ctx_.get(), data.data(), data.size()) != 1) {
    throw std::runtime_error("EVP_DigestUpdate failed");
  }
  return *this;
}

HashWriter &HashWriter::Write(std::string_view label) {
  return Write(std::span<const uint8_t>(
      reinterpret_cast<const uint8_t *>(label.data()), label.size()));
}

uint256 HashWriter::GetHash() {
  if (finalized_) {
    throw std::logic_error("HashWriter finalized twice");
  }
  uint256 out;
  unsigned int out_len = 0;
  if (EVP_DigestFinal_ex(ctx_.get(), out.data(), &out_len) != 1 ||
      out_len != uint256::size()) {
    throw std::runtime_error("EVP_DigestFinal_ex failed");
  }
  finalized_ = true;
  return out;
}

bool GetRandomBytes(std::span<uint8_t> out) {
  if (out.empty()) {
    return true;
  }
  return RAND_bytes(out.data(), static_cast<int>(out.size())) == 1;
}

} // namespace crypto
} // namespace stakenode
