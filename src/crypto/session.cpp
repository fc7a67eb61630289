// Copyright (c) 2024 StakeNode
// Distributed under the MIT software license

#include "crypto/session.hpp"
#include "crypto/hash.hpp"
#include "util/logging.hpp"
#include <algorithm>
#include <memory>
#include <openssl/evp.h>

namespace stakenode {
namespace crypto {

namespace {

struct PkeyDeleter {
  void operator()(EVP_PKEY *p) const { EVP_PKEY_free(p); }
};
struct PkeyCtxDeleter {
  void operator()(EVP_PKEY_CTX *p) const { EVP_PKEY_CTX_free(p); }
};
struct CipherCtxDeleter {
  void operator()(EVP_CIPHER_CTX *p) const { EVP_CIPHER_CTX_free(p); }
};

using PkeyPtr = std::unique_ptr<EVP_PKEY, PkeyDeleter>;
using PkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, PkeyCtxDeleter>;
using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

bool ExtractKeyPair(EVP_PKEY *pkey, KeyPair &out) {
  size_t pub_len = out.public_key.size();
  size_t sec_len = out.secret_key.size();
  if (EVP_PKEY_get_raw_public_key(pkey, out.public_key.data(), &pub_len) != 1 ||
      EVP_PKEY_get_raw_private_key(pkey, out.secret_key.data(), &sec_len) !=
          1) {
    return false;
  }
  return pub_len == X25519_KEY_SIZE && sec_len == X25519_KEY_SIZE;
}

} // namespace

std::optional<KeyPair> KeyPair::Generate() {
  PkeyCtxPtr ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_X25519, nullptr));
  if (!ctx || EVP_PKEY_keygen_init(ctx.get()) != 1) {
    LOG_CRYPTO_ERROR("X25519 keygen init failed");
    return std::nullopt;
  }
  EVP_PKEY *raw = nullptr;
  if (EVP_PKEY_keygen(ctx.get(), &raw) != 1) {
    LOG_CRYPTO_ERROR("X25519 keygen failed");
    return std::nullopt;
  }
  PkeyPtr pkey(raw);
  KeyPair kp;
  if (!ExtractKeyPair(pkey.get(), kp)) {
    return std::nullopt;
  }
  return kp;
}

std::optional<KeyPair> KeyPair::FromSecret(const SecretKey &secret) {
  PkeyPtr pkey(EVP_PKEY_new_raw_private_key(EVP_PKEY_X25519, nullptr,
                                            secret.data(), secret.size()));
  if (!pkey) {
    return std::nullopt;
  }
  KeyPair kp;
  if (!ExtractKeyPair(pkey.get(), kp)) {
    return std::nullopt;
  }
  return kp;
}

std::optional<std::array<uint8_t, 32>>
DeriveSharedSecret(const SecretKey &secret, const PublicKey &peer_public) {
  PkeyPtr local(EVP_PKEY_new_raw_private_key(EVP_PKEY_X25519, nullptr,
                                             secret.data(), secret.size()));
  PkeyPtr remote(EVP_PKEY_new_raw_public_key(
      EVP_PKEY_X25519, nullptr, peer_public.data(), peer_public.size()));
  if (!local || !remote) {
    return std::nullopt;
  }

  PkeyCtxPtr ctx(EVP_PKEY_CTX_new(local.get(), nullptr));
  if (!ctx || EVP_PKEY_derive_init(ctx.get()) != 1 ||
      EVP_PKEY_derive_set_peer(ctx.get(), remote.get()) != 1) {
    return std::nullopt;
  }

  std::array<uint8_t, 32> shared{};
  size_t len = shared.size();
  if (EVP_PKEY_derive(ctx.get(), shared.data(), &len) != 1 ||
      len != shared.size()) {
    return std::nullopt;
  }
  if (std::all_of(shared.begin(), shared.end(),
                  [](uint8_t b) { return b == 0; })) {
    LOG_CRYPTO_WARN("X25519 produced an all-zero shared secret");
    return std::nullopt;
  }
  return shared;
}

std::array<uint8_t, SESSION_NONCE_SIZE> DirectionalCipher::NextNonce() {
  std::array<uint8_t, SESSION_NONCE_SIZE> nonce = nonce_base_;
  uint64_t ctr = counter_++;
  for (int i = 0; i < 8; ++i) {
    nonce[SESSION_NONCE_SIZE - 1 - i] ^= static_cast<uint8_t>(ctr >> (8 * i));
  }
  return nonce;
}

bool DirectionalCipher::Seal(std::span<const uint8_t> plaintext,
                             std::vector<uint8_t> &out) {
  CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
  if (!ctx) {
    return false;
  }
  auto nonce = NextNonce();
  if (EVP_EncryptInit_ex(ctx.get(), EVP_chacha20_poly1305(), nullptr,
                         key_.data(), nonce.data()) != 1) {
    return false;
  }

  out.assign(plaintext.size() + SESSION_TAG_SIZE, 0);
  int len = 0;
  if (!plaintext.empty() &&
      EVP_EncryptUpdate(ctx.get(), out.data(), &len, plaintext.data(),
                        static_cast<int>(plaintext.size())) != 1) {
    return false;
  }
  int final_len = 0;
  if (EVP_EncryptFinal_ex(ctx.get(), out.data() + len, &final_len) != 1) {
    return false;
  }
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_GET_TAG, SESSION_TAG_SIZE,
                          out.data() + plaintext.size()) != 1) {
    return false;
  }
  return true;
}

bool DirectionalCipher::Open(std::span<const uint8_t> frame,
                             std::vector<uint8_t> &out) {
  if (frame.size() < SESSION_TAG_SIZE) {
    return false;
  }
  const size_t body_len = frame.size() - SESSION_TAG_SIZE;

  CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
  if (!ctx) {
    return false;
  }
  auto nonce = NextNonce();
  if (EVP_DecryptInit_ex(ctx.get(), EVP_chacha20_poly1305(), nullptr,
                         key_.data(), nonce.data()) != 1) {
    return false;
  }

  out.assign(body_len, 0);
  int len = 0;
  if (body_len > 0 &&
      EVP_DecryptUpdate(ctx.get(), out.data(), &len, frame.data(),
                        static_cast<int>(body_len)) != 1) {
    return false;
  }
  std::array<uint8_t, SESSION_TAG_SIZE> tag{};
  std::copy(frame.begin() + body_len, frame.end(), tag.begin());
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_TAG, SESSION_TAG_SIZE,
                          tag.data()) != 1) {
    return false;
  }
  int final_len = 0;
  if (EVP_DecryptFinal_ex(ctx.get(), out.data() + len, &final_len) != 1) {
    out.clear();
    return false;
  }
  return true;
}

std::optional<SessionCipher>
SessionCipher::Establish(const SecretKey &local_secret,
                         const PublicKey &remote_public,
                         std::span<const uint8_t> sent_connection_msg,
                         std::span<const uint8_t> received_connection_msg,
                         bool initiator) {
  auto shared = DeriveSharedSecret(local_secret, remote_public);
  if (!shared) {
    return std::nullopt;
  }

  auto init_msg = initiator ? sent_connection_msg : received_connection_msg;
  auto resp_msg = initiator ? received_connection_msg : sent_connection_msg;

  uint256 transcript;
  {
    HashWriter hw;
    hw.Write(init_msg).Write(resp_msg);
    transcript = hw.GetHash();
  }

  auto derive = [&](std::string_view label, DirectionalCipher &out) {
    HashWriter key_hw;
    key_hw.Write(std::span<const uint8_t>(shared->data(), shared->size()))
        .Write(transcript)
        .Write(label);
    uint256 key_hash = key_hw.GetHash();

    HashWriter nonce_hw;
    nonce_hw.Write(transcript).Write(label).Write("nonce");
    uint256 nonce_hash = nonce_hw.GetHash();

    std::array<uint8_t, SESSION_KEY_SIZE> key{};
    std::array<uint8_t, SESSION_NONCE_SIZE> nonce{};
    std::copy(key_hash.begin(), key_hash.end(), key.begin());
    std::copy(nonce_hash.begin(), nonce_hash.begin() + SESSION_NONCE_SIZE,
              nonce.begin());
    out = DirectionalCipher(key, nonce);
  };

  DirectionalCipher initiator_dir;
  DirectionalCipher responder_dir;
  derive("stakenode/initiator", initiator_dir);
  derive("stakenode/responder", responder_dir);

  SessionCipher session;
  session.send_ = initiator ? initiator_dir : responder_dir;
  session.recv_ = initiator ? responder_dir : initiator_dir;
  return session;
}

} // namespace crypto
} // namespace stakenode
