// Copyright (c) 2024 StakeNode
// Distributed under the MIT software license

#ifndef STAKENODE_CRYPTO_SESSION_HPP
#define STAKENODE_CRYPTO_SESSION_HPP

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace stakenode {
namespace crypto {

static constexpr size_t X25519_KEY_SIZE = 32;
static constexpr size_t SESSION_KEY_SIZE = 32;
static constexpr size_t SESSION_NONCE_SIZE = 12;
static constexpr size_t SESSION_TAG_SIZE = 16;

using PublicKey = std::array<uint8_t, X25519_KEY_SIZE>;
using SecretKey = std::array<uint8_t, X25519_KEY_SIZE>;

struct KeyPair {
  PublicKey public_key{};
  SecretKey secret_key{};

  // Fresh X25519 key pair from the OpenSSL RNG
  static std::optional<KeyPair> Generate();

  // Recompute the public half of a stored secret key
  static std::optional<KeyPair> FromSecret(const SecretKey &secret);
};

// X25519(our secret, their public). Rejects the all-zero (low order) result.
std::optional<std::array<uint8_t, 32>>
DeriveSharedSecret(const SecretKey &secret, const PublicKey &peer_public);

/**
 * One direction of an authenticated session: ChaCha20-Poly1305 with a
 * per-message counter XORed into the nonce base. Each frame carries
 * ciphertext || 16-byte tag. Counters never wrap; the session is closed
 * long before 2^64 frames.
 */
class DirectionalCipher {
public:
  DirectionalCipher() = default;
  DirectionalCipher(const std::array<uint8_t, SESSION_KEY_SIZE> &key,
                    const std::array<uint8_t, SESSION_NONCE_SIZE> &nonce_base)
      : key_(key), nonce_base_(nonce_base) {}

  bool Seal(std::span<const uint8_t> plaintext, std::vector<uint8_t> &out);
  bool Open(std::span<const uint8_t> frame, std::vector<uint8_t> &out);

  uint64_t counter() const { return counter_; }

private:
  std::array<uint8_t, SESSION_NONCE_SIZE> NextNonce();

  std::array<uint8_t, SESSION_KEY_SIZE> key_{};
  std::array<uint8_t, SESSION_NONCE_SIZE> nonce_base_{};
  uint64_t counter_{0};
};

/**
 * Both directions of a peer session.
 *
 * Keys are bound to the handshake transcript: the two plaintext connection
 * messages in initiator-then-responder order. Both ends compute the same
 * pair; the initiator sends with the first and the responder with the second.
 */
class SessionCipher {
public:
  static std::optional<SessionCipher>
  Establish(const SecretKey &local_secret, const PublicKey &remote_public,
            std::span<const uint8_t> sent_connection_msg,
            std::span<const uint8_t> received_connection_msg, bool initiator);

  bool Encrypt(std::span<const uint8_t> plaintext, std::vector<uint8_t> &out) {
    return send_.Seal(plaintext, out);
  }
  bool Decrypt(std::span<const uint8_t> frame, std::vector<uint8_t> &out) {
    return recv_.Open(frame, out);
  }

private:
  DirectionalCipher send_;
  DirectionalCipher recv_;
};

} // namespace crypto
} // namespace stakenode

#endif // STAKENODE_CRYPTO_SESSION_HPP
