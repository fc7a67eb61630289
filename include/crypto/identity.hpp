// Copyright (c) 2024 StakeNode
// Distributed under the MIT software license

#ifndef STAKENODE_CRYPTO_IDENTITY_HPP
#define STAKENODE_CRYPTO_IDENTITY_HPP

#include "crypto/pow.hpp"
#include "crypto/session.hpp"
#include <filesystem>
#include <optional>
#include <string>

namespace stakenode {
namespace crypto {

// Hex SHA-256 of an X25519 public key; the stable name of a peer
std::string PeerIdFromPublicKey(const PublicKey &public_key);

/**
 * Node identity: X25519 key pair plus the proof-of-work stamp over its
 * public key.
 *
 * identity.json layout:
 *   { "public_key": "<hex>", "secret_key": "<hex>", "proof_of_work_stamp": "<hex>" }
 */
struct NodeIdentity {
  KeyPair keys;
  PowStamp stamp{};

  std::string PeerId() const { return PeerIdFromPublicKey(keys.public_key); }

  // Fresh keys and a stamp meeting `difficulty`
  static std::optional<NodeIdentity> Generate(unsigned int difficulty);

  /**
   * Load and check an identity file. Fails if the file is malformed, the
   * public key does not match the secret key, or the stamp does not meet
   * `difficulty`.
   */
  static std::optional<NodeIdentity> Load(const std::filesystem::path &path,
                                          unsigned int difficulty);

  // Atomic write of identity.json
  bool Save(const std::filesystem::path &path) const;
};

} // namespace crypto
} // namespace stakenode

#endif // STAKENODE_CRYPTO_IDENTITY_HPP
