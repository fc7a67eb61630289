// Copyright (c) 2024 StakeNode
// Distributed under the MIT software license

#include "crypto/identity.hpp"
#include "crypto/hash.hpp"
#include "util/files.hpp"
#include "util/logging.hpp"
#include "util/strencodings.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace stakenode {
namespace crypto {

std::string PeerIdFromPublicKey(const PublicKey &public_key) {
  return Sha256(public_key).GetHex();
}

std::optional<NodeIdentity> NodeIdentity::Generate(unsigned int difficulty) {
  auto keys = KeyPair::Generate();
  if (!keys) {
    return std::nullopt;
  }
  auto stamp = GenerateProofOfWork(keys->public_key, difficulty);
  if (!stamp) {
    return std::nullopt;
  }
  NodeIdentity id;
  id.keys = *keys;
  id.stamp = *stamp;
  return id;
}

namespace {

template <size_t N>
bool ParseFixedHex(const json &j, const char *field, std::array<uint8_t, N> &out) {
  if (!j.contains(field) || !j[field].is_string()) {
    return false;
  }
  auto bytes = util::ParseHex(j[field].get<std::string>());
  if (!bytes || bytes->size() != N) {
    return false;
  }
  std::copy(bytes->begin(), bytes->end(), out.begin());
  return true;
}

} // namespace

std::optional<NodeIdentity>
NodeIdentity::Load(const std::filesystem::path &path, unsigned int difficulty) {
  std::string content;
  if (!util::read_file(path, content)) {
    LOG_CRYPTO_DEBUG("No identity file at {}", path.string());
    return std::nullopt;
  }

  try {
    json root = json::parse(content);

    SecretKey secret{};
    PublicKey declared_public{};
    PowStamp stamp{};
    if (!ParseFixedHex(root, "secret_key", secret) ||
        !ParseFixedHex(root, "public_key", declared_public) ||
        !ParseFixedHex(root, "proof_of_work_stamp", stamp)) {
      LOG_CRYPTO_ERROR("Identity file {} is missing a field", path.string());
      return std::nullopt;
    }

    auto keys = KeyPair::FromSecret(secret);
    if (!keys || keys->public_key != declared_public) {
      LOG_CRYPTO_ERROR("Identity file {}: public key does not match secret key",
                       path.string());
      return std::nullopt;
    }
    if (!CheckProofOfWork(keys->public_key, stamp, difficulty)) {
      LOG_CRYPTO_ERROR("Identity file {}: stamp does not meet difficulty {}",
                       path.string(), difficulty);
      return std::nullopt;
    }

    NodeIdentity id;
    id.keys = *keys;
    id.stamp = stamp;
    return id;
  } catch (const json::exception &e) {
    LOG_CRYPTO_ERROR("Failed to parse identity file {}: {}", path.string(),
                     e.what());
    return std::nullopt;
  }
}

bool NodeIdentity::Save(const std::filesystem::path &path) const {
  json root;
  root["public_key"] = util::HexStr(keys.public_key);
  root["secret_key"] = util::HexStr(keys.secret_key);
  root["proof_of_work_stamp"] = util::HexStr(stamp);
  if (!util::atomic_write_file(path, root.dump(2))) {
    LOG_CRYPTO_ERROR("Failed to write identity file {}", path.string());
    return false;
  }
  return true;
}

} // namespace crypto
} // namespace stakenode
