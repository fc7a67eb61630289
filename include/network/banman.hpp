// Copyright (c) 2024 StakeNode
// Distributed under the MIT software license

#ifndef STAKENODE_NETWORK_BANMAN_HPP
#define STAKENODE_NETWORK_BANMAN_HPP

#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <string>

namespace stakenode {
namespace network {

// One cool-down, keyed by peer identity (hex hash of its public key)
struct BanEntry {
  static constexpr int CURRENT_VERSION = 1;

  int version{CURRENT_VERSION};
  int64_t create_time{0}; // unix seconds
  int64_t ban_until{0};   // unix seconds; 0 = permanent
  std::string reason;

  bool IsExpired(int64_t now) const { return ban_until > 0 && now >= ban_until; }
};

/**
 * BanMan - identity cool-downs, persisted to <datadir>/banlist.json
 *
 *   { "<identity>": { "version": 1, "create_time": T, "ban_until": T,
 *                     "reason": "..." }, ... }
 *
 * Saves are atomic (temp file, fsync, rename). Expired entries are
 * dropped on load and on save.
 */
class BanMan {
public:
  static constexpr int64_t DEFAULT_BAN_DURATION = 24 * 60 * 60;

  // Empty datadir keeps bans in memory only
  explicit BanMan(std::filesystem::path datadir = {}, bool auto_save = true);
  ~BanMan();

  bool Load();
  bool Save();

  // duration_sec <= 0 bans permanently
  void Ban(const std::string &identity, int64_t duration_sec,
           const std::string &reason = "");
  void Unban(const std::string &identity);
  bool IsBanned(const std::string &identity) const;

  std::map<std::string, BanEntry> GetBanned() const;
  void ClearBanned();
  void SweepBanned();

  std::filesystem::path GetBanlistPath() const;

private:
  bool SaveInternal(); // m_banned_mutex must be held

  std::filesystem::path m_datadir;
  bool m_auto_save;

  mutable std::mutex m_banned_mutex;
  std::map<std::string, BanEntry> m_banned;
};

} // namespace network
} // namespace stakenode

#endif // STAKENODE_NETWORK_BANMAN_HPP
