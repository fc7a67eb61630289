// Copyright (c) 2024 StakeNode
// Distributed under the MIT software license

#include "network/banman.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"
#include <fcntl.h>
#include <fstream>
#include <nlohmann/json.hpp>
#include <unistd.h>

using json = nlohmann::json;

namespace stakenode {
namespace network {

BanMan::BanMan(std::filesystem::path datadir, bool auto_save)
    : m_datadir(std::move(datadir)), m_auto_save(auto_save) {
  LOG_NET_TRACE("BanMan initialized (datadir: {}, auto_save: {})",
                m_datadir.empty() ? "<none>" : m_datadir.string(), auto_save);
}

BanMan::~BanMan() {
  if (!m_datadir.empty()) {
    Save();
  }
}

std::filesystem::path BanMan::GetBanlistPath() const {
  if (m_datadir.empty()) {
    return {};
  }
  return m_datadir / "banlist.json";
}

bool BanMan::Load() {
  std::lock_guard<std::mutex> lock(m_banned_mutex);

  const auto path = GetBanlistPath();
  if (path.empty()) {
    return true;
  }

  std::ifstream file(path);
  if (!file.is_open()) {
    LOG_NET_TRACE("BanMan: no existing banlist at {}", path.string());
    return true;
  }

  try {
    json j;
    file >> j;

    const int64_t now = util::GetTime();
    size_t loaded = 0;
    size_t expired = 0;

    for (const auto &[identity, data] : j.items()) {
      BanEntry entry;
      entry.version = data.value("version", BanEntry::CURRENT_VERSION);
      entry.create_time = data.value("create_time", int64_t(0));
      entry.ban_until = data.value("ban_until", int64_t(0));
      entry.reason = data.value("reason", std::string());

      if (entry.IsExpired(now)) {
        ++expired;
        continue;
      }
      m_banned[identity] = std::move(entry);
      ++loaded;
    }

    LOG_NET_DEBUG("BanMan: loaded {} bans from {} (skipped {} expired)",
                  loaded, path.string(), expired);

    if (expired > 0 && m_auto_save) {
      SaveInternal();
    }
    return true;
  } catch (const std::exception &e) {
    LOG_NET_ERROR("BanMan: failed to parse {}: {}", path.string(), e.what());
    return false;
  }
}

bool BanMan::SaveInternal() {
  const auto dest = GetBanlistPath();
  if (dest.empty()) {
    return true;
  }

  const int64_t now = util::GetTime();
  for (auto it = m_banned.begin(); it != m_banned.end();) {
    if (it->second.IsExpired(now)) {
      it = m_banned.erase(it);
    } else {
      ++it;
    }
  }

  try {
    json j = json::object();
    for (const auto &[identity, entry] : m_banned) {
      j[identity] = {{"version", entry.version},
                     {"create_time", entry.create_time},
                     {"ban_until", entry.ban_until},
                     {"reason", entry.reason}};
    }
    const std::string data = j.dump(2);

    std::filesystem::path tmp = dest;
    tmp += ".tmp";

    int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd < 0) {
      LOG_NET_ERROR("BanMan: failed to open {} for writing", tmp.string());
      return false;
    }
    size_t total = 0;
    while (total < data.size()) {
      ssize_t n = ::write(fd, data.data() + total, data.size() - total);
      if (n <= 0) {
        LOG_NET_ERROR("BanMan: write error to {}", tmp.string());
        ::close(fd);
        std::error_code ec_remove;
        std::filesystem::remove(tmp, ec_remove);
        return false;
      }
      total += static_cast<size_t>(n);
    }
    if (::fsync(fd) != 0) {
      LOG_NET_ERROR("BanMan: fsync failed for {}", tmp.string());
      ::close(fd);
      std::error_code ec_remove;
      std::filesystem::remove(tmp, ec_remove);
      return false;
    }
    ::close(fd);

    std::error_code ec;
    std::filesystem::rename(tmp, dest, ec);
    if (ec) {
      LOG_NET_ERROR("BanMan: failed to replace {}: {}", dest.string(),
                    ec.message());
      std::error_code ec_remove;
      std::filesystem::remove(tmp, ec_remove);
      return false;
    }

    LOG_NET_TRACE("BanMan: saved {} bans to {}", m_banned.size(),
                  dest.string());
    return true;
  } catch (const std::exception &e) {
    LOG_NET_ERROR("BanMan: failed to save {}: {}", dest.string(), e.what());
    return false;
  }
}

bool BanMan::Save() {
  std::lock_guard<std::mutex> lock(m_banned_mutex);
  return SaveInternal();
}

void BanMan::Ban(const std::string &identity, int64_t duration_sec,
                 const std::string &reason) {
  std::lock_guard<std::mutex> lock(m_banned_mutex);

  const int64_t now = util::GetTime();
  BanEntry entry;
  entry.create_time = now;
  entry.ban_until = duration_sec > 0 ? now + duration_sec : 0;
  entry.reason = reason;
  m_banned[identity] = entry;

  if (duration_sec > 0) {
    LOG_NET_WARN("BanMan: banned {} for {}s: {}", identity, duration_sec,
                 reason);
  } else {
    LOG_NET_WARN("BanMan: permanently banned {}: {}", identity, reason);
  }
  if (m_auto_save) {
    SaveInternal();
  }
}

void BanMan::Unban(const std::string &identity) {
  std::lock_guard<std::mutex> lock(m_banned_mutex);
  if (m_banned.erase(identity) > 0) {
    LOG_NET_INFO("BanMan: unbanned {}", identity);
    if (m_auto_save) {
      SaveInternal();
    }
  }
}

bool BanMan::IsBanned(const std::string &identity) const {
  std::lock_guard<std::mutex> lock(m_banned_mutex);
  auto it = m_banned.find(identity);
  if (it == m_banned.end()) {
    return false;
  }
  return !it->second.IsExpired(util::GetTime());
}

std::map<std::string, BanEntry> BanMan::GetBanned() const {
  std::lock_guard<std::mutex> lock(m_banned_mutex);
  return m_banned;
}

void BanMan::ClearBanned() {
  std::lock_guard<std::mutex> lock(m_banned_mutex);
  m_banned.clear();
  if (m_auto_save) {
    SaveInternal();
  }
}

void BanMan::SweepBanned() {
  std::lock_guard<std::mutex> lock(m_banned_mutex);
  const int64_t now = util::GetTime();
  size_t before = m_banned.size();
  for (auto it = m_banned.begin(); it != m_banned.end();) {
    if (it->second.IsExpired(now)) {
      it = m_banned.erase(it);
    } else {
      ++it;
    }
  }
  size_t removed = before - m_banned.size();
  if (removed > 0) {
    LOG_NET_TRACE("BanMan: swept {} expired bans", removed);
    if (m_auto_save) {
      SaveInternal();
    }
  }
}

} // namespace network
} // namespace stakenode
