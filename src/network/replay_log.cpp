// Copyright (c) 2024 StakeNode
// Distributed under the MIT software license

#include "network/replay_log.hpp"
#include "util/files.hpp"
#include "util/logging.hpp"
#include "util/strencodings.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace stakenode {
namespace network {

ReplayLog::~ReplayLog() { Close(); }

bool ReplayLog::Open(const std::filesystem::path &path) {
  std::lock_guard<std::mutex> lock(m_mutex);
  if (m_file.is_open()) {
    m_file.close();
  }
  if (path.has_parent_path() && !util::ensure_directory(path.parent_path())) {
    LOG_NET_ERROR("cannot create directory for replay log {}", path.string());
    return false;
  }
  m_file.open(path, std::ios::out | std::ios::app);
  if (!m_file.is_open()) {
    LOG_NET_ERROR("cannot open replay log {}", path.string());
    return false;
  }
  m_path = path;
  LOG_NET_INFO("recording peer traffic to {}", path.string());
  return true;
}

void ReplayLog::Close() {
  std::lock_guard<std::mutex> lock(m_mutex);
  if (m_file.is_open()) {
    m_file.flush();
    m_file.close();
  }
}

bool ReplayLog::IsOpen() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_file.is_open();
}

void ReplayLog::Record(const ReplayEntry &entry) {
  json j;
  j["time"] = entry.time;
  j["peer"] = entry.peer;
  j["identity"] = entry.identity;
  j["kind"] = entry.kind;
  j["payload"] = util::HexStr(entry.payload);
  const std::string line = j.dump();

  std::lock_guard<std::mutex> lock(m_mutex);
  if (!m_file.is_open()) {
    return;
  }
  m_file << line << '\n';
  m_file.flush();
  if (!m_file) {
    LOG_NET_ERROR("write to replay log {} failed", m_path.string());
    m_file.clear();
    return;
  }
  ++m_recorded;
}

size_t ReplayLog::RecordedCount() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_recorded;
}

// ============================================================================
// ReplayReader
// ============================================================================

bool ReplayReader::Open(const std::filesystem::path &path) {
  m_file.open(path);
  m_error = false;
  m_line = 0;
  return m_file.is_open();
}

std::optional<ReplayEntry> ReplayReader::Next() {
  if (m_error || !m_file.is_open()) {
    return std::nullopt;
  }

  std::string line;
  while (std::getline(m_file, line)) {
    ++m_line;
    if (util::TrimString(line).empty()) {
      continue;
    }

    try {
      json j = json::parse(line);
      ReplayEntry entry;
      entry.time = j.at("time").get<int64_t>();
      entry.peer = j.at("peer").get<sync::PeerId>();
      entry.identity = j.at("identity").get<std::string>();
      entry.kind = j.at("kind").get<std::string>();
      auto payload = util::ParseHex(j.at("payload").get<std::string>());
      if (!payload) {
        LOG_NET_ERROR("replay log line {}: bad payload hex", m_line);
        m_error = true;
        return std::nullopt;
      }
      entry.payload = std::move(*payload);
      return entry;
    } catch (const json::exception &e) {
      LOG_NET_ERROR("replay log line {}: {}", m_line, e.what());
      m_error = true;
      return std::nullopt;
    }
  }
  return std::nullopt;
}

message::DecodeStatus ReplayReader::Decode(const ReplayEntry &entry,
                                           message::PeerMessage &out) {
  if (entry.kind != "message") {
    return message::DecodeStatus::UNKNOWN_TAG;
  }
  return message::DecodeMessage(entry.payload, out);
}

} // namespace network
} // namespace stakenode
