// Copyright (c) 2024 StakeNode
// Distributed under the MIT software license

#ifndef STAKENODE_NETWORK_REPLAY_LOG_HPP
#define STAKENODE_NETWORK_REPLAY_LOG_HPP

#include "network/message.hpp"
#include "sync/peer_events.hpp"
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace stakenode {
namespace network {

/**
 * One received frame, as plaintext.
 *
 * kind is "connection", "metadata", "ack" (handshake) or "message"
 * (tagged peer message).
 */
struct ReplayEntry {
  int64_t time{0};
  sync::PeerId peer{0};
  std::string identity;
  std::string kind;
  std::vector<uint8_t> payload;
};

/**
 * Append-only log of inbound peer traffic, one JSON object per line:
 *
 *   {"time":..,"peer":..,"identity":"..","kind":"..","payload":"<hex>"}
 *
 * Recording never affects what the pipeline does with the message; a
 * write failure is logged and the entry dropped.
 */
class ReplayLog {
public:
  ReplayLog() = default;
  ~ReplayLog();

  ReplayLog(const ReplayLog &) = delete;
  ReplayLog &operator=(const ReplayLog &) = delete;

  bool Open(const std::filesystem::path &path);
  void Close();
  bool IsOpen() const;

  void Record(const ReplayEntry &entry);
  size_t RecordedCount() const;

private:
  mutable std::mutex m_mutex;
  std::ofstream m_file;
  std::filesystem::path m_path;
  size_t m_recorded{0};
};

/**
 * Sequential reader for a replay log. Malformed lines stop the reader and
 * set HasError().
 */
class ReplayReader {
public:
  bool Open(const std::filesystem::path &path);

  // Next entry, or nullopt at end of log or on error
  std::optional<ReplayEntry> Next();
  bool HasError() const { return m_error; }

  // Decode a "message" entry back into a PeerMessage
  static message::DecodeStatus Decode(const ReplayEntry &entry,
                                      message::PeerMessage &out);

private:
  std::ifstream m_file;
  bool m_error{false};
  size_t m_line{0};
};

} // namespace network
} // namespace stakenode

#endif // STAKENODE_NETWORK_REPLAY_LOG_HPP
