// Copyright (c) 2024 StakeNode
// Distributed under the MIT software license

#ifndef STAKENODE_NODE_CONFIG_HPP
#define STAKENODE_NODE_CONFIG_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace stakenode {
namespace app {

// Ordered key/value pairs from one configuration layer
using OptionList = std::vector<std::pair<std::string, std::string>>;

/**
 * Node settings, static for the process lifetime.
 *
 * Assembled in three layers, later layers winning:
 *   1. compiled-in defaults (below, plus chain parameters for zeroed fields)
 *   2. <datadir>/stakenode.conf, or the file named by --conf
 *   3. command-line --key=value options
 *
 * List options (seed, connect, debug) may repeat. A layer that names a list
 * option replaces the values inherited from earlier layers.
 */
struct NodeConfig {
  // Chain
  std::string network{"main"}; // main, test or sandbox
  std::filesystem::path datadir;
  std::filesystem::path conf_file; // empty = <datadir>/stakenode.conf

  // Networking
  uint16_t port{0}; // 0 = chain default port
  bool listen{true};
  size_t io_threads{4};
  size_t min_connections{10};
  size_t max_connections{50};
  size_t max_outstanding{16};
  std::vector<std::string> seeds;
  std::vector<std::string> connect;
  bool private_node{false};
  bool disable_mempool{false};

  // Chain manager
  size_t max_missing{10000};
  int32_t lookback{0};                       // 0 = chain default
  std::optional<unsigned int> pow_difficulty; // unset = chain default
  int ban_threshold{-100};
  int64_t ban_duration{24 * 60 * 60};
  int64_t fetch_timeout_sec{30};

  // Validation
  std::string engine{"sandbox"}; // "sandbox" or "ipc:<socket path>"
  uint32_t gc_interval{100};
  uint32_t engine_restarts{3};
  size_t workers{0};
  int64_t engine_timeout_ms{30000};
  int32_t history_window{0}; // 0 = keep all applied-block metadata

  // Replay recording
  bool replay{false};
  std::filesystem::path replay_path; // empty = <datadir>/replay.jsonl

  // Logging
  std::string log_level{"info"};
  std::vector<std::string> debug_components;

  /**
   * Apply one layer. Unknown keys and malformed values fail with a
   * message in `error`; fields already applied stay applied.
   */
  bool Apply(const OptionList &options, std::string &error);

  // Post-parse consistency checks (bounds ordering, network name)
  bool Validate(std::string &error) const;

  std::filesystem::path ConfigFilePath() const;
  std::filesystem::path ReplayFilePath() const;
};

// "--key=value" -> {key, value}; "--flag" -> {flag, "1"}; "--noflag" ->
// {flag, "0"}. Fails on arguments that do not start with "--".
bool ParseCommandLine(int argc, const char *const argv[], OptionList &out,
                      std::string &error);

// Flat "key=value" lines; '#' starts a comment; blank lines are skipped
bool ParseConfigFile(const std::string &content, OptionList &out,
                     std::string &error);

/**
 * Full assembly: defaults, then the config file (if present), then the
 * command line. The datadir and conf path are taken from the command line
 * first so the file can be located.
 */
std::optional<NodeConfig> LoadNodeConfig(int argc, const char *const argv[],
                                         std::string &error);

} // namespace app
} // namespace stakenode

#endif // STAKENODE_NODE_CONFIG_HPP
