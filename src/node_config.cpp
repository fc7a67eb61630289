// Copyright (c) 2024 StakeNode
// Distributed under the MIT software license

#include "node_config.hpp"
#include "util/files.hpp"
#include "util/strencodings.hpp"
#include <algorithm>
#include <limits>

namespace stakenode {
namespace app {

namespace {

bool ParseBool(const std::string &value, bool &out) {
  if (value == "1" || value == "true" || value == "yes") {
    out = true;
    return true;
  }
  if (value == "0" || value == "false" || value == "no") {
    out = false;
    return true;
  }
  return false;
}

template <typename T>
bool ParseUnsigned(const std::string &value, T &out) {
  auto parsed = util::ParseUInt64(value);
  if (!parsed || *parsed > std::numeric_limits<T>::max()) {
    return false;
  }
  out = static_cast<T>(*parsed);
  return true;
}

template <typename T> bool ParseSigned(const std::string &value, T &out) {
  auto parsed = util::ParseInt64(value);
  if (!parsed || *parsed < std::numeric_limits<T>::min() ||
      *parsed > std::numeric_limits<T>::max()) {
    return false;
  }
  out = static_cast<T>(*parsed);
  return true;
}

void SplitCommaList(const std::string &value, std::vector<std::string> &out) {
  size_t pos = 0;
  while (pos <= value.size()) {
    size_t comma = value.find(',', pos);
    if (comma == std::string::npos) {
      comma = value.size();
    }
    std::string item = util::TrimString(value.substr(pos, comma - pos));
    if (!item.empty()) {
      out.push_back(item);
    }
    pos = comma + 1;
  }
}

bool IsListKey(const std::string &key) {
  return key == "seed" || key == "connect" || key == "debug";
}

} // namespace

bool NodeConfig::Apply(const OptionList &options, std::string &error) {
  // List options named by this layer replace inherited values
  std::vector<std::string> cleared;

  for (const auto &[key, value] : options) {
    if (IsListKey(key) &&
        std::find(cleared.begin(), cleared.end(), key) == cleared.end()) {
      cleared.push_back(key);
      if (key == "seed") {
        seeds.clear();
      } else if (key == "connect") {
        connect.clear();
      } else {
        debug_components.clear();
      }
    }

    bool ok = true;
    if (key == "network") {
      network = value;
    } else if (key == "testnet") {
      bool flag = false;
      ok = ParseBool(value, flag);
      if (ok && flag) {
        network = "test";
      }
    } else if (key == "sandbox") {
      bool flag = false;
      ok = ParseBool(value, flag);
      if (ok && flag) {
        network = "sandbox";
      }
    } else if (key == "datadir") {
      ok = !value.empty();
      datadir = value;
    } else if (key == "conf") {
      ok = !value.empty();
      conf_file = value;
    } else if (key == "port") {
      ok = ParseUnsigned(value, port);
    } else if (key == "listen") {
      ok = ParseBool(value, listen);
    } else if (key == "threads") {
      ok = ParseUnsigned(value, io_threads) && io_threads > 0;
    } else if (key == "minconnections") {
      ok = ParseUnsigned(value, min_connections);
    } else if (key == "maxconnections") {
      ok = ParseUnsigned(value, max_connections);
    } else if (key == "maxoutstanding") {
      ok = ParseUnsigned(value, max_outstanding) && max_outstanding > 0;
    } else if (key == "seed") {
      SplitCommaList(value, seeds);
    } else if (key == "connect") {
      SplitCommaList(value, connect);
    } else if (key == "privatenode") {
      ok = ParseBool(value, private_node);
    } else if (key == "disablemempool") {
      ok = ParseBool(value, disable_mempool);
    } else if (key == "maxmissing") {
      ok = ParseUnsigned(value, max_missing) && max_missing > 0;
    } else if (key == "lookback") {
      ok = ParseSigned(value, lookback) && lookback >= 0;
    } else if (key == "powdifficulty") {
      unsigned int difficulty = 0;
      ok = ParseUnsigned(value, difficulty) && difficulty <= 256;
      if (ok) {
        pow_difficulty = difficulty;
      }
    } else if (key == "banthreshold") {
      ok = ParseSigned(value, ban_threshold) && ban_threshold < 0;
    } else if (key == "banduration") {
      ok = ParseSigned(value, ban_duration) && ban_duration > 0;
    } else if (key == "fetchtimeout") {
      ok = ParseSigned(value, fetch_timeout_sec) && fetch_timeout_sec > 0;
    } else if (key == "engine") {
      engine = value;
    } else if (key == "gcinterval") {
      ok = ParseUnsigned(value, gc_interval);
    } else if (key == "enginerestarts") {
      ok = ParseUnsigned(value, engine_restarts);
    } else if (key == "enginetimeout") {
      ok = ParseSigned(value, engine_timeout_ms) && engine_timeout_ms > 0;
    } else if (key == "workers") {
      ok = ParseUnsigned(value, workers);
    } else if (key == "historywindow") {
      ok = ParseSigned(value, history_window) && history_window >= 0;
    } else if (key == "replay") {
      ok = ParseBool(value, replay);
    } else if (key == "replaypath") {
      ok = !value.empty();
      replay_path = value;
      replay = ok;
    } else if (key == "loglevel") {
      log_level = value;
    } else if (key == "verbose") {
      bool flag = false;
      ok = ParseBool(value, flag);
      if (ok && flag) {
        log_level = "debug";
      }
    } else if (key == "debug") {
      SplitCommaList(value, debug_components);
    } else {
      error = "unknown option '" + key + "'";
      return false;
    }

    if (!ok) {
      error = "invalid value '" + value + "' for option '" + key + "'";
      return false;
    }
  }
  return true;
}

bool NodeConfig::Validate(std::string &error) const {
  if (network != "main" && network != "test" && network != "sandbox") {
    error = "unknown network '" + network + "' (expected main, test or sandbox)";
    return false;
  }
  if (max_connections == 0 || min_connections > max_connections) {
    error = "minconnections must not exceed maxconnections, and "
            "maxconnections must be positive";
    return false;
  }
  if (engine != "sandbox" &&
      (engine.rfind("ipc:", 0) != 0 || engine.size() <= 4)) {
    error = "engine must be 'sandbox' or 'ipc:<socket path>'";
    return false;
  }
  return true;
}

std::filesystem::path NodeConfig::ConfigFilePath() const {
  if (!conf_file.empty()) {
    return conf_file;
  }
  return datadir / "stakenode.conf";
}

std::filesystem::path NodeConfig::ReplayFilePath() const {
  if (!replay_path.empty()) {
    return replay_path;
  }
  return datadir / "replay.jsonl";
}

bool ParseCommandLine(int argc, const char *const argv[], OptionList &out,
                      std::string &error) {
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg.size() < 3 || arg.compare(0, 2, "--") != 0) {
      error = "unexpected argument '" + arg + "'";
      return false;
    }
    arg = arg.substr(2);

    size_t eq = arg.find('=');
    if (eq != std::string::npos) {
      out.emplace_back(arg.substr(0, eq), arg.substr(eq + 1));
    } else if (arg.size() > 2 && arg.compare(0, 2, "no") == 0) {
      out.emplace_back(arg.substr(2), "0");
    } else {
      out.emplace_back(arg, "1");
    }
  }
  return true;
}

bool ParseConfigFile(const std::string &content, OptionList &out,
                     std::string &error) {
  size_t line_number = 0;
  size_t pos = 0;
  while (pos < content.size()) {
    size_t end = content.find('\n', pos);
    if (end == std::string::npos) {
      end = content.size();
    }
    std::string line = content.substr(pos, end - pos);
    pos = end + 1;
    ++line_number;

    size_t hash = line.find('#');
    if (hash != std::string::npos) {
      line.erase(hash);
    }
    line = util::TrimString(line);
    if (line.empty()) {
      continue;
    }

    size_t eq = line.find('=');
    if (eq == std::string::npos) {
      out.emplace_back(line, "1");
      continue;
    }
    std::string key = util::TrimString(line.substr(0, eq));
    if (key.empty()) {
      error = "line " + std::to_string(line_number) + ": missing key";
      return false;
    }
    out.emplace_back(key, util::TrimString(line.substr(eq + 1)));
  }
  return true;
}

std::optional<NodeConfig> LoadNodeConfig(int argc, const char *const argv[],
                                         std::string &error) {
  OptionList cli;
  if (!ParseCommandLine(argc, argv, cli, error)) {
    return std::nullopt;
  }

  NodeConfig config;
  config.datadir = util::get_default_datadir();

  // Locate the config file before applying it
  NodeConfig locator = config;
  for (const auto &[key, value] : cli) {
    if (key == "datadir" || key == "conf") {
      if (!locator.Apply({{key, value}}, error)) {
        return std::nullopt;
      }
    }
  }

  const std::filesystem::path conf_path = locator.ConfigFilePath();
  std::string content;
  if (util::read_file(conf_path, content)) {
    OptionList file_options;
    if (!ParseConfigFile(content, file_options, error)) {
      error = conf_path.string() + ": " + error;
      return std::nullopt;
    }
    if (!config.Apply(file_options, error)) {
      error = conf_path.string() + ": " + error;
      return std::nullopt;
    }
  } else if (!locator.conf_file.empty()) {
    error = "cannot read config file " + conf_path.string();
    return std::nullopt;
  }

  if (!config.Apply(cli, error)) {
    return std::nullopt;
  }
  if (!config.Validate(error)) {
    return std::nullopt;
  }
  return config;
}

} // namespace app
} // namespace stakenode
