// Copyright (c) 2024 StakeNode
// Distributed under the MIT software license

#ifndef STAKENODE_VERSION_HPP
#define STAKENODE_VERSION_HPP

#include <string>

namespace stakenode {

// Software version
constexpr int CLIENT_VERSION_MAJOR = 0;
constexpr int CLIENT_VERSION_MINOR = 4;
constexpr int CLIENT_VERSION_PATCH = 0;

// Build version string
inline std::string GetVersionString() {
  return std::to_string(CLIENT_VERSION_MAJOR) + "." +
         std::to_string(CLIENT_VERSION_MINOR) + "." +
         std::to_string(CLIENT_VERSION_PATCH);
}

// Copyright
constexpr const char *COPYRIGHT_YEAR = "2024";
constexpr const char *COPYRIGHT_HOLDERS = "The StakeNode developers";

// Full version info for display
inline std::string GetFullVersionString() {
  return "StakeNode version " + GetVersionString();
}

inline std::string GetCopyrightString() {
  return "Copyright (C) " + std::string(COPYRIGHT_YEAR) + " " +
         std::string(COPYRIGHT_HOLDERS);
}

// ANSI color codes
namespace colors {
constexpr const char *RESET = "\033[0m";
constexpr const char *BLUE = "\033[1;34m";  // Mainnet
constexpr const char *RED = "\033[1;31m";   // Testnet
constexpr const char *GREEN = "\033[1;32m"; // Sandbox
} // namespace colors

// Startup banner with network name
inline std::string GetStartupBanner(const std::string &network) {
  const char *color = colors::RESET;
  if (network == "MAINNET") {
    color = colors::BLUE;
  } else if (network == "TESTNET") {
    color = colors::RED;
  } else if (network == "SANDBOX") {
    color = colors::GREEN;
  }

  const size_t width = 63;
  auto line = [width](const std::string &text) {
    std::string row = "|  " + text;
    if (row.size() < width) {
      row += std::string(width - row.size(), ' ');
    }
    return row + "|\n";
  };

  std::string banner;
  banner += "\n";
  banner += color;
  banner += "+" + std::string(width - 1, '-') + "+\n";
  banner += line("");
  banner += line("S T A K E N O D E");
  banner += line("chain synchronization and block application");
  banner += line("");
  banner += "+" + std::string(width - 1, '-') + "+\n";
  banner += line("Version: " + GetVersionString());
  banner += line("Network: " + network);
  banner += line(GetCopyrightString());
  banner += "+" + std::string(width - 1, '-') + "+";
  banner += colors::RESET;
  banner += "\n\n";
  return banner;
}

} // namespace stakenode

#endif // STAKENODE_VERSION_HPP
