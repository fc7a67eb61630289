// Copyright (c) 2024 StakeNode
// Distributed under the MIT software license

#include "application.hpp"
#include "node_config.hpp"
#include "util/files.hpp"
#include "util/logging.hpp"
#include "version.hpp"
#include <cstring>
#include <iostream> // Keep for CLI output and early errors before logger initialized

void print_usage(const char *program_name) {
  std::cout
      << "Usage: " << program_name << " [options]\n"
      << "\n"
      << "Every option may also be set as key=value in <datadir>/stakenode.conf;\n"
      << "command-line values win over the file.\n"
      << "\n"
      << "Chain:\n"
      << "  --network=<name>       main, test or sandbox (default: main)\n"
      << "  --testnet, --sandbox   Shorthands for --network\n"
      << "  --datadir=<path>       Data directory (default: ~/.stakenode)\n"
      << "  --conf=<file>          Config file (default: <datadir>/stakenode.conf)\n"
      << "\n"
      << "Network:\n"
      << "  --port=<port>          Listen port (default: chain default)\n"
      << "  --listen / --nolisten  Accept inbound connections (default: on)\n"
      << "  --threads=<n>          Number of IO threads (default: 4)\n"
      << "  --minconnections=<n>   Dial peers while below n (default: 10)\n"
      << "  --maxconnections=<n>   Refuse peers above n (default: 50)\n"
      << "  --maxoutstanding=<n>   Outstanding requests per peer (default: 16)\n"
      << "  --seed=<host:port>     Bootstrap address, repeatable\n"
      << "  --connect=<host:port>  Dial only these addresses, repeatable\n"
      << "  --privatenode          Ask peers not to advertise us\n"
      << "  --disablemempool       Announce that we carry no mempool\n"
      << "\n"
      << "Synchronization:\n"
      << "  --maxmissing=<n>       Missing-block index cap (default: 10000)\n"
      << "  --lookback=<n>         Lookback bound in levels (default: chain)\n"
      << "  --powdifficulty=<n>    Identity proof-of-work bits (default: chain)\n"
      << "  --banthreshold=<n>     Peer score at which to ban (default: -100)\n"
      << "  --banduration=<sec>    Ban cool-down (default: 86400)\n"
      << "  --fetchtimeout=<sec>   Per-request fetch timeout (default: 30)\n"
      << "\n"
      << "Validation:\n"
      << "  --engine=<engine>      sandbox or ipc:<socket path> (default: sandbox)\n"
      << "  --gcinterval=<n>       Engine garbage collection every n blocks (default: 100)\n"
      << "  --enginerestarts=<n>   Restarts per call before fatal (default: 3)\n"
      << "  --enginetimeout=<ms>   External engine call timeout (default: 30000)\n"
      << "  --workers=<n>          Dispatcher worker threads (default: 0 = auto)\n"
      << "  --historywindow=<n>    Levels of applied-block metadata to keep (default: 0 = all)\n"
      << "\n"
      << "Replay:\n"
      << "  --replay               Record received messages\n"
      << "  --replaypath=<file>    Recording file (default: <datadir>/replay.jsonl)\n"
      << "\n"
      << "Logging:\n"
      << "  --loglevel=<level>     Set global log level (trace,debug,info,warn,error,critical)\n"
      << "                         Default: info\n"
      << "  --debug=<component>    Enable trace logging for specific component(s)\n"
      << "                         Components: network, sync, chain, storage, crypto, app, all\n"
      << "                         Can be comma-separated: --debug=network,sync\n"
      << "  --verbose              Equivalent to --loglevel=debug\n"
      << "\n"
      << "Other:\n"
      << "  --version              Show version information\n"
      << "  --help                 Show this help message\n"
      << std::endl;
}

int main(int argc, char *argv[]) {
  try {
    for (int i = 1; i < argc; ++i) {
      if (std::strcmp(argv[i], "--help") == 0) {
        print_usage(argv[0]);
        return 0;
      }
      if (std::strcmp(argv[i], "--version") == 0) {
        std::cout << stakenode::GetFullVersionString() << std::endl;
        std::cout << stakenode::GetCopyrightString() << std::endl;
        return 0;
      }
    }

    std::string error;
    auto config = stakenode::app::LoadNodeConfig(argc, argv, error);
    if (!config) {
      std::cerr << "Error: " << error << std::endl;
      print_usage(argv[0]);
      return 1;
    }

    if (!stakenode::util::ensure_directory(config->datadir)) {
      std::cerr << "Error: cannot create data directory "
                << config->datadir.string() << std::endl;
      return 1;
    }

    // Initialize logging system (enable file logging with debug.log)
    std::string log_file = (config->datadir / "debug.log").string();
    stakenode::util::LogManager::Initialize(config->log_level, true, log_file);

    // Apply component-specific debug levels
    for (const auto &component : config->debug_components) {
      if (component == "all") {
        stakenode::util::LogManager::SetLogLevel("trace");
      } else if (component == "net") {
        stakenode::util::LogManager::SetComponentLevel("network", "trace");
      } else {
        stakenode::util::LogManager::SetComponentLevel(component, "trace");
      }
    }

    stakenode::app::Application app(*config);

    if (!app.initialize()) {
      LOG_ERROR("Failed to initialize application");
      stakenode::util::LogManager::Shutdown();
      return 1;
    }

    if (!app.start()) {
      LOG_ERROR("Failed to start application");
      stakenode::util::LogManager::Shutdown();
      return 1;
    }

    // Run until shutdown requested
    app.wait_for_shutdown();

    int exit_code = 0;
    if (app.failed()) {
      LOG_CRITICAL("Stopped after fatal error: {}", app.failure_reason());
      exit_code = 1;
    }

    stakenode::util::LogManager::Shutdown();
    return exit_code;

  } catch (const std::exception &e) {
    // Use std::cerr here because logger may not be safe during exception
    // handling
    std::cerr << "Fatal exception: " << e.what() << std::endl;
    stakenode::util::LogManager::Shutdown();
    return 1;
  }
}
