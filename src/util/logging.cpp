// Copyright (c) 2024 StakeNode
// Distributed under the MIT software license

#include "util/logging.hpp"
#include <iostream>
#include <map>
#include <mutex>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace stakenode {
namespace util {

namespace {

std::mutex s_mutex;
bool s_initialized = false;
std::map<std::string, std::shared_ptr<spdlog::logger>> s_loggers;

constexpr const char *LOG_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v";

// Caller must hold s_mutex
void InitializeLocked(const std::string &log_level, bool log_to_file,
                      const std::string &log_file_path) {
  if (s_initialized) {
    return;
  }

  try {
    std::vector<spdlog::sink_ptr> sinks;

    if (log_to_file) {
      // Append mode so restarts keep history
      auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
          log_file_path, true);
      file_sink->set_pattern(LOG_PATTERN);
      sinks.push_back(file_sink);
    } else {
      auto console_sink =
          std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
      console_sink->set_pattern(LOG_PATTERN);
      sinks.push_back(console_sink);
    }

    for (const auto &component : LogManager::Components()) {
      auto logger = std::make_shared<spdlog::logger>(component, sinks.begin(),
                                                     sinks.end());
      logger->set_level(spdlog::level::from_str(log_level));
      logger->flush_on(spdlog::level::debug);
      spdlog::drop(component);
      spdlog::register_logger(logger);
      s_loggers[component] = logger;
    }

    spdlog::set_default_logger(s_loggers["default"]);
    s_initialized = true;

    s_loggers["default"]->info("Logging system initialized (level: {})",
                               log_level);
  } catch (const spdlog::spdlog_ex &ex) {
    std::cerr << "Log initialization failed: " << ex.what() << std::endl;
  }
}

} // namespace

const std::vector<std::string> &LogManager::Components() {
  static const std::vector<std::string> components = {
      "default", "network", "sync", "chain", "storage", "crypto", "app"};
  return components;
}

void LogManager::Initialize(const std::string &log_level, bool log_to_file,
                            const std::string &log_file_path) {
  std::lock_guard<std::mutex> lock(s_mutex);
  InitializeLocked(log_level, log_to_file, log_file_path);
}

void LogManager::Shutdown() {
  std::lock_guard<std::mutex> lock(s_mutex);
  if (!s_initialized) {
    return;
  }

  s_loggers["default"]->info("Shutting down logging system");
  for (auto &[name, logger] : s_loggers) {
    logger->flush();
  }
  spdlog::shutdown();
  s_loggers.clear();
  s_initialized = false;
}

std::shared_ptr<spdlog::logger> LogManager::GetLogger(const std::string &name) {
  std::lock_guard<std::mutex> lock(s_mutex);
  if (!s_initialized) {
    InitializeLocked("info", false, "");
  }

  auto it = s_loggers.find(name);
  if (it != s_loggers.end()) {
    return it->second;
  }
  return s_loggers["default"];
}

void LogManager::SetLogLevel(const std::string &level) {
  std::lock_guard<std::mutex> lock(s_mutex);
  if (!s_initialized) {
    return;
  }

  auto log_level = spdlog::level::from_str(level);
  for (auto &[name, logger] : s_loggers) {
    logger->set_level(log_level);
  }
  s_loggers["default"]->info("Log level changed to: {}", level);
}

void LogManager::SetComponentLevel(const std::string &component,
                                   const std::string &level) {
  std::lock_guard<std::mutex> lock(s_mutex);
  if (!s_initialized) {
    return;
  }

  auto it = s_loggers.find(component);
  if (it != s_loggers.end()) {
    it->second->set_level(spdlog::level::from_str(level));
    s_loggers["default"]->info("Component '{}' log level set to: {}",
                               component, level);
  } else {
    s_loggers["default"]->warn("Unknown log component: {}", component);
  }
}

} // namespace util
} // namespace stakenode
