// Copyright (c) 2024 StakeNode
// Distributed under the MIT software license

#include "util/files.hpp"
#include "util/logging.hpp"
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <map>
#include <mutex>
#include <random>
#include <sstream>
#include <unistd.h>

namespace stakenode {
namespace util {

namespace {

bool sync_directory(const std::filesystem::path &dir) {
  int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
  if (fd < 0)
    return false;
  bool result = ::fsync(fd) == 0;
  ::close(fd);
  return result;
}

std::string random_suffix() {
  std::random_device rd;
  std::mt19937 gen(rd());
  std::uniform_int_distribution<> dis(0, 0xFFFF);
  char buf[8];
  snprintf(buf, sizeof(buf), "%04x", dis(gen));
  return std::string(buf);
}

// Held directory locks: lock file path -> open descriptor
std::mutex g_dir_locks_mutex;
std::map<std::string, int> g_dir_locks;

} // namespace

bool atomic_write_file(const std::filesystem::path &path,
                       const std::string &data) {
  auto parent = path.parent_path();
  if (!parent.empty() && !ensure_directory(parent)) {
    return false;
  }

  auto temp_path = path;
  temp_path += ".tmp." + random_suffix();

  int fd = ::open(temp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
  if (fd < 0) {
    return false;
  }

  size_t total = 0;
  while (total < data.size()) {
    ssize_t n = ::write(fd, data.data() + total, data.size() - total);
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n <= 0) {
      ::close(fd);
      std::error_code ec;
      std::filesystem::remove(temp_path, ec);
      return false;
    }
    total += static_cast<size_t>(n);
  }

  if (::fsync(fd) != 0) {
    ::close(fd);
    std::error_code ec;
    std::filesystem::remove(temp_path, ec);
    return false;
  }
  ::close(fd);

  std::error_code ec;
  std::filesystem::rename(temp_path, path, ec);
  if (ec) {
    std::error_code ec_remove;
    std::filesystem::remove(temp_path, ec_remove);
    return false;
  }

  if (!parent.empty()) {
    sync_directory(parent);
  }
  return true;
}

bool read_file(const std::filesystem::path &path, std::string &out) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    return false;
  }
  std::ostringstream ss;
  ss << file.rdbuf();
  out = ss.str();
  return true;
}

bool ensure_directory(const std::filesystem::path &dir) {
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  return !ec || std::filesystem::is_directory(dir);
}

std::filesystem::path get_default_datadir() {
  const char *home = std::getenv("HOME");
  if (home) {
    return std::filesystem::path(home) / ".stakenode";
  }
  return std::filesystem::current_path() / ".stakenode";
}

LockResult LockDirectory(const std::filesystem::path &directory,
                         const std::string &lockfile_name) {
  std::lock_guard<std::mutex> lock(g_dir_locks_mutex);

  std::filesystem::path lockfile_path = directory / lockfile_name;
  if (g_dir_locks.count(lockfile_path.string())) {
    return LockResult::Success;
  }

  int fd = ::open(lockfile_path.c_str(), O_RDWR | O_CREAT, 0644);
  if (fd < 0) {
    LOG_ERROR("Failed to create lock file {}: {}", lockfile_path.string(),
              std::strerror(errno));
    return LockResult::ErrorWrite;
  }

  struct flock fl;
  std::memset(&fl, 0, sizeof(fl));
  fl.l_type = F_WRLCK;
  fl.l_whence = SEEK_SET;
  fl.l_start = 0;
  fl.l_len = 0;
  if (::fcntl(fd, F_SETLK, &fl) == -1) {
    LOG_ERROR("Failed to lock directory {}: {}", directory.string(),
              std::strerror(errno));
    ::close(fd);
    return LockResult::ErrorLock;
  }

  g_dir_locks.emplace(lockfile_path.string(), fd);
  return LockResult::Success;
}

void UnlockDirectory(const std::filesystem::path &directory,
                     const std::string &lockfile_name) {
  std::lock_guard<std::mutex> lock(g_dir_locks_mutex);
  auto it = g_dir_locks.find((directory / lockfile_name).string());
  if (it != g_dir_locks.end()) {
    ::close(it->second);
    g_dir_locks.erase(it);
  }
}

} // namespace util
} // namespace stakenode
