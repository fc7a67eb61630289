// Copyright (c) 2024 StakeNode
// Distributed under the MIT software license

#ifndef STAKENODE_UTIL_FILES_HPP
#define STAKENODE_UTIL_FILES_HPP

#include <filesystem>
#include <string>

namespace stakenode {
namespace util {

/**
 * Write a file atomically: temp file in the same directory, fsync, rename,
 * then fsync the directory. Readers see either the old or the new content.
 */
bool atomic_write_file(const std::filesystem::path &path,
                       const std::string &data);

// Read the whole file; false if it cannot be opened
bool read_file(const std::filesystem::path &path, std::string &out);

// Create directory (and parents) if needed
bool ensure_directory(const std::filesystem::path &dir);

// $HOME/.stakenode, or ./.stakenode when HOME is unset
std::filesystem::path get_default_datadir();

enum class LockResult { Success, ErrorWrite, ErrorLock };

/**
 * Take an exclusive fcntl lock on <directory>/<lockfile_name> for the life of
 * the process (or until UnlockDirectory). Prevents two nodes sharing a
 * data directory.
 */
LockResult LockDirectory(const std::filesystem::path &directory,
                         const std::string &lockfile_name);
void UnlockDirectory(const std::filesystem::path &directory,
                     const std::string &lockfile_name);

} // namespace util
} // namespace stakenode

#endif // STAKENODE_UTIL_FILES_HPP
