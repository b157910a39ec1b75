// Copyright (c) 2024 Chaincraft
// Distributed under the MIT software license

#ifndef CHAINCRAFT_UTIL_FS_LOCK_HPP
#define CHAINCRAFT_UTIL_FS_LOCK_HPP

#include <filesystem>
#include <string>

namespace chaincraft {
namespace util {

// Exclusive advisory lock (fcntl F_SETLK) on one file. Released when the
// object is destroyed.
class FileLock {
public:
  explicit FileLock(const std::filesystem::path &file);
  ~FileLock();

  FileLock(const FileLock &) = delete;
  FileLock &operator=(const FileLock &) = delete;

  bool TryLock();
  const std::string &GetReason() const { return reason_; }

private:
  int fd_{-1};
  std::string reason_;
};

enum class LockResult { Success, ErrorWrite, ErrorLock };

// Keeps one daemon per datadir. Locking a directory this process already
// holds succeeds.
LockResult LockDirectory(const std::filesystem::path &directory,
                         const std::string &lockfile_name,
                         bool probe_only = false);
void UnlockDirectory(const std::filesystem::path &directory,
                     const std::string &lockfile_name);
void ReleaseAllDirectoryLocks();

} // namespace util
} // namespace chaincraft

#endif // CHAINCRAFT_UTIL_FS_LOCK_HPP
