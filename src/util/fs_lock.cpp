// Copyright (c) 2024 Chaincraft
// Distributed under the MIT software license

#include "util/fs_lock.hpp"
#include "util/logging.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <map>
#include <memory>
#include <mutex>
#include <unistd.h>

namespace chaincraft {
namespace util {

namespace {
std::mutex g_dir_locks_mutex;
// Lock file path -> held lock
std::map<std::string, std::unique_ptr<FileLock>> g_dir_locks;
} // namespace

FileLock::FileLock(const std::filesystem::path &file) {
  fd_ = ::open(file.c_str(), O_RDWR | O_CREAT, 0644);
  if (fd_ == -1) {
    reason_ = std::strerror(errno);
  }
}

FileLock::~FileLock() {
  if (fd_ != -1) {
    ::close(fd_);
  }
}

bool FileLock::TryLock() {
  if (fd_ == -1) {
    return false;
  }

  struct flock lock;
  std::memset(&lock, 0, sizeof(lock));
  lock.l_type = F_WRLCK;
  lock.l_whence = SEEK_SET;
  lock.l_start = 0;
  lock.l_len = 0; // whole file

  if (::fcntl(fd_, F_SETLK, &lock) == -1) {
    reason_ = std::strerror(errno);
    return false;
  }
  return true;
}

LockResult LockDirectory(const std::filesystem::path &directory,
                         const std::string &lockfile_name, bool probe_only) {
  std::lock_guard<std::mutex> lock(g_dir_locks_mutex);

  const std::filesystem::path lockfile_path = directory / lockfile_name;
  const std::string key = lockfile_path.string();

  if (g_dir_locks.count(key) != 0) {
    return LockResult::Success;
  }

  auto file_lock = std::make_unique<FileLock>(lockfile_path);
  if (!file_lock->TryLock()) {
    if (!file_lock->GetReason().empty() &&
        !std::filesystem::exists(lockfile_path)) {
      LOG_ERROR("Failed to create lock file {}: {}", key,
                file_lock->GetReason());
      return LockResult::ErrorWrite;
    }
    LOG_ERROR("Failed to lock directory {}: {}", directory.string(),
              file_lock->GetReason());
    return LockResult::ErrorLock;
  }

  if (!probe_only) {
    g_dir_locks.emplace(key, std::move(file_lock));
  }
  return LockResult::Success;
}

void UnlockDirectory(const std::filesystem::path &directory,
                     const std::string &lockfile_name) {
  std::lock_guard<std::mutex> lock(g_dir_locks_mutex);
  g_dir_locks.erase((directory / lockfile_name).string());
}

void ReleaseAllDirectoryLocks() {
  std::lock_guard<std::mutex> lock(g_dir_locks_mutex);
  g_dir_locks.clear();
}

} // namespace util
} // namespace chaincraft
