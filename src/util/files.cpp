// Copyright (c) 2024 Chaincraft
// Distributed under the MIT software license

#include "util/files.hpp"
#include "util/logging.hpp"
#include <cstdlib>
#include <fcntl.h>
#include <fstream>
#include <sstream>
#include <unistd.h>

namespace chaincraft {
namespace util {

namespace {

bool sync_directory(const std::filesystem::path &dir) {
  int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
  if (fd < 0) {
    return false;
  }
  bool ok = ::fsync(fd) == 0;
  ::close(fd);
  return ok;
}

void remove_quietly(const std::filesystem::path &path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
  if (ec) {
    LOG_WARN("failed to remove temporary file {}: {}", path.string(),
             ec.message());
  }
}

} // namespace

bool atomic_write_file(const std::filesystem::path &path,
                       const std::string &data) {
  auto parent = path.parent_path();
  if (!parent.empty() && !ensure_directory(parent)) {
    LOG_ERROR("cannot create directory {}", parent.string());
    return false;
  }

  std::filesystem::path tmp = path;
  tmp += ".tmp";

  int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
  if (fd < 0) {
    LOG_ERROR("failed to open {} for writing", tmp.string());
    return false;
  }

  size_t total = 0;
  while (total < data.size()) {
    ssize_t n = ::write(fd, data.data() + total, data.size() - total);
    if (n <= 0) {
      LOG_ERROR("write error on {}", tmp.string());
      ::close(fd);
      remove_quietly(tmp);
      return false;
    }
    total += static_cast<size_t>(n);
  }

  if (::fsync(fd) != 0) {
    LOG_ERROR("fsync failed for {}", tmp.string());
    ::close(fd);
    remove_quietly(tmp);
    return false;
  }
  ::close(fd);

  std::error_code ec;
  std::filesystem::rename(tmp, path, ec);
  if (ec) {
    LOG_ERROR("failed to replace {}: {}", path.string(), ec.message());
    remove_quietly(tmp);
    return false;
  }

  if (!parent.empty() && !sync_directory(parent)) {
    LOG_WARN("directory fsync failed for {}", parent.string());
  }
  return true;
}

std::optional<std::string> read_file_string(const std::filesystem::path &path) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    return std::nullopt;
  }
  std::ostringstream ss;
  ss << file.rdbuf();
  if (file.bad()) {
    return std::nullopt;
  }
  return ss.str();
}

bool ensure_directory(const std::filesystem::path &dir) {
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  return !ec || std::filesystem::is_directory(dir);
}

std::filesystem::path get_default_datadir() {
  const char *home = std::getenv("HOME");
  if (home) {
    return std::filesystem::path(home) / ".chaincraft";
  }
  return std::filesystem::current_path() / ".chaincraft";
}

} // namespace util
} // namespace chaincraft
