// Copyright (c) 2024 Chaincraft
// Distributed under the MIT software license

#ifndef CHAINCRAFT_UTIL_FILES_HPP
#define CHAINCRAFT_UTIL_FILES_HPP

#include <filesystem>
#include <optional>
#include <string>

namespace chaincraft {
namespace util {

/**
 * Crash-safe write: data goes to "<path>.tmp", is fsync'd, then renamed over
 * path and the parent directory is fsync'd. Readers see either the old or
 * the new contents, never a partial file.
 *
 * Returns false (temp file removed) on any failure.
 */
bool atomic_write_file(const std::filesystem::path &path,
                       const std::string &data);

// nullopt if the file does not exist or cannot be read
std::optional<std::string> read_file_string(const std::filesystem::path &path);

// Recursive mkdir; true if the directory exists afterwards
bool ensure_directory(const std::filesystem::path &dir);

// ~/.chaincraft, or ./.chaincraft when HOME is unset
std::filesystem::path get_default_datadir();

} // namespace util
} // namespace chaincraft

#endif // CHAINCRAFT_UTIL_FILES_HPP
