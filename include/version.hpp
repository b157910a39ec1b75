// Copyright (c) 2024 Chaincraft
// Distributed under the MIT software license

#ifndef CHAINCRAFT_VERSION_HPP
#define CHAINCRAFT_VERSION_HPP

#include <string>

namespace chaincraft {

constexpr int CLIENT_VERSION_MAJOR = 0;
constexpr int CLIENT_VERSION_MINOR = 3;
constexpr int CLIENT_VERSION_PATCH = 0;

inline std::string GetVersionString() {
  return std::to_string(CLIENT_VERSION_MAJOR) + "." +
         std::to_string(CLIENT_VERSION_MINOR) + "." +
         std::to_string(CLIENT_VERSION_PATCH);
}

constexpr const char *COPYRIGHT_YEAR = "2024";
constexpr const char *COPYRIGHT_HOLDERS = "The Chaincraft developers";

// User agent carried in VERSION
// Format: /Chaincraft:0.3.0/
inline std::string GetUserAgent() {
  return "/Chaincraft:" + GetVersionString() + "/";
}

inline std::string GetFullVersionString() {
  return "Chaincraft node version " + GetVersionString();
}

inline std::string GetCopyrightString() {
  return "Copyright (C) " + std::string(COPYRIGHT_YEAR) + " " +
         std::string(COPYRIGHT_HOLDERS);
}

} // namespace chaincraft

#endif // CHAINCRAFT_VERSION_HPP
