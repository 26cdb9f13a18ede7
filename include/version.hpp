// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#ifndef STATESYNC_VERSION_HPP
#define STATESYNC_VERSION_HPP

#include "manifest/manifest.hpp"
#include <string>

namespace statesync {

// Software version
constexpr int CLIENT_VERSION_MAJOR = 1;
constexpr int CLIENT_VERSION_MINOR = 0;
constexpr int CLIENT_VERSION_PATCH = 0;

// Build version string
inline std::string GetVersionString() {
  return std::to_string(CLIENT_VERSION_MAJOR) + "." +
         std::to_string(CLIENT_VERSION_MINOR) + "." +
         std::to_string(CLIENT_VERSION_PATCH);
}

// Copyright
constexpr const char *COPYRIGHT_YEAR = "2024";
constexpr const char *COPYRIGHT_HOLDERS = "Coinbase Chain";

// Full version info for display, including the manifest protocol range
inline std::string GetFullVersionString() {
  return "statesync-tool version " + GetVersionString() +
         " (manifest versions " +
         std::to_string(manifest::MIN_SUPPORTED_STATE_SYNC_VERSION) + "-" +
         std::to_string(manifest::CURRENT_STATE_SYNC_VERSION) + ")";
}

// Get copyright string
inline std::string GetCopyrightString() {
  return "Copyright (C) " + std::string(COPYRIGHT_YEAR) + " " +
         std::string(COPYRIGHT_HOLDERS);
}

} // namespace statesync

#endif // STATESYNC_VERSION_HPP
