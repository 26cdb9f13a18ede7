// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#ifndef STATESYNC_STATESYNC_CONFIG_HPP
#define STATESYNC_STATESYNC_CONFIG_HPP

#include "manifest/manifest.hpp"
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace statesync {

/**
 * StateSyncConfig - engine parameters
 *
 * chunk_size only shapes the manifests this node produces. The chunk layout
 * travels in the manifest and grouping follows the manifest version, so
 * peers need not agree on it.
 */
struct StateSyncConfig {
  std::filesystem::path root{"statesync-data"};
  uint32_t chunk_size{manifest::DEFAULT_CHUNK_SIZE};
  uint32_t manifest_version{manifest::CURRENT_STATE_SYNC_VERSION};
  size_t hashing_threads{0}; // 0 = hardware concurrency

  // True if usable; otherwise `error` names the offending field
  bool Validate(std::string &error) const;
};

/**
 * Load a config from a JSON object. Missing keys keep their defaults.
 * Returns std::nullopt (and logs) on unreadable, malformed or invalid files.
 *
 *   { "root": "/var/lib/state", "chunk_size": 1048576,
 *     "manifest_version": 2, "hashing_threads": 4 }
 */
std::optional<StateSyncConfig>
LoadStateSyncConfig(const std::filesystem::path &path);

} // namespace statesync

#endif // STATESYNC_STATESYNC_CONFIG_HPP
