// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#ifndef STATESYNC_STATESYNC_STATE_SYNC_CACHE_HPP
#define STATESYNC_STATESYNC_STATE_SYNC_CACHE_HPP

/*
 * StateSyncCache - single-slot cache of an aborted download
 *
 * When a Chunkable is torn down while still loading, its scratchpad is moved
 * into tmp/state_sync_cache_<height> together with the manifest and the set
 * of chunks it was still missing. A later download salvages whatever chunks
 * of that entry its own manifest needs.
 *
 * - At most one entry. A Put at a lower height than the current entry is
 *   rejected; equal or higher heights replace it (and delete its directory).
 * - A Put whose target directory already exists, is non-empty and is not the
 *   current entry's own directory is refused and the directory left alone;
 *   it is never mistaken for a cache entry.
 * - A successful sync at height >= the entry's height clears the entry.
 * - All methods are thread-safe (one shared_mutex).
 */

#include "manifest/manifest.hpp"
#include "statesync/state_layout.hpp"
#include <filesystem>
#include <memory>
#include <optional>
#include <set>
#include <shared_mutex>

namespace statesync {

struct CacheEntry {
  Height height{0};
  std::shared_ptr<const manifest::Manifest> manifest;
  // chunk_table indices not present in `path` (ungrouped)
  std::set<uint32_t> missing_chunks;
  std::filesystem::path path;
};

class StateSyncCache {
public:
  explicit StateSyncCache(StateLayout layout);

  StateSyncCache(const StateSyncCache &) = delete;
  StateSyncCache &operator=(const StateSyncCache &) = delete;

  /**
   * Store an aborted download. On success `scratchpad` has been moved into
   * the cache; on failure the caller still owns (and should delete) it.
   */
  bool Put(Height height, std::shared_ptr<const manifest::Manifest> manifest,
           std::set<uint32_t> missing_chunks,
           const std::filesystem::path &scratchpad);

  std::optional<CacheEntry> Get() const;

  /**
   * Hand the entry over to a download with an identical manifest. The
   * entry's directory is renamed to `destination` (which must not exist)
   * and the cache becomes empty. Returns the entry with its new path, or
   * std::nullopt if there is no matching entry.
   */
  std::optional<CacheEntry> Take(const manifest::Manifest &manifest,
                                 const std::filesystem::path &destination);

  void RegisterSuccessfulSync(Height height);

private:
  // Caller holds mutex_ exclusively
  void ClearLocked();

  StateLayout layout_;
  mutable std::shared_mutex mutex_;
  std::optional<CacheEntry> entry_;
};

} // namespace statesync

#endif // STATESYNC_STATESYNC_STATE_SYNC_CACHE_HPP
