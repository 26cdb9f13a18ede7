// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#ifndef STATESYNC_STATESYNC_ACTIVE_SYNCS_HPP
#define STATESYNC_STATESYNC_ACTIVE_SYNCS_HPP

#include "manifest/manifest.hpp"
#include "statesync/state_sync_cache.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <set>

namespace statesync {

/**
 * ActiveSyncRegistry - at most one Chunkable per height
 *
 * TryRegister hands out a Guard; the height stays registered until the
 * Guard is destroyed.
 */
class ActiveSyncRegistry
    : public std::enable_shared_from_this<ActiveSyncRegistry> {
public:
  class Guard {
  public:
    Guard(std::shared_ptr<ActiveSyncRegistry> registry, Height height)
        : registry_(std::move(registry)), height_(height) {}
    ~Guard();

    Guard(Guard &&other) noexcept = default;
    Guard &operator=(Guard &&other) = delete;
    Guard(const Guard &) = delete;
    Guard &operator=(const Guard &) = delete;

    Height height() const { return height_; }

  private:
    std::shared_ptr<ActiveSyncRegistry> registry_;
    Height height_;
  };

  // std::nullopt if a sync at `height` is already active
  std::optional<Guard> TryRegister(Height height);

  bool IsActive(Height height) const;
  size_t size() const;

private:
  void Release(Height height);

  mutable std::mutex mutex_;
  std::set<Height> active_;
};

// Collaborators shared by every Chunkable of one StateSync
struct StateSyncRefs {
  std::shared_ptr<ActiveSyncRegistry> active;
  std::shared_ptr<StateSyncCache> cache;
};

} // namespace statesync

#endif // STATESYNC_STATESYNC_ACTIVE_SYNCS_HPP
