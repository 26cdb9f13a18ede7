// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "statesync/state_sync_cache.hpp"
#include "util/files.hpp"
#include "util/logging.hpp"
#include <mutex>

namespace statesync {

namespace fs = std::filesystem;

StateSyncCache::StateSyncCache(StateLayout layout)
    : layout_(std::move(layout)) {}

bool StateSyncCache::Put(Height height,
                         std::shared_ptr<const manifest::Manifest> manifest,
                         std::set<uint32_t> missing_chunks,
                         const fs::path &scratchpad) {
  std::unique_lock<std::shared_mutex> lock(mutex_);

  if (entry_ && height < entry_->height) {
    LOG_CACHE_DEBUG("Not caching sync at height {}: cache holds height {}",
                    height, entry_->height);
    return false;
  }

  const fs::path target = layout_.CacheDir(height);
  const bool own_dir = entry_ && entry_->path == target;
  std::error_code ec;
  if (!own_dir && fs::exists(target, ec) && !util::is_empty_directory(target)) {
    LOG_CACHE_WARN("Not caching sync at height {}: {} already exists", height,
                   target.string());
    return false;
  }

  ClearLocked();
  if (!util::remove_all(target)) {
    return false;
  }

  fs::rename(scratchpad, target, ec);
  if (ec) {
    LOG_CACHE_ERROR("Failed to move {} to {}: {}", scratchpad.string(),
                    target.string(), ec.message());
    return false;
  }

  LOG_CACHE_DEBUG("Cached sync at height {} ({} chunks missing)", height,
                  missing_chunks.size());
  entry_ = CacheEntry{height, std::move(manifest), std::move(missing_chunks),
                      target};
  return true;
}

std::optional<CacheEntry> StateSyncCache::Get() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return entry_;
}

std::optional<CacheEntry> StateSyncCache::Take(const manifest::Manifest &manifest,
                                               const fs::path &destination) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  if (!entry_ || !entry_->manifest || !(*entry_->manifest == manifest)) {
    return std::nullopt;
  }

  std::error_code ec;
  fs::rename(entry_->path, destination, ec);
  if (ec) {
    LOG_CACHE_ERROR("Failed to move cache {} to {}: {}", entry_->path.string(),
                    destination.string(), ec.message());
    return std::nullopt;
  }

  CacheEntry taken = std::move(*entry_);
  entry_.reset();
  taken.path = destination;
  LOG_CACHE_DEBUG("Handed cached sync at height {} to {}", taken.height,
                  destination.string());
  return taken;
}

void StateSyncCache::RegisterSuccessfulSync(Height height) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  if (entry_ && entry_->height <= height) {
    LOG_CACHE_DEBUG("Sync at height {} completed, dropping cache at height {}",
                    height, entry_->height);
    ClearLocked();
  }
}

void StateSyncCache::ClearLocked() {
  if (!entry_) {
    return;
  }
  util::remove_all(entry_->path);
  entry_.reset();
}

} // namespace statesync
