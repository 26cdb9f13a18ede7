// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "statesync/active_syncs.hpp"

namespace statesync {

ActiveSyncRegistry::Guard::~Guard() {
  if (registry_) {
    registry_->Release(height_);
  }
}

std::optional<ActiveSyncRegistry::Guard>
ActiveSyncRegistry::TryRegister(Height height) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!active_.insert(height).second) {
    return std::nullopt;
  }
  return std::optional<Guard>(std::in_place, shared_from_this(), height);
}

bool ActiveSyncRegistry::IsActive(Height height) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return active_.count(height) != 0;
}

size_t ActiveSyncRegistry::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return active_.size();
}

void ActiveSyncRegistry::Release(Height height) {
  std::lock_guard<std::mutex> lock(mutex_);
  active_.erase(height);
}

} // namespace statesync
