// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "statesync/priority.hpp"

namespace statesync {

Priority ComputePriority(const std::optional<StateSyncArtifactId> &desired,
                         Height latest_local_height,
                         const StateSyncArtifactId &id) {
  if (desired) {
    if (id.height < desired->height) {
      return Priority::Drop;
    }
    if (id.height > desired->height) {
      return Priority::Stash;
    }
    return id.root_hash == desired->root_hash ? Priority::Fetch
                                              : Priority::Drop;
  }
  if (id.height <= latest_local_height) {
    return Priority::Drop;
  }
  return Priority::Stash;
}

} // namespace statesync
