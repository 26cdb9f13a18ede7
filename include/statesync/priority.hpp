// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#ifndef STATESYNC_STATESYNC_PRIORITY_HPP
#define STATESYNC_STATESYNC_PRIORITY_HPP

#include "statesync/types.hpp"
#include <optional>

namespace statesync {

/**
 * Classify an advert.
 *
 * With a desired target: Fetch the exact target, Drop anything older or a
 * different root at the target height, Stash anything newer.
 * Without one: Drop what is not newer than the latest local checkpoint,
 * Stash the rest.
 */
Priority ComputePriority(const std::optional<StateSyncArtifactId> &desired,
                         Height latest_local_height,
                         const StateSyncArtifactId &id);

} // namespace statesync

#endif // STATESYNC_STATESYNC_PRIORITY_HPP
