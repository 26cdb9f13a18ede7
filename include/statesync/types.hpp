// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#ifndef STATESYNC_STATESYNC_TYPES_HPP
#define STATESYNC_STATESYNC_TYPES_HPP

#include "manifest/file_groups.hpp"
#include "manifest/manifest.hpp"
#include <filesystem>
#include <memory>

namespace statesync {

// Identity of an advertised or requested state: certified (height, root)
struct StateSyncArtifactId {
  Height height{0};
  Hash256 root_hash{};

  bool operator==(const StateSyncArtifactId &other) const = default;
};

/**
 * A complete checkpoint, local or freshly synced
 *
 * Produced by a Chunkable on completion and by StateSync::CommitCheckpoint;
 * also the producer-side handle for serving chunks (GetChunk).
 */
struct StateSyncMessage {
  Height height{0};
  Hash256 root_hash{};
  std::filesystem::path checkpoint_root;
  std::shared_ptr<const manifest::Manifest> manifest;
  std::shared_ptr<const manifest::FileGroupChunks> file_group;

  StateSyncArtifactId id() const { return {height, root_hash}; }
};

// Classification of an advert by the transport
enum class Priority {
  Fetch, // download now
  Stash, // keep the advert for later
  Drop,  // not useful
};

const char *PriorityToString(Priority priority);

} // namespace statesync

#endif // STATESYNC_STATESYNC_TYPES_HPP
