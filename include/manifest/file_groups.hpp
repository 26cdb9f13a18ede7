// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#ifndef STATESYNC_MANIFEST_FILE_GROUPS_HPP
#define STATESYNC_MANIFEST_FILE_GROUPS_HPP

#include "manifest/manifest.hpp"
#include <map>
#include <vector>

namespace statesync {
namespace manifest {

// Group chunk id -> chunk_table indices, in file-table order
using FileGroupChunks = std::map<ChunkId, std::vector<uint32_t>>;

/**
 * Pack small single-chunk files into group chunks.
 *
 * A function of the manifest alone: sender and receiver derive the same map
 * from the protocol constants of manifest.version, whatever their local
 * configuration. Manifests older than STATE_SYNC_V2 are never grouped.
 */
FileGroupChunks ComputeFileGroups(const Manifest &manifest);

// chunk_table index -> owning group id
std::map<uint32_t, ChunkId> InvertFileGroups(const FileGroupChunks &groups);

} // namespace manifest
} // namespace statesync

#endif // STATESYNC_MANIFEST_FILE_GROUPS_HPP
