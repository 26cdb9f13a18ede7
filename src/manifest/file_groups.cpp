// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "manifest/file_groups.hpp"

namespace statesync {
namespace manifest {

FileGroupChunks ComputeFileGroups(const Manifest &manifest) {
  FileGroupChunks groups;
  if (manifest.version < STATE_SYNC_V2) {
    return groups;
  }

  const auto ranges = manifest.FileChunkRanges();
  ChunkId group_id = FILE_GROUP_CHUNK_ID_OFFSET;
  std::vector<uint32_t> current;
  uint64_t current_bytes = 0;

  for (size_t f = 0; f < manifest.file_table.size(); ++f) {
    const FileInfo &file = manifest.file_table[f];
    if (file.size_bytes == 0 || file.size_bytes > MAX_FILE_SIZE_TO_GROUP) {
      continue;
    }
    // Small files below the chunk size always have exactly one chunk
    if (ranges[f].second - ranges[f].first != 1) {
      continue;
    }
    uint32_t chunk_index = static_cast<uint32_t>(ranges[f].first);
    uint64_t chunk_bytes = manifest.chunk_table[chunk_index].size_bytes;

    if (!current.empty() && current_bytes + chunk_bytes > MAX_FILE_GROUP_BYTES) {
      groups.emplace(group_id++, std::move(current));
      current.clear();
      current_bytes = 0;
    }
    current.push_back(chunk_index);
    current_bytes += chunk_bytes;
  }
  if (!current.empty()) {
    groups.emplace(group_id, std::move(current));
  }
  return groups;
}

std::map<uint32_t, ChunkId> InvertFileGroups(const FileGroupChunks &groups) {
  std::map<uint32_t, ChunkId> owner;
  for (const auto &[id, members] : groups) {
    for (uint32_t index : members) {
      owner.emplace(index, id);
    }
  }
  return owner;
}

} // namespace manifest
} // namespace statesync
