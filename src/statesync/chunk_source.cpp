// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "statesync/chunk_source.hpp"
#include "util/files.hpp"
#include "util/logging.hpp"

namespace statesync {

namespace {

std::optional<std::vector<uint8_t>>
ReadChunk(const StateSyncMessage &msg, size_t chunk_index) {
  const auto &chunk = msg.manifest->chunk_table[chunk_index];
  const auto &file = msg.manifest->file_table[chunk.file_index];
  auto bytes = util::read_range(msg.checkpoint_root / file.relative_path,
                                chunk.offset, chunk.size_bytes);
  if (!bytes) {
    LOG_SYNC_ERROR("Failed to read chunk {} of {} at height {}", chunk_index,
                   file.relative_path, msg.height);
  }
  return bytes;
}

} // namespace

std::optional<std::vector<uint8_t>> GetChunk(const StateSyncMessage &msg,
                                             manifest::ChunkId id) {
  if (!msg.manifest) {
    return std::nullopt;
  }
  if (id == manifest::MANIFEST_CHUNK) {
    return manifest::EncodeManifest(*msg.manifest);
  }

  if (manifest::IsFileGroupChunk(id)) {
    if (!msg.file_group) {
      return std::nullopt;
    }
    auto it = msg.file_group->find(id);
    if (it == msg.file_group->end()) {
      return std::nullopt;
    }
    std::vector<uint8_t> out;
    for (uint32_t index : it->second) {
      auto piece = ReadChunk(msg, index);
      if (!piece) {
        return std::nullopt;
      }
      out.insert(out.end(), piece->begin(), piece->end());
    }
    return out;
  }

  size_t index = manifest::ChunkIndexForId(id);
  if (index >= msg.manifest->chunk_table.size()) {
    return std::nullopt;
  }
  return ReadChunk(msg, index);
}

} // namespace statesync
