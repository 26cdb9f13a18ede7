// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#ifndef STATESYNC_STATESYNC_CHUNK_SOURCE_HPP
#define STATESYNC_STATESYNC_CHUNK_SOURCE_HPP

#include "statesync/types.hpp"
#include <cstdint>
#include <optional>
#include <vector>

namespace statesync {

/**
 * Producer side: bytes of chunk `id` of a complete checkpoint.
 *
 * - MANIFEST_CHUNK: the encoded manifest
 * - regular ids: the chunk's byte range of its file
 * - group ids: the constituent chunks concatenated in group order
 *
 * Returns std::nullopt for unknown ids and on read failures.
 */
std::optional<std::vector<uint8_t>> GetChunk(const StateSyncMessage &msg,
                                             manifest::ChunkId id);

} // namespace statesync

#endif // STATESYNC_STATESYNC_CHUNK_SOURCE_HPP
