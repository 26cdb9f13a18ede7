// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#ifndef STATESYNC_MANIFEST_MANIFEST_HPP
#define STATESYNC_MANIFEST_MANIFEST_HPP

#include "crypto/sha256.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace statesync {

// Monotonically increasing identifier of a committed state version
using Height = uint64_t;

namespace manifest {

// ============================================================================
// Protocol constants
// ============================================================================

// Manifest versions. V2 introduced small-file grouping; a decoder accepts the
// current and the immediately prior version.
constexpr uint32_t STATE_SYNC_V1 = 1;
constexpr uint32_t STATE_SYNC_V2 = 2;
constexpr uint32_t CURRENT_STATE_SYNC_VERSION = STATE_SYNC_V2;
constexpr uint32_t MIN_SUPPORTED_STATE_SYNC_VERSION = STATE_SYNC_V1;

// Page size of the producer's dirty-page tracking
constexpr uint32_t PAGE_SIZE = 4096;

// 1 MiB: power of two and page aligned, so a dirty page never straddles
// two chunks
constexpr uint32_t DEFAULT_CHUNK_SIZE = 1u << 20;

// Files up to this size are candidates for group chunks (V2 and later)
constexpr uint64_t MAX_FILE_SIZE_TO_GROUP = 1u << 13;

// Byte cap of one group chunk, independent of the producer's chunk size
constexpr uint64_t MAX_FILE_GROUP_BYTES = DEFAULT_CHUNK_SIZE;

// Chunk 0 is the encoded manifest, chunk i + 1 is chunk_table[i], and ids at
// or above FILE_GROUP_CHUNK_ID_OFFSET are group chunks.
using ChunkId = uint32_t;
constexpr ChunkId MANIFEST_CHUNK = 0;
constexpr ChunkId FILE_GROUP_CHUNK_ID_OFFSET = 1u << 30;

// Decoder limits
constexpr size_t MAX_PATH_LENGTH = 4096;

inline constexpr bool IsSupportedVersion(uint32_t version) {
  return version >= MIN_SUPPORTED_STATE_SYNC_VERSION &&
         version <= CURRENT_STATE_SYNC_VERSION;
}

inline constexpr ChunkId ChunkIdForIndex(size_t chunk_index) {
  return static_cast<ChunkId>(chunk_index + 1);
}

inline constexpr size_t ChunkIndexForId(ChunkId id) { return id - 1; }

inline constexpr bool IsFileGroupChunk(ChunkId id) {
  return id >= FILE_GROUP_CHUNK_ID_OFFSET;
}

// ============================================================================
// Manifest
// ============================================================================

struct FileInfo {
  std::string relative_path; // '/'-separated, relative to the checkpoint root
  uint64_t size_bytes{0};
  Hash256 hash{};

  bool operator==(const FileInfo &other) const = default;
};

struct ChunkInfo {
  uint32_t file_index{0};
  uint32_t size_bytes{0};
  uint64_t offset{0};
  Hash256 hash{};

  bool operator==(const ChunkInfo &other) const = default;
};

/**
 * Canonical description of a checkpoint
 *
 * Chunks of a file are contiguous in chunk_table and ordered by offset;
 * files are ordered by relative_path. Immutable once computed and shared as
 * std::shared_ptr<const Manifest>.
 */
struct Manifest {
  uint32_t version{CURRENT_STATE_SYNC_VERSION};
  std::vector<FileInfo> file_table;
  std::vector<ChunkInfo> chunk_table;

  Manifest() = default;
  Manifest(uint32_t version, std::vector<FileInfo> files,
           std::vector<ChunkInfo> chunks)
      : version(version), file_table(std::move(files)),
        chunk_table(std::move(chunks)) {}

  bool operator==(const Manifest &other) const = default;

  // [begin, end) chunk_table indices of every file; relies on the
  // contiguity invariant
  std::vector<std::pair<size_t, size_t>> FileChunkRanges() const;

  uint64_t TotalBytes() const;
};

// ============================================================================
// Encoding (chunk 0)
// ============================================================================

enum class DecodeStatus {
  OK,
  MALFORMED,
  UNSUPPORTED_VERSION,
};

/**
 * Wire format (little-endian):
 *   u32 version
 *   varint n_files  { varint path_len, path, u64 size_bytes, hash[32] }
 *   varint n_chunks { u32 file_index, u32 size_bytes, u64 offset, hash[32] }
 */
std::vector<uint8_t> EncodeManifest(const Manifest &manifest);

/**
 * Decode chunk 0. Trailing bytes are malformed. On failure `error` receives
 * a short reason.
 */
DecodeStatus DecodeManifest(const uint8_t *data, size_t size, Manifest &out,
                            std::string &error);

} // namespace manifest
} // namespace statesync

#endif // STATESYNC_MANIFEST_MANIFEST_HPP
