// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "manifest/manifest_hash.hpp"
#include "util/strencodings.hpp"
#include <filesystem>

namespace statesync {
namespace manifest {

namespace {

constexpr const char *kChunkDomain = "statesync-chunk";
constexpr const char *kFileDomain = "statesync-file";
constexpr const char *kRootDomain = "statesync-root-hash";

bool IsSafeRelativePath(const std::string &path) {
  if (path.empty() || path.front() == '/') {
    return false;
  }
  for (const auto &part : std::filesystem::path(path)) {
    if (part == ".." || part == ".") {
      return false;
    }
  }
  return true;
}

} // namespace

Hash256 ChunkHash(const uint8_t *data, size_t len) {
  crypto::CSHA256 hasher;
  hasher.WriteDomain(kChunkDomain).Write(data, len);
  return hasher.Finalize();
}

Hash256 FileHash(const std::vector<ChunkInfo> &chunk_table, size_t begin,
                 size_t end) {
  crypto::CSHA256 hasher;
  hasher.WriteDomain(kFileDomain);
  hasher.WriteU32BE(static_cast<uint32_t>(end - begin));
  for (size_t i = begin; i < end; ++i) {
    hasher.Write(chunk_table[i].hash.data(), chunk_table[i].hash.size());
  }
  return hasher.Finalize();
}

Hash256 ManifestRootHash(const Manifest &manifest) {
  crypto::CSHA256 hasher;
  hasher.WriteDomain(kRootDomain);
  hasher.WriteU32BE(manifest.version);

  hasher.WriteU32BE(static_cast<uint32_t>(manifest.file_table.size()));
  for (const auto &file : manifest.file_table) {
    hasher.WriteU32BE(static_cast<uint32_t>(file.relative_path.size()));
    hasher.Write(reinterpret_cast<const uint8_t *>(file.relative_path.data()),
                 file.relative_path.size());
    hasher.WriteU64BE(file.size_bytes);
    hasher.Write(file.hash.data(), file.hash.size());
  }

  hasher.WriteU32BE(static_cast<uint32_t>(manifest.chunk_table.size()));
  for (const auto &chunk : manifest.chunk_table) {
    hasher.WriteU32BE(chunk.file_index);
    hasher.WriteU32BE(chunk.size_bytes);
    hasher.WriteU64BE(chunk.offset);
    hasher.Write(chunk.hash.data(), chunk.hash.size());
  }

  return hasher.Finalize();
}

bool ValidateManifest(const Manifest &manifest, const Hash256 &expected_root,
                      std::string &reason) {
  if (!IsSupportedVersion(manifest.version)) {
    reason = "unsupported version " + std::to_string(manifest.version);
    return false;
  }

  const auto &files = manifest.file_table;
  const auto &chunks = manifest.chunk_table;

  for (size_t f = 0; f < files.size(); ++f) {
    if (!IsSafeRelativePath(files[f].relative_path)) {
      reason = "invalid path '" + files[f].relative_path + "'";
      return false;
    }
    if (f > 0 && !(files[f - 1].relative_path < files[f].relative_path)) {
      reason = "file table not sorted at " + files[f].relative_path;
      return false;
    }
  }

  size_t i = 0;
  for (size_t f = 0; f < files.size(); ++f) {
    size_t begin = i;
    uint64_t expected_offset = 0;
    while (i < chunks.size() && chunks[i].file_index == f) {
      if (chunks[i].size_bytes == 0) {
        reason = "empty chunk " + std::to_string(i);
        return false;
      }
      if (chunks[i].offset != expected_offset) {
        reason = "chunk " + std::to_string(i) + " has offset " +
                 std::to_string(chunks[i].offset) + ", expected " +
                 std::to_string(expected_offset);
        return false;
      }
      expected_offset += chunks[i].size_bytes;
      ++i;
    }
    if (expected_offset != files[f].size_bytes) {
      reason = "chunks of " + files[f].relative_path + " cover " +
               std::to_string(expected_offset) + " of " +
               std::to_string(files[f].size_bytes) + " bytes";
      return false;
    }
    if (FileHash(chunks, begin, i) != files[f].hash) {
      reason = "file hash mismatch for " + files[f].relative_path;
      return false;
    }
  }
  if (i != chunks.size()) {
    reason = "chunk " + std::to_string(i) + " references file " +
             std::to_string(chunks[i].file_index) + " out of order";
    return false;
  }

  Hash256 root = ManifestRootHash(manifest);
  if (root != expected_root) {
    reason = "root hash mismatch: expected " + util::HexStr(expected_root) +
             ", got " + util::HexStr(root);
    return false;
  }

  return true;
}

} // namespace manifest
} // namespace statesync
