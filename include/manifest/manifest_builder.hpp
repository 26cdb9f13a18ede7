// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#ifndef STATESYNC_MANIFEST_MANIFEST_BUILDER_HPP
#define STATESYNC_MANIFEST_MANIFEST_BUILDER_HPP

/*
 * Manifest computation over a checkpoint directory
 *
 * - Files are visited in sorted relative-path order and split into fixed-size
 *   chunks (the last one may be short). Empty files have no chunks.
 * - Hashing fans out one task per file on the caller's ThreadPool; all tasks
 *   are joined before ComputeManifest returns.
 * - Incremental mode takes the previous checkpoint's manifest plus the
 *   producer's dirty-chunk report. Clean chunks of tracked files reuse the
 *   previous hash without reading the file; dirty chunks are rehashed.
 *   Either way the result equals a from-scratch computation as long as the
 *   dirty report is complete.
 * - Any read failure is fatal for the whole computation (ManifestError).
 */

#include "manifest/manifest.hpp"
#include "util/threadpool.hpp"
#include <atomic>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace statesync {
namespace manifest {

class ManifestError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/**
 * Cost counters for manifest computation. Classification never affects the
 * resulting manifest.
 */
struct ManifestMetrics {
  std::atomic<uint64_t> reused_bytes{0};              // hash copied from base
  std::atomic<uint64_t> hashed_bytes{0};              // rehashed, new content
  std::atomic<uint64_t> hashed_and_compared_bytes{0}; // rehashed, same hash
  std::atomic<uint64_t> files{0};
  std::atomic<uint64_t> chunks{0};

  void Reset();
};

// Relative path -> chunk indices written since the base checkpoint
using DirtyChunks = std::map<std::string, std::set<uint64_t>>;

struct ManifestDelta {
  std::shared_ptr<const Manifest> base_manifest;
  Height base_height{0};
  Height target_height{0};
  // Files absent from this map are untracked and hashed in full
  DirtyChunks dirty_chunks;
};

/**
 * Sorted, '/'-separated relative paths of all regular files below `root`.
 * Throws ManifestError if the directory cannot be walked or contains
 * anything other than regular files and directories.
 */
std::vector<std::string> ListCheckpointFiles(const std::filesystem::path &root);

/**
 * Compute the manifest of `checkpoint`.
 *
 * @param pool       hashing workers (bounded, owned by the caller)
 * @param metrics    reuse/rehash counters, updated concurrently
 * @param version    manifest version to stamp
 * @param checkpoint checkpoint root directory
 * @param chunk_size chunk size in bytes (power of two, page aligned)
 * @param delta      previous manifest and dirty chunks, if known
 * @throws ManifestError on unreadable files
 */
Manifest ComputeManifest(util::ThreadPool &pool, ManifestMetrics &metrics,
                         uint32_t version,
                         const std::filesystem::path &checkpoint,
                         uint32_t chunk_size,
                         const std::optional<ManifestDelta> &delta);

/**
 * Hashes of the `chunk_size` chunks of one file, reading `size_bytes` bytes.
 * Used for re-validation of assembled files.
 * @throws ManifestError if the file is shorter or unreadable
 */
std::vector<Hash256> HashFileChunks(const std::filesystem::path &path,
                                    uint64_t size_bytes, uint32_t chunk_size);

} // namespace manifest
} // namespace statesync

#endif // STATESYNC_MANIFEST_MANIFEST_BUILDER_HPP
