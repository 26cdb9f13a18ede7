// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#ifndef STATESYNC_MANIFEST_MANIFEST_HASH_HPP
#define STATESYNC_MANIFEST_MANIFEST_HASH_HPP

#include "manifest/manifest.hpp"
#include <string>
#include <vector>

namespace statesync {
namespace manifest {

/**
 * Domain-separated hashes
 *
 *   chunk = H(sep("statesync-chunk") || bytes)
 *   file  = H(sep("statesync-file") || u32be(n) || chunk_hash_0 .. chunk_hash_n-1)
 *   root  = H(sep("statesync-root-hash") || u32be(version)
 *             || u32be(n_files)  || { u32be(len) path u64be(size) file_hash }
 *             || u32be(n_chunks) || { u32be(file_index) u32be(size) u64be(offset) chunk_hash })
 *
 * The root hash is the identity peers agree on: any change in encoding here
 * is a protocol change and needs a new manifest version.
 */
Hash256 ChunkHash(const uint8_t *data, size_t len);

Hash256 FileHash(const std::vector<ChunkInfo> &chunk_table, size_t begin,
                 size_t end);

Hash256 ManifestRootHash(const Manifest &manifest);

/**
 * Structural and cryptographic validation of a received manifest
 *
 * Checks:
 * - version is supported
 * - chunks reference existing files, are grouped per file in file order,
 *   start at offset 0 and are consecutive, are non-empty, and sum to the
 *   file size
 * - relative paths are non-empty, relative, free of ".." and strictly sorted
 * - every file hash matches its chunk hashes
 * - the root hash matches `expected_root`
 *
 * @return true if valid; otherwise `reason` names the first failure
 */
bool ValidateManifest(const Manifest &manifest, const Hash256 &expected_root,
                      std::string &reason);

} // namespace manifest
} // namespace statesync

#endif // STATESYNC_MANIFEST_MANIFEST_HASH_HPP
