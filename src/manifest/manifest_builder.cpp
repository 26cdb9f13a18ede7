// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "manifest/manifest_builder.hpp"
#include "manifest/manifest_hash.hpp"
#include "util/logging.hpp"
#include "util/strencodings.hpp"
#include <algorithm>
#include <chrono>
#include <fstream>
#include <unordered_map>

namespace statesync {
namespace manifest {

namespace fs = std::filesystem;

namespace {

// Base chunks of one file, for incremental reuse
struct BaseFile {
  const Manifest *manifest{nullptr};
  size_t begin{0};
  size_t end{0};
  const std::set<uint64_t> *dirty{nullptr};
};

struct FileResult {
  FileInfo info;
  std::vector<ChunkInfo> chunks; // file_index filled in by the caller
};

class ChunkReader {
public:
  ChunkReader(const fs::path &path, uint32_t chunk_size)
      : path_(path), file_(path, std::ios::binary), buffer_(chunk_size) {
    if (!file_) {
      throw ManifestError("cannot open " + path.string());
    }
  }

  const std::vector<uint8_t> &Read(uint64_t offset, uint32_t len) {
    file_.clear();
    file_.seekg(static_cast<std::streamoff>(offset));
    file_.read(reinterpret_cast<char *>(buffer_.data()), len);
    if (!file_ || static_cast<uint64_t>(file_.gcount()) != len) {
      throw ManifestError("short read of " + std::to_string(len) +
                          " bytes at offset " + std::to_string(offset) +
                          " in " + path_.string());
    }
    return buffer_;
  }

private:
  fs::path path_;
  std::ifstream file_;
  std::vector<uint8_t> buffer_;
};

FileResult HashFile(const fs::path &root, const std::string &relative_path,
                    uint64_t size_bytes, uint32_t chunk_size,
                    const BaseFile &base, ManifestMetrics &metrics) {
  FileResult result;
  result.info.relative_path = relative_path;
  result.info.size_bytes = size_bytes;

  std::optional<ChunkReader> reader;
  uint64_t n_chunks = (size_bytes + chunk_size - 1) / chunk_size;
  result.chunks.reserve(static_cast<size_t>(n_chunks));

  for (uint64_t i = 0; i < n_chunks; ++i) {
    ChunkInfo chunk;
    chunk.offset = i * chunk_size;
    chunk.size_bytes =
        static_cast<uint32_t>(std::min<uint64_t>(chunk_size, size_bytes - chunk.offset));

    const ChunkInfo *base_chunk = nullptr;
    if (base.manifest && base.begin + i < base.end) {
      const ChunkInfo &candidate = base.manifest->chunk_table[base.begin + i];
      if (candidate.offset == chunk.offset &&
          candidate.size_bytes == chunk.size_bytes) {
        base_chunk = &candidate;
      }
    }

    if (base_chunk && base.dirty && base.dirty->count(i) == 0) {
      chunk.hash = base_chunk->hash;
      metrics.reused_bytes += chunk.size_bytes;
    } else {
      if (!reader) {
        reader.emplace(root / relative_path, chunk_size);
      }
      const auto &bytes = reader->Read(chunk.offset, chunk.size_bytes);
      chunk.hash = ChunkHash(bytes.data(), chunk.size_bytes);
      if (base_chunk && base_chunk->hash == chunk.hash) {
        metrics.hashed_and_compared_bytes += chunk.size_bytes;
      } else {
        metrics.hashed_bytes += chunk.size_bytes;
      }
    }
    result.chunks.push_back(chunk);
  }

  result.info.hash = FileHash(result.chunks, 0, result.chunks.size());
  metrics.files += 1;
  metrics.chunks += result.chunks.size();
  return result;
}

} // namespace

void ManifestMetrics::Reset() {
  reused_bytes = 0;
  hashed_bytes = 0;
  hashed_and_compared_bytes = 0;
  files = 0;
  chunks = 0;
}

std::vector<std::string> ListCheckpointFiles(const fs::path &root) {
  std::vector<std::string> files;
  std::error_code ec;
  fs::recursive_directory_iterator it(root, ec);
  if (ec) {
    throw ManifestError("cannot list " + root.string() + ": " + ec.message());
  }
  for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if (ec) {
      throw ManifestError("cannot list " + root.string() + ": " +
                          ec.message());
    }
    const auto status = it->symlink_status(ec);
    if (ec) {
      throw ManifestError("cannot stat " + it->path().string());
    }
    if (fs::is_directory(status)) {
      continue;
    }
    if (!fs::is_regular_file(status)) {
      throw ManifestError("unexpected non-regular file " + it->path().string());
    }
    files.push_back(fs::relative(it->path(), root).generic_string());
  }
  if (ec) {
    throw ManifestError("cannot list " + root.string() + ": " + ec.message());
  }
  std::sort(files.begin(), files.end());
  return files;
}

Manifest ComputeManifest(util::ThreadPool &pool, ManifestMetrics &metrics,
                         uint32_t version, const fs::path &checkpoint,
                         uint32_t chunk_size,
                         const std::optional<ManifestDelta> &delta) {
  if (chunk_size == 0) {
    throw ManifestError("chunk size must be positive");
  }
  auto start = std::chrono::steady_clock::now();

  const std::vector<std::string> paths = ListCheckpointFiles(checkpoint);

  // Index the base manifest by path
  std::unordered_map<std::string, size_t> base_index;
  std::vector<std::pair<size_t, size_t>> base_ranges;
  const Manifest *base_manifest = nullptr;
  if (delta && delta->base_manifest) {
    base_manifest = delta->base_manifest.get();
    base_ranges = base_manifest->FileChunkRanges();
    for (size_t f = 0; f < base_manifest->file_table.size(); ++f) {
      base_index.emplace(base_manifest->file_table[f].relative_path, f);
    }
    LOG_MANIFEST_DEBUG("Computing manifest at height {} incrementally from "
                       "height {} ({} tracked files)",
                       delta->target_height, delta->base_height,
                       delta->dirty_chunks.size());
  }

  // Sizes first, so nothing below throws while tasks are in flight
  std::vector<uint64_t> sizes;
  sizes.reserve(paths.size());
  for (const auto &relative_path : paths) {
    std::error_code ec;
    sizes.push_back(fs::file_size(checkpoint / relative_path, ec));
    if (ec) {
      throw ManifestError("cannot stat " + relative_path + ": " + ec.message());
    }
  }

  std::vector<std::future<FileResult>> futures;
  futures.reserve(paths.size());
  for (size_t f = 0; f < paths.size(); ++f) {
    const std::string &relative_path = paths[f];
    uint64_t size = sizes[f];

    BaseFile base;
    if (base_manifest) {
      auto dirty = delta->dirty_chunks.find(relative_path);
      auto idx = base_index.find(relative_path);
      if (dirty != delta->dirty_chunks.end() && idx != base_index.end()) {
        base.manifest = base_manifest;
        base.begin = base_ranges[idx->second].first;
        base.end = base_ranges[idx->second].second;
        base.dirty = &dirty->second;
      } else if (idx != base_index.end()) {
        // Untracked: still compare against the base for classification
        base.manifest = base_manifest;
        base.begin = base_ranges[idx->second].first;
        base.end = base_ranges[idx->second].second;
      }
    }

    futures.push_back(pool.enqueue(HashFile, std::cref(checkpoint),
                                   std::cref(relative_path), size, chunk_size,
                                   base, std::ref(metrics)));
  }

  std::vector<FileResult> results;
  try {
    results = util::JoinAll(futures);
  } catch (const ManifestError &e) {
    LOG_MANIFEST_ERROR("Manifest computation of {} failed: {}",
                       checkpoint.string(), e.what());
    throw;
  }

  Manifest manifest;
  manifest.version = version;
  manifest.file_table.reserve(results.size());
  for (size_t f = 0; f < results.size(); ++f) {
    for (auto &chunk : results[f].chunks) {
      chunk.file_index = static_cast<uint32_t>(f);
      manifest.chunk_table.push_back(chunk);
    }
    manifest.file_table.push_back(std::move(results[f].info));
  }

  auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start);
  LOG_MANIFEST_DEBUG("Computed manifest of {}: {} files, {} chunks, {} in {} ms "
                     "(reused {}, hashed {}, hashed_and_compared {})",
                     checkpoint.string(), manifest.file_table.size(),
                     manifest.chunk_table.size(),
                     util::FormatBytes(manifest.TotalBytes()), elapsed.count(),
                     metrics.reused_bytes.load(), metrics.hashed_bytes.load(),
                     metrics.hashed_and_compared_bytes.load());
  return manifest;
}

std::vector<Hash256> HashFileChunks(const fs::path &path, uint64_t size_bytes,
                                    uint32_t chunk_size) {
  std::vector<Hash256> hashes;
  if (size_bytes == 0) {
    return hashes;
  }
  ChunkReader reader(path, chunk_size);
  for (uint64_t offset = 0; offset < size_bytes; offset += chunk_size) {
    uint32_t len =
        static_cast<uint32_t>(std::min<uint64_t>(chunk_size, size_bytes - offset));
    const auto &bytes = reader.Read(offset, len);
    hashes.push_back(ChunkHash(bytes.data(), len));
  }
  return hashes;
}

} // namespace manifest
} // namespace statesync
