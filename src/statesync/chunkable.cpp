// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "statesync/chunkable.hpp"
#include "manifest/manifest_hash.hpp"
#include "util/files.hpp"
#include "util/logging.hpp"
#include "util/strencodings.hpp"
#include <fstream>

namespace statesync {

namespace fs = std::filesystem;
using manifest::ChunkId;
using manifest::ChunkInfo;
using manifest::FileInfo;
using manifest::Manifest;

namespace {

// Chunk hashes still needed -> chunk_table indices carrying that hash
using NeededChunks = std::map<Hash256, std::vector<uint32_t>>;

NeededChunks IndexByHash(const Manifest &manifest,
                         const std::set<uint32_t> &missing) {
  NeededChunks needed;
  for (uint32_t index : missing) {
    needed[manifest.chunk_table[index].hash].push_back(index);
  }
  return needed;
}

/**
 * Copy chunks of a source manifest whose hashes are still needed. Source
 * bytes are re-hashed, so a damaged source never lands in the scratchpad.
 * Returns the number of target chunks filled.
 */
template <typename SkipFn, typename WriteFn>
uint64_t CopyMatchingChunks(const fs::path &source_root,
                            const Manifest &source, const Manifest &target,
                            NeededChunks &needed, std::set<uint32_t> &missing,
                            SkipFn skip, WriteFn write) {
  uint64_t copied = 0;
  for (size_t j = 0; j < source.chunk_table.size() && !needed.empty(); ++j) {
    const ChunkInfo &src = source.chunk_table[j];
    auto it = needed.find(src.hash);
    if (it == needed.end() || skip(j)) {
      continue;
    }
    auto bytes = util::read_range(
        source_root / source.file_table[src.file_index].relative_path,
        src.offset, src.size_bytes);
    if (!bytes || manifest::ChunkHash(bytes->data(), bytes->size()) != src.hash) {
      continue;
    }
    for (uint32_t index : it->second) {
      if (target.chunk_table[index].size_bytes != bytes->size()) {
        continue;
      }
      if (write(index, bytes->data())) {
        missing.erase(index);
        ++copied;
      }
    }
    needed.erase(it);
  }
  return copied;
}

// chunk_table indices of a file whose bytes differ from the manifest
std::vector<uint32_t> VerifyFile(const fs::path &path, const Manifest &manifest,
                                 size_t file_index, size_t begin, size_t end) {
  std::vector<uint32_t> bad;
  auto all_bad = [&]() {
    for (size_t i = begin; i < end; ++i) {
      bad.push_back(static_cast<uint32_t>(i));
    }
    return bad;
  };

  const FileInfo &file = manifest.file_table[file_index];
  std::error_code ec;
  uint64_t actual = fs::file_size(path, ec);
  if (ec) {
    if (!util::ensure_directory(path.parent_path()) ||
        !util::create_sized_file(path, file.size_bytes)) {
      LOG_SYNC_ERROR("Failed to recreate {}", path.string());
    }
    return all_bad();
  }
  if (actual != file.size_bytes) {
    fs::resize_file(path, file.size_bytes, ec);
    if (ec) {
      return all_bad();
    }
  }

  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return all_bad();
  }
  std::vector<uint8_t> buffer;
  for (size_t i = begin; i < end; ++i) {
    const ChunkInfo &chunk = manifest.chunk_table[i];
    buffer.resize(chunk.size_bytes);
    in.clear();
    in.seekg(static_cast<std::streamoff>(chunk.offset));
    in.read(reinterpret_cast<char *>(buffer.data()), chunk.size_bytes);
    if (!in || static_cast<uint64_t>(in.gcount()) != chunk.size_bytes ||
        manifest::ChunkHash(buffer.data(), buffer.size()) != chunk.hash) {
      bad.push_back(static_cast<uint32_t>(i));
    }
  }
  return bad;
}

} // namespace

AddChunkResult AddChunkResult::Completed(StateSyncMessage artifact) {
  AddChunkResult result(Result::COMPLETED);
  result.artifact_ = std::move(artifact);
  return result;
}

AddChunkResult AddChunkResult::Invalid(Code code, const std::string &reason) {
  AddChunkResult result(Result::INVALID);
  result.code_ = code;
  result.reason_ = reason;
  return result;
}

AddChunkResult AddChunkResult::Abandoned(Code code,
                                         const std::string &reason) {
  AddChunkResult result = Invalid(code, reason);
  result.fatal_ = true;
  return result;
}

const char *AddChunkCodeToString(AddChunkResult::Code code) {
  using Code = AddChunkResult::Code;
  switch (code) {
  case Code::NONE:
    return "none";
  case Code::CHUNK_HASH_MISMATCH:
    return "chunk-hash-mismatch";
  case Code::MANIFEST_HASH_MISMATCH:
    return "manifest-hash-mismatch";
  case Code::UNSUPPORTED_VERSION:
    return "unsupported-version";
  case Code::MALFORMED_MANIFEST:
    return "malformed-manifest";
  case Code::MANIFEST_NOT_RECEIVED:
    return "manifest-not-received";
  case Code::UNKNOWN_CHUNK:
    return "unknown-chunk";
  case Code::POST_ASSEMBLY_MISMATCH:
    return "post-assembly-mismatch";
  case Code::IO_ERROR:
    return "io-error";
  }
  return "unknown";
}

Chunkable::Chunkable(const StateSyncArtifactId &id, ChunkableContext context,
                     ActiveSyncRegistry::Guard guard)
    : id_(id), ctx_(std::move(context)), guard_(std::move(guard)),
      scratchpad_(ctx_.layout.ScratchpadPath(id.height)) {
  LOG_SYNC_DEBUG("Starting state sync at height {} (root {})", id_.height,
                 util::HexStr(id_.root_hash));
}

Chunkable::~Chunkable() {
  if (auto *complete = std::get_if<Complete>(&state_)) {
    ctx_.refs.cache->RegisterSuccessfulSync(complete->artifact.height);
  } else if (auto *loading = std::get_if<Loading>(&state_)) {
    std::set<uint32_t> missing = MissingChunks(*loading);
    LOG_SYNC_INFO("Aborting state sync at height {} with {} chunks missing",
                  id_.height, missing.size());
    if (!ctx_.refs.cache->Put(id_.height, loading->manifest, std::move(missing),
                              scratchpad_)) {
      util::remove_all(scratchpad_);
    }
  } else {
    util::remove_all(scratchpad_);
  }
  state_ = Blank{};
  UpdateOutstanding();
}

AddChunkResult Chunkable::AddChunk(ChunkId id,
                                   const std::vector<uint8_t> &bytes) {
  return AddChunk(id, bytes.data(), bytes.size());
}

AddChunkResult Chunkable::AddChunk(ChunkId id, const uint8_t *data,
                                   size_t len) {
  if (id == manifest::MANIFEST_CHUNK) {
    return AddManifestChunk(data, len);
  }

  if (std::holds_alternative<Complete>(state_)) {
    return AddChunkResult::Accepted();
  }
  auto *loading = std::get_if<Loading>(&state_);
  if (!loading) {
    return AddChunkResult::Invalid(AddChunkResult::Code::MANIFEST_NOT_RECEIVED,
                                   "chunk " + std::to_string(id) +
                                       " before manifest");
  }

  if (manifest::IsFileGroupChunk(id)) {
    if (loading->file_group->count(id) == 0) {
      return AddChunkResult::Invalid(AddChunkResult::Code::UNKNOWN_CHUNK,
                                     "unknown group chunk " +
                                         std::to_string(id));
    }
  } else if (manifest::ChunkIndexForId(id) >=
             loading->manifest->chunk_table.size()) {
    return AddChunkResult::Invalid(AddChunkResult::Code::UNKNOWN_CHUNK,
                                   "unknown chunk " + std::to_string(id));
  }

  if (loading->fetch_chunks.count(id) == 0) {
    return AddChunkResult::Accepted();
  }

  ctx_.metrics->chunks_received++;
  AddChunkResult result = manifest::IsFileGroupChunk(id)
                              ? AddGroupChunk(*loading, id, data, len)
                              : AddRegularChunk(*loading, id, data, len);
  if (!result.IsAccepted()) {
    return result;
  }
  return MaybeComplete();
}

AddChunkResult Chunkable::AddManifestChunk(const uint8_t *data, size_t len) {
  if (!std::holds_alternative<Blank>(state_)) {
    return AddChunkResult::Accepted();
  }

  Manifest decoded;
  std::string error;
  switch (manifest::DecodeManifest(data, len, decoded, error)) {
  case manifest::DecodeStatus::OK:
    break;
  case manifest::DecodeStatus::UNSUPPORTED_VERSION:
    LOG_SYNC_WARN("Manifest for height {}: {}", id_.height, error);
    return AddChunkResult::Invalid(AddChunkResult::Code::UNSUPPORTED_VERSION,
                                   error);
  case manifest::DecodeStatus::MALFORMED:
    LOG_SYNC_WARN("Malformed manifest for height {}: {}", id_.height, error);
    return AddChunkResult::Invalid(AddChunkResult::Code::MALFORMED_MANIFEST,
                                   error);
  }

  if (!manifest::ValidateManifest(decoded, id_.root_hash, error)) {
    LOG_SYNC_WARN("Rejecting manifest for height {}: {}", id_.height, error);
    return AddChunkResult::Invalid(AddChunkResult::Code::MANIFEST_HASH_MISMATCH,
                                   error);
  }

  auto manifest = std::make_shared<const Manifest>(std::move(decoded));
  auto groups = std::make_shared<const manifest::FileGroupChunks>(
      manifest::ComputeFileGroups(*manifest));

  std::set<uint32_t> missing;
  if (!PrepareScratchpad(*manifest, missing)) {
    util::remove_all(scratchpad_);
    return AddChunkResult::Invalid(AddChunkResult::Code::IO_ERROR,
                                   "failed to prepare " + scratchpad_.string());
  }

  Loading loading;
  loading.manifest = manifest;
  loading.file_group = groups;
  loading.group_of = manifest::InvertFileGroups(*groups);
  loading.fetch_chunks = ToFetchSet(loading, missing);

  LOG_SYNC_INFO("State sync at height {}: {} files, {} chunks ({} groups), "
                "{} to fetch of {}",
                id_.height, manifest->file_table.size(),
                manifest->chunk_table.size(), groups->size(),
                loading.fetch_chunks.size(),
                util::FormatBytes(manifest->TotalBytes()));

  state_ = std::move(loading);
  return MaybeComplete();
}

AddChunkResult Chunkable::AddRegularChunk(Loading &loading, ChunkId id,
                                          const uint8_t *data, size_t len) {
  const uint32_t index = static_cast<uint32_t>(manifest::ChunkIndexForId(id));
  const ChunkInfo &chunk = loading.manifest->chunk_table[index];

  if (len != chunk.size_bytes || manifest::ChunkHash(data, len) != chunk.hash) {
    ctx_.metrics->corrupted_chunks++;
    LOG_SYNC_WARN("Chunk {} at height {} does not match the manifest", id,
                  id_.height);
    return AddChunkResult::Invalid(AddChunkResult::Code::CHUNK_HASH_MISMATCH,
                                   "chunk " + std::to_string(id) +
                                       " hash mismatch");
  }

  if (!WriteChunk(*loading.manifest, index, data)) {
    return AddChunkResult::Invalid(AddChunkResult::Code::IO_ERROR,
                                   "failed to write chunk " +
                                       std::to_string(id));
  }
  loading.fetch_chunks.erase(id);
  UpdateOutstanding();
  return AddChunkResult::Accepted();
}

AddChunkResult Chunkable::AddGroupChunk(Loading &loading, ChunkId id,
                                        const uint8_t *data, size_t len) {
  const auto &members = loading.file_group->at(id);
  const auto &chunks = loading.manifest->chunk_table;

  uint64_t expected = 0;
  for (uint32_t index : members) {
    expected += chunks[index].size_bytes;
  }
  if (len != expected) {
    ctx_.metrics->corrupted_chunks++;
    LOG_SYNC_WARN("Group chunk {} at height {} has {} bytes, expected {}", id,
                  id_.height, len, expected);
    return AddChunkResult::Invalid(AddChunkResult::Code::CHUNK_HASH_MISMATCH,
                                   "group chunk " + std::to_string(id) +
                                       " size mismatch");
  }

  // Verify every piece before writing any
  size_t offset = 0;
  for (uint32_t index : members) {
    if (manifest::ChunkHash(data + offset, chunks[index].size_bytes) !=
        chunks[index].hash) {
      ctx_.metrics->corrupted_chunks++;
      LOG_SYNC_WARN("Group chunk {} at height {}: piece {} does not match the "
                    "manifest",
                    id, id_.height, index);
      return AddChunkResult::Invalid(AddChunkResult::Code::CHUNK_HASH_MISMATCH,
                                     "group chunk " + std::to_string(id) +
                                         " hash mismatch");
    }
    offset += chunks[index].size_bytes;
  }

  offset = 0;
  for (uint32_t index : members) {
    if (!WriteChunk(*loading.manifest, index, data + offset)) {
      return AddChunkResult::Invalid(AddChunkResult::Code::IO_ERROR,
                                     "failed to write group chunk " +
                                         std::to_string(id));
    }
    offset += chunks[index].size_bytes;
  }
  loading.fetch_chunks.erase(id);
  UpdateOutstanding();
  return AddChunkResult::Accepted();
}

bool Chunkable::PrepareScratchpad(const Manifest &manifest,
                                  std::set<uint32_t> &missing) {
  if (!util::remove_all(scratchpad_)) {
    return false;
  }

  if (auto taken = ctx_.refs.cache->Take(manifest, scratchpad_)) {
    for (uint32_t index : taken->missing_chunks) {
      if (index < manifest.chunk_table.size()) {
        missing.insert(index);
      }
    }
    ctx_.metrics->chunks_copied_from_cache +=
        manifest.chunk_table.size() - missing.size();
    LOG_SYNC_DEBUG("Resuming cached sync from height {}: {} of {} chunks "
                   "missing",
                   taken->height, missing.size(), manifest.chunk_table.size());
  } else {
    if (!CreateScratchpad(manifest)) {
      return false;
    }
    for (uint32_t i = 0; i < manifest.chunk_table.size(); ++i) {
      missing.insert(i);
    }
    SalvageFromCache(manifest, missing);
  }

  SalvageFromCheckpoint(manifest, missing);
  return true;
}

bool Chunkable::CreateScratchpad(const Manifest &manifest) {
  if (!util::ensure_directory(scratchpad_)) {
    return false;
  }
  for (const auto &file : manifest.file_table) {
    const fs::path path = scratchpad_ / file.relative_path;
    if (!util::ensure_directory(path.parent_path()) ||
        !util::create_sized_file(path, file.size_bytes)) {
      LOG_SYNC_ERROR("Failed to create {}", path.string());
      return false;
    }
  }
  return true;
}

void Chunkable::SalvageFromCache(const Manifest &manifest,
                                 std::set<uint32_t> &missing) {
  auto entry = ctx_.refs.cache->Get();
  if (!entry || !entry->manifest || missing.empty()) {
    return;
  }

  NeededChunks needed = IndexByHash(manifest, missing);
  uint64_t copied = CopyMatchingChunks(
      entry->path, *entry->manifest, manifest, needed, missing,
      [&](size_t j) {
        return entry->missing_chunks.count(static_cast<uint32_t>(j)) != 0;
      },
      [&](uint32_t index, const uint8_t *data) {
        return WriteChunk(manifest, index, data);
      });

  ctx_.metrics->chunks_copied_from_cache += copied;
  LOG_SYNC_DEBUG("Copied {} chunks from cached sync at height {}", copied,
                 entry->height);
}

void Chunkable::SalvageFromCheckpoint(const Manifest &manifest,
                                      std::set<uint32_t> &missing) {
  if (!ctx_.latest_checkpoint || !ctx_.latest_checkpoint->manifest ||
      missing.empty()) {
    return;
  }
  const LocalCheckpoint &local = *ctx_.latest_checkpoint;
  const Manifest &source = *local.manifest;

  // Whole files with identical content
  std::map<Hash256, size_t> local_files;
  for (size_t f = 0; f < source.file_table.size(); ++f) {
    local_files.emplace(source.file_table[f].hash, f);
  }
  const auto ranges = manifest.FileChunkRanges();
  uint64_t files_copied = 0;
  uint64_t chunks_copied = 0;
  for (size_t f = 0; f < manifest.file_table.size(); ++f) {
    const FileInfo &file = manifest.file_table[f];
    auto [begin, end] = ranges[f];
    if (begin == end || missing.lower_bound(static_cast<uint32_t>(begin)) ==
                            missing.lower_bound(static_cast<uint32_t>(end))) {
      continue;
    }
    auto it = local_files.find(file.hash);
    if (it == local_files.end() ||
        source.file_table[it->second].size_bytes != file.size_bytes) {
      continue;
    }
    std::error_code ec;
    fs::copy_file(local.path / source.file_table[it->second].relative_path,
                  scratchpad_ / file.relative_path,
                  fs::copy_options::overwrite_existing, ec);
    if (ec) {
      LOG_SYNC_DEBUG("Failed to copy {} from checkpoint {}: {}",
                     file.relative_path, local.height, ec.message());
      continue;
    }
    for (size_t i = begin; i < end; ++i) {
      chunks_copied += missing.erase(static_cast<uint32_t>(i));
    }
    ++files_copied;
  }

  // Individual chunks
  NeededChunks needed = IndexByHash(manifest, missing);
  chunks_copied += CopyMatchingChunks(
      local.path, source, manifest, needed, missing,
      [](size_t) { return false; },
      [&](uint32_t index, const uint8_t *data) {
        return WriteChunk(manifest, index, data);
      });

  ctx_.metrics->files_copied_from_checkpoint += files_copied;
  ctx_.metrics->chunks_copied_from_checkpoint += chunks_copied;
  LOG_SYNC_DEBUG("Copied {} files and {} chunks in total from checkpoint {}",
                 files_copied, chunks_copied, local.height);
}

bool Chunkable::WriteChunk(const Manifest &manifest, uint32_t index,
                           const uint8_t *data) {
  const ChunkInfo &chunk = manifest.chunk_table[index];
  const fs::path path =
      scratchpad_ / manifest.file_table[chunk.file_index].relative_path;
  if (!util::write_at(path, chunk.offset, data, chunk.size_bytes)) {
    LOG_SYNC_ERROR("Failed to write chunk {} to {}", index, path.string());
    return false;
  }
  return true;
}

AddChunkResult Chunkable::MaybeComplete() {
  auto *loading = std::get_if<Loading>(&state_);
  if (!loading) {
    return AddChunkResult::Accepted();
  }
  UpdateOutstanding();
  if (!loading->fetch_chunks.empty()) {
    return AddChunkResult::Accepted();
  }
  return FinishAssembly(*loading);
}

AddChunkResult Chunkable::FinishAssembly(Loading &loading) {
  const Manifest &manifest = *loading.manifest;
  const auto ranges = manifest.FileChunkRanges();

  std::vector<std::future<std::vector<uint32_t>>> futures;
  futures.reserve(manifest.file_table.size());
  for (size_t f = 0; f < manifest.file_table.size(); ++f) {
    futures.push_back(ctx_.pool->enqueue(
        VerifyFile, scratchpad_ / manifest.file_table[f].relative_path,
        std::cref(manifest), f, ranges[f].first, ranges[f].second));
  }

  std::vector<std::vector<uint32_t>> per_file;
  try {
    per_file = util::JoinAll(futures);
  } catch (const std::exception &e) {
    LOG_SYNC_ERROR("Verification of {} failed: {}", scratchpad_.string(),
                   e.what());
    return Abandon(AddChunkResult::Code::IO_ERROR, e.what());
  }

  std::set<uint32_t> bad;
  for (const auto &indices : per_file) {
    bad.insert(indices.begin(), indices.end());
  }
  if (bad.empty()) {
    return Promote(loading);
  }

  if (!retried_) {
    retried_ = true;
    ctx_.metrics->post_assembly_retries++;
    loading.fetch_chunks = ToFetchSet(loading, bad);
    UpdateOutstanding();
    LOG_SYNC_WARN("Assembled state at height {} differs from its manifest in "
                  "{} chunks, fetching them again",
                  id_.height, bad.size());
    return AddChunkResult::Accepted();
  }

  LOG_SYNC_ERROR("Assembled state at height {} still differs from its "
                 "manifest in {} chunks, giving up",
                 id_.height, bad.size());
  return Abandon(AddChunkResult::Code::POST_ASSEMBLY_MISMATCH,
                 std::to_string(bad.size()) + " chunks differ after retry");
}

AddChunkResult Chunkable::Abandon(AddChunkResult::Code code,
                                  const std::string &reason) {
  ctx_.metrics->syncs_failed++;
  LOG_SYNC_WARN("Abandoning state sync at height {}: {}", id_.height, reason);
  util::remove_all(scratchpad_);
  state_ = Blank{};
  retried_ = false;
  UpdateOutstanding();
  return AddChunkResult::Abandoned(code, reason);
}

AddChunkResult Chunkable::Promote(Loading &loading) {
  const fs::path target = ctx_.layout.CheckpointPath(id_.height);
  std::error_code ec;
  if (fs::exists(target, ec)) {
    LOG_SYNC_INFO("Checkpoint at height {} already exists, reusing it",
                  id_.height);
    util::remove_all(scratchpad_);
  } else {
    if (!util::ensure_directory(ctx_.layout.checkpoints_dir())) {
      return Abandon(AddChunkResult::Code::IO_ERROR,
                     "cannot create checkpoints directory");
    }
    fs::rename(scratchpad_, target, ec);
    if (ec) {
      LOG_SYNC_ERROR("Failed to promote {} to {}: {}", scratchpad_.string(),
                     target.string(), ec.message());
      return Abandon(AddChunkResult::Code::IO_ERROR, ec.message());
    }
    util::sync_directory(ctx_.layout.checkpoints_dir());
  }

  StateSyncMessage artifact;
  artifact.height = id_.height;
  artifact.root_hash = id_.root_hash;
  artifact.checkpoint_root = target;
  artifact.manifest = loading.manifest;
  artifact.file_group = loading.file_group;

  state_ = Complete{artifact};
  ctx_.metrics->syncs_completed++;
  UpdateOutstanding();
  LOG_SYNC_INFO("State sync at height {} complete", id_.height);
  return AddChunkResult::Completed(std::move(artifact));
}

std::set<ChunkId>
Chunkable::ToFetchSet(const Loading &loading,
                      const std::set<uint32_t> &missing) const {
  std::set<ChunkId> fetch;
  for (uint32_t index : missing) {
    auto it = loading.group_of.find(index);
    fetch.insert(it != loading.group_of.end() ? it->second
                                              : manifest::ChunkIdForIndex(index));
  }
  return fetch;
}

std::set<uint32_t> Chunkable::MissingChunks(const Loading &loading) const {
  std::set<uint32_t> missing;
  for (ChunkId id : loading.fetch_chunks) {
    if (manifest::IsFileGroupChunk(id)) {
      const auto &members = loading.file_group->at(id);
      missing.insert(members.begin(), members.end());
    } else {
      missing.insert(static_cast<uint32_t>(manifest::ChunkIndexForId(id)));
    }
  }
  return missing;
}

std::vector<ChunkId> Chunkable::ChunksToDownload() const {
  if (std::holds_alternative<Blank>(state_)) {
    return {manifest::MANIFEST_CHUNK};
  }
  if (auto *loading = std::get_if<Loading>(&state_)) {
    return std::vector<ChunkId>(loading->fetch_chunks.begin(),
                                loading->fetch_chunks.end());
  }
  return {};
}

void Chunkable::UpdateOutstanding() {
  uint64_t now = 0;
  if (auto *loading = std::get_if<Loading>(&state_)) {
    now = loading->fetch_chunks.size();
  }
  if (now >= outstanding_reported_) {
    ctx_.metrics->chunks_outstanding += now - outstanding_reported_;
  } else {
    ctx_.metrics->chunks_outstanding -= outstanding_reported_ - now;
  }
  outstanding_reported_ = now;
}

} // namespace statesync
