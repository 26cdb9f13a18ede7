// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#ifndef STATESYNC_STATESYNC_CHUNKABLE_HPP
#define STATESYNC_STATESYNC_CHUNKABLE_HPP

/*
 * Chunkable - assembly of one state at (height, root_hash) from chunks
 *
 * State machine:
 *   Blank    no manifest yet; only chunk 0 is wanted
 *   Loading  manifest validated, scratchpad laid out, fetch set outstanding
 *   Complete scratchpad validated and promoted to checkpoints/<height>
 *
 * - Chunk 0 must come first; other chunks may arrive in any order, and
 *   chunks that are not outstanding are accepted as no-ops.
 * - On receipt of the manifest, data is salvaged from the cache entry of an
 *   earlier attempt and from the latest local checkpoint before anything is
 *   requested. If nothing remains, the download completes immediately.
 * - Every received chunk is verified against its manifest hash before it is
 *   written. A corrupt chunk is rejected and stays outstanding.
 * - Once nothing is outstanding the whole scratchpad is re-hashed. Chunks
 *   that do not match are fetched again, once; a second mismatch aborts the
 *   attempt (scratchpad deleted, state back to Blank). So does an I/O
 *   failure while verifying or promoting. A failed chunk write only leaves
 *   that chunk outstanding.
 * - On destruction a loading download is offered to the cache, a complete
 *   one clears older cache entries.
 *
 * Not thread-safe: one Chunkable is driven by one caller.
 */

#include "manifest/file_groups.hpp"
#include "manifest/manifest.hpp"
#include "statesync/active_syncs.hpp"
#include "statesync/metrics.hpp"
#include "statesync/state_layout.hpp"
#include "statesync/types.hpp"
#include "util/threadpool.hpp"
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>

namespace statesync {

/**
 * Outcome of Chunkable::AddChunk
 * Modelled on a validation state: either accepted, completed with the
 * resulting artifact, or invalid with a code and reason.
 */
class AddChunkResult {
public:
  enum class Result {
    ACCEPTED,
    COMPLETED,
    INVALID,
  };

  enum class Code {
    NONE,
    CHUNK_HASH_MISMATCH,    // chunk bytes do not match the manifest
    MANIFEST_HASH_MISMATCH, // manifest does not match the root hash
    UNSUPPORTED_VERSION,
    MALFORMED_MANIFEST,
    MANIFEST_NOT_RECEIVED, // chunk before chunk 0
    UNKNOWN_CHUNK,
    POST_ASSEMBLY_MISMATCH, // assembled state still wrong after a retry
    IO_ERROR,
  };

  static AddChunkResult Accepted() { return AddChunkResult(Result::ACCEPTED); }
  static AddChunkResult Completed(StateSyncMessage artifact);
  static AddChunkResult Invalid(Code code, const std::string &reason);
  // Invalid, and the scratchpad is gone; the next useful chunk is chunk 0
  static AddChunkResult Abandoned(Code code, const std::string &reason);

  bool IsAccepted() const { return result_ == Result::ACCEPTED; }
  bool IsCompleted() const { return result_ == Result::COMPLETED; }
  bool IsInvalid() const { return result_ == Result::INVALID; }

  // The attempt was abandoned; further chunks are pointless until a new
  // manifest is supplied
  bool IsFatal() const { return fatal_; }

  Code GetCode() const { return code_; }
  const std::string &GetRejectReason() const { return reason_; }
  const std::optional<StateSyncMessage> &GetArtifact() const {
    return artifact_;
  }

private:
  explicit AddChunkResult(Result result) : result_(result) {}

  Result result_;
  Code code_{Code::NONE};
  bool fatal_{false};
  std::string reason_;
  std::optional<StateSyncMessage> artifact_;
};

const char *AddChunkCodeToString(AddChunkResult::Code code);

// A local checkpoint usable as a salvage source
struct LocalCheckpoint {
  Height height{0};
  std::filesystem::path path;
  std::shared_ptr<const manifest::Manifest> manifest;
};

struct ChunkableContext {
  StateLayout layout;
  StateSyncRefs refs;
  std::shared_ptr<util::ThreadPool> pool;
  std::shared_ptr<StateSyncMetrics> metrics;
  std::optional<LocalCheckpoint> latest_checkpoint;
};

class Chunkable {
public:
  struct Blank {};

  struct Loading {
    std::shared_ptr<const manifest::Manifest> manifest;
    std::shared_ptr<const manifest::FileGroupChunks> file_group;
    std::map<uint32_t, manifest::ChunkId> group_of; // chunk index -> group
    std::set<manifest::ChunkId> fetch_chunks;
  };

  struct Complete {
    StateSyncMessage artifact;
  };

  using DownloadState = std::variant<Blank, Loading, Complete>;

  Chunkable(const StateSyncArtifactId &id, ChunkableContext context,
            ActiveSyncRegistry::Guard guard);
  ~Chunkable();

  Chunkable(const Chunkable &) = delete;
  Chunkable &operator=(const Chunkable &) = delete;

  AddChunkResult AddChunk(manifest::ChunkId id,
                          const std::vector<uint8_t> &bytes);
  AddChunkResult AddChunk(manifest::ChunkId id, const uint8_t *data,
                          size_t len);

  // Outstanding chunk ids, ascending; {MANIFEST_CHUNK} while Blank
  std::vector<manifest::ChunkId> ChunksToDownload() const;

  const StateSyncArtifactId &id() const { return id_; }
  const std::filesystem::path &scratchpad() const { return scratchpad_; }
  const DownloadState &state() const { return state_; }
  bool IsComplete() const { return std::holds_alternative<Complete>(state_); }

private:
  AddChunkResult AddManifestChunk(const uint8_t *data, size_t len);
  AddChunkResult AddRegularChunk(Loading &loading, manifest::ChunkId id,
                                 const uint8_t *data, size_t len);
  AddChunkResult AddGroupChunk(Loading &loading, manifest::ChunkId id,
                               const uint8_t *data, size_t len);

  // Lay out the scratchpad and salvage; `missing` receives the chunk
  // indices still needed
  bool PrepareScratchpad(const manifest::Manifest &manifest,
                         std::set<uint32_t> &missing);
  bool CreateScratchpad(const manifest::Manifest &manifest);
  void SalvageFromCache(const manifest::Manifest &manifest,
                        std::set<uint32_t> &missing);
  void SalvageFromCheckpoint(const manifest::Manifest &manifest,
                             std::set<uint32_t> &missing);

  bool WriteChunk(const manifest::Manifest &manifest, uint32_t index,
                  const uint8_t *data);

  AddChunkResult MaybeComplete();
  AddChunkResult FinishAssembly(Loading &loading);
  AddChunkResult Promote(Loading &loading);
  // Drop the scratchpad and return to Blank
  AddChunkResult Abandon(AddChunkResult::Code code, const std::string &reason);

  std::set<manifest::ChunkId> ToFetchSet(const Loading &loading,
                                         const std::set<uint32_t> &missing) const;
  std::set<uint32_t> MissingChunks(const Loading &loading) const;
  void UpdateOutstanding();

  const StateSyncArtifactId id_;
  ChunkableContext ctx_;
  ActiveSyncRegistry::Guard guard_;
  const std::filesystem::path scratchpad_;
  DownloadState state_{Blank{}};
  bool retried_{false};
  uint64_t outstanding_reported_{0};
};

} // namespace statesync

#endif // STATESYNC_STATESYNC_CHUNKABLE_HPP
