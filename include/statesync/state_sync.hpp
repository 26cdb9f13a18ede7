// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#ifndef STATESYNC_STATESYNC_STATE_SYNC_HPP
#define STATESYNC_STATESYNC_STATE_SYNC_HPP

/*
 * StateSync - entry point for the state manager and the transport
 *
 * Consumer side:
 *   FetchState(height, root)      certified target to download
 *   GetPriorityFunction()         classify adverts (Fetch / Stash / Drop)
 *   CreateChunkable(id)           start a download (one per height)
 *   DeliverStateSync(msg)         register a completed download
 *
 * Producer side:
 *   CommitCheckpoint(height, ...) compute and register a local checkpoint
 *   GetValidatedByIdentifier(id)  look up a local checkpoint by (height, root)
 *   GetChunk(id, chunk)           serve chunk bytes
 *
 * Owns the hashing pool, the cache and the active-sync registry. All public
 * methods are thread-safe; Chunkables it returns are driven by one caller.
 */

#include "manifest/manifest_builder.hpp"
#include "statesync/active_syncs.hpp"
#include "statesync/chunkable.hpp"
#include "statesync/config.hpp"
#include "statesync/metrics.hpp"
#include "statesync/state_layout.hpp"
#include "statesync/state_sync_cache.hpp"
#include "statesync/types.hpp"
#include "util/threadpool.hpp"
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace statesync {

class StateSync {
public:
  using PriorityFn = std::function<Priority(const StateSyncArtifactId &)>;

  explicit StateSync(const StateSyncConfig &config);
  ~StateSync();

  StateSync(const StateSync &) = delete;
  StateSync &operator=(const StateSync &) = delete;

  /**
   * Prepare the layout and register the checkpoints already on disk
   * (their manifests are recomputed). Returns false on I/O failure.
   */
  bool Initialize();

  // Consumer side

  void FetchState(Height height, const Hash256 &root_hash);

  // Snapshot of the current target and latest local height
  PriorityFn GetPriorityFunction() const;

  /**
   * Start downloading `id`. Returns nullptr if a sync at that height is
   * already active or the checkpoint exists locally.
   */
  std::unique_ptr<Chunkable> CreateChunkable(const StateSyncArtifactId &id);

  /**
   * Register the artifact of a completed Chunkable as a local checkpoint.
   * Clears the fetch target once it is reached.
   */
  bool DeliverStateSync(const StateSyncMessage &msg);

  // Producer side

  /**
   * Compute the manifest of checkpoints/<height> and register it. With
   * `dirty_chunks` the manifest of the latest lower checkpoint is reused for
   * clean chunks. Returns std::nullopt if the checkpoint cannot be read.
   */
  std::optional<StateSyncMessage>
  CommitCheckpoint(Height height,
                   const std::optional<manifest::DirtyChunks> &dirty_chunks =
                       std::nullopt);

  std::optional<StateSyncMessage>
  GetValidatedByIdentifier(const StateSyncArtifactId &id) const;

  std::optional<std::vector<uint8_t>> GetChunk(const StateSyncArtifactId &id,
                                               manifest::ChunkId chunk) const;

  // Queries

  std::optional<StateSyncArtifactId> desired_state() const;
  std::optional<Height> LatestCheckpointHeight() const;
  std::vector<StateSyncArtifactId> ListCheckpoints() const;

  const StateSyncConfig &config() const { return config_; }
  const StateLayout &layout() const { return layout_; }
  std::shared_ptr<StateSyncCache> cache() const { return refs_.cache; }
  const ActiveSyncRegistry &active_syncs() const { return *refs_.active; }
  const StateSyncMetrics &metrics() const { return *metrics_; }

private:
  // Caller holds mutex_
  std::optional<LocalCheckpoint> LatestCheckpointLocked() const;

  const StateSyncConfig config_;
  const StateLayout layout_;
  std::shared_ptr<util::ThreadPool> pool_;
  std::shared_ptr<StateSyncMetrics> metrics_;
  StateSyncRefs refs_;

  mutable std::mutex mutex_;
  std::optional<StateSyncArtifactId> desired_;
  std::map<Height, StateSyncMessage> checkpoints_;
};

} // namespace statesync

#endif // STATESYNC_STATESYNC_STATE_SYNC_HPP
