// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "statesync/state_sync.hpp"
#include "manifest/manifest_hash.hpp"
#include "statesync/chunk_source.hpp"
#include "statesync/priority.hpp"
#include "util/logging.hpp"
#include "util/strencodings.hpp"

namespace statesync {

StateSync::StateSync(const StateSyncConfig &config)
    : config_(config), layout_(config.root),
      pool_(std::make_shared<util::ThreadPool>(config.hashing_threads)),
      metrics_(std::make_shared<StateSyncMetrics>()) {
  refs_.active = std::make_shared<ActiveSyncRegistry>();
  refs_.cache = std::make_shared<StateSyncCache>(layout_);
}

StateSync::~StateSync() = default;

bool StateSync::Initialize() {
  std::string error;
  if (!config_.Validate(error)) {
    LOG_SYNC_ERROR("Invalid state sync config: {}", error);
    return false;
  }
  if (!layout_.Initialize()) {
    LOG_SYNC_ERROR("Failed to initialize state layout at {}",
                   layout_.root().string());
    return false;
  }

  for (Height height : layout_.CheckpointHeights()) {
    if (!CommitCheckpoint(height)) {
      return false;
    }
  }
  LOG_SYNC_INFO("State sync initialized at {} with {} checkpoints",
                layout_.root().string(), ListCheckpoints().size());
  return true;
}

void StateSync::FetchState(Height height, const Hash256 &root_hash) {
  std::lock_guard<std::mutex> lock(mutex_);
  LOG_SYNC_INFO("Fetching state at height {} (root {})", height,
                util::HexStr(root_hash));
  desired_ = StateSyncArtifactId{height, root_hash};
}

StateSync::PriorityFn StateSync::GetPriorityFunction() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::optional<StateSyncArtifactId> desired = desired_;
  Height latest = checkpoints_.empty() ? 0 : checkpoints_.rbegin()->first;
  return [desired, latest](const StateSyncArtifactId &id) {
    return ComputePriority(desired, latest, id);
  };
}

std::unique_ptr<Chunkable>
StateSync::CreateChunkable(const StateSyncArtifactId &id) {
  ChunkableContext context{layout_, refs_, pool_, metrics_, std::nullopt};
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (checkpoints_.count(id.height) != 0) {
      LOG_SYNC_DEBUG("Not syncing height {}: checkpoint exists", id.height);
      return nullptr;
    }
    context.latest_checkpoint = LatestCheckpointLocked();
  }

  auto guard = refs_.active->TryRegister(id.height);
  if (!guard) {
    LOG_SYNC_DEBUG("Not syncing height {}: sync already active", id.height);
    return nullptr;
  }
  return std::make_unique<Chunkable>(id, std::move(context),
                                     std::move(*guard));
}

bool StateSync::DeliverStateSync(const StateSyncMessage &msg) {
  if (!msg.manifest) {
    return false;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  checkpoints_[msg.height] = msg;
  if (desired_ && desired_->height <= msg.height) {
    desired_.reset();
  }
  LOG_SYNC_INFO("Delivered synced state at height {}", msg.height);
  return true;
}

std::optional<StateSyncMessage>
StateSync::CommitCheckpoint(Height height,
                            const std::optional<manifest::DirtyChunks> &dirty_chunks) {
  std::optional<manifest::ManifestDelta> delta;
  if (dirty_chunks) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = checkpoints_.lower_bound(height);
    if (it != checkpoints_.begin()) {
      --it;
      delta = manifest::ManifestDelta{it->second.manifest, it->first, height,
                                      *dirty_chunks};
    }
  }

  std::shared_ptr<const manifest::Manifest> computed;
  try {
    computed = std::make_shared<const manifest::Manifest>(
        manifest::ComputeManifest(*pool_, metrics_->manifest,
                                  config_.manifest_version,
                                  layout_.CheckpointPath(height),
                                  config_.chunk_size, delta));
  } catch (const std::exception &e) {
    LOG_SYNC_ERROR("Failed to compute manifest at height {}: {}", height,
                   e.what());
    return std::nullopt;
  }

  StateSyncMessage msg;
  msg.height = height;
  msg.root_hash = manifest::ManifestRootHash(*computed);
  msg.checkpoint_root = layout_.CheckpointPath(height);
  msg.manifest = computed;
  msg.file_group = std::make_shared<const manifest::FileGroupChunks>(
      manifest::ComputeFileGroups(*computed));

  std::lock_guard<std::mutex> lock(mutex_);
  checkpoints_[height] = msg;
  LOG_SYNC_DEBUG("Committed checkpoint at height {} (root {})", height,
                 util::HexStr(msg.root_hash));
  return msg;
}

std::optional<StateSyncMessage>
StateSync::GetValidatedByIdentifier(const StateSyncArtifactId &id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = checkpoints_.find(id.height);
  if (it == checkpoints_.end() || it->second.root_hash != id.root_hash) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<std::vector<uint8_t>>
StateSync::GetChunk(const StateSyncArtifactId &id,
                    manifest::ChunkId chunk) const {
  auto msg = GetValidatedByIdentifier(id);
  if (!msg) {
    return std::nullopt;
  }
  return statesync::GetChunk(*msg, chunk);
}

std::optional<StateSyncArtifactId> StateSync::desired_state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return desired_;
}

std::optional<Height> StateSync::LatestCheckpointHeight() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (checkpoints_.empty()) {
    return std::nullopt;
  }
  return checkpoints_.rbegin()->first;
}

std::vector<StateSyncArtifactId> StateSync::ListCheckpoints() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<StateSyncArtifactId> ids;
  for (const auto &[height, msg] : checkpoints_) {
    ids.push_back(msg.id());
  }
  return ids;
}

std::optional<LocalCheckpoint> StateSync::LatestCheckpointLocked() const {
  if (checkpoints_.empty()) {
    return std::nullopt;
  }
  const StateSyncMessage &msg = checkpoints_.rbegin()->second;
  return LocalCheckpoint{msg.height, msg.checkpoint_root, msg.manifest};
}

} // namespace statesync
