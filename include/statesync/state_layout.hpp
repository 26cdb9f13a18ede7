// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#ifndef STATESYNC_STATESYNC_STATE_LAYOUT_HPP
#define STATESYNC_STATESYNC_STATE_LAYOUT_HPP

#include "manifest/manifest.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace statesync {

/**
 * StateLayout - on-disk layout below a state root
 *
 *   <root>/checkpoints/<height>               complete checkpoints
 *   <root>/tmp/state_sync_scratchpad_<height> assembly in progress
 *   <root>/tmp/state_sync_cache_<height>      salvaged partial download
 *
 * Heights are rendered as 16 lower-case hex digits so that directory
 * order matches height order. Everything below tmp/ is discarded on
 * Initialize(), since cache entries do not survive a restart.
 */
class StateLayout {
public:
  explicit StateLayout(std::filesystem::path root);

  // Create checkpoints/ and tmp/, wiping the contents of tmp/
  bool Initialize() const;

  const std::filesystem::path &root() const { return root_; }
  std::filesystem::path checkpoints_dir() const;
  std::filesystem::path tmp_dir() const;

  std::filesystem::path CheckpointPath(Height height) const;
  std::filesystem::path ScratchpadPath(Height height) const;
  std::filesystem::path CacheDir(Height height) const;

  // Heights of all checkpoint directories, ascending
  std::vector<Height> CheckpointHeights() const;

  static std::string HeightDirName(Height height);

private:
  std::filesystem::path root_;
};

} // namespace statesync

#endif // STATESYNC_STATESYNC_STATE_LAYOUT_HPP
