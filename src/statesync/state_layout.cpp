// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "statesync/state_layout.hpp"
#include "util/files.hpp"
#include "util/logging.hpp"
#include <algorithm>
#include <fmt/format.h>

namespace statesync {

namespace fs = std::filesystem;

namespace {

constexpr const char *kScratchpadPrefix = "state_sync_scratchpad_";
constexpr const char *kCachePrefix = "state_sync_cache_";

} // namespace

StateLayout::StateLayout(fs::path root) : root_(std::move(root)) {}

bool StateLayout::Initialize() const {
  if (!util::ensure_directory(checkpoints_dir())) {
    return false;
  }
  if (!util::remove_all(tmp_dir())) {
    return false;
  }
  return util::ensure_directory(tmp_dir());
}

fs::path StateLayout::checkpoints_dir() const { return root_ / "checkpoints"; }

fs::path StateLayout::tmp_dir() const { return root_ / "tmp"; }

fs::path StateLayout::CheckpointPath(Height height) const {
  return checkpoints_dir() / HeightDirName(height);
}

fs::path StateLayout::ScratchpadPath(Height height) const {
  return tmp_dir() / (kScratchpadPrefix + HeightDirName(height));
}

fs::path StateLayout::CacheDir(Height height) const {
  return tmp_dir() / (kCachePrefix + HeightDirName(height));
}

std::vector<Height> StateLayout::CheckpointHeights() const {
  std::vector<Height> heights;
  std::error_code ec;
  for (fs::directory_iterator it(checkpoints_dir(), ec), end; !ec && it != end;
       it.increment(ec)) {
    if (!it->is_directory(ec)) {
      continue;
    }
    const std::string name = it->path().filename().string();
    if (name.size() != 16 ||
        name.find_first_not_of("0123456789abcdef") != std::string::npos) {
      LOG_WARN("Ignoring unexpected entry in {}: {}",
               checkpoints_dir().string(), name);
      continue;
    }
    heights.push_back(std::stoull(name, nullptr, 16));
  }
  if (ec) {
    LOG_ERROR("Failed to list {}: {}", checkpoints_dir().string(),
              ec.message());
  }
  std::sort(heights.begin(), heights.end());
  return heights;
}

std::string StateLayout::HeightDirName(Height height) {
  return fmt::format("{:016x}", height);
}

} // namespace statesync
