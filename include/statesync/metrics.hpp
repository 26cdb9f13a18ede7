// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#ifndef STATESYNC_STATESYNC_METRICS_HPP
#define STATESYNC_STATESYNC_METRICS_HPP

#include "manifest/manifest_builder.hpp"
#include <atomic>
#include <cstdint>

namespace statesync {

// Counters shared by the facade, every Chunkable and the manifest builder
struct StateSyncMetrics {
  manifest::ManifestMetrics manifest;

  std::atomic<uint64_t> chunks_outstanding{0}; // gauge, summed over syncs
  std::atomic<uint64_t> chunks_received{0};
  std::atomic<uint64_t> corrupted_chunks{0};
  std::atomic<uint64_t> chunks_copied_from_cache{0};
  std::atomic<uint64_t> chunks_copied_from_checkpoint{0};
  std::atomic<uint64_t> files_copied_from_checkpoint{0};
  std::atomic<uint64_t> post_assembly_retries{0};
  std::atomic<uint64_t> syncs_completed{0};
  std::atomic<uint64_t> syncs_failed{0};
};

} // namespace statesync

#endif // STATESYNC_STATESYNC_METRICS_HPP
