#include <catch2/catch_test_macros.hpp>
#include "manifest/file_groups.hpp"
#include "manifest/manifest_builder.hpp"
#include "test_helpers.hpp"
#include <set>

using namespace statesync;
using namespace statesync::manifest;
using namespace statesync::test;

namespace {

// Manifest with one single-chunk file per entry of `sizes`
Manifest ManifestOfSizes(const std::vector<uint32_t> &sizes,
                         uint32_t version = CURRENT_STATE_SYNC_VERSION) {
  Manifest manifest;
  manifest.version = version;
  for (size_t i = 0; i < sizes.size(); ++i) {
    FileInfo file;
    file.relative_path = "f" + std::to_string(1000 + i);
    file.size_bytes = sizes[i];
    manifest.file_table.push_back(file);
    if (sizes[i] > 0) {
      ChunkInfo chunk;
      chunk.file_index = static_cast<uint32_t>(i);
      chunk.size_bytes = sizes[i];
      manifest.chunk_table.push_back(chunk);
    }
  }
  return manifest;
}

} // namespace

TEST_CASE("ComputeFileGroups - Grouping rules", "[file_groups]") {
  SECTION("Old manifests are never grouped") {
    Manifest manifest = ManifestOfSizes({1, 1, 1}, STATE_SYNC_V1);
    REQUIRE(ComputeFileGroups(manifest).empty());
  }

  SECTION("Small files share one group, large and empty files are excluded") {
    Manifest manifest = ManifestOfSizes({10, 0, 9000, 20, 8192});
    auto groups = ComputeFileGroups(manifest);
    REQUIRE(groups.size() == 1);
    REQUIRE(groups.begin()->first == FILE_GROUP_CHUNK_ID_OFFSET);
    // chunk_table indices: 10 -> 0, 9000 -> 1, 20 -> 2, 8192 -> 3
    REQUIRE(groups.begin()->second == std::vector<uint32_t>{0, 2, 3});
  }

  SECTION("Multi-chunk files are excluded") {
    TempDir dir;
    WriteCheckpoint(dir.path(), SampleCheckpoint(1));
    util::ThreadPool pool(1);
    ManifestMetrics metrics;
    Manifest manifest = ComputeManifest(pool, metrics,
                                        CURRENT_STATE_SYNC_VERSION, dir.path(),
                                        4096, std::nullopt);
    auto groups = ComputeFileGroups(manifest);
    REQUIRE(groups.size() == 1);
    // stable.bin (one full chunk), queues.pbuf and system_metadata.pbuf;
    // subnet_queues.pbuf is 8 KiB but spans two 4 KiB chunks
    REQUIRE(groups.begin()->second == std::vector<uint32_t>{6, 7, 10});
  }
}

TEST_CASE("ComputeFileGroups - Group size bound", "[file_groups]") {
  std::vector<uint32_t> sizes;
  for (int i = 0; i < 500; ++i) {
    sizes.push_back(1000 + (i * 37) % 7000);
  }
  Manifest manifest = ManifestOfSizes(sizes);
  auto groups = ComputeFileGroups(manifest);

  REQUIRE(groups.size() == 3);
  std::set<uint32_t> seen;
  ChunkId expected_id = FILE_GROUP_CHUNK_ID_OFFSET;
  for (const auto &[id, members] : groups) {
    REQUIRE(id == expected_id++);
    uint64_t total = 0;
    for (uint32_t index : members) {
      total += manifest.chunk_table[index].size_bytes;
      REQUIRE(seen.insert(index).second);
    }
    REQUIRE(total <= MAX_FILE_GROUP_BYTES);
  }
  REQUIRE(seen.size() == sizes.size());

  auto owner = InvertFileGroups(groups);
  REQUIRE(owner.size() == sizes.size());
  REQUIRE(owner.at(0) == FILE_GROUP_CHUNK_ID_OFFSET);
}

TEST_CASE("ComputeFileGroups - One large and two tiny files", "[file_groups]") {
  TempDir dir;
  WriteCheckpoint(dir.path(), {{"a", RandomBytes(10 * 1024 * 1024, 1)},
                               {"b", {0x01}},
                               {"c", {0x02}}});
  util::ThreadPool pool(2);
  ManifestMetrics metrics;
  Manifest manifest =
      ComputeManifest(pool, metrics, CURRENT_STATE_SYNC_VERSION, dir.path(),
                      DEFAULT_CHUNK_SIZE, std::nullopt);

  REQUIRE(manifest.chunk_table.size() == 12);
  auto groups = ComputeFileGroups(manifest);
  REQUIRE(groups.size() == 1);
  REQUIRE(groups.at(FILE_GROUP_CHUNK_ID_OFFSET) ==
          std::vector<uint32_t>{10, 11});
}
