#include <catch2/catch_test_macros.hpp>
#include "manifest/manifest_builder.hpp"
#include "manifest/manifest_hash.hpp"
#include "test_helpers.hpp"

using namespace statesync;
using namespace statesync::manifest;
using namespace statesync::test;

namespace {

Manifest Compute(const fs::path &dir, size_t threads = 2,
                 const std::optional<ManifestDelta> &delta = std::nullopt,
                 ManifestMetrics *metrics_out = nullptr) {
  util::ThreadPool pool(threads);
  ManifestMetrics metrics;
  Manifest manifest = ComputeManifest(pool, metrics_out ? *metrics_out : metrics,
                                      CURRENT_STATE_SYNC_VERSION, dir, 4096,
                                      delta);
  return manifest;
}

} // namespace

TEST_CASE("ComputeManifest - Chunk layout", "[manifest_builder]") {
  TempDir dir;
  WriteCheckpoint(dir.path(), SampleCheckpoint(1));
  Manifest manifest = Compute(dir.path());

  REQUIRE(manifest.file_table.size() == 6);
  REQUIRE(manifest.file_table[0].relative_path ==
          "canister_states/0001/memory.bin");
  REQUIRE(manifest.file_table[3].relative_path ==
          "canister_states/0002/wasm_chunk_store.bin");
  REQUIRE(manifest.file_table[5].relative_path == "system_metadata.pbuf");

  auto ranges = manifest.FileChunkRanges();

  SECTION("Multi-chunk file ends in a short chunk") {
    auto [begin, end] = ranges[0];
    REQUIRE(end - begin == 6);
    for (size_t i = begin; i < end; ++i) {
      REQUIRE(manifest.chunk_table[i].file_index == 0);
      REQUIRE(manifest.chunk_table[i].offset == (i - begin) * 4096);
    }
    REQUIRE(manifest.chunk_table[end - 1].size_bytes == 100);
  }

  SECTION("Empty file is listed without chunks") {
    REQUIRE(manifest.file_table[3].size_bytes == 0);
    REQUIRE(ranges[3].first == ranges[3].second);
  }

  SECTION("Chunk hashes are hashes of the file bytes") {
    auto content = ReadFile(dir.path() / "subnet_queues.pbuf");
    auto [begin, end] = ranges[4];
    REQUIRE(end - begin == 2);
    REQUIRE(manifest.chunk_table[begin].hash == ChunkHash(content.data(), 4096));
    REQUIRE(manifest.chunk_table[begin + 1].hash ==
            ChunkHash(content.data() + 4096, 4096));

    auto rehashed = HashFileChunks(dir.path() / "subnet_queues.pbuf",
                                   content.size(), 4096);
    REQUIRE(rehashed.size() == 2);
    REQUIRE(rehashed[1] == manifest.chunk_table[begin + 1].hash);
  }

  SECTION("Manifest validates against its own root") {
    std::string reason;
    REQUIRE(ValidateManifest(manifest, ManifestRootHash(manifest), reason));
  }
}

TEST_CASE("ComputeManifest - Determinism", "[manifest_builder]") {
  TempDir a;
  TempDir b;
  auto files = SampleCheckpoint(3);
  WriteCheckpoint(a.path(), files);

  // Same content, created in reverse order
  for (auto it = files.rbegin(); it != files.rend(); ++it) {
    WriteFile(b.path() / it->first, it->second);
  }

  Manifest ma = Compute(a.path(), 1);
  Manifest mb = Compute(b.path(), 4);
  REQUIRE(ma == mb);
  REQUIRE(EncodeManifest(ma) == EncodeManifest(mb));
  REQUIRE(ManifestRootHash(ma) == ManifestRootHash(mb));

  SECTION("Any content change changes the root") {
    auto data = files["canister_states/0002/queues.pbuf"];
    data[10] ^= 1;
    WriteFile(b.path() / "canister_states/0002/queues.pbuf", data);
    REQUIRE(ManifestRootHash(Compute(b.path())) != ManifestRootHash(ma));
  }

  SECTION("Renaming a file changes the root") {
    fs::rename(b.path() / "system_metadata.pbuf",
               b.path() / "system_metadata2.pbuf");
    REQUIRE(ManifestRootHash(Compute(b.path())) != ManifestRootHash(ma));
  }
}

TEST_CASE("ComputeManifest - Incremental equals full computation",
          "[manifest_builder]") {
  TempDir base_dir;
  TempDir next_dir;
  auto files = SampleCheckpoint(5);
  WriteCheckpoint(base_dir.path(), files);
  auto base = std::make_shared<const Manifest>(Compute(base_dir.path()));

  // Next checkpoint: one page rewritten, one file grown, one removed, one new
  auto next_files = files;
  auto &memory = next_files["canister_states/0001/memory.bin"];
  for (size_t i = 2 * 4096; i < 2 * 4096 + 64; ++i) {
    memory[i] ^= 0x5a;
  }
  auto &stable = next_files["canister_states/0001/stable.bin"];
  stable.resize(stable.size() + 100, 7);
  next_files.erase("system_metadata.pbuf");
  next_files["ingress_history.pbuf"] = RandomBytes(50, 99);
  WriteCheckpoint(next_dir.path(), next_files);

  DirtyChunks dirty;
  dirty["canister_states/0001/memory.bin"] = {2, 3}; // 3 written but unchanged
  dirty["canister_states/0001/stable.bin"] = {1};
  dirty["subnet_queues.pbuf"] = {};

  ManifestMetrics metrics;
  ManifestDelta delta{base, 10, 20, dirty};
  Manifest incremental = Compute(next_dir.path(), 2, delta, &metrics);
  Manifest full = Compute(next_dir.path());

  REQUIRE(incremental == full);
  REQUIRE(ManifestRootHash(incremental) == ManifestRootHash(full));

  // memory.bin: 4 clean chunks reused, chunk 2 changed, chunk 3 unchanged
  // stable.bin: chunk 0 reused, chunk 1 new; subnet_queues.pbuf: all reused
  REQUIRE(metrics.reused_bytes.load() == 3 * 4096 + 100 + 4096 + 2 * 4096);
  REQUIRE(metrics.hashed_and_compared_bytes.load() >= 4096);
  REQUIRE(metrics.hashed_bytes.load() >= 4096 + 100);
  REQUIRE(metrics.files.load() == full.file_table.size());
}

TEST_CASE("ComputeManifest - Errors", "[manifest_builder]") {
  SECTION("Missing checkpoint directory") {
    TempDir dir;
    REQUIRE_THROWS_AS(Compute(dir.path() / "missing"), ManifestError);
  }

  SECTION("Symlinks are not checkpoint files") {
    TempDir dir;
    WriteCheckpoint(dir.path(), SampleCheckpoint(1));
    fs::create_symlink(dir.path() / "system_metadata.pbuf",
                       dir.path() / "link.pbuf");
    REQUIRE_THROWS_AS(Compute(dir.path()), ManifestError);
  }

  SECTION("Zero chunk size") {
    TempDir dir;
    util::ThreadPool pool(1);
    ManifestMetrics metrics;
    REQUIRE_THROWS_AS(ComputeManifest(pool, metrics, CURRENT_STATE_SYNC_VERSION,
                                      dir.path(), 0, std::nullopt),
                      ManifestError);
  }
}

TEST_CASE("ListCheckpointFiles - Sorted relative paths", "[manifest_builder]") {
  TempDir dir;
  WriteFile(dir.path() / "b/z.bin", {1});
  WriteFile(dir.path() / "a.bin", {1});
  WriteFile(dir.path() / "b/a.bin", {1});
  fs::create_directories(dir.path() / "empty_dir");

  auto files = ListCheckpointFiles(dir.path());
  REQUIRE(files == std::vector<std::string>{"a.bin", "b/a.bin", "b/z.bin"});
}
