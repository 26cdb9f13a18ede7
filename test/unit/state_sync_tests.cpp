#include <catch2/catch_test_macros.hpp>
#include "manifest/manifest_hash.hpp"
#include "statesync/state_sync.hpp"
#include "test_helpers.hpp"

using namespace statesync;
using namespace statesync::test;
using manifest::FILE_GROUP_CHUNK_ID_OFFSET;

TEST_CASE("StateSync - Initialize registers existing checkpoints",
          "[state_sync]") {
  TempDir dir;
  StateSync node(TestConfig(dir.path()));
  WriteCheckpoint(node.layout().CheckpointPath(3), SampleCheckpoint(1));
  WriteCheckpoint(node.layout().CheckpointPath(7), SampleCheckpoint(2));
  WriteFile(node.layout().ScratchpadPath(9) / "stale", {1});

  REQUIRE(node.Initialize());
  REQUIRE(node.LatestCheckpointHeight() == 7);
  REQUIRE(node.ListCheckpoints().size() == 2);
  REQUIRE_FALSE(fs::exists(node.layout().ScratchpadPath(9)));

  auto id = node.ListCheckpoints().back();
  auto msg = node.GetValidatedByIdentifier(id);
  REQUIRE(msg.has_value());
  REQUIRE(msg->root_hash == manifest::ManifestRootHash(*msg->manifest));
  REQUIRE(msg->checkpoint_root == node.layout().CheckpointPath(7));

  StateSyncArtifactId wrong = id;
  wrong.root_hash[5] ^= 0x10;
  REQUIRE_FALSE(node.GetValidatedByIdentifier(wrong).has_value());
  REQUIRE_FALSE(node.GetChunk(wrong, 0).has_value());
}

TEST_CASE("StateSync - Initialize rejects an invalid config", "[state_sync]") {
  TempDir dir;
  StateSyncConfig config = TestConfig(dir.path());
  config.chunk_size = 5000;
  StateSync node(config);
  REQUIRE_FALSE(node.Initialize());
}

TEST_CASE("StateSync - Serving chunks", "[state_sync]") {
  TempDir dir;
  StateSync node(TestConfig(dir.path()));
  CheckpointFiles files = SampleCheckpoint(4);
  WriteCheckpoint(node.layout().CheckpointPath(1), files);
  REQUIRE(node.Initialize());
  auto id = node.ListCheckpoints().front();

  SECTION("Manifest chunk") {
    auto bytes = node.GetChunk(id, 0);
    REQUIRE(bytes.has_value());
    manifest::Manifest decoded;
    std::string error;
    REQUIRE(manifest::DecodeManifest(bytes->data(), bytes->size(), decoded,
                                     error) == manifest::DecodeStatus::OK);
    REQUIRE(manifest::ManifestRootHash(decoded) == id.root_hash);
  }

  SECTION("Regular chunk") {
    const auto &memory = files["canister_states/0001/memory.bin"];
    auto second = node.GetChunk(id, 2);
    REQUIRE(second ==
            std::vector<uint8_t>(memory.begin() + 4096, memory.begin() + 8192));
    auto last = node.GetChunk(id, 6);
    REQUIRE(last == std::vector<uint8_t>(memory.begin() + 5 * 4096,
                                         memory.end()));
  }

  SECTION("Group chunk") {
    std::vector<uint8_t> expected = files["canister_states/0001/stable.bin"];
    for (const char *path :
         {"canister_states/0002/queues.pbuf", "system_metadata.pbuf"}) {
      const auto &piece = files[path];
      expected.insert(expected.end(), piece.begin(), piece.end());
    }
    REQUIRE(node.GetChunk(id, FILE_GROUP_CHUNK_ID_OFFSET) == expected);
  }

  SECTION("Unknown chunks") {
    REQUIRE_FALSE(node.GetChunk(id, 12).has_value());
    REQUIRE_FALSE(node.GetChunk(id, FILE_GROUP_CHUNK_ID_OFFSET + 1).has_value());
  }
}

TEST_CASE("StateSync - Incremental commit", "[state_sync]") {
  TempDir dir;
  StateSync node(TestConfig(dir.path()));
  CheckpointFiles files = SampleCheckpoint(5);
  WriteCheckpoint(node.layout().CheckpointPath(1), files);
  REQUIRE(node.Initialize());

  files["canister_states/0001/memory.bin"][2 * 4096 + 1] ^= 0xff;
  WriteCheckpoint(node.layout().CheckpointPath(2), files);

  auto before = node.metrics().manifest.reused_bytes.load();
  auto incremental = node.CommitCheckpoint(
      2, manifest::DirtyChunks{{"canister_states/0001/memory.bin", {2}}});
  REQUIRE(incremental.has_value());
  REQUIRE(node.metrics().manifest.reused_bytes.load() > before);

  TempDir other;
  StateSync fresh(TestConfig(other.path()));
  WriteCheckpoint(fresh.layout().CheckpointPath(2), files);
  REQUIRE(fresh.Initialize());
  REQUIRE(fresh.ListCheckpoints().front() == incremental->id());
  REQUIRE(*fresh.GetValidatedByIdentifier(incremental->id())->manifest ==
          *incremental->manifest);

  REQUIRE_FALSE(node.CommitCheckpoint(42).has_value());
}

TEST_CASE("StateSync - Fetch target and priorities", "[state_sync]") {
  TempDir source_dir;
  TempDir dest_dir;
  StateSync source(TestConfig(source_dir.path()));
  StateSync dest(TestConfig(dest_dir.path()));
  WriteCheckpoint(source.layout().CheckpointPath(10), SampleCheckpoint(6));
  REQUIRE(source.Initialize());
  REQUIRE(dest.Initialize());
  auto id = source.ListCheckpoints().front();

  // No target, nothing local: anything above height 0 is worth keeping
  REQUIRE(dest.GetPriorityFunction()(id) == Priority::Stash);

  dest.FetchState(id.height, id.root_hash);
  REQUIRE(dest.desired_state() == id);
  auto priority = dest.GetPriorityFunction();
  REQUIRE(priority(id) == Priority::Fetch);

  StateSyncArtifactId stale{5, id.root_hash};
  REQUIRE(priority(stale) == Priority::Drop);

  auto chunkable = dest.CreateChunkable(id);
  REQUIRE(chunkable);
  auto result = SyncFrom(source, id, *chunkable);
  REQUIRE(result.IsCompleted());
  REQUIRE(dest.DeliverStateSync(*result.GetArtifact()));
  REQUIRE_FALSE(dest.desired_state().has_value());
  REQUIRE(dest.LatestCheckpointHeight() == 10);

  // Priority functions are snapshots
  REQUIRE(priority(id) == Priority::Fetch);
  REQUIRE(dest.GetPriorityFunction()(id) == Priority::Drop);
}
