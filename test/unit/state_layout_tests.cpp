#include <catch2/catch_test_macros.hpp>
#include "statesync/active_syncs.hpp"
#include "statesync/config.hpp"
#include "statesync/state_layout.hpp"
#include "test_helpers.hpp"

using namespace statesync;
using namespace statesync::test;

TEST_CASE("StateLayout - Paths", "[layout]") {
  StateLayout layout("/var/state");

  REQUIRE(StateLayout::HeightDirName(0) == "0000000000000000");
  REQUIRE(StateLayout::HeightDirName(0x1f2) == "00000000000001f2");
  REQUIRE(layout.CheckpointPath(255) ==
          fs::path("/var/state/checkpoints/00000000000000ff"));
  REQUIRE(layout.ScratchpadPath(1) ==
          fs::path("/var/state/tmp/state_sync_scratchpad_0000000000000001"));
  REQUIRE(layout.CacheDir(1) ==
          fs::path("/var/state/tmp/state_sync_cache_0000000000000001"));
}

TEST_CASE("StateLayout - Initialize", "[layout]") {
  TempDir dir;
  StateLayout layout(dir.path());

  WriteFile(layout.ScratchpadPath(3) / "leftover", {1});
  WriteFile(layout.CheckpointPath(3) / "state", {2});
  WriteFile(layout.CheckpointPath(1) / "state", {3});
  fs::create_directories(layout.checkpoints_dir() / "not-a-height");

  REQUIRE(layout.Initialize());
  REQUIRE(fs::exists(layout.tmp_dir()));
  REQUIRE(fs::is_empty(layout.tmp_dir()));
  REQUIRE(layout.CheckpointHeights() == std::vector<Height>{1, 3});
}

TEST_CASE("ActiveSyncRegistry - One sync per height", "[layout]") {
  auto registry = std::make_shared<ActiveSyncRegistry>();

  auto first = registry->TryRegister(5);
  REQUIRE(first.has_value());
  REQUIRE(registry->IsActive(5));
  REQUIRE_FALSE(registry->TryRegister(5).has_value());

  {
    auto other = registry->TryRegister(6);
    REQUIRE(other.has_value());
    REQUIRE(registry->size() == 2);
  }
  REQUIRE_FALSE(registry->IsActive(6));

  first.reset();
  REQUIRE(registry->size() == 0);
  REQUIRE(registry->TryRegister(5).has_value());
}

TEST_CASE("StateSyncConfig - Validate", "[config]") {
  StateSyncConfig config;
  std::string error;
  REQUIRE(config.Validate(error));

  SECTION("Chunk size not a power of two") {
    config.chunk_size = 3 * 4096;
    REQUIRE_FALSE(config.Validate(error));
  }

  SECTION("Chunk size below the page size") {
    config.chunk_size = 1024;
    REQUIRE_FALSE(config.Validate(error));
  }

  SECTION("Unsupported manifest version") {
    config.manifest_version = 3;
    REQUIRE_FALSE(config.Validate(error));
    config.manifest_version = 0;
    REQUIRE_FALSE(config.Validate(error));
  }

  SECTION("Empty root") {
    config.root.clear();
    REQUIRE_FALSE(config.Validate(error));
  }
}

TEST_CASE("StateSyncConfig - Load from JSON", "[config]") {
  TempDir dir;
  const fs::path path = dir.path() / "statesync.json";

  auto write = [&](const std::string &text) {
    WriteFile(path, std::vector<uint8_t>(text.begin(), text.end()));
  };

  SECTION("All keys") {
    write(R"({"root": "/data/state", "chunk_size": 65536,
              "manifest_version": 1, "hashing_threads": 3})");
    auto config = LoadStateSyncConfig(path);
    REQUIRE(config.has_value());
    REQUIRE(config->root == fs::path("/data/state"));
    REQUIRE(config->chunk_size == 65536);
    REQUIRE(config->manifest_version == 1);
    REQUIRE(config->hashing_threads == 3);
  }

  SECTION("Missing keys keep defaults") {
    write(R"({"hashing_threads": 1})");
    auto config = LoadStateSyncConfig(path);
    REQUIRE(config.has_value());
    REQUIRE(config->chunk_size == manifest::DEFAULT_CHUNK_SIZE);
    REQUIRE(config->manifest_version == manifest::CURRENT_STATE_SYNC_VERSION);
  }

  SECTION("Malformed JSON") {
    write("{ not json");
    REQUIRE_FALSE(LoadStateSyncConfig(path).has_value());
  }

  SECTION("Invalid values") {
    write(R"({"chunk_size": 1000})");
    REQUIRE_FALSE(LoadStateSyncConfig(path).has_value());
  }

  SECTION("Missing file") {
    REQUIRE_FALSE(LoadStateSyncConfig(dir.path() / "absent.json").has_value());
  }
}
