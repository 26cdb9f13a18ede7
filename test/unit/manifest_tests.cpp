#include <catch2/catch_test_macros.hpp>
#include "manifest/manifest.hpp"
#include "manifest/manifest_builder.hpp"
#include "manifest/manifest_hash.hpp"
#include "test_helpers.hpp"
#include "util/serialize.hpp"

using namespace statesync;
using namespace statesync::manifest;
using namespace statesync::test;

namespace {

Manifest BuildSampleManifest(const fs::path &dir, uint32_t version = CURRENT_STATE_SYNC_VERSION) {
  WriteCheckpoint(dir, SampleCheckpoint(7));
  util::ThreadPool pool(2);
  ManifestMetrics metrics;
  return ComputeManifest(pool, metrics, version, dir, 4096, std::nullopt);
}

DecodeStatus Decode(const std::vector<uint8_t> &bytes, Manifest &out) {
  std::string error;
  return DecodeManifest(bytes.data(), bytes.size(), out, error);
}

} // namespace

TEST_CASE("Manifest codec - Encoding round trip", "[manifest]") {
  TempDir dir;
  Manifest manifest = BuildSampleManifest(dir.path());

  auto bytes = EncodeManifest(manifest);
  Manifest decoded;
  REQUIRE(Decode(bytes, decoded) == DecodeStatus::OK);
  REQUIRE(decoded == manifest);
  REQUIRE(ManifestRootHash(decoded) == ManifestRootHash(manifest));
}

TEST_CASE("Manifest codec - Version handling", "[manifest]") {
  TempDir dir;
  Manifest manifest = BuildSampleManifest(dir.path());

  SECTION("Previous version is still accepted") {
    manifest.version = STATE_SYNC_V1;
    Manifest decoded;
    REQUIRE(Decode(EncodeManifest(manifest), decoded) == DecodeStatus::OK);
    REQUIRE(decoded.version == STATE_SYNC_V1);
  }

  SECTION("Future version is rejected") {
    manifest.version = CURRENT_STATE_SYNC_VERSION + 1;
    Manifest decoded;
    REQUIRE(Decode(EncodeManifest(manifest), decoded) ==
            DecodeStatus::UNSUPPORTED_VERSION);
  }

  SECTION("Version zero is rejected") {
    manifest.version = 0;
    Manifest decoded;
    REQUIRE(Decode(EncodeManifest(manifest), decoded) ==
            DecodeStatus::UNSUPPORTED_VERSION);
  }
}

TEST_CASE("Manifest codec - Malformed input", "[manifest]") {
  TempDir dir;
  Manifest manifest = BuildSampleManifest(dir.path());
  auto bytes = EncodeManifest(manifest);
  Manifest decoded;

  SECTION("Empty input") {
    REQUIRE(Decode({}, decoded) == DecodeStatus::MALFORMED);
  }

  SECTION("Trailing byte") {
    bytes.push_back(0);
    REQUIRE(Decode(bytes, decoded) == DecodeStatus::MALFORMED);
  }

  SECTION("Every truncation") {
    for (size_t len = 0; len < bytes.size(); len += 7) {
      std::vector<uint8_t> prefix(bytes.begin(), bytes.begin() + len);
      REQUIRE(Decode(prefix, decoded) == DecodeStatus::MALFORMED);
    }
  }

  SECTION("Oversized table length does not allocate") {
    util::Serializer s;
    s.write_uint32(CURRENT_STATE_SYNC_VERSION);
    s.write_varint(util::MAX_SIZE);
    REQUIRE(Decode(s.data(), decoded) == DecodeStatus::MALFORMED);
  }
}

TEST_CASE("ValidateManifest - Structural and hash checks", "[manifest]") {
  TempDir dir;
  Manifest manifest = BuildSampleManifest(dir.path());
  const Hash256 root = ManifestRootHash(manifest);
  std::string reason;

  SECTION("Computed manifest is valid") {
    REQUIRE(ValidateManifest(manifest, root, reason));
  }

  SECTION("Wrong root hash") {
    Hash256 other = root;
    other[0] ^= 1;
    REQUIRE_FALSE(ValidateManifest(manifest, other, reason));
    REQUIRE(reason.find("root hash") != std::string::npos);
  }

  SECTION("Tampered chunk hash breaks its file hash") {
    manifest.chunk_table[0].hash[5] ^= 0xff;
    REQUIRE_FALSE(ValidateManifest(manifest, root, reason));
    REQUIRE(reason.find("file hash") != std::string::npos);
  }

  SECTION("Consistently tampered chunk and file hash break the root") {
    manifest.chunk_table[0].hash[5] ^= 0xff;
    auto ranges = manifest.FileChunkRanges();
    manifest.file_table[0].hash =
        FileHash(manifest.chunk_table, ranges[0].first, ranges[0].second);
    REQUIRE_FALSE(ValidateManifest(manifest, root, reason));
    REQUIRE(reason.find("root hash") != std::string::npos);
  }

  SECTION("Offset gap") {
    manifest.chunk_table[1].offset += 1;
    REQUIRE_FALSE(ValidateManifest(manifest, root, reason));
  }

  SECTION("Unsorted file table") {
    std::swap(manifest.file_table[0], manifest.file_table[1]);
    REQUIRE_FALSE(ValidateManifest(manifest, root, reason));
  }

  SECTION("Path escaping the checkpoint") {
    manifest.file_table[0].relative_path = "../etc/passwd";
    REQUIRE_FALSE(ValidateManifest(manifest, root, reason));
    REQUIRE(reason.find("invalid path") != std::string::npos);
  }

  SECTION("Chunks not covering the file") {
    manifest.file_table.back().size_bytes += 1;
    REQUIRE_FALSE(ValidateManifest(manifest, root, reason));
  }

  SECTION("Unsupported version") {
    manifest.version = 7;
    REQUIRE_FALSE(ValidateManifest(manifest, ManifestRootHash(manifest), reason));
  }
}

TEST_CASE("Manifest - Root hash depends on version", "[manifest]") {
  TempDir dir;
  Manifest v2 = BuildSampleManifest(dir.path());
  Manifest v1 = v2;
  v1.version = STATE_SYNC_V1;
  REQUIRE(ManifestRootHash(v1) != ManifestRootHash(v2));

  std::string reason;
  REQUIRE(ValidateManifest(v1, ManifestRootHash(v1), reason));
}

TEST_CASE("Manifest - Chunk ids", "[manifest]") {
  REQUIRE(ChunkIdForIndex(0) == 1);
  REQUIRE(ChunkIndexForId(1) == 0);
  REQUIRE_FALSE(IsFileGroupChunk(MANIFEST_CHUNK));
  REQUIRE_FALSE(IsFileGroupChunk(FILE_GROUP_CHUNK_ID_OFFSET - 1));
  REQUIRE(IsFileGroupChunk(FILE_GROUP_CHUNK_ID_OFFSET));
  REQUIRE(DEFAULT_CHUNK_SIZE % PAGE_SIZE == 0);
}
