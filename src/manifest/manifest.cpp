// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "manifest/manifest.hpp"
#include "util/serialize.hpp"
#include <algorithm>

namespace statesync {
namespace manifest {

namespace {

constexpr size_t kMinFileEntrySize = 1 + 8 + 32;
constexpr size_t kChunkEntrySize = 4 + 4 + 8 + 32;

} // namespace

std::vector<std::pair<size_t, size_t>> Manifest::FileChunkRanges() const {
  std::vector<std::pair<size_t, size_t>> ranges(file_table.size(), {0, 0});
  size_t i = 0;
  for (size_t f = 0; f < file_table.size(); ++f) {
    size_t begin = i;
    while (i < chunk_table.size() && chunk_table[i].file_index == f) {
      ++i;
    }
    ranges[f] = {begin, i};
  }
  return ranges;
}

uint64_t Manifest::TotalBytes() const {
  uint64_t total = 0;
  for (const auto &file : file_table) {
    total += file.size_bytes;
  }
  return total;
}

std::vector<uint8_t> EncodeManifest(const Manifest &manifest) {
  util::Serializer s;
  s.write_uint32(manifest.version);

  s.write_varint(manifest.file_table.size());
  for (const auto &file : manifest.file_table) {
    s.write_string(file.relative_path);
    s.write_uint64(file.size_bytes);
    s.write_bytes(file.hash.data(), file.hash.size());
  }

  s.write_varint(manifest.chunk_table.size());
  for (const auto &chunk : manifest.chunk_table) {
    s.write_uint32(chunk.file_index);
    s.write_uint32(chunk.size_bytes);
    s.write_uint64(chunk.offset);
    s.write_bytes(chunk.hash.data(), chunk.hash.size());
  }

  return s.release();
}

DecodeStatus DecodeManifest(const uint8_t *data, size_t size, Manifest &out,
                            std::string &error) {
  util::Deserializer d(data, size);

  uint32_t version = d.read_uint32();
  if (d.has_error()) {
    error = "truncated version";
    return DecodeStatus::MALFORMED;
  }
  if (!IsSupportedVersion(version)) {
    error = "unsupported manifest version " + std::to_string(version);
    return DecodeStatus::UNSUPPORTED_VERSION;
  }

  Manifest manifest;
  manifest.version = version;

  uint64_t n_files = d.read_varint();
  if (d.has_error() || n_files > d.bytes_remaining() / kMinFileEntrySize) {
    error = "bad file table length";
    return DecodeStatus::MALFORMED;
  }
  manifest.file_table.reserve(static_cast<size_t>(n_files));
  for (uint64_t i = 0; i < n_files; ++i) {
    FileInfo file;
    file.relative_path = d.read_string(MAX_PATH_LENGTH);
    file.size_bytes = d.read_uint64();
    d.read_bytes(file.hash.data(), file.hash.size());
    if (d.has_error()) {
      error = "truncated file entry " + std::to_string(i);
      return DecodeStatus::MALFORMED;
    }
    manifest.file_table.push_back(std::move(file));
  }

  uint64_t n_chunks = d.read_varint();
  if (d.has_error() || n_chunks > d.bytes_remaining() / kChunkEntrySize) {
    error = "bad chunk table length";
    return DecodeStatus::MALFORMED;
  }
  manifest.chunk_table.reserve(static_cast<size_t>(n_chunks));
  for (uint64_t i = 0; i < n_chunks; ++i) {
    ChunkInfo chunk;
    chunk.file_index = d.read_uint32();
    chunk.size_bytes = d.read_uint32();
    chunk.offset = d.read_uint64();
    d.read_bytes(chunk.hash.data(), chunk.hash.size());
    if (d.has_error()) {
      error = "truncated chunk entry " + std::to_string(i);
      return DecodeStatus::MALFORMED;
    }
    manifest.chunk_table.push_back(chunk);
  }

  if (d.bytes_remaining() != 0) {
    error = "trailing bytes after chunk table";
    return DecodeStatus::MALFORMED;
  }

  out = std::move(manifest);
  return DecodeStatus::OK;
}

} // namespace manifest
} // namespace statesync
