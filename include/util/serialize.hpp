// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#ifndef STATESYNC_UTIL_SERIALIZE_HPP
#define STATESYNC_UTIL_SERIALIZE_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace statesync {
namespace util {

// Serialization limits (Bitcoin Core src/serialize.h)
constexpr uint64_t MAX_SIZE = 0x02000000; // 32 MB - largest length prefix
constexpr size_t MAX_VECTOR_ALLOCATE = 5 * 1000 * 1000;

/**
 * Little-endian byte writer
 *
 * Integers are fixed-width little-endian; lengths use Bitcoin's CompactSize
 * varint (1, 3, 5 or 9 bytes).
 */
class Serializer {
public:
  void write_uint8(uint8_t value);
  void write_uint32(uint32_t value);
  void write_uint64(uint64_t value);
  void write_varint(uint64_t value);
  void write_bytes(const uint8_t *data, size_t len);
  void write_string(const std::string &str); // varint length + bytes

  const std::vector<uint8_t> &data() const { return buffer_; }
  std::vector<uint8_t> release() { return std::move(buffer_); }

private:
  std::vector<uint8_t> buffer_;
};

/**
 * Bounds-checked reader
 *
 * The first failed read latches the error flag; later reads return zero
 * values, so callers can read a whole record and check has_error() once.
 */
class Deserializer {
public:
  explicit Deserializer(const std::vector<uint8_t> &data);
  Deserializer(const uint8_t *data, size_t size);

  uint8_t read_uint8();
  uint32_t read_uint32();
  uint64_t read_uint64();
  uint64_t read_varint(); // errors on non-canonical encodings and > MAX_SIZE
  bool read_bytes(uint8_t *out, size_t len);
  std::string read_string(size_t max_len);

  bool has_error() const { return error_; }
  size_t bytes_remaining() const { return error_ ? 0 : size_ - pos_; }

private:
  bool check(size_t len);

  const uint8_t *data_;
  size_t size_;
  size_t pos_{0};
  bool error_{false};
};

} // namespace util
} // namespace statesync

#endif // STATESYNC_UTIL_SERIALIZE_HPP
