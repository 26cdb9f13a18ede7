// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "util/serialize.hpp"
#include <cstring>

namespace statesync {
namespace util {

void Serializer::write_uint8(uint8_t value) { buffer_.push_back(value); }

void Serializer::write_uint32(uint32_t value) {
  for (int i = 0; i < 4; ++i) {
    buffer_.push_back(static_cast<uint8_t>(value >> (i * 8)));
  }
}

void Serializer::write_uint64(uint64_t value) {
  for (int i = 0; i < 8; ++i) {
    buffer_.push_back(static_cast<uint8_t>(value >> (i * 8)));
  }
}

void Serializer::write_varint(uint64_t value) {
  if (value < 0xfd) {
    write_uint8(static_cast<uint8_t>(value));
  } else if (value <= 0xffff) {
    write_uint8(0xfd);
    buffer_.push_back(static_cast<uint8_t>(value));
    buffer_.push_back(static_cast<uint8_t>(value >> 8));
  } else if (value <= 0xffffffff) {
    write_uint8(0xfe);
    write_uint32(static_cast<uint32_t>(value));
  } else {
    write_uint8(0xff);
    write_uint64(value);
  }
}

void Serializer::write_bytes(const uint8_t *data, size_t len) {
  buffer_.insert(buffer_.end(), data, data + len);
}

void Serializer::write_string(const std::string &str) {
  write_varint(str.size());
  write_bytes(reinterpret_cast<const uint8_t *>(str.data()), str.size());
}

Deserializer::Deserializer(const std::vector<uint8_t> &data)
    : data_(data.data()), size_(data.size()) {}

Deserializer::Deserializer(const uint8_t *data, size_t size)
    : data_(data), size_(size) {}

bool Deserializer::check(size_t len) {
  if (error_ || len > size_ - pos_) {
    error_ = true;
    return false;
  }
  return true;
}

uint8_t Deserializer::read_uint8() {
  if (!check(1))
    return 0;
  return data_[pos_++];
}

uint32_t Deserializer::read_uint32() {
  if (!check(4))
    return 0;
  uint32_t value = 0;
  for (int i = 0; i < 4; ++i) {
    value |= static_cast<uint32_t>(data_[pos_++]) << (i * 8);
  }
  return value;
}

uint64_t Deserializer::read_uint64() {
  if (!check(8))
    return 0;
  uint64_t value = 0;
  for (int i = 0; i < 8; ++i) {
    value |= static_cast<uint64_t>(data_[pos_++]) << (i * 8);
  }
  return value;
}

uint64_t Deserializer::read_varint() {
  uint8_t prefix = read_uint8();
  uint64_t value = 0;
  uint64_t min_value = 0;
  if (prefix < 0xfd) {
    value = prefix;
  } else if (prefix == 0xfd) {
    if (!check(2))
      return 0;
    value = static_cast<uint64_t>(data_[pos_]) |
            (static_cast<uint64_t>(data_[pos_ + 1]) << 8);
    pos_ += 2;
    min_value = 0xfd;
  } else if (prefix == 0xfe) {
    value = read_uint32();
    min_value = 0x10000;
  } else {
    value = read_uint64();
    min_value = 0x100000000ULL;
  }

  // Non-canonical encodings would let one value have several byte forms
  if (error_ || value < min_value || value > MAX_SIZE) {
    error_ = true;
    return 0;
  }
  return value;
}

bool Deserializer::read_bytes(uint8_t *out, size_t len) {
  if (!check(len))
    return false;
  if (len > 0) {
    std::memcpy(out, data_ + pos_, len);
  }
  pos_ += len;
  return true;
}

std::string Deserializer::read_string(size_t max_len) {
  uint64_t len = read_varint();
  if (error_ || len > max_len || !check(static_cast<size_t>(len))) {
    error_ = true;
    return {};
  }
  std::string out(reinterpret_cast<const char *>(data_ + pos_),
                  static_cast<size_t>(len));
  pos_ += static_cast<size_t>(len);
  return out;
}

} // namespace util
} // namespace statesync
