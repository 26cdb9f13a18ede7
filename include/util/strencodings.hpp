// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#ifndef STATESYNC_UTIL_STRENCODINGS_HPP
#define STATESYNC_UTIL_STRENCODINGS_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace statesync {
namespace util {

// Lower-case hex of a byte range
std::string HexStr(const uint8_t *data, size_t len);

template <typename Container> std::string HexStr(const Container &c) {
  return HexStr(reinterpret_cast<const uint8_t *>(c.data()), c.size());
}

// Parse an even-length hex string; std::nullopt on any non-hex character
std::optional<std::vector<uint8_t>> ParseHex(const std::string &hex);

// Human-readable byte count ("1.5 MiB")
std::string FormatBytes(uint64_t bytes);

} // namespace util
} // namespace statesync

#endif // STATESYNC_UTIL_STRENCODINGS_HPP
