// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#ifndef STATESYNC_CRYPTO_SHA256_HPP
#define STATESYNC_CRYPTO_SHA256_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

// OpenSSL context type, kept out of the public header
struct evp_md_ctx_st;

namespace statesync {

using Hash256 = std::array<uint8_t, 32>;

namespace crypto {

/**
 * Streaming SHA-256 (OpenSSL EVP)
 *
 *   Hash256 h;
 *   CSHA256().Write(data, len).Finalize(h.data());
 *
 * Not reusable after Finalize() without Reset().
 */
class CSHA256 {
public:
  static constexpr size_t OUTPUT_SIZE = 32;

  CSHA256();
  ~CSHA256();

  CSHA256(const CSHA256 &) = delete;
  CSHA256 &operator=(const CSHA256 &) = delete;

  CSHA256 &Write(const uint8_t *data, size_t len);
  CSHA256 &WriteU8(uint8_t value);
  CSHA256 &WriteU32BE(uint32_t value);
  CSHA256 &WriteU64BE(uint64_t value);

  // Domain separator: one length byte followed by the ASCII tag
  CSHA256 &WriteDomain(const std::string &tag);

  void Finalize(uint8_t out[OUTPUT_SIZE]);
  Hash256 Finalize();
  CSHA256 &Reset();

private:
  evp_md_ctx_st *ctx_;
};

} // namespace crypto
} // namespace statesync

#endif // STATESYNC_CRYPTO_SHA256_HPP
