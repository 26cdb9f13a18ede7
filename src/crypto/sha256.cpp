// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "crypto/sha256.hpp"
#include <openssl/evp.h>
#include <stdexcept>

namespace statesync {
namespace crypto {

CSHA256::CSHA256() : ctx_(EVP_MD_CTX_new()) {
  if (!ctx_) {
    throw std::runtime_error("EVP_MD_CTX_new failed");
  }
  if (EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1) {
    EVP_MD_CTX_free(ctx_);
    throw std::runtime_error("EVP_DigestInit_ex(sha256) failed");
  }
}

CSHA256::~CSHA256() { EVP_MD_CTX_free(ctx_); }

CSHA256 &CSHA256::Write(const uint8_t *data, size_t len) {
  if (len > 0 && EVP_DigestUpdate(ctx_, data, len) != 1) {
    throw std::runtime_error("EVP_DigestUpdate failed");
  }
  return *this;
}

CSHA256 &CSHA256::WriteU8(uint8_t value) { return Write(&value, 1); }

CSHA256 &CSHA256::WriteU32BE(uint32_t value) {
  uint8_t buf[4] = {static_cast<uint8_t>(value >> 24),
                    static_cast<uint8_t>(value >> 16),
                    static_cast<uint8_t>(value >> 8),
                    static_cast<uint8_t>(value)};
  return Write(buf, sizeof(buf));
}

CSHA256 &CSHA256::WriteU64BE(uint64_t value) {
  uint8_t buf[8];
  for (int i = 0; i < 8; ++i) {
    buf[i] = static_cast<uint8_t>(value >> (56 - 8 * i));
  }
  return Write(buf, sizeof(buf));
}

CSHA256 &CSHA256::WriteDomain(const std::string &tag) {
  WriteU8(static_cast<uint8_t>(tag.size()));
  return Write(reinterpret_cast<const uint8_t *>(tag.data()), tag.size());
}

void CSHA256::Finalize(uint8_t out[OUTPUT_SIZE]) {
  unsigned int len = 0;
  if (EVP_DigestFinal_ex(ctx_, out, &len) != 1 || len != OUTPUT_SIZE) {
    throw std::runtime_error("EVP_DigestFinal_ex failed");
  }
}

Hash256 CSHA256::Finalize() {
  Hash256 out;
  Finalize(out.data());
  return out;
}

CSHA256 &CSHA256::Reset() {
  if (EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1) {
    throw std::runtime_error("EVP_DigestInit_ex(sha256) failed");
  }
  return *this;
}

} // namespace crypto
} // namespace statesync
