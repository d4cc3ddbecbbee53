#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace uuidcraft::crypto {

  // Digest sizes
  constexpr size_t MD5_SIZE = 16;
  constexpr size_t SHA1_SIZE = 20;

  using Md5Digest = std::array<uint8_t, MD5_SIZE>;
  using Sha1Digest = std::array<uint8_t, SHA1_SIZE>;

  // Fills out with cryptographically secure bytes (OpenSSL RAND_bytes).
  // Throws std::runtime_error if the generator fails.
  void random_bytes(uint8_t* out, size_t len);

  // Secure random 64-bit value
  uint64_t random_u64();

  // Non-cryptographic 64-bit value from a thread-local Mersenne Twister
  uint64_t fast_random_u64();

  // One-shot digests.
  // Throws std::runtime_error if OpenSSL reports a failure.
  Md5Digest md5(const std::vector<uint8_t>& data);
  Sha1Digest sha1(const std::vector<uint8_t>& data);

  // Last OpenSSL error as text, for diagnostics
  std::string last_error();

}  // namespace uuidcraft::crypto
