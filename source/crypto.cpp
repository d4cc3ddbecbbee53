#include <fmt/format.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <uuidcraft/crypto.h>

#include <iostream>
#include <random>
#include <stdexcept>

namespace uuidcraft::crypto {

  // Thread-local EVP digest context (reused instead of allocated per call)
  namespace {
    thread_local EVP_MD_CTX* tl_digest_ctx = nullptr;

    EVP_MD_CTX* get_digest_ctx() {
      if (!tl_digest_ctx) {
        tl_digest_ctx = EVP_MD_CTX_new();
      }
      return tl_digest_ctx;
    }

    template <size_t N>
    std::array<uint8_t, N> digest(const EVP_MD* md, const char* name,
                                  const std::vector<uint8_t>& data) {
      EVP_MD_CTX* ctx = get_digest_ctx();
      if (!ctx) {
        throw std::runtime_error(fmt::format("{}: cannot allocate digest context", name));
      }

      // Reset context for reuse
      EVP_MD_CTX_reset(ctx);

      std::array<uint8_t, N> out{};
      unsigned int out_len = 0;

      if (EVP_DigestInit_ex(ctx, md, nullptr) != 1
          || EVP_DigestUpdate(ctx, data.data(), data.size()) != 1
          || EVP_DigestFinal_ex(ctx, out.data(), &out_len) != 1) {
        throw std::runtime_error(fmt::format("{} failed: {}", name, last_error()));
      }

      if (out_len != N) {
        throw std::runtime_error(
            fmt::format("{} returned {} bytes, expected {}", name, out_len, N));
      }

      return out;
    }
  }  // anonymous namespace

  void random_bytes(uint8_t* out, size_t len) {
    if (len == 0) return;

    if (RAND_bytes(out, static_cast<int>(len)) != 1) {
      std::string error = last_error();
      std::cerr << fmt::format("Failed to generate {} random bytes: {}", len, error) << std::endl;
      throw std::runtime_error("RAND_bytes failed: " + error);
    }
  }

  uint64_t random_u64() {
    uint8_t bytes[8];
    random_bytes(bytes, sizeof(bytes));

    uint64_t value = 0;
    for (uint8_t b : bytes) {
      value = (value << 8) | b;
    }
    return value;
  }

  uint64_t fast_random_u64() {
    static thread_local std::mt19937_64 gen(std::random_device{}());
    return gen();
  }

  Md5Digest md5(const std::vector<uint8_t>& data) {
    return digest<MD5_SIZE>(EVP_md5(), "MD5", data);
  }

  Sha1Digest sha1(const std::vector<uint8_t>& data) {
    return digest<SHA1_SIZE>(EVP_sha1(), "SHA-1", data);
  }

  std::string last_error() {
    unsigned long code = ERR_get_error();
    if (code == 0) {
      return "unknown error";
    }
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    return buf;
  }

}  // namespace uuidcraft::crypto
