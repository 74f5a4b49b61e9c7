#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <openssl/evp.h>

namespace shacrypt {

constexpr std::size_t kSha256Size = 32;

using Sha256Digest = std::array<std::uint8_t, kSha256Size>;

// Byte view over a digest, for feeding it back into the mixing helpers.
std::string_view digest_view(const Sha256Digest& digest);

// One EVP_MD_CTX reused for every sum; not safe to share between threads.
// Throws std::runtime_error if OpenSSL fails.
class Sha256Hasher {
 public:
  Sha256Hasher();

  Sha256Hasher(const Sha256Hasher&) = delete;
  Sha256Hasher& operator=(const Sha256Hasher&) = delete;

  // SHA-256 over the concatenation of `parts`, in order.
  Sha256Digest sum(const std::vector<std::string_view>& parts);

 private:
  struct CtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
  };

  std::unique_ptr<EVP_MD_CTX, CtxDeleter> ctx_;
};

// Cycles `src` until exactly `length` bytes are produced.
// Returns an empty string when `src` is empty.
std::string repeat_bytes(std::string_view src, std::size_t length);

// `src` repeated `count` times, without copying it.
std::vector<std::string_view> multiply_bytes(std::string_view src, std::size_t count);

// Walks the bits of `length` from the least significant one while the
// remaining value is non-zero: a set bit contributes `sum_b`, a clear bit
// contributes `password`.
std::vector<std::string_view> length_mixer(std::size_t length,
                                           std::string_view sum_b,
                                           std::string_view password);

// Input of round `round` of the stretching loop:
//   odd ? p : c,  [s if round % 3],  [p if round % 7],  odd ? c : p
std::vector<std::string_view> round_dispatch(std::size_t round,
                                             std::string_view c,
                                             std::string_view p,
                                             std::string_view s);

}  // namespace shacrypt
