#include "shacrypt/secure_random.hpp"

#include <stdexcept>

#include <openssl/rand.h>

#include "shacrypt/h64.hpp"

namespace shacrypt {

std::vector<std::uint8_t> random_bytes(std::size_t size) {
  std::vector<std::uint8_t> out(size);
  if (size == 0) return out;
  if (RAND_bytes(out.data(), static_cast<int>(out.size())) != 1) {
    throw std::runtime_error("Unable to generate random bytes");
  }
  return out;
}

std::string random_h64(std::size_t count) {
  const auto bytes = random_bytes(count);
  std::string out;
  out.reserve(count);
  // 256 is a multiple of 64, so masking keeps the distribution uniform.
  for (std::uint8_t b : bytes) {
    out.push_back(kH64Alphabet[b & 0x3f]);
  }
  return out;
}

}  // namespace shacrypt
