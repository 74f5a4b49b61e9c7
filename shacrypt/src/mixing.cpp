#include "shacrypt/mixing.hpp"

#include <stdexcept>

namespace shacrypt {

std::string_view digest_view(const Sha256Digest& digest) {
  return std::string_view(reinterpret_cast<const char*>(digest.data()), digest.size());
}

Sha256Hasher::Sha256Hasher() : ctx_(EVP_MD_CTX_new()) {
  if (!ctx_) {
    throw std::runtime_error("Failed to create EVP digest context");
  }
}

Sha256Digest Sha256Hasher::sum(const std::vector<std::string_view>& parts) {
  if (EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
    throw std::runtime_error("EVP_DigestInit_ex failed");
  }
  for (const auto& part : parts) {
    if (part.empty()) continue;
    if (EVP_DigestUpdate(ctx_.get(), part.data(), part.size()) != 1) {
      throw std::runtime_error("EVP_DigestUpdate failed");
    }
  }

  Sha256Digest out{};
  unsigned int out_len = 0;
  if (EVP_DigestFinal_ex(ctx_.get(), out.data(), &out_len) != 1 || out_len != out.size()) {
    throw std::runtime_error("EVP_DigestFinal_ex failed");
  }
  return out;
}

std::string repeat_bytes(std::string_view src, std::size_t length) {
  std::string out;
  if (src.empty()) return out;
  out.reserve(length);
  while (out.size() + src.size() <= length) {
    out.append(src.data(), src.size());
  }
  out.append(src.data(), length - out.size());
  return out;
}

std::vector<std::string_view> multiply_bytes(std::string_view src, std::size_t count) {
  return std::vector<std::string_view>(count, src);
}

std::vector<std::string_view> length_mixer(std::size_t length,
                                           std::string_view sum_b,
                                           std::string_view password) {
  std::vector<std::string_view> out;
  for (std::size_t bits = length; bits > 0; bits >>= 1) {
    out.push_back((bits & 1) != 0 ? sum_b : password);
  }
  return out;
}

std::vector<std::string_view> round_dispatch(std::size_t round,
                                             std::string_view c,
                                             std::string_view p,
                                             std::string_view s) {
  const bool odd = (round & 1) != 0;
  std::vector<std::string_view> out;
  out.reserve(4);
  out.push_back(odd ? p : c);
  if (round % 3 != 0) out.push_back(s);
  if (round % 7 != 0) out.push_back(p);
  out.push_back(odd ? c : p);
  return out;
}

}  // namespace shacrypt
