#include "shacrypt/h64.hpp"

#include <array>

namespace shacrypt {

namespace {

constexpr int kInvalid = -1;

std::array<int, 256> make_reverse_table() {
  std::array<int, 256> table{};
  table.fill(kInvalid);
  for (std::size_t i = 0; i < kH64Alphabet.size(); ++i) {
    table[static_cast<unsigned char>(kH64Alphabet[i])] = static_cast<int>(i);
  }
  return table;
}

const std::array<int, 256>& reverse_table() {
  static const std::array<int, 256> table = make_reverse_table();
  return table;
}

}  // namespace

std::string h64_encode(const std::uint8_t* data, std::size_t len) {
  std::string out;
  out.reserve((len * 4 + 2) / 3);
  std::size_t i = 0;
  while (i < len) {
    const std::size_t group = (len - i) < 3 ? (len - i) : 3;
    std::uint32_t value = 0;
    for (std::size_t j = 0; j < group; ++j) {
      value |= static_cast<std::uint32_t>(data[i + j]) << (8 * j);
    }
    for (std::size_t j = 0; j <= group; ++j) {
      out.push_back(kH64Alphabet[value & 0x3f]);
      value >>= 6;
    }
    i += group;
  }
  return out;
}

bool is_h64(std::string_view text) {
  const auto& table = reverse_table();
  for (char c : text) {
    if (table[static_cast<unsigned char>(c)] == kInvalid) return false;
  }
  return true;
}

}  // namespace shacrypt
