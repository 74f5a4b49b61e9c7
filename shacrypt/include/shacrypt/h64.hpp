#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace shacrypt {

// crypt(3) alphabet: value 0 is '.', value 63 is 'z'.
inline constexpr std::string_view kH64Alphabet =
    "./0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz";

// Packs bytes three at a time, little-endian, least significant 6 bits first.
// A trailing group of n (1 or 2) bytes yields n + 1 characters.
std::string h64_encode(const std::uint8_t* data, std::size_t len);

// True when every character belongs to kH64Alphabet.
bool is_h64(std::string_view text);

}  // namespace shacrypt
