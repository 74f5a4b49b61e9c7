#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace shacrypt {

// `size` bytes from the OpenSSL CSPRNG. Throws std::runtime_error if the
// generator cannot be seeded.
std::vector<std::uint8_t> random_bytes(std::size_t size);

// `count` characters of kH64Alphabet, one random byte per character.
std::string random_h64(std::size_t count);

}  // namespace shacrypt
