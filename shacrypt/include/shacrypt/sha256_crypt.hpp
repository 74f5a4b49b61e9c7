#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "shacrypt/mixing.hpp"
#include "shacrypt/scheme.hpp"

namespace shacrypt {

constexpr std::uint32_t kSha256MinRounds = 1000;
constexpr std::uint32_t kSha256MaxRounds = 999999999;
constexpr std::uint32_t kSha256DefaultRounds = 5000;
constexpr std::size_t kSha256SaltMax = 16;
constexpr std::size_t kSha256EncodedDigestSize = 43;

inline constexpr std::string_view kSha256Prefix = "$5$";
inline constexpr std::string_view kSha256Name = "{SHA256-CRYPT}";

// Clamps into [kSha256MinRounds, kSha256MaxRounds].
std::uint32_t clamp_sha256_rounds(std::int64_t rounds);

// SHA256-CRYPT key stretching with the final byte permutation applied, so
// h64_encode of the result is the 43-character digest of "$5$" strings.
Sha256Digest sha256_crypt_raw(std::string_view password,
                              std::string_view salt,
                              std::uint32_t rounds);

class Sha256Definition;

// Immutable SHA256-CRYPT record: rounds, salt (at most 16 bytes, no '$') and
// the encoded digest (at most 43 characters, empty until computed).
class Sha256Crypt final : public Crypter {
  struct FieldsTag {
    explicit FieldsTag() = default;
  };

 public:
  explicit Sha256Crypt(std::uint32_t rounds = kSha256DefaultRounds);
  // Only reachable from inside the class; takes salt and digest as given.
  Sha256Crypt(FieldsTag, std::uint32_t rounds, std::string salt, std::string digest);

  // Parses "$5$[rounds=N$]salt$digest". Fills `error` when malformed.
  static std::optional<Sha256Crypt> parse(const std::string& encoded,
                                          std::string* error = nullptr);

  std::uint32_t rounds() const { return rounds_; }
  const std::string& salt() const { return salt_; }
  const std::string& digest() const { return digest_; }

  std::unique_ptr<Crypter> with_salt(std::string_view salt) const override;
  std::unique_ptr<Crypter> with_digest(std::string_view digest) const override;
  std::unique_ptr<Crypter> compute(std::string_view password) const override;
  bool verify(std::string_view password) const override;

  std::string format() const override;
  nlohmann::json options() const override;
  std::unique_ptr<Definition> definition() const override;

  bool operator==(const Sha256Crypt& other) const;
  bool operator!=(const Sha256Crypt& other) const { return !(*this == other); }

 private:
  std::string encoded_digest_for(std::string_view password) const;

  std::uint32_t rounds_;
  std::string salt_;
  std::string digest_;
};

class Sha256Definition final : public Definition {
 public:
  explicit Sha256Definition(std::uint32_t rounds = kSha256DefaultRounds);

  std::uint32_t rounds() const { return rounds_; }

  std::string name() const override;
  std::string prefix() const override;

  nlohmann::json options() const override;
  std::unique_ptr<Definition> with_options(const nlohmann::json& opts) const override;
  std::unique_ptr<Crypter> default_crypter() const override;
  std::string crypt(std::string_view password,
                    std::string_view salt,
                    const nlohmann::json& opts) const override;
  std::unique_ptr<Crypter> try_parse(const std::string& encoded,
                                     std::string* error = nullptr) const override;

 private:
  std::uint32_t rounds_;
};

}  // namespace shacrypt
