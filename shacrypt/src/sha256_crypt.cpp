#include "shacrypt/sha256_crypt.hpp"

#include <array>
#include <limits>
#include <utility>
#include <vector>

#include <openssl/crypto.h>
#include <spdlog/spdlog.h>

#include "shacrypt/h64.hpp"
#include "shacrypt/secure_random.hpp"

namespace shacrypt {

namespace {

constexpr std::string_view kRoundsKey = "rounds=";

// Byte order of the final digest; consecutive triplets of the permuted digest
// are what the crypt encoding packs into each group of four characters.
constexpr std::array<std::size_t, kSha256Size> kOutputPermutation = {
    20, 10, 0,  11, 1,  21, 2,  22, 12, 23, 13, 3,  14, 4,  24, 5,
    25, 15, 26, 16, 6,  17, 7,  27, 8,  28, 18, 29, 19, 9,  30, 31,
};

bool starts_with(std::string_view s, std::string_view prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

// Crypt salts end at the first '$' and never exceed 16 bytes.
std::string make_salt(std::string_view salt) {
  const auto dollar = salt.find('$');
  if (dollar != std::string_view::npos) salt = salt.substr(0, dollar);
  if (salt.size() > kSha256SaltMax) salt = salt.substr(0, kSha256SaltMax);
  return std::string(salt);
}

std::vector<std::string> split_fields(std::string_view s) {
  std::vector<std::string> out;
  for (;;) {
    const auto pos = s.find('$');
    if (pos == std::string_view::npos) break;
    out.emplace_back(s.substr(0, pos));
    s.remove_prefix(pos + 1);
  }
  out.emplace_back(s);
  return out;
}

std::optional<std::uint32_t> parse_rounds(std::string_view field, std::string& reason) {
  const std::string_view digits = field.substr(kRoundsKey.size());
  if (digits.empty()) {
    reason = "rounds value is empty";
    return std::nullopt;
  }
  std::int64_t value = 0;
  for (char c : digits) {
    if (c < '0' || c > '9') {
      reason = "rounds value is not a number";
      return std::nullopt;
    }
    // Saturate; anything past the maximum clamps to it anyway.
    if (value <= static_cast<std::int64_t>(kSha256MaxRounds)) {
      value = value * 10 + (c - '0');
    }
  }
  return clamp_sha256_rounds(value);
}

}  // namespace

std::uint32_t clamp_sha256_rounds(std::int64_t rounds) {
  if (rounds < static_cast<std::int64_t>(kSha256MinRounds)) return kSha256MinRounds;
  if (rounds > static_cast<std::int64_t>(kSha256MaxRounds)) return kSha256MaxRounds;
  return static_cast<std::uint32_t>(rounds);
}

Sha256Digest sha256_crypt_raw(std::string_view password,
                              std::string_view salt,
                              std::uint32_t rounds) {
  Sha256Hasher hasher;

  const Sha256Digest sum_b = hasher.sum({password, salt, password});

  const std::string b_cycled = repeat_bytes(digest_view(sum_b), password.size());
  std::vector<std::string_view> parts_a{password, salt, b_cycled};
  const auto mixer = length_mixer(password.size(), digest_view(sum_b), password);
  parts_a.insert(parts_a.end(), mixer.begin(), mixer.end());
  const Sha256Digest sum_a = hasher.sum(parts_a);

  const Sha256Digest sum_p = hasher.sum(multiply_bytes(password, password.size()));
  const std::string p_seq = repeat_bytes(digest_view(sum_p), password.size());

  const Sha256Digest sum_s = hasher.sum(multiply_bytes(salt, 16 + sum_a[0]));
  const std::string s_seq = repeat_bytes(digest_view(sum_s), salt.size());

  Sha256Digest c = sum_a;
  for (std::uint32_t i = 0; i < rounds; ++i) {
    c = hasher.sum(round_dispatch(i, digest_view(c), p_seq, s_seq));
  }

  Sha256Digest out{};
  for (std::size_t k = 0; k < out.size(); ++k) {
    out[k] = c[kOutputPermutation[k]];
  }
  return out;
}

// --- Sha256Crypt ---

Sha256Crypt::Sha256Crypt(std::uint32_t rounds)
    : rounds_(clamp_sha256_rounds(rounds)) {}

Sha256Crypt::Sha256Crypt(FieldsTag, std::uint32_t rounds, std::string salt, std::string digest)
    : rounds_(clamp_sha256_rounds(rounds)), salt_(std::move(salt)), digest_(std::move(digest)) {}

std::optional<Sha256Crypt> Sha256Crypt::parse(const std::string& encoded, std::string* error) {
  auto reject = [&](const std::string& reason) -> std::optional<Sha256Crypt> {
    spdlog::debug("Rejected {} record: {}", kSha256Name, reason);
    if (error) *error = reason;
    return std::nullopt;
  };

  if (!starts_with(encoded, kSha256Prefix)) {
    return reject("missing " + std::string(kSha256Prefix) + " prefix");
  }
  if (encoded.size() == kSha256Prefix.size()) {
    return Sha256Crypt();
  }

  auto fields = split_fields(std::string_view(encoded).substr(kSha256Prefix.size()));
  // One trailing '$' closes the last field, whether or not rounds are given.
  if (fields.size() > 1 && fields.back().empty()) fields.pop_back();

  std::uint32_t rounds = kSha256DefaultRounds;
  std::size_t salt_index = 0;
  if (starts_with(fields[0], kRoundsKey)) {
    std::string reason;
    auto parsed = parse_rounds(fields[0], reason);
    if (!parsed) return reject(reason);
    rounds = *parsed;
    salt_index = 1;
  }

  const std::size_t remaining = fields.size() - salt_index;
  if (remaining > 2) {
    return reject("too many '$'-separated fields");
  }

  std::string salt;
  std::string digest;
  if (remaining >= 1) salt = make_salt(fields[salt_index]);
  if (remaining == 2) {
    digest = fields[salt_index + 1];
    if (digest.size() > kSha256EncodedDigestSize) {
      return reject("digest longer than " + std::to_string(kSha256EncodedDigestSize) +
                    " characters");
    }
    if (!is_h64(digest)) {
      return reject("digest contains characters outside the crypt alphabet");
    }
  }

  return Sha256Crypt(FieldsTag{}, rounds, std::move(salt), std::move(digest));
}

std::unique_ptr<Crypter> Sha256Crypt::with_salt(std::string_view salt) const {
  std::string s = salt.empty() ? random_h64(kSha256SaltMax) : make_salt(salt);
  return std::make_unique<Sha256Crypt>(FieldsTag{}, rounds_, std::move(s), digest_);
}

std::unique_ptr<Crypter> Sha256Crypt::with_digest(std::string_view digest) const {
  if (digest.size() > kSha256EncodedDigestSize) {
    digest = digest.substr(0, kSha256EncodedDigestSize);
  }
  return std::make_unique<Sha256Crypt>(FieldsTag{}, rounds_, salt_, std::string(digest));
}

std::string Sha256Crypt::encoded_digest_for(std::string_view password) const {
  const Sha256Digest raw = sha256_crypt_raw(password, salt_, rounds_);
  return h64_encode(raw.data(), raw.size());
}

std::unique_ptr<Crypter> Sha256Crypt::compute(std::string_view password) const {
  return std::make_unique<Sha256Crypt>(FieldsTag{}, rounds_, salt_,
                                       encoded_digest_for(password));
}

bool Sha256Crypt::verify(std::string_view password) const {
  // The candidate is computed even for an empty password so that rejecting
  // it costs the same as rejecting a wrong one.
  const std::string candidate = encoded_digest_for(password);
  if (password.empty()) return false;
  if (candidate.size() != digest_.size()) return false;
  return CRYPTO_memcmp(candidate.data(), digest_.data(), digest_.size()) == 0;
}

std::string Sha256Crypt::format() const {
  std::string out(kSha256Prefix);
  if (rounds_ != kSha256DefaultRounds) {
    out += std::string(kRoundsKey) + std::to_string(rounds_) + "$";
  }
  out += salt_;
  out += "$";
  out += digest_;
  return out;
}

nlohmann::json Sha256Crypt::options() const {
  return {{"rounds", rounds_}};
}

std::unique_ptr<Definition> Sha256Crypt::definition() const {
  return std::make_unique<Sha256Definition>(rounds_);
}

bool Sha256Crypt::operator==(const Sha256Crypt& other) const {
  return rounds_ == other.rounds_ && salt_ == other.salt_ && digest_ == other.digest_;
}

// --- Sha256Definition ---

Sha256Definition::Sha256Definition(std::uint32_t rounds)
    : rounds_(clamp_sha256_rounds(rounds)) {}

std::string Sha256Definition::name() const {
  return std::string(kSha256Name);
}

std::string Sha256Definition::prefix() const {
  return std::string(kSha256Prefix);
}

nlohmann::json Sha256Definition::options() const {
  return {{"rounds", rounds_}};
}

std::unique_ptr<Definition> Sha256Definition::with_options(const nlohmann::json& opts) const {
  if (!opts.is_object()) return std::make_unique<Sha256Definition>(rounds_);
  auto it = opts.find("rounds");
  if (it == opts.end() || !it->is_number_integer()) {
    return std::make_unique<Sha256Definition>(rounds_);
  }

  std::int64_t requested = 0;
  if (it->is_number_unsigned()) {
    const auto v = it->get<std::uint64_t>();
    const auto cap = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
    requested = static_cast<std::int64_t>(v > cap ? cap : v);
  } else {
    requested = it->get<std::int64_t>();
  }
  return std::make_unique<Sha256Definition>(clamp_sha256_rounds(requested));
}

std::unique_ptr<Crypter> Sha256Definition::default_crypter() const {
  return std::make_unique<Sha256Crypt>(rounds_);
}

std::string Sha256Definition::crypt(std::string_view password,
                                    std::string_view salt,
                                    const nlohmann::json& opts) const {
  return with_options(opts)->default_crypter()->with_salt(salt)->compute(password)->format();
}

std::unique_ptr<Crypter> Sha256Definition::try_parse(const std::string& encoded,
                                                     std::string* error) const {
  if (!starts_with(encoded, kSha256Prefix)) return nullptr;
  auto record = Sha256Crypt::parse(encoded, error);
  if (!record) return nullptr;
  return std::make_unique<Sha256Crypt>(std::move(*record));
}

}  // namespace shacrypt
