#pragma once

#include <memory>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace shacrypt {

class Crypter;

// A password hashing scheme at one cost setting. Implementations are
// immutable: every with_* call returns a new object.
class Definition {
 public:
  virtual ~Definition() = default;

  // Display name, e.g. "{SHA256-CRYPT}".
  virtual std::string name() const = 0;
  // Literal that every encoded string of this scheme starts with, e.g. "$5$".
  virtual std::string prefix() const = 0;

  virtual nlohmann::json options() const = 0;
  // Unknown keys and values of the wrong type are ignored; numeric values
  // outside the scheme's bounds are clamped.
  virtual std::unique_ptr<Definition> with_options(const nlohmann::json& opts) const = 0;

  // Record with this definition's settings, no salt and no digest.
  virtual std::unique_ptr<Crypter> default_crypter() const = 0;

  // with_options(opts) -> default_crypter() -> with_salt(salt) -> compute(password) -> format().
  virtual std::string crypt(std::string_view password,
                            std::string_view salt,
                            const nlohmann::json& opts) const = 0;

  // Returns nullptr without touching `error` when `encoded` does not carry
  // this scheme's prefix. Returns nullptr and fills `error` when it does but
  // the rest is malformed.
  virtual std::unique_ptr<Crypter> try_parse(const std::string& encoded,
                                             std::string* error = nullptr) const = 0;
};

// One hashed (or to-be-hashed) password record.
class Crypter {
 public:
  virtual ~Crypter() = default;

  // An empty salt asks for a freshly generated one. The digest is kept.
  virtual std::unique_ptr<Crypter> with_salt(std::string_view salt) const = 0;
  virtual std::unique_ptr<Crypter> with_digest(std::string_view digest) const = 0;
  // Same settings and salt, digest computed from `password`.
  virtual std::unique_ptr<Crypter> compute(std::string_view password) const = 0;
  // Constant-time check of `password` against the stored digest.
  virtual bool verify(std::string_view password) const = 0;

  virtual std::string format() const = 0;
  virtual nlohmann::json options() const = 0;
  virtual std::unique_ptr<Definition> definition() const = 0;
};

}  // namespace shacrypt
