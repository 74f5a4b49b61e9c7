#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "shacrypt/scheme.hpp"

namespace shacrypt {

// Schemes keyed by prefix. Populate it before sharing it; lookups are
// const and need no locking afterwards.
class SchemeRegistry {
 public:
  // Returns false (and fills `error`) if a scheme with the same prefix or
  // name is already registered.
  bool add(std::shared_ptr<const Definition> definition, std::string* error = nullptr);

  std::shared_ptr<const Definition> find_by_prefix(const std::string& prefix) const;
  std::shared_ptr<const Definition> find_by_name(const std::string& name) const;

  // Scheme whose prefix `encoded` starts with, longest prefix first.
  std::shared_ptr<const Definition> identify(const std::string& encoded) const;

  // Parses `encoded` with the scheme that recognises it. Returns nullptr when
  // no scheme recognises it, or when the recognising scheme rejects it as
  // malformed; only the latter fills `error`.
  std::unique_ptr<Crypter> parse(const std::string& encoded, std::string* error = nullptr) const;

  std::vector<std::string> names() const;
  std::size_t size() const { return by_prefix_.size(); }

 private:
  std::map<std::string, std::shared_ptr<const Definition>> by_prefix_;
};

// Process-wide registry holding every built-in scheme, created on first use.
const SchemeRegistry& default_registry();

}  // namespace shacrypt
