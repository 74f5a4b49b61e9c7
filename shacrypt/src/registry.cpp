#include "shacrypt/registry.hpp"

#include <stdexcept>

#include <spdlog/spdlog.h>

#include "shacrypt/sha256_crypt.hpp"

namespace shacrypt {

bool SchemeRegistry::add(std::shared_ptr<const Definition> definition, std::string* error) {
  if (!definition) {
    if (error) *error = "null scheme definition";
    return false;
  }
  const std::string prefix = definition->prefix();
  if (prefix.empty()) {
    if (error) *error = definition->name() + " has an empty prefix";
    return false;
  }
  if (by_prefix_.count(prefix) != 0) {
    if (error) *error = "prefix " + prefix + " already registered";
    return false;
  }
  if (find_by_name(definition->name())) {
    if (error) *error = "scheme " + definition->name() + " already registered";
    return false;
  }
  spdlog::debug("Registered scheme {} ({})", definition->name(), prefix);
  by_prefix_.emplace(prefix, std::move(definition));
  return true;
}

std::shared_ptr<const Definition> SchemeRegistry::find_by_prefix(const std::string& prefix) const {
  auto it = by_prefix_.find(prefix);
  if (it == by_prefix_.end()) return nullptr;
  return it->second;
}

std::shared_ptr<const Definition> SchemeRegistry::find_by_name(const std::string& name) const {
  for (const auto& [prefix, def] : by_prefix_) {
    if (def->name() == name) return def;
  }
  return nullptr;
}

std::shared_ptr<const Definition> SchemeRegistry::identify(const std::string& encoded) const {
  std::shared_ptr<const Definition> best;
  std::size_t best_len = 0;
  for (const auto& [prefix, def] : by_prefix_) {
    if (prefix.size() > best_len && encoded.compare(0, prefix.size(), prefix) == 0) {
      best = def;
      best_len = prefix.size();
    }
  }
  return best;
}

std::unique_ptr<Crypter> SchemeRegistry::parse(const std::string& encoded, std::string* error) const {
  auto def = identify(encoded);
  if (!def) {
    spdlog::debug("No registered scheme recognises the supplied hash");
    return nullptr;
  }
  return def->try_parse(encoded, error);
}

std::vector<std::string> SchemeRegistry::names() const {
  std::vector<std::string> out;
  out.reserve(by_prefix_.size());
  for (const auto& [prefix, def] : by_prefix_) {
    out.push_back(def->name());
  }
  return out;
}

namespace {

SchemeRegistry build_default_registry() {
  SchemeRegistry registry;
  std::string error;
  if (!registry.add(std::make_shared<Sha256Definition>(), &error)) {
    throw std::logic_error("built-in scheme registration failed: " + error);
  }
  return registry;
}

}  // namespace

const SchemeRegistry& default_registry() {
  static const SchemeRegistry registry = build_default_registry();
  return registry;
}

}  // namespace shacrypt
