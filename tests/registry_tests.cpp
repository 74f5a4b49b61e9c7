#include <memory>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "shacrypt/registry.hpp"
#include "shacrypt/sha256_crypt.hpp"
#include "test_runner.hpp"

using shacrypt::Crypter;
using shacrypt::Definition;
using shacrypt::SchemeRegistry;
using shacrypt::Sha256Definition;
using shacrypt::testing::TestRunner;

namespace {

// Stand-in for another scheme: recognises its prefix, rejects everything
// after it as malformed.
class RejectingDefinition final : public Definition {
 public:
  RejectingDefinition(std::string name, std::string prefix)
      : name_(std::move(name)), prefix_(std::move(prefix)) {}

  std::string name() const override { return name_; }
  std::string prefix() const override { return prefix_; }
  nlohmann::json options() const override { return nlohmann::json::object(); }
  std::unique_ptr<Definition> with_options(const nlohmann::json&) const override {
    return std::make_unique<RejectingDefinition>(name_, prefix_);
  }
  std::unique_ptr<Crypter> default_crypter() const override { return nullptr; }
  std::string crypt(std::string_view, std::string_view, const nlohmann::json&) const override {
    return {};
  }
  std::unique_ptr<Crypter> try_parse(const std::string& encoded,
                                     std::string* error = nullptr) const override {
    if (encoded.compare(0, prefix_.size(), prefix_) != 0) return nullptr;
    if (error) *error = name_ + " is not supported";
    return nullptr;
  }

 private:
  std::string name_;
  std::string prefix_;
};

const std::string kHelloWorld = "$5$saltstring$5B8vYYiY.CVt1RlTTf8KbXBH3hsxY/GNooZaBBGWEc5";

}  // namespace

int main() {
  TestRunner tr("registry");

  // Built-in registry.
  {
    const auto& reg = shacrypt::default_registry();
    tr.expect(&reg == &shacrypt::default_registry(), "default registry is a single instance");
    tr.expect(reg.size() == 1, "one built-in scheme");
    tr.expect(reg.find_by_prefix("$5$") != nullptr, "lookup by prefix");
    tr.expect(reg.find_by_name("{SHA256-CRYPT}") != nullptr, "lookup by name");
    tr.expect(reg.find_by_prefix("$6$") == nullptr, "unknown prefix");

    std::string err;
    auto record = reg.parse(kHelloWorld, &err);
    tr.expect(record != nullptr && err.empty(), "parse via registry");
    tr.expect(record && record->verify("Hello world!"), "registry record verifies");

    tr.expect(reg.parse("$6$rounds=5000$salt$abc", &err) == nullptr, "unrecognised hash");
    tr.expect(err.empty(), "unrecognised hash is not an error");
    tr.expect(reg.parse("plain text", &err) == nullptr && err.empty(), "no prefix at all");

    tr.expect(reg.parse("$5$rounds=nope$salt$", &err) == nullptr, "malformed hash");
    tr.expect(!err.empty(), "malformed hash reports error");
  }

  // Concurrent readers of the built-in registry.
  {
    std::vector<int> ok(4, 0);
    std::vector<std::thread> threads;
    for (std::size_t i = 0; i < ok.size(); ++i) {
      threads.emplace_back([&ok, i] {
        auto record = shacrypt::default_registry().parse(kHelloWorld);
        ok[i] = (record && record->verify("Hello world!")) ? 1 : 0;
      });
    }
    for (auto& t : threads) t.join();
    for (std::size_t i = 0; i < ok.size(); ++i) {
      tr.expect(ok[i] == 1, "concurrent verification " + std::to_string(i));
    }
  }

  // Explicit registry with several schemes.
  {
    SchemeRegistry reg;
    std::string err;
    tr.expect(reg.add(std::make_shared<Sha256Definition>(), &err), "add sha256");
    tr.expect(reg.add(std::make_shared<RejectingDefinition>("{SHA512-CRYPT}", "$6$"), &err),
              "add second scheme");
    tr.expect(!reg.add(std::make_shared<Sha256Definition>(10000), &err), "duplicate prefix");
    tr.expect(err.find("$5$") != std::string::npos, "duplicate prefix named");
    tr.expect(!reg.add(std::make_shared<RejectingDefinition>("{SHA512-CRYPT}", "$x$"), &err),
              "duplicate name");
    tr.expect(!reg.add(std::make_shared<RejectingDefinition>("{EMPTY}", ""), &err),
              "empty prefix");
    tr.expect(!reg.add(nullptr, &err), "null definition");
    tr.expect(reg.size() == 2, "two schemes registered");

    const auto names = reg.names();
    tr.expect(names.size() == 2, "names listed");

    auto id = reg.identify("$6$salt$abc");
    tr.expect(id && id->name() == "{SHA512-CRYPT}", "identify by prefix");

    err.clear();
    tr.expect(reg.parse("$6$salt$abc", &err) == nullptr, "second scheme rejects");
    tr.expect(err == "{SHA512-CRYPT} is not supported", "second scheme error surfaced");

    err.clear();
    auto record = reg.parse(kHelloWorld, &err);
    tr.expect(record && record->verify("Hello world!"), "sha256 still reachable");
  }

  // Longest prefix wins.
  {
    SchemeRegistry reg;
    tr.expect(reg.add(std::make_shared<RejectingDefinition>("{SHORT}", "$a")), "add short");
    tr.expect(reg.add(std::make_shared<RejectingDefinition>("{LONG}", "$ab$")), "add long");
    auto id = reg.identify("$ab$xyz");
    tr.expect(id && id->name() == "{LONG}", "longest prefix chosen");
    id = reg.identify("$ac$xyz");
    tr.expect(id && id->name() == "{SHORT}", "shorter prefix still matches");
  }

  return tr.exit_code();
}
