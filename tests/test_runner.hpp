#pragma once

#include <iostream>
#include <string>
#include <utility>

namespace shacrypt::testing {

struct TestRunner {
  explicit TestRunner(std::string suite) : suite(std::move(suite)) {}

  std::string suite;
  int failures{0};

  void expect(bool condition, const std::string& msg) {
    if (!condition) {
      ++failures;
      std::cerr << "[FAIL] " << msg << "\n";
    }
  }

  void expect_eq(const std::string& actual, const std::string& expected, const std::string& msg) {
    if (actual != expected) {
      ++failures;
      std::cerr << "[FAIL] " << msg << "\n  expected: " << expected << "\n  actual:   " << actual
                << "\n";
    }
  }

  int exit_code() const {
    if (failures == 0) {
      std::cout << "[PASS] all " << suite << " tests\n";
      return 0;
    }
    std::cerr << "[FAILURES] total: " << failures << "\n";
    return 1;
  }
};

}  // namespace shacrypt::testing
