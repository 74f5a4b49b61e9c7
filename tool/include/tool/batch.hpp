#pragma once

#include <optional>
#include <string>
#include <vector>

#include "shacrypt/registry.hpp"
#include "tool/thread_pool.hpp"

namespace shacrypt::tool {

enum class VerifyOutcome { Match, Mismatch, Invalid };

struct VerifyJob {
  std::string encoded;
  std::string password;
};

std::string to_string(VerifyOutcome outcome);

// Splits "ENCODED<TAB>PASSWORD" at the first tab. A trailing '\r' is dropped.
std::optional<VerifyJob> parse_batch_line(const std::string& line);

// Verifies one record. Hashes no registered scheme recognises, and malformed
// ones, are Invalid.
VerifyOutcome verify_one(const SchemeRegistry& registry, const VerifyJob& job);

// Verifies every job on `pool`, one record per task. A missing job is
// Invalid. Results are in input order.
std::vector<VerifyOutcome> verify_batch(const SchemeRegistry& registry,
                                        const std::vector<std::optional<VerifyJob>>& jobs,
                                        ThreadPool& pool);

}  // namespace shacrypt::tool
