#include "tool/batch.hpp"

#include <exception>

#include <spdlog/spdlog.h>

namespace shacrypt::tool {

std::string to_string(VerifyOutcome outcome) {
  switch (outcome) {
    case VerifyOutcome::Match:
      return "OK";
    case VerifyOutcome::Mismatch:
      return "FAIL";
    case VerifyOutcome::Invalid:
      return "INVALID";
  }
  return "INVALID";
}

std::optional<VerifyJob> parse_batch_line(const std::string& line) {
  std::string s = line;
  if (!s.empty() && s.back() == '\r') s.pop_back();
  const auto tab = s.find('\t');
  if (tab == std::string::npos) return std::nullopt;
  return VerifyJob{s.substr(0, tab), s.substr(tab + 1)};
}

VerifyOutcome verify_one(const SchemeRegistry& registry, const VerifyJob& job) {
  std::string error;
  auto record = registry.parse(job.encoded, &error);
  if (!record) {
    if (!error.empty()) spdlog::info("Malformed hash: {}", error);
    return VerifyOutcome::Invalid;
  }
  return record->verify(job.password) ? VerifyOutcome::Match : VerifyOutcome::Mismatch;
}

std::vector<VerifyOutcome> verify_batch(const SchemeRegistry& registry,
                                        const std::vector<std::optional<VerifyJob>>& jobs,
                                        ThreadPool& pool) {
  std::vector<VerifyOutcome> results(jobs.size(), VerifyOutcome::Invalid);
  for (std::size_t i = 0; i < jobs.size(); ++i) {
    if (!jobs[i]) continue;
    // Each task writes only its own slot.
    const bool queued = pool.enqueue([&registry, &jobs, &results, i] {
      try {
        results[i] = verify_one(registry, *jobs[i]);
      } catch (const std::exception& ex) {
        spdlog::error("Verification of line {} failed: {}", i + 1, ex.what());
        results[i] = VerifyOutcome::Invalid;
      }
    });
    if (!queued) {
      spdlog::warn("Worker pool stopped; line {} not verified", i + 1);
    }
  }
  pool.wait_idle();
  return results;
}

}  // namespace shacrypt::tool
