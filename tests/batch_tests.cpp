#include <atomic>
#include <optional>
#include <string>
#include <vector>

#include "shacrypt/registry.hpp"
#include "test_runner.hpp"
#include "tool/batch.hpp"
#include "tool/thread_pool.hpp"

using shacrypt::testing::TestRunner;
using shacrypt::tool::ThreadPool;
using shacrypt::tool::VerifyJob;
using shacrypt::tool::VerifyOutcome;

int main() {
  TestRunner tr("batch");

  // Worker pool drains everything before wait_idle returns.
  {
    ThreadPool pool(3);
    tr.expect(pool.size() == 3, "three workers");
    std::atomic<int> counter{0};
    for (int i = 0; i < 100; ++i) {
      tr.expect(pool.enqueue([&counter] { counter.fetch_add(1); }), "enqueue task");
    }
    pool.wait_idle();
    tr.expect(counter.load() == 100, "all tasks ran");
    pool.shutdown();
    tr.expect(!pool.enqueue([] {}), "enqueue after shutdown refused");
    pool.shutdown();
  }
  {
    ThreadPool pool(0);
    tr.expect(pool.size() == 1, "zero workers becomes one");
  }

  // Line parsing.
  {
    auto job = shacrypt::tool::parse_batch_line("$5$abc$xyz\tpass\tword\r");
    tr.expect(job.has_value(), "tab-separated line");
    tr.expect(job && job->encoded == "$5$abc$xyz", "encoded part");
    tr.expect(job && job->password == "pass\tword", "password keeps later tabs");
    tr.expect(!shacrypt::tool::parse_batch_line("no separator"), "line without tab");
  }

  tr.expect(shacrypt::tool::to_string(VerifyOutcome::Match) == "OK", "OK label");
  tr.expect(shacrypt::tool::to_string(VerifyOutcome::Mismatch) == "FAIL", "FAIL label");
  tr.expect(shacrypt::tool::to_string(VerifyOutcome::Invalid) == "INVALID", "INVALID label");

  // Batch verification keeps input order.
  {
    const std::string hello = "$5$saltstring$5B8vYYiY.CVt1RlTTf8KbXBH3hsxY/GNooZaBBGWEc5";
    const std::string ten_k =
        "$5$rounds=10000$saltstringsaltst$3xv.VbSHBb41AL9AvLeujZkZRBAwqFMz2.opqey6IcA";
    std::vector<std::optional<VerifyJob>> jobs = {
        VerifyJob{hello, "Hello world!"},
        VerifyJob{hello, "Hello world?"},
        std::nullopt,
        VerifyJob{"$6$salt$abc", "Hello world!"},
        VerifyJob{"$5$rounds=bad$salt$", "Hello world!"},
        VerifyJob{ten_k, "Hello world!"},
        VerifyJob{hello, ""},
    };
    ThreadPool pool(4);
    auto results = shacrypt::tool::verify_batch(shacrypt::default_registry(), jobs, pool);
    const std::vector<VerifyOutcome> expected = {
        VerifyOutcome::Match,   VerifyOutcome::Mismatch, VerifyOutcome::Invalid,
        VerifyOutcome::Invalid, VerifyOutcome::Invalid,  VerifyOutcome::Match,
        VerifyOutcome::Mismatch,
    };
    tr.expect(results.size() == expected.size(), "one result per line");
    for (std::size_t i = 0; i < expected.size() && i < results.size(); ++i) {
      tr.expect(results[i] == expected[i], "outcome of line " + std::to_string(i + 1));
    }
  }

  return tr.exit_code();
}
