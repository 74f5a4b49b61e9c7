#include <exception>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "shacrypt/registry.hpp"
#include "shacrypt/sha256_crypt.hpp"
#include "tool/batch.hpp"
#include "tool/config.hpp"
#include "tool/thread_pool.hpp"

using shacrypt::tool::Command;
using shacrypt::tool::ToolConfig;
using shacrypt::tool::VerifyJob;
using shacrypt::tool::VerifyOutcome;

namespace {

void setup_logging(const ToolConfig& cfg) {
  std::shared_ptr<spdlog::logger> logger;
  if (!cfg.log_file.empty()) {
    logger = spdlog::rotating_logger_mt("shacrypt", cfg.log_file, 1024 * 1024 * 5, 3);
  } else {
    logger = spdlog::stderr_color_mt("shacrypt");
  }
  spdlog::set_default_logger(logger);
  spdlog::set_level(cfg.log_level);
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
}

std::string read_password_line() {
  std::string line;
  std::getline(std::cin, line);
  if (!line.empty() && line.back() == '\r') line.pop_back();
  return line;
}

int run_hash(const ToolConfig& cfg) {
  auto def = shacrypt::default_registry().find_by_prefix(std::string(shacrypt::kSha256Prefix));
  if (!def) {
    spdlog::error("{} is not registered", shacrypt::kSha256Name);
    return 2;
  }
  const std::string password = read_password_line();
  std::cout << def->crypt(password, cfg.salt, cfg.scheme_options) << "\n";
  return 0;
}

int run_verify(const ToolConfig& cfg) {
  std::string error;
  auto record = shacrypt::default_registry().parse(cfg.encoded, &error);
  if (!record) {
    std::cerr << (error.empty() ? "unrecognised hash format" : error) << "\n";
    return 2;
  }
  const std::string password = read_password_line();
  if (!record->verify(password)) {
    spdlog::info("Password mismatch");
    return 1;
  }
  return 0;
}

int run_batch_verify(const ToolConfig& cfg) {
  std::vector<std::optional<VerifyJob>> jobs;
  std::string line;
  while (std::getline(std::cin, line)) {
    jobs.push_back(shacrypt::tool::parse_batch_line(line));
  }
  spdlog::info("Verifying {} records on {} workers", jobs.size(), cfg.workers);

  shacrypt::tool::ThreadPool pool(cfg.workers);
  auto results = shacrypt::tool::verify_batch(shacrypt::default_registry(), jobs, pool);
  pool.shutdown();

  bool all_ok = true;
  for (auto outcome : results) {
    std::cout << shacrypt::tool::to_string(outcome) << "\n";
    if (outcome != VerifyOutcome::Match) all_ok = false;
  }
  return all_ok ? 0 : 1;
}

}  // namespace

int main(int argc, char** argv) {
  try {
    ToolConfig cfg;
    std::string error;
    std::vector<std::string> args(argv + 1, argv + argc);
    if (!shacrypt::tool::parse_args(args, cfg, error)) {
      std::cerr << error << "\n\n" << shacrypt::tool::usage();
      return 2;
    }

    setup_logging(cfg);
    switch (cfg.command) {
      case Command::Hash:
        return run_hash(cfg);
      case Command::Verify:
        return run_verify(cfg);
      case Command::BatchVerify:
        return run_batch_verify(cfg);
      case Command::None:
        break;
    }
  } catch (const std::exception& ex) {
    std::cerr << "shacrypt_tool: " << ex.what() << "\n";
    return 2;
  }
  std::cerr << shacrypt::tool::usage();
  return 2;
}
