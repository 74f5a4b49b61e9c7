#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace shacrypt::tool {

enum class Command { None, Hash, Verify, BatchVerify };

struct ToolConfig {
  Command command{Command::None};
  std::string encoded;   // argument of `verify`
  nlohmann::json scheme_options = nlohmann::json::object();
  std::string salt;      // empty: generate one
  std::size_t workers{4};
  spdlog::level::level_enum log_level{spdlog::level::warn};
  std::string log_file;  // empty: log to stderr
};

// Applies keys of a JSON config document ("rounds", "workers", "log_level",
// "log_file"). Unknown keys are ignored. Returns false and fills error on a
// value of the wrong type.
bool apply_config_json(const nlohmann::json& j, ToolConfig& cfg, std::string& error);

// Reads and applies a JSON config file.
bool load_config_file(const std::string& path, ToolConfig& cfg, std::string& error);

// Parses argv (without argv[0]). `--config` is applied first so flags given
// on the command line win over file values.
bool parse_args(const std::vector<std::string>& args, ToolConfig& cfg, std::string& error);

// Help text, including the names of the registered hash schemes.
std::string usage();

}  // namespace shacrypt::tool
