#include "tool/config.hpp"

#include <fstream>
#include <stdexcept>

#include "shacrypt/registry.hpp"

namespace shacrypt::tool {

namespace {

bool parse_level(const std::string& value, spdlog::level::level_enum& out, std::string& error) {
  auto lvl = spdlog::level::from_str(value);
  if (lvl == spdlog::level::off && value != "off") {
    error = "unknown log level: " + value;
    return false;
  }
  out = lvl;
  return true;
}

bool parse_count(const std::string& flag, const std::string& value, long long& out,
                 std::string& error) {
  std::size_t used = 0;
  try {
    out = std::stoll(value, &used);
  } catch (const std::exception&) {
    error = flag + " expects a number, got '" + value + "'";
    return false;
  }
  if (used != value.size()) {
    error = flag + " expects a number, got '" + value + "'";
    return false;
  }
  return true;
}

}  // namespace

bool apply_config_json(const nlohmann::json& j, ToolConfig& cfg, std::string& error) {
  if (!j.is_object()) {
    error = "config must be a JSON object";
    return false;
  }

  if (j.contains("rounds")) {
    if (!j["rounds"].is_number_integer()) {
      error = "rounds must be an integer";
      return false;
    }
    cfg.scheme_options["rounds"] = j["rounds"];
  }

  if (j.contains("workers")) {
    if (!j["workers"].is_number_integer() || j["workers"].get<std::int64_t>() <= 0) {
      error = "workers must be a positive integer";
      return false;
    }
    cfg.workers = j["workers"].get<std::size_t>();
  }

  if (j.contains("log_level")) {
    if (!j["log_level"].is_string()) {
      error = "log_level must be string";
      return false;
    }
    if (!parse_level(j["log_level"].get<std::string>(), cfg.log_level, error)) return false;
  }

  if (j.contains("log_file")) {
    if (!j["log_file"].is_string()) {
      error = "log_file must be string";
      return false;
    }
    cfg.log_file = j["log_file"].get<std::string>();
  }

  return true;
}

bool load_config_file(const std::string& path, ToolConfig& cfg, std::string& error) {
  std::ifstream in(path);
  if (!in) {
    error = "cannot open config file: " + path;
    return false;
  }
  nlohmann::json j;
  try {
    j = nlohmann::json::parse(in);
  } catch (const std::exception& ex) {
    error = std::string("JSON parse error in ") + path + ": " + ex.what();
    return false;
  }
  return apply_config_json(j, cfg, error);
}

bool parse_args(const std::vector<std::string>& args, ToolConfig& cfg, std::string& error) {
  // Config file first, so explicit flags override it.
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "--config requires a path";
        return false;
      }
      if (!load_config_file(args[i + 1], cfg, error)) return false;
    }
  }

  std::vector<std::string> positional;
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string& arg = args[i];
    const bool has_value = i + 1 < args.size();
    if (arg == "--config") {
      ++i;
    } else if (arg == "--rounds") {
      if (!has_value) {
        error = "--rounds requires a value";
        return false;
      }
      long long rounds = 0;
      if (!parse_count(arg, args[++i], rounds, error)) return false;
      cfg.scheme_options["rounds"] = rounds;
    } else if (arg == "--salt") {
      if (!has_value) {
        error = "--salt requires a value";
        return false;
      }
      cfg.salt = args[++i];
    } else if (arg == "--workers") {
      if (!has_value) {
        error = "--workers requires a value";
        return false;
      }
      long long workers = 0;
      if (!parse_count(arg, args[++i], workers, error)) return false;
      if (workers <= 0) {
        error = "--workers must be positive";
        return false;
      }
      cfg.workers = static_cast<std::size_t>(workers);
    } else if (arg == "--log-file") {
      if (!has_value) {
        error = "--log-file requires a path";
        return false;
      }
      cfg.log_file = args[++i];
    } else if (arg == "--log-level") {
      if (!has_value) {
        error = "--log-level requires a value";
        return false;
      }
      if (!parse_level(args[++i], cfg.log_level, error)) return false;
    } else if (arg.size() > 2 && arg.compare(0, 2, "--") == 0) {
      error = "unknown option: " + arg;
      return false;
    } else {
      positional.push_back(arg);
    }
  }

  if (positional.empty()) {
    error = "missing command";
    return false;
  }
  const std::string& cmd = positional[0];
  if (cmd == "hash" && positional.size() == 1) {
    cfg.command = Command::Hash;
  } else if (cmd == "verify" && positional.size() == 2) {
    cfg.command = Command::Verify;
    cfg.encoded = positional[1];
  } else if (cmd == "batch-verify" && positional.size() == 1) {
    cfg.command = Command::BatchVerify;
  } else {
    error = "invalid command line for '" + cmd + "'";
    return false;
  }
  return true;
}

std::string usage() {
  std::string text =
      "usage: shacrypt_tool [--config FILE] [--rounds N] [--salt S] [--workers N]\n"
      "                     [--log-file FILE] [--log-level LEVEL]\n"
      "                     hash | verify ENCODED | batch-verify\n"
      "\n"
      "  hash          read a password from stdin, print its $5$ string\n"
      "  verify        read a password from stdin, exit 0 if it matches ENCODED\n"
      "  batch-verify  read ENCODED<TAB>PASSWORD lines, print OK/FAIL/INVALID per line\n"
      "\n"
      "schemes:";
  for (const auto& name : default_registry().names()) {
    text += " " + name;
  }
  text += "\n";
  return text;
}

}  // namespace shacrypt::tool
