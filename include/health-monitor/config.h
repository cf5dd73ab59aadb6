#pragma once

#include "health-monitor/result.h"

#include <cstdint>
#include <string_view>

namespace hmon {

inline constexpr std::string_view kDefaultServerConfigPath =
    "/root/.openclaw/workspace/config/mcporter.json";

struct Config {
  std::string_view config_path;
  std::string_view log_level;
  std::string_view inspector;
  std::string_view unknown_as;
  int64_t startup_grace_ms = 5000;
  // One-shot mode: run a single tool and exit.
  std::string_view call_tool;
  std::string_view call_name;
  bool show_version = false;
  bool show_help = false;
};

struct ConfigParser {
  static Result<Config> parse(int argc, char* argv[]);
  static std::string_view version();
  static std::string_view usage();
};

} // namespace hmon
