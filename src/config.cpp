#include "health-monitor/config.h"

#include <charconv>
#include <cstdlib>
#include <string>
#include <string_view>

namespace hmon {

namespace {

constexpr std::string_view kVersion = "1.0.0";

constexpr std::string_view kUsage =
    "Usage: health-monitor [OPTIONS]\n"
    "Options:\n"
    "  --config <path>          Server config file (env HEALTH_MONITOR_CONFIG)\n"
    "  --log-level <level>      Log level (debug, info, warn, error)\n"
    "  --inspector <kind>       Process inspector (procfs, ps)\n"
    "  --unknown-as <verdict>   Verdict for undiscoverable servers (healthy, unhealthy)\n"
    "  --startup-grace-ms <ms>  Wait for a restarted server before re-checking\n"
    "  --call <tool>            Run one tool, print its result and exit\n"
    "  --name <server>          Server name argument for --call\n"
    "  --version, -v            Show version\n"
    "  --help, -h               Show this help\n";

} // namespace

Result<Config> ConfigParser::parse(int argc, char* argv[]) {
  Config config;
  config.log_level = "info";
  config.inspector = "procfs";
  config.unknown_as = "healthy";
  config.config_path = kDefaultServerConfigPath;

  if (const char* env_config = std::getenv("HEALTH_MONITOR_CONFIG")) {
    config.config_path = env_config;
  }

  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      config.show_help = true;
    } else if (arg == "--version" || arg == "-v") {
      config.show_version = true;
    } else if (arg == "--log-level" && i + 1 < argc) {
      config.log_level = argv[++i];
    } else if (arg == "--config" && i + 1 < argc) {
      config.config_path = argv[++i];
    } else if (arg == "--inspector" && i + 1 < argc) {
      config.inspector = argv[++i];
      if (config.inspector != "procfs" && config.inspector != "ps") {
        return Result<Config>::error(ErrorCode::InvalidArgument,
                                     "Unknown inspector: " + std::string(config.inspector));
      }
    } else if (arg == "--unknown-as" && i + 1 < argc) {
      config.unknown_as = argv[++i];
      if (config.unknown_as != "healthy" && config.unknown_as != "unhealthy") {
        return Result<Config>::error(ErrorCode::InvalidArgument,
                                     "Unknown verdict: " + std::string(config.unknown_as));
      }
    } else if (arg == "--startup-grace-ms" && i + 1 < argc) {
      std::string_view value = argv[++i];
      int64_t ms = 0;
      auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), ms);
      if (ec != std::errc{} || ptr != value.data() + value.size() || ms < 0) {
        return Result<Config>::error(ErrorCode::InvalidArgument,
                                     "Invalid --startup-grace-ms value");
      }
      config.startup_grace_ms = ms;
    } else if (arg == "--call" && i + 1 < argc) {
      config.call_tool = argv[++i];
    } else if (arg == "--name" && i + 1 < argc) {
      config.call_name = argv[++i];
    } else {
      return Result<Config>::error(ErrorCode::InvalidArgument, "Unknown argument");
    }
  }

  return Result<Config>::ok(config);
}

std::string_view ConfigParser::version() {
  return kVersion;
}

std::string_view ConfigParser::usage() {
  return kUsage;
}

} // namespace hmon
