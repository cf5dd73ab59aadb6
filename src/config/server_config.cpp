#include "health-monitor/server_config.h"
#include "health-monitor/logger.h"

#include <nlohmann/json.hpp>

#include <fstream>
#include <iterator>
#include <sstream>

namespace hmon {

const ServerSpec* find_server(const ServerSpecList& specs, std::string_view name) {
  for (const auto& spec : specs) {
    if (spec.name == name) {
      return &spec;
    }
  }
  return nullptr;
}

std::string joined_args(const ServerSpec& spec) {
  std::string out;
  for (size_t i = 0; i < spec.args.size(); ++i) {
    if (i > 0) {
      out += ' ';
    }
    out += spec.args[i];
  }
  return out;
}

Result<ServerSpecList> parse_server_config(std::string_view json_text,
                                           std::vector<std::string>* skipped) {
  nlohmann::ordered_json doc;
  try {
    doc = nlohmann::ordered_json::parse(json_text);
  } catch (const nlohmann::json::parse_error& e) {
    return Result<ServerSpecList>::error(ErrorCode::ConfigParseError, e.what());
  }

  if (!doc.is_object()) {
    return Result<ServerSpecList>::error(ErrorCode::ConfigParseError,
                                         "config root is not an object");
  }

  ServerSpecList specs;
  auto servers = doc.find("mcpServers");
  if (servers == doc.end() || !servers->is_object()) {
    return Result<ServerSpecList>::ok(specs);
  }

  for (const auto& [name, entry] : servers->items()) {
    auto command = entry.is_object() ? entry.find("command") : entry.end();
    if (command == entry.end() || !command->is_string()) {
      if (skipped) {
        skipped->push_back(name);
      }
      continue;
    }

    ServerSpec spec;
    spec.name = name;
    spec.command = command->get<std::string>();

    auto description = entry.find("description");
    if (description != entry.end() && description->is_string()) {
      spec.description = description->get<std::string>();
    }

    auto args = entry.find("args");
    if (args != entry.end() && args->is_array()) {
      for (const auto& arg : *args) {
        if (arg.is_string()) {
          spec.args.push_back(arg.get<std::string>());
        } else {
          spec.args.push_back(arg.dump());
        }
      }
    }

    specs.push_back(std::move(spec));
  }

  return Result<ServerSpecList>::ok(std::move(specs));
}

ServerConfigStore::ServerConfigStore(std::string path, Logger& logger)
    : path_(std::move(path)), logger_(logger) {}

Result<ServerSpecList> ServerConfigStore::read(std::vector<std::string>* skipped) const {
  std::ifstream file(path_);
  if (!file) {
    return Result<ServerSpecList>::error(ErrorCode::ConfigNotFound, "cannot open " + path_);
  }

  std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
  return parse_server_config(content, skipped);
}

ServerSpecList ServerConfigStore::load() {
  std::vector<std::string> skipped;
  auto result = read(&skipped);
  if (!result) {
    logger_.error("Failed to load server config " + path_ + ": " + result.error().message);
    return {};
  }
  for (const auto& name : skipped) {
    logger_.warn("server '" + name + "' has no command, ignoring");
  }

  std::ostringstream oss;
  oss << "loaded " << result.value().size() << " server(s) from " << path_;
  logger_.debug(oss.str());
  return std::move(result.value());
}

} // namespace hmon
