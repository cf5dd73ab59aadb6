#pragma once

#include "health-monitor/result.h"

#include <string>
#include <string_view>
#include <vector>

namespace hmon {

class Logger;

// Launch specification of one managed server. Never mutated after loading.
struct ServerSpec {
  std::string name;
  std::string description;
  std::string command;
  std::vector<std::string> args;
};

// Ordered as in the config file.
using ServerSpecList = std::vector<ServerSpec>;

const ServerSpec* find_server(const ServerSpecList& specs, std::string_view name);

// Space-joined args, empty when there are none.
std::string joined_args(const ServerSpec& spec);

// Source of the managed server set (injected for testability)
class IServerSource {
public:
  virtual ~IServerSource() = default;

  virtual ServerSpecList load() = 0;
};

// Parse the JSON document; servers live under "mcpServers".
// Entries without a string "command" are skipped and their names appended to
// `skipped` when given.
Result<ServerSpecList> parse_server_config(std::string_view json_text,
                                           std::vector<std::string>* skipped = nullptr);

// Reads the config file on every load() so edits apply without a restart.
// Read or parse failures degrade to an empty server set.
class ServerConfigStore : public IServerSource {
public:
  ServerConfigStore(std::string path, Logger& logger);

  ServerSpecList load() override;

  // ConfigNotFound when the file cannot be opened, ConfigParseError when it is
  // not a JSON object.
  Result<ServerSpecList> read(std::vector<std::string>* skipped = nullptr) const;

  [[nodiscard]] const std::string& path() const { return path_; }

private:
  std::string path_;
  Logger& logger_;
};

} // namespace hmon
