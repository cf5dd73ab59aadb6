#pragma once

#include <atomic>
#include <istream>
#include <ostream>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace hmon {

class Logger;
class ToolHandler;

namespace rpc_error {
constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kInternalError = -32603;
} // namespace rpc_error

inline constexpr std::string_view kMcpProtocolVersion = "2024-11-05";

// Model Context Protocol host: one JSON-RPC 2.0 message per line in, one
// response per line out. Requests are handled one at a time.
class McpServer {
public:
  McpServer(ToolHandler& tools, Logger& logger, std::string server_version);

  // Until EOF, a read error or a "shutdown" request.
  void serve(std::istream& in, std::ostream& out);
  void stop();
  [[nodiscard]] bool running() const noexcept { return running_.load(); }

  // Returns a null json for notifications, which get no response, even when
  // they are malformed.
  nlohmann::json handle_line(const std::string& line);
  nlohmann::json handle_request(const nlohmann::json& request);

private:
  nlohmann::json handle_initialize(const nlohmann::json& id);
  nlohmann::json handle_tools_list(const nlohmann::json& id);
  nlohmann::json handle_tools_call(const nlohmann::json& params, const nlohmann::json& id);

  // Invalid UTF-8 in strings is replaced, never thrown.
  static std::string dump_line(const nlohmann::json& message);
  static nlohmann::json make_result(const nlohmann::json& id, nlohmann::json result);
  static nlohmann::json make_error(const nlohmann::json& id, int code, const std::string& message);

  ToolHandler& tools_;
  Logger& logger_;
  std::string server_version_;
  std::atomic<bool> running_{false};
};

} // namespace hmon
