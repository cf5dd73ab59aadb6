#include "health-monitor/mcp_server.h"
#include "health-monitor/logger.h"
#include "health-monitor/tool_handler.h"

#include <stdexcept>

namespace hmon {

McpServer::McpServer(ToolHandler& tools, Logger& logger, std::string server_version)
    : tools_(tools), logger_(logger), server_version_(std::move(server_version)) {}

void McpServer::serve(std::istream& in, std::ostream& out) {
  running_ = true;
  std::string line;

  while (running_ && std::getline(in, line)) {
    if (line.empty() || line == "\r") {
      continue;
    }

    std::string reply;
    try {
      nlohmann::json response = handle_line(line);
      if (!response.is_null()) {
        reply = dump_line(response);
      }
    } catch (const std::exception& e) {
      logger_.error(std::string("request failed: ") + e.what());
      reply = dump_line(make_error(nullptr, rpc_error::kInternalError, "Internal error"));
    }

    if (!reply.empty()) {
      out << reply << "\n";
      out.flush();
    }
  }

  running_ = false;
}

void McpServer::stop() {
  running_ = false;
}

nlohmann::json McpServer::handle_line(const std::string& line) {
  nlohmann::json request;
  try {
    request = nlohmann::json::parse(line);
  } catch (const nlohmann::json::parse_error& e) {
    // The parser message quotes raw input bytes, which may not be UTF-8.
    logger_.warn("unparseable request (byte " + std::to_string(e.byte) + ")");
    return make_error(nullptr, rpc_error::kParseError, "Parse error");
  }
  return handle_request(request);
}

nlohmann::json McpServer::handle_request(const nlohmann::json& request) {
  if (!request.is_object()) {
    return make_error(nullptr, rpc_error::kInvalidRequest, "Request is not an object");
  }

  nlohmann::json id = request.value("id", nlohmann::json());
  bool is_notification = !request.contains("id");

  if (!request.contains("jsonrpc") || request["jsonrpc"] != "2.0") {
    logger_.debug("invalid jsonrpc version");
    return is_notification ? nlohmann::json()
                           : make_error(id, rpc_error::kInvalidRequest, "Missing or invalid jsonrpc version");
  }
  if (!request.contains("method") || !request["method"].is_string()) {
    logger_.debug("request without a method");
    return is_notification ? nlohmann::json()
                           : make_error(id, rpc_error::kInvalidRequest, "Missing or invalid method");
  }

  std::string method = request["method"].get<std::string>();
  nlohmann::json params = request.value("params", nlohmann::json::object());
  logger_.debug("rpc: " + method);

  if (method == "notifications/initialized" || method == "initialized") {
    return nlohmann::json();
  }

  nlohmann::json response;
  if (method == "initialize") {
    response = handle_initialize(id);
  } else if (method == "ping") {
    response = make_result(id, nlohmann::json::object());
  } else if (method == "tools/list") {
    response = handle_tools_list(id);
  } else if (method == "tools/call") {
    response = handle_tools_call(params, id);
  } else if (method == "shutdown") {
    running_ = false;
    response = make_result(id, nlohmann::json::object());
  } else {
    response = make_error(id, rpc_error::kMethodNotFound, "Unknown method: " + method);
  }

  return is_notification ? nlohmann::json() : response;
}

nlohmann::json McpServer::handle_initialize(const nlohmann::json& id) {
  nlohmann::json result = {
      {"protocolVersion", std::string(kMcpProtocolVersion)},
      {"capabilities", {{"tools", nlohmann::json::object()}}},
      {"serverInfo", {{"name", "health-monitor"}, {"version", server_version_}}},
  };
  return make_result(id, std::move(result));
}

nlohmann::json McpServer::handle_tools_list(const nlohmann::json& id) {
  nlohmann::json tools = nlohmann::json::array();
  for (const auto& tool : ToolHandler::definitions()) {
    tools.push_back({
        {"name", tool.name},
        {"description", tool.description},
        {"inputSchema", tool.input_schema},
    });
  }
  return make_result(id, {{"tools", tools}});
}

nlohmann::json McpServer::handle_tools_call(const nlohmann::json& params, const nlohmann::json& id) {
  if (!params.is_object() || !params.contains("name") || !params["name"].is_string()) {
    return make_error(id, rpc_error::kInvalidParams, "Missing tool name");
  }

  std::string name = params["name"].get<std::string>();
  nlohmann::json arguments = params.value("arguments", nlohmann::json::object());
  ToolResult result = tools_.call(name, arguments);

  nlohmann::json content = nlohmann::json::array();
  content.push_back({{"type", "text"}, {"text", result.text}});
  return make_result(id, {{"content", content}, {"isError", result.is_error}});
}

std::string McpServer::dump_line(const nlohmann::json& message) {
  return message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

nlohmann::json McpServer::make_result(const nlohmann::json& id, nlohmann::json result) {
  return {
      {"jsonrpc", "2.0"},
      {"id", id},
      {"result", std::move(result)},
  };
}

nlohmann::json McpServer::make_error(const nlohmann::json& id, int code, const std::string& message) {
  return {
      {"jsonrpc", "2.0"},
      {"id", id},
      {"error", {{"code", code}, {"message", message}}},
  };
}

} // namespace hmon
