#include "health-monitor/tool_handler.h"
#include "health-monitor/logger.h"
#include "health-monitor/restart_orchestrator.h"

#include <stdexcept>

namespace hmon {

namespace {

constexpr int kIndent = 2;

nlohmann::json name_schema(const std::string& description) {
    return {
        {"type", "object"},
        {"properties", {{"name", {{"type", "string"}, {"description", description}}}}},
        {"required", nlohmann::json::array({"name"})},
    };
}

nlohmann::json empty_schema() {
    return {{"type", "object"}, {"properties", nlohmann::json::object()}};
}

std::string required_name(const nlohmann::json& arguments) {
    if (!arguments.is_object()) {
        throw std::invalid_argument("Server name is required");
    }
    auto it = arguments.find("name");
    if (it == arguments.end() || !it->is_string() || it->get<std::string>().empty()) {
        throw std::invalid_argument("Server name is required");
    }
    return it->get<std::string>();
}

nlohmann::ordered_json status_array(const std::vector<ServerStatus>& statuses) {
    nlohmann::ordered_json servers = nlohmann::ordered_json::array();
    for (const auto& status : statuses) {
        servers.push_back(to_json(status));
    }
    return servers;
}

size_t count_healthy(const std::vector<ServerStatus>& statuses) {
    size_t healthy = 0;
    for (const auto& status : statuses) {
        if (status.healthy) {
            ++healthy;
        }
    }
    return healthy;
}

ToolResult text_result(const nlohmann::ordered_json& payload, bool is_error = false) {
    return ToolResult{payload.dump(kIndent), is_error};
}

} // namespace

nlohmann::ordered_json to_json(const ServerStatus& status) {
    nlohmann::ordered_json out;
    out["name"] = status.name;
    out["description"] = status.description;
    out["command"] = status.command;
    out["args"] = status.args;
    out["healthy"] = status.healthy;
    out["state"] = std::string(health_state_to_string(status.state));
    out["lastChecked"] = format_iso8601(status.last_checked);
    if (status.uptime_seconds) {
        out["uptimeSeconds"] = *status.uptime_seconds;
    }
    if (status.pid) {
        out["pid"] = *status.pid;
    }
    out["match"] = std::string(match_source_to_string(status.match));
    out["cached"] = status.cached;
    return out;
}

ToolHandler::ToolHandler(HealthEngine& engine, RestartOrchestrator& orchestrator, IClock& clock, Logger& logger)
    : engine_(engine), orchestrator_(orchestrator), clock_(clock), logger_(logger) {}

const std::vector<ToolDefinition>& ToolHandler::definitions() {
    static const std::vector<ToolDefinition> tools = {
        {"list_servers", "List all configured MCP servers with their health status", empty_schema()},
        {"check_health", "Check health of a specific MCP server by name",
         name_schema("Name of the MCP server to check")},
        {"check_all_health", "Force check health of all MCP servers", empty_schema()},
        {"restart_server", "Restart a specific MCP server by name",
         name_schema("Name of the MCP server to restart")},
        {"get_unhealthy", "Get list of all unhealthy MCP servers", empty_schema()},
        {"restart_unhealthy", "Restart all unhealthy MCP servers automatically", empty_schema()},
    };
    return tools;
}

ToolResult ToolHandler::call(std::string_view tool, const nlohmann::json& arguments) {
    logger_.debug("tool call: " + std::string(tool));
    try {
        return dispatch(tool, arguments);
    } catch (const std::exception& e) {
        logger_.error("tool " + std::string(tool) + " failed: " + e.what());
        return ToolResult{std::string("Error: ") + e.what(), true};
    }
}

ToolResult ToolHandler::dispatch(std::string_view tool, const nlohmann::json& arguments) {
    if (tool == "list_servers") {
        return list_servers();
    } else if (tool == "check_health") {
        return check_health(arguments);
    } else if (tool == "check_all_health") {
        return check_all_health();
    } else if (tool == "restart_server") {
        return restart_server(arguments);
    } else if (tool == "get_unhealthy") {
        return get_unhealthy();
    } else if (tool == "restart_unhealthy") {
        return restart_unhealthy();
    }
    throw std::invalid_argument("Unknown tool: " + std::string(tool));
}

ToolResult ToolHandler::list_servers() {
    auto statuses = engine_.check_all();
    size_t healthy = count_healthy(statuses);
    auto last = engine_.last_full_check();

    nlohmann::ordered_json payload;
    payload["summary"] = {
        {"total", statuses.size()},
        {"healthy", healthy},
        {"unhealthy", statuses.size() - healthy},
        {"lastChecked", last ? format_iso8601(*last) : std::string("never")},
    };
    payload["servers"] = status_array(statuses);
    return text_result(payload);
}

ToolResult ToolHandler::check_health(const nlohmann::json& arguments) {
    std::string name = required_name(arguments);
    auto result = engine_.force_check(name);
    if (!result) {
        return ToolResult{result.error().message, true};
    }
    return text_result(to_json(result.value()));
}

ToolResult ToolHandler::check_all_health() {
    auto statuses = engine_.check_all_forced();
    size_t healthy = count_healthy(statuses);

    nlohmann::ordered_json payload;
    payload["summary"] = {
        {"total", statuses.size()},
        {"healthy", healthy},
        {"unhealthy", statuses.size() - healthy},
        {"checkedAt", format_iso8601(clock_.now())},
    };
    payload["servers"] = status_array(statuses);
    return text_result(payload);
}

ToolResult ToolHandler::restart_server(const nlohmann::json& arguments) {
    std::string name = required_name(arguments);
    RestartResult result = orchestrator_.restart(name);

    nlohmann::ordered_json payload;
    payload["success"] = result.success;
    payload["message"] = result.message;
    return text_result(payload, !result.success);
}

ToolResult ToolHandler::get_unhealthy() {
    auto statuses = engine_.get_unhealthy();

    nlohmann::ordered_json payload;
    payload["count"] = statuses.size();
    payload["servers"] = status_array(statuses);
    return text_result(payload);
}

ToolResult ToolHandler::restart_unhealthy() {
    auto results = orchestrator_.restart_all_unhealthy();
    size_t successful = 0;
    nlohmann::ordered_json entries = nlohmann::ordered_json::array();
    for (const auto& result : results) {
        if (result.success) {
            ++successful;
        }
        nlohmann::ordered_json entry;
        entry["name"] = result.name;
        entry["success"] = result.success;
        entry["message"] = result.message;
        entries.push_back(std::move(entry));
    }

    nlohmann::ordered_json payload;
    payload["summary"] = {
        {"total", results.size()},
        {"successful", successful},
        {"failed", results.size() - successful},
    };
    payload["results"] = std::move(entries);
    return text_result(payload);
}

} // namespace hmon
