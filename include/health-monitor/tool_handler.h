#pragma once

#include "health-monitor/health_engine.h"

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace hmon {

class Logger;
class RestartOrchestrator;

struct ToolDefinition {
    std::string name;
    std::string description;
    nlohmann::json input_schema;
};

struct ToolResult {
    std::string text;
    bool is_error = false;
};

// Key order follows the ServerStatus fields; absent uptime and pid are omitted.
nlohmann::ordered_json to_json(const ServerStatus& status);

// The six health tools. Every call returns a text payload; failures,
// including exceptions thrown below this layer, come back flagged as errors.
class ToolHandler {
public:
    ToolHandler(HealthEngine& engine, RestartOrchestrator& orchestrator, IClock& clock, Logger& logger);

    static const std::vector<ToolDefinition>& definitions();

    ToolResult call(std::string_view tool, const nlohmann::json& arguments);

private:
    ToolResult dispatch(std::string_view tool, const nlohmann::json& arguments);

    ToolResult list_servers();
    ToolResult check_health(const nlohmann::json& arguments);
    ToolResult check_all_health();
    ToolResult restart_server(const nlohmann::json& arguments);
    ToolResult get_unhealthy();
    ToolResult restart_unhealthy();

    HealthEngine& engine_;
    RestartOrchestrator& orchestrator_;
    IClock& clock_;
    Logger& logger_;
};

} // namespace hmon
