#include <csignal>
#include <fcntl.h>
#include <iostream>
#include <memory>
#include <string>
#include <signal.h>
#include <unistd.h>

#include "health-monitor/clock.h"
#include "health-monitor/config.h"
#include "health-monitor/health_engine.h"
#include "health-monitor/logger.h"
#include "health-monitor/mcp_server.h"
#include "health-monitor/process_inspector.h"
#include "health-monitor/process_locator.h"
#include "health-monitor/process_spawner.h"
#include "health-monitor/restart_orchestrator.h"
#include "health-monitor/server_config.h"
#include "health-monitor/tool_handler.h"

namespace {

volatile std::sig_atomic_t g_signal_received = 0;

void signal_handler(int signal) {
    g_signal_received = signal;
}

// No SA_RESTART: a signal interrupts the blocking stdin read so the serve
// loop can return.
void install_signal_handlers() {
    struct sigaction sa {};
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    std::signal(SIGPIPE, SIG_IGN);
}

bool stdio_usable() {
    return fcntl(STDIN_FILENO, F_GETFL) != -1 && fcntl(STDOUT_FILENO, F_GETFL) != -1;
}

} // namespace

int main(int argc, char* argv[]) {
    auto config_result = hmon::ConfigParser::parse(argc, argv);
    if (!config_result) {
        std::cerr << "Error: " << config_result.error().message << "\n";
        return static_cast<int>(config_result.error().code);
    }

    auto& config = config_result.value();

    if (config.show_version) {
        std::cout << "health-monitor " << hmon::ConfigParser::version() << "\n";
        return 0;
    }

    if (config.show_help) {
        std::cout << hmon::ConfigParser::usage();
        return 0;
    }

    hmon::Logger logger(std::cerr, hmon::Logger::level_from_string(config.log_level));

    logger.info("health-monitor starting");
    logger.info("version: " + std::string(hmon::ConfigParser::version()));
    logger.info("server config: " + std::string(config.config_path));

    hmon::ServerConfigStore servers(std::string(config.config_path), logger);

    std::unique_ptr<hmon::IProcessInspector> inspector;
    if (config.inspector == "ps") {
        inspector = std::make_unique<hmon::PsProcessInspector>();
    } else {
        inspector = std::make_unique<hmon::ProcfsProcessInspector>();
    }

    hmon::SystemClock clock;
    hmon::SpawnRegistry registry;
    hmon::ProcessLocator locator(*inspector, registry, getpid());

    auto unknown_policy = config.unknown_as == "unhealthy" ? hmon::UnknownPolicy::TreatAsUnhealthy
                                                           : hmon::UnknownPolicy::TreatAsHealthy;
    hmon::HealthEngine engine(servers, *inspector, locator, registry, clock, logger, unknown_policy);

    hmon::RestartPolicy restart_policy;
    restart_policy.startup_grace = std::chrono::milliseconds{config.startup_grace_ms};
    hmon::PosixProcessSpawner spawner;
    hmon::RestartOrchestrator orchestrator(servers, engine, locator, registry, spawner, *inspector,
                                           clock, logger, restart_policy);

    hmon::ToolHandler tools(engine, orchestrator, clock, logger);

    if (!config.call_tool.empty()) {
        nlohmann::json arguments = nlohmann::json::object();
        if (!config.call_name.empty()) {
            arguments["name"] = std::string(config.call_name);
        }
        auto result = tools.call(config.call_tool, arguments);
        std::cout << result.text << "\n";
        return result.is_error ? 1 : 0;
    }

    install_signal_handlers();

    if (!stdio_usable()) {
        logger.error("stdin/stdout unavailable, cannot serve requests");
        return 1;
    }

    hmon::McpServer server(tools, logger, std::string(hmon::ConfigParser::version()));
    logger.info("MCP health monitor running on stdio");
    server.serve(std::cin, std::cout);

    if (g_signal_received != 0) {
        logger.warn("shutdown requested (signal " + std::to_string(g_signal_received) + ")");
    }

    logger.info("health-monitor stopped");

    return g_signal_received == SIGINT ? 130 : 0;
}
