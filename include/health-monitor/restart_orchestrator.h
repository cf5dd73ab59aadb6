#pragma once

#include "health-monitor/server_config.h"

#include <chrono>
#include <mutex>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include <sys/types.h>

namespace hmon {

class HealthEngine;
class IClock;
class IProcessInspector;
class IProcessSpawner;
class Logger;
class ProcessLocator;
class SpawnRegistry;

struct RestartPolicy {
    // Upper bound on the wait for a fresh process before re-verifying.
    std::chrono::milliseconds startup_grace{5000};
    // Probe period inside the startup grace and the kill grace.
    std::chrono::milliseconds poll_interval{250};
    // Time between SIGTERM and SIGKILL for the old process.
    std::chrono::milliseconds kill_grace{1000};
};

struct RestartResult {
    bool success = false;
    std::string message;
};

struct NamedRestartResult {
    std::string name;
    bool success = false;
    std::string message;
};

// Terminate -> spawn -> grace -> re-verify for one server. Linear, no
// retries. Failures are reported in the result, never thrown.
class RestartOrchestrator {
public:
    RestartOrchestrator(IServerSource& servers,
                        HealthEngine& engine,
                        ProcessLocator& locator,
                        SpawnRegistry& registry,
                        IProcessSpawner& spawner,
                        IProcessInspector& inspector,
                        IClock& clock,
                        Logger& logger,
                        RestartPolicy policy = RestartPolicy{});

    RestartResult restart(std::string_view name);

    // get_unhealthy() once, then one restart per server, sequentially.
    std::vector<NamedRestartResult> restart_all_unhealthy();

    [[nodiscard]] const RestartPolicy& policy() const { return policy_; }

private:
    RestartResult restart_spec(const ServerSpec& spec);
    void terminate(const ServerSpec& spec);
    // Returns false when the process disappeared before the grace ran out.
    bool await_startup(const ServerSpec& spec, pid_t pid);

    // False when a restart of `name` is already running.
    bool begin_restart(const std::string& name);

    IServerSource& servers_;
    HealthEngine& engine_;
    ProcessLocator& locator_;
    SpawnRegistry& registry_;
    IProcessSpawner& spawner_;
    IProcessInspector& inspector_;
    IClock& clock_;
    Logger& logger_;
    RestartPolicy policy_;

    std::mutex in_flight_mutex_;
    std::set<std::string> in_flight_;
};

} // namespace hmon
