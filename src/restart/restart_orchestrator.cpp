#include "health-monitor/restart_orchestrator.h"
#include "health-monitor/clock.h"
#include "health-monitor/health_engine.h"
#include "health-monitor/logger.h"
#include "health-monitor/process_inspector.h"
#include "health-monitor/process_locator.h"
#include "health-monitor/process_spawner.h"

#include <algorithm>
#include <signal.h>
#include <sstream>
#include <stdexcept>

namespace hmon {

namespace {

// Releases the per-server in-flight marker on every exit path.
class InFlightGuard {
public:
    InFlightGuard(std::mutex& mutex, std::set<std::string>& in_flight, std::string name)
        : mutex_(mutex), in_flight_(in_flight), name_(std::move(name)) {}
    ~InFlightGuard() {
        std::lock_guard<std::mutex> lock(mutex_);
        in_flight_.erase(name_);
    }
    InFlightGuard(const InFlightGuard&) = delete;
    InFlightGuard& operator=(const InFlightGuard&) = delete;

private:
    std::mutex& mutex_;
    std::set<std::string>& in_flight_;
    std::string name_;
};

} // namespace

RestartOrchestrator::RestartOrchestrator(IServerSource& servers,
                                         HealthEngine& engine,
                                         ProcessLocator& locator,
                                         SpawnRegistry& registry,
                                         IProcessSpawner& spawner,
                                         IProcessInspector& inspector,
                                         IClock& clock,
                                         Logger& logger,
                                         RestartPolicy policy)
    : servers_(servers),
      engine_(engine),
      locator_(locator),
      registry_(registry),
      spawner_(spawner),
      inspector_(inspector),
      clock_(clock),
      logger_(logger),
      policy_(policy) {}

RestartResult RestartOrchestrator::restart(std::string_view name) {
    auto specs = servers_.load();
    const ServerSpec* spec = find_server(specs, name);
    if (!spec) {
        return RestartResult{false, "Server " + std::string(name) + " not found in configuration"};
    }

    if (!begin_restart(spec->name)) {
        return RestartResult{false, "Restart of " + spec->name + " already in progress"};
    }
    InFlightGuard guard(in_flight_mutex_, in_flight_, spec->name);

    try {
        return restart_spec(*spec);
    } catch (const std::exception& e) {
        logger_.error("restart of " + spec->name + " failed: " + e.what());
        return RestartResult{false, "Failed to restart " + spec->name + ": " + e.what()};
    }
}

std::vector<NamedRestartResult> RestartOrchestrator::restart_all_unhealthy() {
    std::vector<NamedRestartResult> results;
    auto unhealthy = engine_.get_unhealthy();
    if (!unhealthy.empty()) {
        logger_.info("restarting " + std::to_string(unhealthy.size()) + " unhealthy server(s)");
    }
    for (const auto& status : unhealthy) {
        RestartResult result = restart(status.name);
        results.push_back(NamedRestartResult{status.name, result.success, std::move(result.message)});
    }
    return results;
}

RestartResult RestartOrchestrator::restart_spec(const ServerSpec& spec) {
    logger_.info("restarting " + spec.name);

    terminate(spec);

    auto spawned = spawner_.spawn_detached(spec.command, spec.args);
    if (!spawned) {
        logger_.error("spawn of " + spec.name + " failed: " + spawned.error().message);
        return RestartResult{false, "Failed to restart " + spec.name + ": " + spawned.error().message};
    }
    pid_t pid = spawned.value();
    registry_.record(spec.name, pid);
    logger_.info("spawned " + spec.name + " as pid " + std::to_string(pid));

    if (!await_startup(spec, pid)) {
        logger_.warn(spec.name + " (pid " + std::to_string(pid) + ") exited during startup");
    }

    engine_.invalidate(spec.name);
    ServerStatus status = engine_.check_spec(spec);

    // Unknown means neither the spawned pid nor a matching process was seen.
    if (status.healthy && status.state == HealthState::Healthy) {
        pid_t verified = status.pid.value_or(pid);
        logger_.info("restarted " + spec.name + " (pid " + std::to_string(verified) + ")");
        return RestartResult{true, "Successfully restarted " + spec.name + " (PID: " +
                                       std::to_string(verified) + ")"};
    }

    logger_.warn(spec.name + " still unhealthy after restart");
    return RestartResult{false, "Restarted " + spec.name + " but health check still failing"};
}

void RestartOrchestrator::terminate(const ServerSpec& spec) {
    std::vector<pid_t> victims = locator_.find_restart_victims(spec);
    registry_.forget(spec.name);
    if (victims.empty()) {
        logger_.debug("no running process found for " + spec.name);
        return;
    }

    for (pid_t pid : victims) {
        if (spawner_.send_signal(pid, SIGTERM)) {
            logger_.info("sent SIGTERM to " + spec.name + " pid " + std::to_string(pid));
        } else {
            logger_.debug("SIGTERM to pid " + std::to_string(pid) + " failed");
        }
    }

    TimePoint start = clock_.now();
    auto alive = [this](pid_t pid) { return inspector_.probe(pid).exists; };
    while (!victims.empty()) {
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(clock_.now() - start);
        if (elapsed >= policy_.kill_grace) {
            break;
        }
        clock_.sleep_for(std::min(policy_.poll_interval, policy_.kill_grace - elapsed));
        victims.erase(std::remove_if(victims.begin(), victims.end(),
                                     [&](pid_t pid) { return !alive(pid); }),
                      victims.end());
    }

    for (pid_t pid : victims) {
        logger_.warn("pid " + std::to_string(pid) + " of " + spec.name +
                     " survived SIGTERM, sending SIGKILL");
        spawner_.send_signal(pid, SIGKILL);
    }
}

bool RestartOrchestrator::await_startup(const ServerSpec& spec, pid_t pid) {
    TimePoint start = clock_.now();
    while (true) {
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(clock_.now() - start);
        if (elapsed >= policy_.startup_grace) {
            return true;
        }
        clock_.sleep_for(std::min(policy_.poll_interval, policy_.startup_grace - elapsed));
        if (!inspector_.probe(pid).exists) {
            return false;
        }
        std::ostringstream oss;
        oss << "waiting for " << spec.name << " (pid " << pid << ")";
        logger_.debug(oss.str());
    }
}

bool RestartOrchestrator::begin_restart(const std::string& name) {
    std::lock_guard<std::mutex> lock(in_flight_mutex_);
    return in_flight_.insert(name).second;
}

} // namespace hmon
