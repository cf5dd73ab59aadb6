#include "health-monitor/health_engine.h"
#include "health-monitor/logger.h"
#include "health-monitor/process_inspector.h"

#include <sstream>

namespace hmon {

HealthEngine::HealthEngine(IServerSource& servers,
                           IProcessInspector& inspector,
                           ProcessLocator& locator,
                           SpawnRegistry& registry,
                           IClock& clock,
                           Logger& logger,
                           UnknownPolicy unknown_policy,
                           std::chrono::milliseconds freshness)
    : servers_(servers),
      inspector_(inspector),
      locator_(locator),
      registry_(registry),
      clock_(clock),
      logger_(logger),
      unknown_policy_(unknown_policy),
      cache_(freshness) {}

Result<ServerStatus> HealthEngine::check_one(std::string_view name) {
    auto specs = servers_.load();
    const ServerSpec* spec = find_server(specs, name);
    if (!spec) {
        return Result<ServerStatus>::error(
            ErrorCode::ServerNotConfigured,
            "Server '" + std::string(name) + "' not found in configuration");
    }
    return Result<ServerStatus>::ok(check_spec(*spec));
}

Result<ServerStatus> HealthEngine::force_check(std::string_view name) {
    invalidate(std::string(name));
    return check_one(name);
}

ServerStatus HealthEngine::check_spec(const ServerSpec& spec) {
    TimePoint now = clock_.now();

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (auto entry = cache_.get(spec.name, now)) {
            ServerStatus status = status_from_spec(spec);
            status.healthy = entry->healthy;
            status.state = entry->state;
            status.last_checked = entry->observed_at;
            status.cached = true;
            return status;
        }
    }

    ServerStatus status = probe_spec(spec, now);

    std::lock_guard<std::mutex> lock(state_mutex_);
    auto previous = statuses_.find(spec.name);
    if (previous != statuses_.end() && previous->second.state != status.state) {
        logger_.info("server " + spec.name + " is now " +
                     std::string(health_state_to_string(status.state)));
    }
    cache_.put(spec.name, status.healthy, status.last_checked, status.state);
    statuses_[spec.name] = status;
    return status;
}

std::vector<ServerStatus> HealthEngine::check_all() {
    std::vector<ServerStatus> statuses;
    for (const auto& spec : servers_.load()) {
        statuses.push_back(check_spec(spec));
    }

    std::lock_guard<std::mutex> lock(state_mutex_);
    last_full_check_ = clock_.now();
    return statuses;
}

std::vector<ServerStatus> HealthEngine::check_all_forced() {
    std::vector<ServerStatus> statuses;
    for (const auto& spec : servers_.load()) {
        invalidate(spec.name);
        statuses.push_back(check_spec(spec));
    }

    std::lock_guard<std::mutex> lock(state_mutex_);
    last_full_check_ = clock_.now();
    return statuses;
}

std::vector<ServerStatus> HealthEngine::get_unhealthy() {
    std::vector<ServerStatus> unhealthy;
    for (auto& status : check_all()) {
        if (!status.healthy) {
            unhealthy.push_back(std::move(status));
        }
    }
    return unhealthy;
}

void HealthEngine::invalidate(const std::string& name) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    cache_.invalidate(name);
}

std::optional<TimePoint> HealthEngine::last_full_check() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return last_full_check_;
}

std::optional<ServerStatus> HealthEngine::last_status(const std::string& name) const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    auto it = statuses_.find(name);
    if (it == statuses_.end()) {
        return std::nullopt;
    }
    return it->second;
}

ServerStatus HealthEngine::probe_spec(const ServerSpec& spec, TimePoint now) {
    ServerStatus status = status_from_spec(spec);
    status.last_checked = now;

    ProcessMatch match = locator_.locate(spec);
    ProbeResult probe;
    if (match.pid) {
        probe = inspector_.probe(*match.pid);
        if (!probe.exists && match.source == MatchSource::Spawned) {
            // The process we spawned is gone; fall back to the heuristic.
            logger_.debug("spawned pid " + std::to_string(*match.pid) + " of " + spec.name +
                          " is gone");
            registry_.forget(spec.name);
            match = locator_.locate_by_command_line(spec);
            if (match.pid) {
                probe = inspector_.probe(*match.pid);
            }
        }
    }

    status.match = match.source;
    if (match.pid) {
        status.pid = match.pid;
        status.state = probe.exists ? HealthState::Healthy : HealthState::Unhealthy;
        status.healthy = probe.exists;
        status.uptime_seconds = probe.uptime_seconds;
    } else {
        // No OS footprint found and no transport-level ping exists.
        status.state = HealthState::Unknown;
        status.healthy = unknown_policy_ == UnknownPolicy::TreatAsHealthy;
    }

    std::ostringstream oss;
    oss << "probed " << spec.name << ": " << health_state_to_string(status.state)
        << " (match=" << match_source_to_string(status.match);
    if (status.pid) {
        oss << ", pid=" << *status.pid;
    }
    oss << ")";
    logger_.debug(oss.str());
    return status;
}

ServerStatus HealthEngine::status_from_spec(const ServerSpec& spec) const {
    ServerStatus status;
    status.name = spec.name;
    status.description = spec.description;
    status.command = spec.command;
    status.args = spec.args;
    return status;
}

} // namespace hmon
