#pragma once

#include "health-monitor/clock.h"
#include "health-monitor/health_cache.h"
#include "health-monitor/process_locator.h"
#include "health-monitor/result.h"
#include "health-monitor/server_config.h"

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <sys/types.h>

namespace hmon {

class IProcessInspector;
class Logger;

// What the boolean `healthy` reports for a server whose state is Unknown.
enum class UnknownPolicy {
    TreatAsHealthy,
    TreatAsUnhealthy,
};

struct ServerStatus {
    std::string name;
    std::string description;
    std::string command;
    std::vector<std::string> args;
    bool healthy = false;
    HealthState state = HealthState::Unhealthy;
    TimePoint last_checked;
    std::optional<int64_t> uptime_seconds;
    std::optional<pid_t> pid;
    MatchSource match = MatchSource::None;
    // Built from a fresh cache entry, no probe performed.
    bool cached = false;
};

// Produces ServerStatus values for the configured servers, memoizing
// verdicts in a HealthCache. Owns the cache, the last-status map and the
// last-full-check time; all three are guarded by one mutex.
class HealthEngine {
public:
    HealthEngine(IServerSource& servers,
                 IProcessInspector& inspector,
                 ProcessLocator& locator,
                 SpawnRegistry& registry,
                 IClock& clock,
                 Logger& logger,
                 UnknownPolicy unknown_policy = UnknownPolicy::TreatAsHealthy,
                 std::chrono::milliseconds freshness = HealthCache::kDefaultFreshness);

    // Cached when fresh, probed otherwise.
    Result<ServerStatus> check_one(std::string_view name);

    // Invalidates the cache entry first, so a probe always happens.
    Result<ServerStatus> force_check(std::string_view name);

    // Steps shared by check_one and the restart path, for an already
    // resolved spec.
    ServerStatus check_spec(const ServerSpec& spec);

    // Every configured server, in config order. Stamps last_full_check().
    std::vector<ServerStatus> check_all();
    std::vector<ServerStatus> check_all_forced();

    // check_all() filtered on healthy == false.
    std::vector<ServerStatus> get_unhealthy();

    void invalidate(const std::string& name);

    [[nodiscard]] std::optional<TimePoint> last_full_check() const;
    [[nodiscard]] std::optional<ServerStatus> last_status(const std::string& name) const;
    [[nodiscard]] UnknownPolicy unknown_policy() const { return unknown_policy_; }

private:
    ServerStatus probe_spec(const ServerSpec& spec, TimePoint now);
    ServerStatus status_from_spec(const ServerSpec& spec) const;

    IServerSource& servers_;
    IProcessInspector& inspector_;
    ProcessLocator& locator_;
    SpawnRegistry& registry_;
    IClock& clock_;
    Logger& logger_;
    UnknownPolicy unknown_policy_;

    mutable std::mutex state_mutex_;
    HealthCache cache_;
    std::unordered_map<std::string, ServerStatus> statuses_;
    std::optional<TimePoint> last_full_check_;
};

} // namespace hmon
