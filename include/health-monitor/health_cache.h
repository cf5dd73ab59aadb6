#pragma once

#include "health-monitor/clock.h"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace hmon {

enum class HealthState : uint8_t {
    Healthy,
    Unhealthy,
    // No process found and no transport-level ping available.
    Unknown,
};

std::string_view health_state_to_string(HealthState state);

struct HealthCacheEntry {
    bool healthy = false;
    HealthState state = HealthState::Unhealthy;
    TimePoint observed_at;
};

// Single-entry-per-server memo of the last probe verdict. An entry is fresh
// while now - observed_at < freshness; stale entries are ignored but only
// removed by invalidate(). Not synchronized: the owner serializes access.
class HealthCache {
public:
    static constexpr std::chrono::milliseconds kDefaultFreshness{30000};

    explicit HealthCache(std::chrono::milliseconds freshness = kDefaultFreshness);

    // Fresh entry for `name`, or std::nullopt on a miss or a stale entry.
    [[nodiscard]] std::optional<HealthCacheEntry> get(const std::string& name, TimePoint now) const;

    void put(const std::string& name, bool healthy, TimePoint now);
    void put(const std::string& name, bool healthy, TimePoint now, HealthState state);
    void invalidate(const std::string& name);

    [[nodiscard]] size_t size() const { return entries_.size(); }
    [[nodiscard]] std::chrono::milliseconds freshness() const { return freshness_; }

private:
    std::chrono::milliseconds freshness_;
    std::unordered_map<std::string, HealthCacheEntry> entries_;
};

} // namespace hmon
