#include "health-monitor/health_cache.h"

namespace hmon {

std::string_view health_state_to_string(HealthState state) {
    switch (state) {
        case HealthState::Healthy: return "healthy";
        case HealthState::Unhealthy: return "unhealthy";
        case HealthState::Unknown: return "unknown";
    }
    return "unknown";
}

HealthCache::HealthCache(std::chrono::milliseconds freshness) : freshness_(freshness) {}

std::optional<HealthCacheEntry> HealthCache::get(const std::string& name, TimePoint now) const {
    auto it = entries_.find(name);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    if (now - it->second.observed_at >= freshness_) {
        return std::nullopt;
    }
    return it->second;
}

void HealthCache::put(const std::string& name, bool healthy, TimePoint now) {
    put(name, healthy, now, healthy ? HealthState::Healthy : HealthState::Unhealthy);
}

void HealthCache::put(const std::string& name, bool healthy, TimePoint now, HealthState state) {
    entries_[name] = HealthCacheEntry{healthy, state, now};
}

void HealthCache::invalidate(const std::string& name) {
    entries_.erase(name);
}

} // namespace hmon
