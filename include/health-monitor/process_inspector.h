#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <sys/types.h>

namespace hmon {

struct ProcessEntry {
    pid_t pid = 0;
    // argv joined with single spaces
    std::string cmdline;
};

struct ProbeResult {
    bool exists = false;
    // Absent when the process does not exist. Unreadable start times degrade
    // to 0: liveness is what matters, uptime is advisory.
    std::optional<int64_t> uptime_seconds;
};

// Interface for reading the OS process table (injected for testability)
class IProcessInspector {
public:
    virtual ~IProcessInspector() = default;

    // Live processes sorted by ascending pid. Zombies are excluded.
    // Bounded scan: implementations cap the number of entries visited.
    virtual std::vector<ProcessEntry> list_processes() = 0;

    // Existence check without a disruptive signal, plus uptime.
    virtual ProbeResult probe(pid_t pid) = 0;
};

// Production Linux implementation using /proc
class ProcfsProcessInspector : public IProcessInspector {
public:
    // Hard cap on /proc entries to visit per call (avoid pathological load)
    static constexpr int kMaxProcEntries = 5000;

    std::vector<ProcessEntry> list_processes() override;
    ProbeResult probe(pid_t pid) override;
};

// Portable implementation shelling out to ps(1); uptime comes from the
// etime column.
class PsProcessInspector : public IProcessInspector {
public:
    static constexpr int kMaxProcEntries = 5000;

    std::vector<ProcessEntry> list_processes() override;
    ProbeResult probe(pid_t pid) override;
};

// Convert a ps etime string ([[DD-]HH:]MM:SS) to whole seconds.
// Unrecognized input yields 0.
int64_t parse_elapsed_time(std::string_view etime);

} // namespace hmon
