#pragma once

#include "health-monitor/server_config.h"

#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <sys/types.h>

namespace hmon {

class IProcessInspector;
struct ProcessEntry;

// How a server was mapped to an OS process.
enum class MatchSource {
    None,        // nothing found
    Spawned,     // pid recorded when this monitor spawned the server
    CommandLine, // substring heuristic over the process table
};

std::string_view match_source_to_string(MatchSource source);

struct ProcessMatch {
    std::optional<pid_t> pid;
    MatchSource source = MatchSource::None;
};

// Pids this monitor spawned, by server name.
class SpawnRegistry {
public:
    void record(const std::string& name, pid_t pid);
    void forget(const std::string& name);
    [[nodiscard]] std::optional<pid_t> get(const std::string& name) const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, pid_t> pids_;
};

// True when `cmdline` contains the server's command, or its space-joined args
// when there are any.
bool command_line_matches(std::string_view cmdline, const ServerSpec& spec);

// Maps a server to an OS process. A recorded spawn wins while that pid is live
// and its command line still matches; otherwise the record is dropped, the
// process table is scanned and the lowest matching pid is picked. The scan is a
// heuristic: one server's process may be attributed to another whose command
// line overlaps, and servers without a distinct OS process are never found.
class ProcessLocator {
public:
    ProcessLocator(IProcessInspector& inspector, SpawnRegistry& registry, pid_t self_pid);

    ProcessMatch locate(const ServerSpec& spec);

    // Heuristic match only, ignoring the spawn registry.
    ProcessMatch locate_by_command_line(const ServerSpec& spec);

    // Processes to terminate before a respawn: every live pid whose command
    // line contains the space-joined args, plus the recorded spawn when its
    // command line still matches the server (a recycled pid is left alone).
    // Sorted, without duplicates.
    std::vector<pid_t> find_restart_victims(const ServerSpec& spec);

private:
    ProcessMatch match_command_line(const std::vector<ProcessEntry>& entries,
                                    const ServerSpec& spec) const;

    IProcessInspector& inspector_;
    SpawnRegistry& registry_;
    pid_t self_pid_;
};

} // namespace hmon
