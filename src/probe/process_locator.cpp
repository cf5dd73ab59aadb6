#include "health-monitor/process_locator.h"
#include "health-monitor/process_inspector.h"

namespace hmon {

std::string_view match_source_to_string(MatchSource source) {
    switch (source) {
        case MatchSource::None: return "none";
        case MatchSource::Spawned: return "spawned";
        case MatchSource::CommandLine: return "cmdline";
    }
    return "none";
}

void SpawnRegistry::record(const std::string& name, pid_t pid) {
    std::lock_guard<std::mutex> lock(mutex_);
    pids_[name] = pid;
}

void SpawnRegistry::forget(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    pids_.erase(name);
}

std::optional<pid_t> SpawnRegistry::get(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pids_.find(name);
    if (it == pids_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool command_line_matches(std::string_view cmdline, const ServerSpec& spec) {
    if (!spec.command.empty() && cmdline.find(spec.command) != std::string_view::npos) {
        return true;
    }
    std::string args = joined_args(spec);
    return !args.empty() && cmdline.find(args) != std::string_view::npos;
}

ProcessLocator::ProcessLocator(IProcessInspector& inspector, SpawnRegistry& registry, pid_t self_pid)
    : inspector_(inspector), registry_(registry), self_pid_(self_pid) {}

ProcessMatch ProcessLocator::locate(const ServerSpec& spec) {
    auto entries = inspector_.list_processes();
    if (auto spawned = registry_.get(spec.name)) {
        for (const auto& entry : entries) {
            if (entry.pid == *spawned && command_line_matches(entry.cmdline, spec)) {
                return ProcessMatch{*spawned, MatchSource::Spawned};
            }
        }
        // Exited, or the pid now belongs to another program.
        registry_.forget(spec.name);
    }
    return match_command_line(entries, spec);
}

ProcessMatch ProcessLocator::locate_by_command_line(const ServerSpec& spec) {
    return match_command_line(inspector_.list_processes(), spec);
}

ProcessMatch ProcessLocator::match_command_line(const std::vector<ProcessEntry>& entries,
                                                const ServerSpec& spec) const {
    // Entries are sorted by pid, so the first hit is the lowest.
    for (const auto& entry : entries) {
        if (entry.pid == self_pid_) {
            continue;
        }
        if (command_line_matches(entry.cmdline, spec)) {
            return ProcessMatch{entry.pid, MatchSource::CommandLine};
        }
    }
    return ProcessMatch{};
}

std::vector<pid_t> ProcessLocator::find_restart_victims(const ServerSpec& spec) {
    std::vector<pid_t> pids;
    std::string args = joined_args(spec);
    auto spawned = registry_.get(spec.name);

    for (const auto& entry : inspector_.list_processes()) {
        if (entry.pid == self_pid_) {
            continue;
        }
        bool args_match = !args.empty() && entry.cmdline.find(args) != std::string::npos;
        bool spawned_match = spawned && entry.pid == *spawned &&
                             command_line_matches(entry.cmdline, spec);
        if (args_match || spawned_match) {
            pids.push_back(entry.pid);
        }
    }
    return pids;
}

} // namespace hmon
