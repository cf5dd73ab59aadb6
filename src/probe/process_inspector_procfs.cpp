#include "health-monitor/process_inspector.h"
#include "procfs_stat.h"

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <dirent.h>
#include <signal.h>
#include <sys/types.h>
#include <unistd.h>

namespace hmon {

namespace {

bool is_dead_state(char state) {
  // Z: zombie, X: dead
  return state == 'Z' || state == 'X';
}

} // namespace

std::vector<ProcessEntry> ProcfsProcessInspector::list_processes() {
  std::vector<ProcessEntry> entries;

  DIR* proc_dir = opendir("/proc");
  if (!proc_dir) {
    return entries; // Unable to access /proc
  }

  int scanned = 0;
  struct dirent* entry;
  while ((entry = readdir(proc_dir)) != nullptr && scanned < kMaxProcEntries) {
    if (entry->d_type != DT_DIR && entry->d_type != DT_UNKNOWN)
      continue;

    // pid directories are digits only
    char* endptr;
    long pid = strtol(entry->d_name, &endptr, 10);
    if (*endptr != '\0' || pid <= 0)
      continue;

    scanned++;

    auto stat = read_proc_stat(static_cast<pid_t>(pid));
    if (!stat || is_dead_state(stat->state))
      continue;

    std::string cmdline = read_proc_cmdline(static_cast<pid_t>(pid));
    if (cmdline.empty())
      continue; // kernel thread or already gone

    entries.push_back({static_cast<pid_t>(pid), std::move(cmdline)});
  }

  closedir(proc_dir);

  std::sort(entries.begin(), entries.end(),
            [](const ProcessEntry& a, const ProcessEntry& b) { return a.pid < b.pid; });
  return entries;
}

ProbeResult ProcfsProcessInspector::probe(pid_t pid) {
  ProbeResult result;
  if (pid <= 0) {
    return result;
  }

  if (kill(pid, 0) != 0 && errno != EPERM) {
    return result;
  }

  auto stat = read_proc_stat(pid);
  if (stat && is_dead_state(stat->state)) {
    return result;
  }

  result.exists = true;
  result.uptime_seconds = 0;

  auto system_uptime = read_system_uptime_seconds();
  long ticks_per_second = sysconf(_SC_CLK_TCK);
  if (stat && system_uptime && ticks_per_second > 0) {
    double started = static_cast<double>(stat->start_time_ticks) / ticks_per_second;
    double elapsed = *system_uptime - started;
    if (elapsed > 0) {
      result.uptime_seconds = static_cast<int64_t>(std::floor(elapsed));
    }
  }

  return result;
}

} // namespace hmon
