// Small helpers reading /proc/<pid>/stat, /proc/<pid>/cmdline and /proc/uptime
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <sys/types.h>

namespace hmon {

struct ProcStat {
  char state = '?';
  // start_time, field 22, clock ticks since boot
  uint64_t start_time_ticks = 0;
};

// Read and parse /proc/<pid>/stat, or std::nullopt on read/parse failure.
std::optional<ProcStat> read_proc_stat(pid_t pid);

// Parse a full /proc/<pid>/stat line. The caller should ensure the buffer
// contains a NUL-terminated line as read from procfs. Exposed for unit testing.
std::optional<ProcStat> parse_stat_line(const char* stat_line);

// Seconds since boot from the first field of /proc/uptime.
std::optional<double> read_system_uptime_seconds();
std::optional<double> parse_uptime_line(const char* uptime_line);

// argv of <pid> joined with single spaces; empty for kernel threads or when
// the process vanished.
std::string read_proc_cmdline(pid_t pid);

} // namespace hmon
