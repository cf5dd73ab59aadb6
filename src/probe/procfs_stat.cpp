#include "procfs_stat.h"

#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iterator>
#include <unistd.h>

namespace hmon {

std::optional<ProcStat> read_proc_stat(pid_t pid) {
  char stat_path[256];
  snprintf(stat_path, sizeof(stat_path), "/proc/%d/stat", pid);
  FILE* stat_file = fopen(stat_path, "r");
  if (!stat_file)
    return std::nullopt;

  char buf[4096];
  if (!fgets(buf, sizeof(buf), stat_file)) {
    fclose(stat_file);
    return std::nullopt;
  }
  fclose(stat_file);
  return parse_stat_line(buf);
}

std::optional<ProcStat> parse_stat_line(const char* stat_line) {
  if (!stat_line)
    return std::nullopt;
  // comm may contain spaces and parentheses; the last ')' terminates it.
  const char* p = strrchr(stat_line, ')');
  if (!p)
    return std::nullopt;

  ProcStat stat;
  bool have_state = false;
  int token_idx = 3; // field index of the next token after ')'
  const char* s = p + 1;
  while (*s) {
    while (*s && isspace((unsigned char)*s))
      ++s;
    if (!*s)
      break;
    const char* t = s;
    while (*s && !isspace((unsigned char)*s))
      ++s;
    if (token_idx == 3) {
      stat.state = *t;
      have_state = true;
    } else if (token_idx == 22) {
      char tmp[64] = {0};
      int len = (int)(s - t);
      if (len <= 0 || len >= (int)sizeof(tmp))
        return std::nullopt;
      memcpy(tmp, t, len);
      char* end = nullptr;
      stat.start_time_ticks = strtoull(tmp, &end, 10);
      if (*end != '\0')
        return std::nullopt;
      return have_state ? std::optional<ProcStat>(stat) : std::nullopt;
    }
    token_idx++;
  }
  return std::nullopt;
}

std::optional<double> read_system_uptime_seconds() {
  FILE* f = fopen("/proc/uptime", "r");
  if (!f)
    return std::nullopt;
  char buf[128];
  if (!fgets(buf, sizeof(buf), f)) {
    fclose(f);
    return std::nullopt;
  }
  fclose(f);
  return parse_uptime_line(buf);
}

std::optional<double> parse_uptime_line(const char* uptime_line) {
  if (!uptime_line)
    return std::nullopt;
  char* end = nullptr;
  double v = strtod(uptime_line, &end);
  if (end == uptime_line || v < 0)
    return std::nullopt;
  return v;
}

std::string read_proc_cmdline(pid_t pid) {
  char path[256];
  snprintf(path, sizeof(path), "/proc/%d/cmdline", pid);
  std::ifstream file(path, std::ios::binary);
  if (!file)
    return {};

  std::string raw((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
  while (!raw.empty() && raw.back() == '\0')
    raw.pop_back();
  for (char& c : raw) {
    if (c == '\0')
      c = ' ';
  }
  return raw;
}

} // namespace hmon
