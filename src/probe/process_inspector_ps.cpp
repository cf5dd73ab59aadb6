#include "health-monitor/process_inspector.h"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <signal.h>
#include <sstream>
#include <string>

namespace hmon {

namespace {

// Runs `command` through the shell and returns its stdout, or std::nullopt
// when the command could not be started or exited non-zero.
std::optional<std::string> capture_output(const std::string& command) {
  FILE* pipe = popen(command.c_str(), "r");
  if (!pipe) {
    return std::nullopt;
  }

  std::string output;
  char buffer[4096];
  size_t n;
  while ((n = fread(buffer, 1, sizeof(buffer), pipe)) > 0) {
    output.append(buffer, n);
  }

  int status = pclose(pipe);
  if (status != 0) {
    return std::nullopt;
  }
  return output;
}

} // namespace

std::vector<ProcessEntry> PsProcessInspector::list_processes() {
  std::vector<ProcessEntry> entries;

  auto output = capture_output("ps -eo pid=,stat=,args= 2>/dev/null");
  if (!output) {
    return entries;
  }

  std::istringstream lines(*output);
  std::string line;
  int scanned = 0;
  while (std::getline(lines, line) && scanned < kMaxProcEntries) {
    std::istringstream fields(line);
    long pid = 0;
    std::string state;
    if (!(fields >> pid >> state) || pid <= 0) {
      continue;
    }
    scanned++;
    if (state.front() == 'Z' || state.front() == 'X') {
      continue;
    }

    std::string args;
    std::getline(fields, args);
    auto first = args.find_first_not_of(' ');
    if (first == std::string::npos) {
      continue;
    }
    entries.push_back({static_cast<pid_t>(pid), args.substr(first)});
  }

  std::sort(entries.begin(), entries.end(),
            [](const ProcessEntry& a, const ProcessEntry& b) { return a.pid < b.pid; });
  return entries;
}

ProbeResult PsProcessInspector::probe(pid_t pid) {
  ProbeResult result;
  if (pid <= 0) {
    return result;
  }

  if (kill(pid, 0) != 0 && errno != EPERM) {
    return result;
  }

  auto output = capture_output("ps -o stat=,etime= -p " + std::to_string(pid) + " 2>/dev/null");
  if (!output) {
    // ps exits non-zero when the pid vanished between the two calls
    return result;
  }

  std::istringstream fields(*output);
  std::string state;
  std::string etime;
  fields >> state >> etime;
  if (!state.empty() && (state.front() == 'Z' || state.front() == 'X')) {
    return result;
  }

  result.exists = true;
  result.uptime_seconds = parse_elapsed_time(etime);
  return result;
}

} // namespace hmon
