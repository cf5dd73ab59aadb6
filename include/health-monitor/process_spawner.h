#pragma once

#include "health-monitor/result.h"

#include <string>
#include <vector>

#include <sys/types.h>

namespace hmon {

// Interface for process spawning/signaling (injected for testability)
class IProcessSpawner {
public:
    virtual ~IProcessSpawner() = default;

    // Launch `command` with `args` so that it outlives this process.
    // Returns the new pid, or SpawnFailed when fork or exec failed.
    virtual Result<pid_t> spawn_detached(const std::string& command,
                                         const std::vector<std::string>& args) = 0;

    // Send signal to a single pid
    virtual bool send_signal(pid_t pid, int signal) = 0;
};

// fork/setsid/fork/exec. The grandchild is reparented to init (or the nearest
// subreaper), runs in its own session and has stdio on /dev/null. Exec
// failures are reported back through a close-on-exec pipe.
class PosixProcessSpawner : public IProcessSpawner {
public:
    Result<pid_t> spawn_detached(const std::string& command,
                                 const std::vector<std::string>& args) override;
    bool send_signal(pid_t pid, int signal) override;
};

} // namespace hmon
