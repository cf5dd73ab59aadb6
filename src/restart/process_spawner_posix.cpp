#include "health-monitor/process_spawner.h"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace hmon {

namespace {

// Report written by the intermediate child or the grandchild. Small enough
// for an atomic pipe write.
struct SpawnReport {
    enum Kind : int { Pid = 1, ForkFailed = 2, SetsidFailed = 3, ExecFailed = 4 };
    int kind;
    int value;
};

void write_report(int fd, SpawnReport::Kind kind, int value) {
    SpawnReport report{kind, value};
    ssize_t n;
    do {
        n = write(fd, &report, sizeof(report));
    } while (n < 0 && errno == EINTR);
}

[[noreturn]] void exec_grandchild(int report_fd, const char* file, char* const argv[]) {
    int devnull = open("/dev/null", O_RDWR);
    if (devnull >= 0) {
        dup2(devnull, STDIN_FILENO);
        dup2(devnull, STDOUT_FILENO);
        dup2(devnull, STDERR_FILENO);
        if (devnull > STDERR_FILENO)
            close(devnull);
    }

    // Ignored dispositions and the signal mask survive exec.
    signal(SIGPIPE, SIG_DFL);
    signal(SIGINT, SIG_DFL);
    signal(SIGTERM, SIG_DFL);
    sigset_t empty;
    sigemptyset(&empty);
    sigprocmask(SIG_SETMASK, &empty, nullptr);

    execvp(file, argv);
    write_report(report_fd, SpawnReport::ExecFailed, errno);
    _exit(127);
}

} // namespace

Result<pid_t> PosixProcessSpawner::spawn_detached(const std::string& command,
                                                  const std::vector<std::string>& args) {
    if (command.empty()) {
        return Result<pid_t>::error(ErrorCode::SpawnFailed, "empty command");
    }

    // Build argv before forking; only async-signal-safe calls after fork.
    std::vector<std::string> storage;
    storage.reserve(args.size() + 1);
    storage.push_back(command);
    storage.insert(storage.end(), args.begin(), args.end());
    std::vector<char*> argv;
    argv.reserve(storage.size() + 1);
    for (auto& s : storage) {
        argv.push_back(s.data());
    }
    argv.push_back(nullptr);

    int report_pipe[2];
    if (pipe2(report_pipe, O_CLOEXEC) == -1) {
        return Result<pid_t>::error(ErrorCode::SpawnFailed,
                                    std::string("pipe: ") + strerror(errno));
    }

    pid_t child = fork();
    if (child == -1) {
        int err = errno;
        close(report_pipe[0]);
        close(report_pipe[1]);
        return Result<pid_t>::error(ErrorCode::SpawnFailed, std::string("fork: ") + strerror(err));
    }

    if (child == 0) { // Intermediate
        close(report_pipe[0]);
        if (setsid() == -1) {
            write_report(report_pipe[1], SpawnReport::SetsidFailed, errno);
            _exit(1);
        }
        pid_t grandchild = fork();
        if (grandchild == -1) {
            write_report(report_pipe[1], SpawnReport::ForkFailed, errno);
            _exit(1);
        }
        if (grandchild == 0) {
            exec_grandchild(report_pipe[1], argv[0], argv.data());
        }
        write_report(report_pipe[1], SpawnReport::Pid, grandchild);
        _exit(0);
    }

    // Parent
    close(report_pipe[1]);
    int status = 0;
    while (waitpid(child, &status, 0) == -1 && errno == EINTR) {
    }

    // EOF arrives once the intermediate has exited and the grandchild has
    // exec'd (close-on-exec) or died.
    pid_t spawned = -1;
    int failure_kind = 0;
    int failure_errno = 0;
    SpawnReport report;
    while (true) {
        ssize_t n = read(report_pipe[0], &report, sizeof(report));
        if (n < 0 && errno == EINTR)
            continue;
        if (n != static_cast<ssize_t>(sizeof(report)))
            break;
        if (report.kind == SpawnReport::Pid) {
            spawned = report.value;
        } else {
            failure_kind = report.kind;
            failure_errno = report.value;
        }
    }
    close(report_pipe[0]);

    if (failure_kind == SpawnReport::ExecFailed) {
        return Result<pid_t>::error(ErrorCode::SpawnFailed,
                                    "exec " + command + ": " + strerror(failure_errno));
    }
    if (failure_kind != 0) {
        return Result<pid_t>::error(ErrorCode::SpawnFailed,
                                    std::string(failure_kind == SpawnReport::ForkFailed ? "fork: " : "setsid: ") +
                                        strerror(failure_errno));
    }
    if (spawned <= 0) {
        return Result<pid_t>::error(ErrorCode::SpawnFailed, "no pid reported by spawn helper");
    }
    return Result<pid_t>::ok(spawned);
}

bool PosixProcessSpawner::send_signal(pid_t pid, int signal) {
    if (pid <= 0) {
        return false;
    }
    return kill(pid, signal) == 0;
}

} // namespace hmon
