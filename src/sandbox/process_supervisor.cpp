#include "sandbox/process_supervisor.h"
#include "sandbox/watchdog.h"
#include <mutex>
#include <atomic>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <cstdlib>
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sched.h>
#include <sys/wait.h>
#include <sys/resource.h>
#include <sys/prctl.h>
#include <sys/stat.h>

extern char** environ;

namespace warden {
namespace sandbox {

namespace {

constexpr size_t kReadChunk = 8192;
constexpr size_t kMaxStderrBytes = 64 * 1024;
constexpr int kPollIntervalMs = 50;
constexpr int kMaxInheritedFd = 4096;
constexpr std::chrono::milliseconds kDrainGrace(200);

struct SpawnFailure {
    int stage;
    int err;
};

enum SpawnStage {
    STAGE_CHDIR = 1,
    STAGE_ISOLATE,
    STAGE_LIMITS,
    STAGE_PRIVS,
    STAGE_EXEC
};

const char* stageName(int stage) {
    switch (stage) {
        case STAGE_CHDIR: return "chdir";
        case STAGE_ISOLATE: return "namespace isolation";
        case STAGE_LIMITS: return "resource limits";
        case STAGE_PRIVS: return "privilege drop";
        case STAGE_EXEC: return "exec";
        default: return "setup";
    }
}

void ignoreSigpipeOnce() {
    static std::once_flag once;
    std::call_once(once, [] {
        struct sigaction sa;
        std::memset(&sa, 0, sizeof(sa));
        sa.sa_handler = SIG_IGN;
        sigemptyset(&sa.sa_mask);
        sigaction(SIGPIPE, &sa, nullptr);
    });
}

void closePair(int fds[2]) {
    if (fds[0] >= 0) close(fds[0]);
    if (fds[1] >= 0) close(fds[1]);
    fds[0] = fds[1] = -1;
}

void closeFd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

bool setLimit(int resource, uint64_t value) {
    struct rlimit rl;
    rl.rlim_cur = rl.rlim_max = static_cast<rlim_t>(value);
    return setrlimit(resource, &rl) == 0;
}

// Only async-signal-safe calls from here on; the parent may be multithreaded.
[[noreturn]] void childFail(int statusFd, int stage, int exitCode) {
    SpawnFailure f{stage, errno};
    ssize_t w = write(statusFd, &f, sizeof(f));
    (void)w;
    _exit(exitCode);
}

[[noreturn]] void runChild(const ProcessSpec& spec, char* const* argv, char* const* envp,
                           int stdinFd, int stdoutFd, int stderrFd, int statusFd) {
    setpgid(0, 0);
    prctl(PR_SET_PDEATHSIG, SIGKILL);

    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = SIG_DFL;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGPIPE, &sa, nullptr);
    sigset_t none;
    sigemptyset(&none);
    sigprocmask(SIG_SETMASK, &none, nullptr);

    if (dup2(stdinFd, STDIN_FILENO) < 0 || dup2(stdoutFd, STDOUT_FILENO) < 0 ||
        dup2(stderrFd, STDERR_FILENO) < 0) {
        childFail(statusFd, STAGE_EXEC, kChildSetupFailedExit);
    }
    for (int fd = 3; fd < kMaxInheritedFd; fd++) {
        if (fd != statusFd) close(fd);
    }

    if (!spec.workingDir.empty() && chdir(spec.workingDir.c_str()) != 0) {
        childFail(statusFd, STAGE_CHDIR, kChildSetupFailedExit);
    }

    const ChildLimits& lim = spec.limits;
    if (lim.isolateNetwork && unshare(CLONE_NEWUSER | CLONE_NEWNET) != 0) {
        childFail(statusFd, STAGE_ISOLATE, kChildSetupFailedExit);
    }
    if (lim.niceness > 0 && setpriority(PRIO_PROCESS, 0, lim.niceness) != 0) {
        childFail(statusFd, STAGE_LIMITS, kChildSetupFailedExit);
    }
    if ((lim.addressSpaceBytes && !setLimit(RLIMIT_AS, lim.addressSpaceBytes)) ||
        (lim.cpuSeconds && !setLimit(RLIMIT_CPU, lim.cpuSeconds)) ||
        (lim.noFileWrites && !setLimit(RLIMIT_FSIZE, 0)) ||
        (!lim.noFileWrites && lim.maxFileBytes && !setLimit(RLIMIT_FSIZE, lim.maxFileBytes)) ||
        (lim.maxOpenFiles && !setLimit(RLIMIT_NOFILE, lim.maxOpenFiles)) ||
        (lim.disableCore && !setLimit(RLIMIT_CORE, 0))) {
        childFail(statusFd, STAGE_LIMITS, kChildSetupFailedExit);
    }
    if (lim.noNewPrivileges && prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) != 0) {
        childFail(statusFd, STAGE_PRIVS, kChildSetupFailedExit);
    }

    execve(argv[0], argv, envp);
    childFail(statusFd, STAGE_EXEC, kChildExecFailedExit);
}

}

const char* terminationName(Termination t) {
    switch (t) {
        case Termination::EXITED: return "exited";
        case Termination::SIGNALED: return "signaled";
        case Termination::TIMED_OUT: return "timed_out";
        case Termination::CANCELLED: return "cancelled";
        case Termination::SPAWN_FAILED: return "spawn_failed";
        default: return "unknown";
    }
}

std::string findExecutable(const std::string& name) {
    if (name.empty()) return "";
    if (name.find('/') != std::string::npos) {
        return access(name.c_str(), X_OK) == 0 ? name : "";
    }
    const char* envPath = std::getenv("PATH");
    std::string path = envPath ? envPath : "/usr/local/bin:/usr/bin:/bin";
    size_t start = 0;
    while (start <= path.size()) {
        size_t end = path.find(':', start);
        if (end == std::string::npos) end = path.size();
        std::string dir = path.substr(start, end - start);
        if (!dir.empty()) {
            std::string candidate = dir + "/" + name;
            struct stat st;
            if (stat(candidate.c_str(), &st) == 0 && S_ISREG(st.st_mode) &&
                access(candidate.c_str(), X_OK) == 0) {
                return candidate;
            }
        }
        start = end + 1;
    }
    return "";
}

ProcessSupervisor::ProcessSupervisor(utils::Logger& logger) : logger_(logger) {
    ignoreSigpipeOnce();
}

ProcessOutcome ProcessSupervisor::run(const ProcessSpec& spec, const core::CancellationToken* cancel) const {
    ProcessOutcome outcome;

    if (spec.argv.empty() || spec.argv[0].empty() || spec.argv[0][0] != '/') {
        outcome.spawnError = "program path must be absolute";
        return outcome;
    }
    if (cancel && cancel->isCancelled()) {
        outcome.termination = Termination::CANCELLED;
        return outcome;
    }

    std::vector<char*> argv;
    for (const auto& a : spec.argv) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);
    std::vector<char*> envp;
    if (!spec.inheritEnv) {
        for (const auto& e : spec.env) envp.push_back(const_cast<char*>(e.c_str()));
        envp.push_back(nullptr);
    }
    char* const* envArray = spec.inheritEnv ? environ : envp.data();

    int inPipe[2] = {-1, -1};
    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};
    int statusPipe[2] = {-1, -1};
    if (pipe2(inPipe, O_CLOEXEC) != 0 || pipe2(outPipe, O_CLOEXEC) != 0 ||
        pipe2(errPipe, O_CLOEXEC) != 0 || pipe2(statusPipe, O_CLOEXEC) != 0) {
        outcome.spawnError = std::string("pipe: ") + std::strerror(errno);
        closePair(inPipe);
        closePair(outPipe);
        closePair(errPipe);
        closePair(statusPipe);
        logger_.error("supervisor", outcome.spawnError);
        return outcome;
    }

    auto start = std::chrono::steady_clock::now();
    pid_t pid = fork();
    if (pid < 0) {
        outcome.spawnError = std::string("fork: ") + std::strerror(errno);
        closePair(inPipe);
        closePair(outPipe);
        closePair(errPipe);
        closePair(statusPipe);
        logger_.error("supervisor", outcome.spawnError);
        return outcome;
    }
    if (pid == 0) {
        runChild(spec, argv.data(), envArray, inPipe[0], outPipe[1], errPipe[1], statusPipe[1]);
    }

    outcome.pid = pid;
    if (setpgid(pid, pid) != 0 && errno != EACCES && errno != ESRCH) {
        logger_.warn("supervisor", std::string("setpgid: ") + std::strerror(errno));
    }
    closeFd(inPipe[0]);
    closeFd(outPipe[1]);
    closeFd(errPipe[1]);
    closeFd(statusPipe[1]);

    // Closed by exec on success; carries the failing stage otherwise.
    SpawnFailure failure{0, 0};
    ssize_t got;
    do {
        got = read(statusPipe[0], &failure, sizeof(failure));
    } while (got < 0 && errno == EINTR);
    closeFd(statusPipe[0]);

    if (got == static_cast<ssize_t>(sizeof(failure))) {
        int status = 0;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        closeFd(inPipe[1]);
        closeFd(outPipe[0]);
        closeFd(errPipe[0]);
        outcome.termination = Termination::SPAWN_FAILED;
        outcome.exitCode = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
        outcome.spawnError = std::string(stageName(failure.stage)) + ": " + std::strerror(failure.err);
        outcome.wallTimeMs = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count());
        logger_.warn("supervisor", "spawn of " + spec.argv[0] + " failed at " + outcome.spawnError);
        return outcome;
    }

    logger_.debug("supervisor", "started pid " + std::to_string(pid) + " (" + spec.argv[0] + ")");

    std::mutex killMtx;
    bool reaped = false;
    std::atomic<bool> killedByWatchdog{false};
    auto killGroup = [pid, this]() {
        if (kill(-pid, SIGKILL) != 0 && errno != ESRCH) {
            logger_.warn("supervisor", std::string("kill: ") + std::strerror(errno));
        }
    };

    Watchdog watchdog;
    std::function<bool()> abortCheck;
    if (cancel) {
        abortCheck = [cancel]() { return cancel->isCancelled(); };
    }
    watchdog.arm(spec.timeout, [&]() {
        std::lock_guard<std::mutex> lock(killMtx);
        if (reaped) return;
        killedByWatchdog = true;
        killGroup();
    }, abortCheck);

    fcntl(inPipe[1], F_SETFL, fcntl(inPipe[1], F_GETFL) | O_NONBLOCK);
    fcntl(outPipe[0], F_SETFL, fcntl(outPipe[0], F_GETFL) | O_NONBLOCK);
    fcntl(errPipe[0], F_SETFL, fcntl(errPipe[0], F_GETFL) | O_NONBLOCK);

    int inFd = inPipe[1];
    int outFd = outPipe[0];
    int errFd = errPipe[0];
    size_t written = 0;
    if (spec.stdinData.empty()) closeFd(inFd);

    bool exited = false;
    bool overLimit = false;
    std::chrono::steady_clock::time_point drainDeadline;
    char buffer[kReadChunk];

    // Child has exited but is not yet reaped: the pgid is still ours.
    auto markExited = [&]() {
        {
            std::lock_guard<std::mutex> lock(killMtx);
            reaped = true;
        }
        exited = true;
        killGroup();
        drainDeadline = std::chrono::steady_clock::now() + kDrainGrace;
    };

    while (outFd >= 0 || errFd >= 0 || inFd >= 0) {
        if (!exited) {
            siginfo_t info;
            std::memset(&info, 0, sizeof(info));
            if (waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOHANG | WNOWAIT) == 0 &&
                info.si_pid == pid) {
                markExited();
                closeFd(inFd);
            }
        } else if (std::chrono::steady_clock::now() >= drainDeadline) {
            break;
        }

        struct pollfd fds[3];
        int nfds = 0;
        int idxIn = -1, idxOut = -1, idxErr = -1;
        if (inFd >= 0) { idxIn = nfds; fds[nfds++] = {inFd, POLLOUT, 0}; }
        if (outFd >= 0) { idxOut = nfds; fds[nfds++] = {outFd, POLLIN, 0}; }
        if (errFd >= 0) { idxErr = nfds; fds[nfds++] = {errFd, POLLIN, 0}; }
        if (nfds == 0) break;

        int ready = poll(fds, static_cast<nfds_t>(nfds), kPollIntervalMs);
        if (ready < 0) {
            if (errno == EINTR) continue;
            logger_.error("supervisor", std::string("poll: ") + std::strerror(errno));
            killGroup();
            break;
        }
        if (ready == 0) continue;

        if (idxIn >= 0 && fds[idxIn].revents) {
            if (fds[idxIn].revents & (POLLERR | POLLHUP)) {
                closeFd(inFd);
            } else {
                size_t remaining = spec.stdinData.size() - written;
                ssize_t n = write(inFd, spec.stdinData.data() + written, std::min(remaining, kReadChunk * 8));
                if (n > 0) {
                    written += static_cast<size_t>(n);
                    if (written >= spec.stdinData.size()) closeFd(inFd);
                } else if (n < 0 && errno != EAGAIN && errno != EINTR) {
                    closeFd(inFd);
                }
            }
        }

        if (idxOut >= 0 && fds[idxOut].revents) {
            ssize_t n = read(outFd, buffer, sizeof(buffer));
            if (n > 0) {
                if (!overLimit) {
                    size_t room = spec.maxOutputBytes > outcome.stdoutData.size()
                        ? static_cast<size_t>(spec.maxOutputBytes - outcome.stdoutData.size()) : 0;
                    outcome.stdoutData.append(buffer, std::min(room, static_cast<size_t>(n)));
                    if (static_cast<size_t>(n) > room) {
                        overLimit = true;
                        outcome.outputTruncated = true;
                        std::lock_guard<std::mutex> lock(killMtx);
                        if (!reaped) killGroup();
                    }
                }
            } else if (n == 0 || (errno != EAGAIN && errno != EINTR)) {
                closeFd(outFd);
            }
        }

        if (idxErr >= 0 && fds[idxErr].revents) {
            ssize_t n = read(errFd, buffer, sizeof(buffer));
            if (n > 0) {
                if (outcome.stderrData.size() < kMaxStderrBytes) {
                    size_t room = kMaxStderrBytes - outcome.stderrData.size();
                    outcome.stderrData.append(buffer, std::min(room, static_cast<size_t>(n)));
                }
            } else if (n == 0 || (errno != EAGAIN && errno != EINTR)) {
                closeFd(errFd);
            }
        }
    }
    closeFd(inFd);
    closeFd(outFd);
    closeFd(errFd);

    if (!exited) {
        // Output is closed but the child lives on; the watchdog bounds this wait.
        siginfo_t info;
        int rc;
        do {
            std::memset(&info, 0, sizeof(info));
            rc = waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOWAIT);
        } while (rc < 0 && errno == EINTR);
        markExited();
    }

    int status = 0;
    struct rusage usage;
    std::memset(&usage, 0, sizeof(usage));
    while (wait4(pid, &status, 0, &usage) < 0 && errno == EINTR) {}
    watchdog.disarm();

    outcome.wallTimeMs = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count());
    outcome.peakRssKb = static_cast<uint64_t>(usage.ru_maxrss);

    if (WIFEXITED(status)) {
        outcome.exitCode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        outcome.signal = WTERMSIG(status);
    }

    if (killedByWatchdog) {
        outcome.termination = watchdog.trigger() == WatchdogTrigger::ABORTED
            ? Termination::CANCELLED : Termination::TIMED_OUT;
    } else if (WIFSIGNALED(status)) {
        outcome.termination = Termination::SIGNALED;
    } else {
        outcome.termination = Termination::EXITED;
    }

    logger_.debug("supervisor", "pid " + std::to_string(pid) + " " + terminationName(outcome.termination) +
                  " after " + std::to_string(outcome.wallTimeMs) + "ms");
    return outcome;
}

}
}
