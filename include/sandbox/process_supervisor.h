#pragma once

#include "core/types.h"
#include "utils/logger.h"
#include <string>
#include <vector>
#include <chrono>
#include <cstdint>
#include <sys/types.h>

namespace warden {
namespace sandbox {

// Applied in the child between fork and exec. Zero means "leave as is".
struct ChildLimits {
    uint64_t addressSpaceBytes = 0;
    uint64_t cpuSeconds = 0;
    uint64_t maxOpenFiles = 0;
    bool noFileWrites = false;
    uint64_t maxFileBytes = 0;              // ignored when noFileWrites is set
    bool disableCore = true;
    bool noNewPrivileges = true;
    int niceness = 0;
    bool isolateNetwork = false;
};

struct ProcessSpec {
    std::vector<std::string> argv;        // argv[0] must be an absolute path
    std::vector<std::string> env;         // KEY=VALUE, used when inheritEnv is false
    bool inheritEnv = false;
    std::string workingDir;
    std::string stdinData;
    std::chrono::milliseconds timeout{30000};
    uint64_t maxOutputBytes = 1024 * 1024;
    ChildLimits limits;
};

enum class Termination {
    EXITED = 0,
    SIGNALED,
    TIMED_OUT,
    CANCELLED,
    SPAWN_FAILED
};

const char* terminationName(Termination t);

struct ProcessOutcome {
    Termination termination = Termination::SPAWN_FAILED;
    int exitCode = -1;
    int signal = 0;
    std::string stdoutData;
    std::string stderrData;
    bool outputTruncated = false;
    uint64_t wallTimeMs = 0;
    uint64_t peakRssKb = 0;
    pid_t pid = -1;
    std::string spawnError;
};

// Child exit code used when setup between fork and exec fails.
constexpr int kChildSetupFailedExit = 125;
constexpr int kChildExecFailedExit = 127;

// Runs one child in its own process group. A watchdog kills the whole
// group at the deadline or on cancellation; the child is always reaped
// before run() returns.
class ProcessSupervisor {
public:
    explicit ProcessSupervisor(utils::Logger& logger);

    ProcessOutcome run(const ProcessSpec& spec, const core::CancellationToken* cancel = nullptr) const;

private:
    utils::Logger& logger_;
};

// Resolves a program name against PATH. Returns the input unchanged when
// it already contains a slash and is executable, empty when not found.
std::string findExecutable(const std::string& name);

}
}
