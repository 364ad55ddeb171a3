#include "sandbox/container_sandbox.h"
#include "sandbox/runner.h"
#include <random>
#include <sstream>
#include <iomanip>

namespace warden {
namespace sandbox {

namespace {

constexpr const char* kScratchMount = "/scratch:rw,noexec,nosuid,nodev,size=64m";
constexpr const char* kCacheMount = "/run/warden:rw,noexec,nosuid,nodev,size=16m";
constexpr const char* kCacheDir = "/run/warden";
constexpr const char* kNobodyUser = "65534:65534";

// docker/podman exit codes for failures of the launcher itself.
const std::vector<int> kRuntimeFailureCodes = {125, 126, 127};

std::string formatCpus(double fraction) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << fraction;
    return oss.str();
}

}

std::string randomContainerName() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    std::ostringstream oss;
    oss << "warden-" << std::hex << std::setw(16) << std::setfill('0') << rng();
    return oss.str();
}

ContainerSandbox::ContainerSandbox(policy::PolicyStorePtr policy, core::Context& ctx,
                                   const utils::SandboxConfig& config)
    : policy_(std::move(policy)), ctx_(ctx), config_(config), supervisor_(ctx.logger) {}

bool ContainerSandbox::probe() {
    available_ = false;
    runtimePath_ = findExecutable(config_.containerRuntime);
    if (runtimePath_.empty()) {
        ctx_.logger.info("container", "runtime '" + config_.containerRuntime + "' not found");
        return false;
    }

    ProcessSpec spec;
    spec.argv = {runtimePath_, "info", "--format", "{{.ServerVersion}}"};
    spec.inheritEnv = true;
    spec.timeout = std::chrono::seconds(config_.probeTimeoutSeconds);
    ProcessOutcome outcome = supervisor_.run(spec);
    if (outcome.termination != Termination::EXITED || outcome.exitCode != 0) {
        ctx_.logger.info("container", "runtime " + runtimePath_ + " not usable (" +
                         terminationName(outcome.termination) + ")");
        return false;
    }

    available_ = true;
    ctx_.logger.info("container", "runtime " + runtimePath_ + " ready, image " + config_.containerImage);
    return true;
}

std::vector<std::string> ContainerSandbox::buildRunArgs(const std::string& containerName,
                                                        const core::ResourceLimits& limits) const {
    const std::string memory = std::to_string(limits.maxMemoryBytes);
    double cpus = limits.maxCpuFraction > 0.0 ? limits.maxCpuFraction : 0.01;

    // Without filesystem access the only writable mount is a private cache
    // for interpreter startup, and code runs from the read-only root.
    const bool scratch = limits.filesystemMode == core::FilesystemMode::READ_ONLY;
    const std::string home = scratch ? "/scratch" : kCacheDir;

    std::vector<std::string> args = {
        runtimePath_, "run", "--rm", "-i",
        "--name", containerName,
        "--network", limits.networkEnabled ? "bridge" : "none",
        "--read-only",
        "--tmpfs", scratch ? kScratchMount : kCacheMount,
        "--workdir", scratch ? "/scratch" : "/",
        "--memory", memory,
        "--memory-swap", memory,
        "--cpus", formatCpus(cpus),
        "--pids-limit", std::to_string(config_.pidsLimit),
        "--cap-drop", "ALL",
        "--security-opt", "no-new-privileges",
        "--user", kNobodyUser,
        "--env", "HOME=" + home,
        "--env", "MPLCONFIGDIR=" + home,
        "--env", "MPLBACKEND=Agg",
        "--env", "TMPDIR=" + home,
        "--log-driver", "none",
        config_.containerImage,
        "python3", "-I", "-B", "-c", runnerScript()
    };
    return args;
}

void ContainerSandbox::removeContainer(const std::string& containerName) {
    ProcessSpec spec;
    spec.argv = {runtimePath_, "rm", "-f", containerName};
    spec.inheritEnv = true;
    spec.timeout = std::chrono::seconds(config_.cleanupTimeoutSeconds);
    ProcessOutcome outcome = supervisor_.run(spec);
    if (outcome.termination != Termination::EXITED) {
        ctx_.logger.error("container", "cleanup of " + containerName + " did not finish (" +
                          terminationName(outcome.termination) + ")");
    }
}

core::ExecutionResult ContainerSandbox::execute(const std::string& code,
                                                const core::DataContext& data,
                                                const core::ResourceLimits& limits,
                                                const core::CancellationToken* cancel) {
    core::ExecutionResult result;
    result.strategy = strategy();
    if (!available_) {
        result.status = core::ExecutionStatus::SANDBOX_UNAVAILABLE;
        return result;
    }

    const std::string containerName = randomContainerName();
    ProcessSpec spec;
    spec.argv = buildRunArgs(containerName, limits);
    spec.inheritEnv = true;
    spec.stdinData = buildRunnerPayload(code, data, *policy_, limits);
    spec.timeout = std::chrono::seconds(limits.maxWallSeconds);
    spec.maxOutputBytes = channelCapacity(limits.maxOutputBytes);

    ctx_.logger.debug("container", "starting " + containerName);
    ProcessOutcome outcome = supervisor_.run(spec, cancel);

    // Killing the client does not stop the container.
    if (outcome.termination != Termination::EXITED && outcome.termination != Termination::SPAWN_FAILED) {
        removeContainer(containerName);
    }

    result = interpretOutcome(outcome, limits.maxOutputBytes, kRuntimeFailureCodes);
    result.strategy = strategy();
    if (result.status == core::ExecutionStatus::SANDBOX_UNAVAILABLE) {
        ctx_.logger.error("container", "runtime failed for " + containerName + ": exit " +
                          std::to_string(outcome.exitCode) + " " + outcome.spawnError);
    }
    ctx_.logger.debug("container", containerName + " finished: " + core::statusName(result.status) +
                      " in " + std::to_string(result.wallTimeMs) + "ms");
    return result;
}

}
}
