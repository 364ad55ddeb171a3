#include "sandbox/restricted_sandbox.h"
#include "sandbox/runner.h"
#include <filesystem>
#include <system_error>
#include <cerrno>
#include <cstring>
#include <cstdlib>

namespace warden {
namespace sandbox {

namespace {

constexpr uint64_t kCpuBackstopSeconds = 2;
constexpr uint64_t kMaxOpenFiles = 64;
constexpr uint64_t kScratchFileBytes = 64ULL * 1024 * 1024;
constexpr int kNiceness = 10;

// Private working directory for one run, removed on scope exit.
class ScratchDir {
public:
    explicit ScratchDir(utils::Logger& logger) : logger_(logger) {
        std::error_code ec;
        auto base = std::filesystem::temp_directory_path(ec);
        if (ec) base = "/tmp";
        std::string templ = (base / "warden-XXXXXX").string();
        std::vector<char> buf(templ.begin(), templ.end());
        buf.push_back('\0');
        if (mkdtemp(buf.data()) != nullptr) {
            path_ = buf.data();
        } else {
            logger_.error("restricted", std::string("mkdtemp: ") + std::strerror(errno));
        }
    }

    ~ScratchDir() {
        if (path_.empty()) return;
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
        if (ec) {
            logger_.warn("restricted", "could not remove scratch dir: " + ec.message());
        }
    }

    ScratchDir(const ScratchDir&) = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;

    bool ok() const { return !path_.empty(); }
    const std::string& path() const { return path_; }

private:
    utils::Logger& logger_;
    std::string path_;
};

std::vector<std::string> minimalEnv(const std::string& home) {
    return {
        "PATH=/usr/local/bin:/usr/bin:/bin",
        "LANG=C.UTF-8",
        "LC_ALL=C.UTF-8",
        "HOME=" + home,
        "TMPDIR=" + home,
        "MPLCONFIGDIR=" + home,
        "MPLBACKEND=Agg",
        "OPENBLAS_NUM_THREADS=1",
        "OMP_NUM_THREADS=1",
        "MKL_NUM_THREADS=1"
    };
}

}

RestrictedInterpreterSandbox::RestrictedInterpreterSandbox(policy::PolicyStorePtr policy, core::Context& ctx,
                                                           const utils::SandboxConfig& config)
    : policy_(std::move(policy)), ctx_(ctx), config_(config), supervisor_(ctx.logger) {}

bool RestrictedInterpreterSandbox::probe() {
    available_ = false;
    networkIsolation_ = false;

    if (!config_.pythonPath.empty()) {
        pythonPath_ = findExecutable(config_.pythonPath);
    } else {
        pythonPath_ = findExecutable("python3");
    }
    if (pythonPath_.empty()) {
        ctx_.logger.warn("restricted", "no python3 interpreter found");
        return false;
    }

    ProcessSpec spec;
    spec.argv = {pythonPath_, "-I", "-B", "-c", "import json, io, csv, base64, builtins"};
    spec.env = minimalEnv("/");
    spec.timeout = std::chrono::seconds(config_.probeTimeoutSeconds);
    ProcessOutcome outcome = supervisor_.run(spec);
    if (outcome.termination != Termination::EXITED || outcome.exitCode != 0) {
        ctx_.logger.warn("restricted", "interpreter probe failed for " + pythonPath_ + " (" +
                         terminationName(outcome.termination) + ")");
        return false;
    }
    available_ = true;

    spec.argv = {pythonPath_, "-I", "-B", "-c", "pass"};
    spec.limits.isolateNetwork = true;
    outcome = supervisor_.run(spec);
    networkIsolation_ = outcome.termination == Termination::EXITED && outcome.exitCode == 0;

    ctx_.logger.info("restricted", "interpreter " + pythonPath_ + " ready, network namespace " +
                     (networkIsolation_ ? "available" : "unavailable"));
    return true;
}

ProcessSpec RestrictedInterpreterSandbox::buildSpec(const std::string& payload, const std::string& scratch,
                                                    const core::ResourceLimits& limits) const {
    ProcessSpec spec;
    spec.argv = {pythonPath_, "-I", "-B", "-c", runnerScript()};
    spec.env = minimalEnv(scratch);
    spec.workingDir = scratch;
    spec.stdinData = payload;
    spec.timeout = std::chrono::seconds(limits.maxWallSeconds);
    spec.maxOutputBytes = channelCapacity(limits.maxOutputBytes);

    spec.limits.addressSpaceBytes = limits.maxMemoryBytes;
    spec.limits.cpuSeconds = limits.maxWallSeconds + kCpuBackstopSeconds;
    spec.limits.noFileWrites = limits.filesystemMode == core::FilesystemMode::NONE;
    spec.limits.maxFileBytes = kScratchFileBytes;
    spec.limits.maxOpenFiles = kMaxOpenFiles;
    spec.limits.niceness = limits.maxCpuFraction < 1.0 ? kNiceness : 0;
    spec.limits.isolateNetwork = !limits.networkEnabled && networkIsolation_;
    return spec;
}

core::ExecutionResult RestrictedInterpreterSandbox::execute(const std::string& code,
                                                            const core::DataContext& data,
                                                            const core::ResourceLimits& limits,
                                                            const core::CancellationToken* cancel) {
    core::ExecutionResult result;
    result.strategy = strategy();
    if (!available_) {
        result.status = core::ExecutionStatus::SANDBOX_UNAVAILABLE;
        return result;
    }

    ScratchDir scratch(ctx_.logger);
    if (!scratch.ok()) {
        result.status = core::ExecutionStatus::SANDBOX_UNAVAILABLE;
        return result;
    }

    if (!limits.networkEnabled && !networkIsolation_ && !isolationWarned_.exchange(true)) {
        ctx_.logger.warn("restricted", "network namespaces unavailable; relying on import policy for network denial");
    }

    std::string payload = buildRunnerPayload(code, data, *policy_, limits);
    ProcessOutcome outcome = supervisor_.run(buildSpec(payload, scratch.path(), limits), cancel);

    result = interpretOutcome(outcome, limits.maxOutputBytes);
    result.strategy = strategy();
    if (outcome.termination == Termination::SPAWN_FAILED) {
        ctx_.logger.error("restricted", "spawn failed: " + outcome.spawnError);
    }
    ctx_.logger.debug("restricted", std::string("run finished: ") + core::statusName(result.status) +
                      " in " + std::to_string(result.wallTimeMs) + "ms, peak rss " +
                      std::to_string(outcome.peakRssKb) + "KB");
    return result;
}

}
}
