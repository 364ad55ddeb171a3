#pragma once

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <atomic>
#include <optional>
#include <cstdint>

namespace warden {
namespace core {

enum class FilesystemMode {
    NONE = 0,
    READ_ONLY = 1
};

struct ResourceLimits {
    uint32_t maxWallSeconds = 30;
    uint64_t maxMemoryBytes = 512ULL * 1024 * 1024;
    double maxCpuFraction = 0.5;
    bool networkEnabled = false;
    FilesystemMode filesystemMode = FilesystemMode::NONE;
    uint64_t maxOutputBytes = 1024 * 1024;
};

// Tabular dataset handed to sandboxed code. Copied, then serialized across
// the process boundary; sandboxed code never sees host memory.
struct DataContext {
    std::string name;
    std::string csv;
    std::map<std::string, std::string> metadata;

    bool empty() const { return csv.empty() && metadata.empty(); }
};

enum class ExecutionStatus {
    OK = 0,
    POLICY_BLOCKED,
    TIMEOUT,
    RESOURCE_EXCEEDED,
    RUNTIME_ERROR,
    SANDBOX_UNAVAILABLE,
    SESSION_BUSY,
    CANCELLED
};

enum class ArtifactKind {
    PLOT_IMAGE = 0,
    PLOT_HTML,
    TABLE
};

struct Artifact {
    ArtifactKind kind;
    std::string payload;
};

enum class SandboxStrategy {
    CONTAINER = 0,
    RESTRICTED_INTERPRETER,
    UNAVAILABLE
};

enum class RequestState {
    RECEIVED = 0,
    INPUT_CHECKED,
    CODE_CHECKED,
    EXECUTING,
    OUTPUT_FILTERED,
    DONE,
    BLOCKED,
    FAILED
};

struct ExecutionResult {
    ExecutionStatus status = ExecutionStatus::RUNTIME_ERROR;
    std::string stdoutText;
    std::vector<Artifact> artifacts;
    uint32_t redactionsApplied = 0;

    std::string errorMessage;
    std::vector<std::string> violations;
    std::string blockedCategory;
    std::vector<std::string> warnings;
    SandboxStrategy strategy = SandboxStrategy::UNAVAILABLE;
    RequestState finalState = RequestState::RECEIVED;
    uint64_t wallTimeMs = 0;
};

struct ExecutionRequest {
    std::string sessionId;
    std::string userMessage;
    std::string code;
    std::optional<DataContext> dataContext;
    ResourceLimits limits;
};

// Shared between a caller and an in-flight execution. Setting it makes the
// supervisor run the kill path; the partial result is discarded.
class CancellationToken {
public:
    void cancel() { cancelled_ = true; }
    bool isCancelled() const { return cancelled_; }

private:
    std::atomic<bool> cancelled_{false};
};

using CancellationTokenPtr = std::shared_ptr<CancellationToken>;

const char* statusName(ExecutionStatus status);
const char* artifactKindName(ArtifactKind kind);
const char* strategyName(SandboxStrategy strategy);
const char* requestStateName(RequestState state);
const char* filesystemModeName(FilesystemMode mode);
bool parseFilesystemMode(const std::string& name, FilesystemMode& out);

// Distinct user-facing explanation for every status. Never includes
// internal error text.
std::string describeStatus(ExecutionStatus status);

bool isTerminal(RequestState state);

}
}
