#include "core/types.h"
#include "core/error.h"

namespace warden {

const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK: return "ok";
        case ErrorCode::POLICY_VIOLATION: return "policy_violation";
        case ErrorCode::TIMEOUT: return "timeout";
        case ErrorCode::RESOURCE_EXCEEDED: return "resource_exceeded";
        case ErrorCode::RUNTIME_ERROR: return "runtime_error";
        case ErrorCode::SANDBOX_UNAVAILABLE: return "sandbox_unavailable";
        case ErrorCode::SESSION_BUSY: return "session_busy";
        case ErrorCode::CANCELLED: return "cancelled";
        case ErrorCode::NOT_FOUND: return "not_found";
        case ErrorCode::INVALID_CONFIG: return "invalid_config";
        case ErrorCode::PARSE_ERROR: return "parse_error";
        case ErrorCode::IO_ERROR: return "io_error";
        case ErrorCode::INTERNAL_ERROR: return "internal_error";
    }
    return "unknown";
}

namespace core {

const char* statusName(ExecutionStatus status) {
    switch (status) {
        case ExecutionStatus::OK: return "ok";
        case ExecutionStatus::POLICY_BLOCKED: return "policy_blocked";
        case ExecutionStatus::TIMEOUT: return "timeout";
        case ExecutionStatus::RESOURCE_EXCEEDED: return "resource_exceeded";
        case ExecutionStatus::RUNTIME_ERROR: return "runtime_error";
        case ExecutionStatus::SANDBOX_UNAVAILABLE: return "sandbox_unavailable";
        case ExecutionStatus::SESSION_BUSY: return "session_busy";
        case ExecutionStatus::CANCELLED: return "cancelled";
    }
    return "unknown";
}

const char* artifactKindName(ArtifactKind kind) {
    switch (kind) {
        case ArtifactKind::PLOT_IMAGE: return "plot_image";
        case ArtifactKind::PLOT_HTML: return "plot_html";
        case ArtifactKind::TABLE: return "table";
    }
    return "unknown";
}

const char* strategyName(SandboxStrategy strategy) {
    switch (strategy) {
        case SandboxStrategy::CONTAINER: return "container";
        case SandboxStrategy::RESTRICTED_INTERPRETER: return "restricted-interpreter";
        case SandboxStrategy::UNAVAILABLE: return "unavailable";
    }
    return "unknown";
}

const char* requestStateName(RequestState state) {
    switch (state) {
        case RequestState::RECEIVED: return "Received";
        case RequestState::INPUT_CHECKED: return "InputChecked";
        case RequestState::CODE_CHECKED: return "CodeChecked";
        case RequestState::EXECUTING: return "Executing";
        case RequestState::OUTPUT_FILTERED: return "OutputFiltered";
        case RequestState::DONE: return "Done";
        case RequestState::BLOCKED: return "Blocked";
        case RequestState::FAILED: return "Failed";
    }
    return "Unknown";
}

const char* filesystemModeName(FilesystemMode mode) {
    return mode == FilesystemMode::READ_ONLY ? "read-only" : "none";
}

bool parseFilesystemMode(const std::string& name, FilesystemMode& out) {
    if (name == "none") { out = FilesystemMode::NONE; return true; }
    if (name == "read-only" || name == "read_only" || name == "readonly") {
        out = FilesystemMode::READ_ONLY;
        return true;
    }
    return false;
}

std::string describeStatus(ExecutionStatus status) {
    switch (status) {
        case ExecutionStatus::OK:
            return "Analysis completed.";
        case ExecutionStatus::POLICY_BLOCKED:
            return "This request was blocked by the safety policy. Please rephrase it as a data analysis task.";
        case ExecutionStatus::TIMEOUT:
            return "The analysis took too long and was stopped. Try a smaller or simpler query.";
        case ExecutionStatus::RESOURCE_EXCEEDED:
            return "The analysis used more memory or compute than allowed. Try working on a subset of the data.";
        case ExecutionStatus::RUNTIME_ERROR:
            return "The analysis code failed while running. Try rephrasing the question.";
        case ExecutionStatus::SANDBOX_UNAVAILABLE:
            return "Code analysis is temporarily unavailable. Please try again later.";
        case ExecutionStatus::SESSION_BUSY:
            return "Another analysis is still running for this session. Please wait for it to finish.";
        case ExecutionStatus::CANCELLED:
            return "The analysis was cancelled.";
    }
    return "The request could not be completed.";
}

bool isTerminal(RequestState state) {
    return state == RequestState::DONE || state == RequestState::BLOCKED || state == RequestState::FAILED;
}

}
}
