#pragma once

#include "core/error.h"
#include "core/types.h"
#include "policy/policy_store.h"
#include "sandbox/process_supervisor.h"
#include <string>
#include <vector>

namespace warden {
namespace sandbox {

// Marker preceding the single JSON result line the runner writes to the
// real stdout. Anything printed by analysis code is captured separately.
constexpr const char* kEnvelopeMarker = "@@WARDEN_RESULT@@";

// Python source executed with `python3 -I -c`. It reads one JSON payload
// from stdin, runs the code against a restricted namespace and reports
// through the envelope.
const std::string& runnerScript();

// {"code", "data": {name, csv, metadata}, "policy": {allowed_imports,
// vetted_builtins, preloaded}, "limits": {filesystem, network}}
//
// Preloaded and imported modules are handed to analysis code as read-only
// views that hide private names and refuse to expose modules outside the
// allowed imports. An audit hook installed before the code runs denies
// process control, network use when disabled, and any file access the
// filesystem mode does not grant: "none" permits reads of the interpreter's
// own installation only, "read-only" permits reads anywhere and writes under
// the working directory.
std::string buildRunnerPayload(const std::string& code, const core::DataContext& data,
                               const policy::PolicyStore& policy, const core::ResourceLimits& limits);

struct RunnerEnvelope {
    std::string status;          // ok | error | memory
    std::string stdoutText;
    std::string error;
    std::vector<core::Artifact> artifacts;
};

Result<RunnerEnvelope> parseEnvelope(const std::string& output);

// Strips absolute paths and traceback frames so error text never reveals
// host layout. Result is capped at a few hundred bytes.
std::string scrubHostDetails(const std::string& text);

// Raw stdout budget for a run: the envelope carries escaped output plus
// encoded artifacts, so the channel is wider than the user-visible cap.
uint64_t channelCapacity(uint64_t maxOutputBytes);

// Maps a supervised run to an execution result. Exit codes listed in
// infraExitCodes mean the launcher itself failed (sandbox_unavailable).
core::ExecutionResult interpretOutcome(const ProcessOutcome& outcome, uint64_t maxOutputBytes,
                                       const std::vector<int>& infraExitCodes = {});

}
}
