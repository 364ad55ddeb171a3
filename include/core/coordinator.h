#pragma once

#include "core/types.h"
#include "core/context.h"
#include "core/session_lock.h"
#include "core/session_store.h"
#include "policy/policy_store.h"
#include "sandbox/sandbox.h"
#include "utils/config.h"
#include <memory>
#include <future>
#include <chrono>

namespace warden {
namespace core {

struct CoordinatorOptions {
    bool guardrailsEnabled = true;
    LockPolicy lockPolicy = LockPolicy::WAIT;
    // Zero means "wall limit of the request plus five seconds".
    std::chrono::milliseconds lockWait{0};
    uint32_t sessionTtlSeconds = kDefaultSessionTtlSeconds;
    size_t workers = 4;
    bool logRejectedMessage = false;

    static CoordinatorOptions fromConfig(const utils::Config& config);
};

struct CoordinatorStatus {
    bool guardrailsActive = false;
    SandboxStrategy sandboxStrategyInUse = SandboxStrategy::UNAVAILABLE;
    uint64_t policyVersion = 0;
    CoreStats stats;
};

// Drives one request through input screening, code validation, sandboxed
// execution and output filtering. Requests for the same session are
// serialized; distinct sessions run concurrently.
class Coordinator {
public:
    Coordinator(Context& ctx, policy::PolicyStorePtr policy,
                std::unique_ptr<sandbox::Sandbox> executor,
                std::shared_ptr<SessionStore> store,
                const CoordinatorOptions& options = CoordinatorOptions());
    ~Coordinator();

    Coordinator(const Coordinator&) = delete;
    Coordinator& operator=(const Coordinator&) = delete;

    ExecutionResult submit(const ExecutionRequest& request, CancellationTokenPtr cancel = nullptr);
    std::future<ExecutionResult> submitAsync(ExecutionRequest request, CancellationTokenPtr cancel = nullptr);

    CoordinatorStatus status() const;
    SessionStore* sessionStore() const;
    const CoordinatorOptions& options() const;

    void shutdown();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
}
