#pragma once

#include "sandbox/sandbox.h"
#include "sandbox/process_supervisor.h"
#include "policy/policy_store.h"
#include "core/context.h"
#include "utils/config.h"
#include <string>
#include <atomic>

namespace warden {
namespace sandbox {

// Runs the analysis in a separate python3 child with a restricted
// namespace, host rlimits and (when the kernel allows it) private user and
// network namespaces. Weaker than a container: the child shares the host
// filesystem view, guarded only by the namespace and a scratch cwd.
class RestrictedInterpreterSandbox : public Sandbox {
public:
    RestrictedInterpreterSandbox(policy::PolicyStorePtr policy, core::Context& ctx,
                                 const utils::SandboxConfig& config);

    // Resolves the interpreter and checks that it starts. Also detects
    // whether network namespaces can be created.
    bool probe();

    core::SandboxStrategy strategy() const override { return core::SandboxStrategy::RESTRICTED_INTERPRETER; }
    bool isAvailable() const override { return available_; }

    core::ExecutionResult execute(const std::string& code,
                                  const core::DataContext& data,
                                  const core::ResourceLimits& limits,
                                  const core::CancellationToken* cancel = nullptr) override;

private:
    ProcessSpec buildSpec(const std::string& payload, const std::string& scratch,
                          const core::ResourceLimits& limits) const;

    policy::PolicyStorePtr policy_;
    core::Context& ctx_;
    utils::SandboxConfig config_;
    ProcessSupervisor supervisor_;
    std::string pythonPath_;
    bool available_ = false;
    bool networkIsolation_ = false;
    std::atomic<bool> isolationWarned_{false};
};

}
}
