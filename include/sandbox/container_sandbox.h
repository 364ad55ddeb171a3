#pragma once

#include "sandbox/sandbox.h"
#include "sandbox/process_supervisor.h"
#include "policy/policy_store.h"
#include "core/context.h"
#include "utils/config.h"
#include <string>
#include <vector>

namespace warden {
namespace sandbox {

// One throwaway container per run: no network unless allowed, read-only
// root with a small tmpfs scratch, all capabilities dropped, non-root user.
// The container is force-removed whenever the run ends abnormally.
class ContainerSandbox : public Sandbox {
public:
    ContainerSandbox(policy::PolicyStorePtr policy, core::Context& ctx,
                     const utils::SandboxConfig& config);

    // True when the runtime binary exists and its daemon answers.
    bool probe();

    core::SandboxStrategy strategy() const override { return core::SandboxStrategy::CONTAINER; }
    bool isAvailable() const override { return available_; }

    core::ExecutionResult execute(const std::string& code,
                                  const core::DataContext& data,
                                  const core::ResourceLimits& limits,
                                  const core::CancellationToken* cancel = nullptr) override;

    // Full `run` command line for a container with the given name.
    std::vector<std::string> buildRunArgs(const std::string& containerName,
                                          const core::ResourceLimits& limits) const;

private:
    void removeContainer(const std::string& containerName);

    policy::PolicyStorePtr policy_;
    core::Context& ctx_;
    utils::SandboxConfig config_;
    ProcessSupervisor supervisor_;
    std::string runtimePath_;
    bool available_ = false;
};

std::string randomContainerName();

}
}
