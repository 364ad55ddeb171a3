#include "sandbox/sandbox_factory.h"
#include "sandbox/container_sandbox.h"
#include "sandbox/restricted_sandbox.h"

namespace warden {
namespace sandbox {

std::unique_ptr<Sandbox> SandboxFactory::create(policy::PolicyStorePtr policy, core::Context& ctx,
                                                const utils::SandboxConfig& config) {
    const std::string& mode = config.strategy;
    if (mode != "auto" && mode != "container" && mode != "restricted") {
        ctx.logger.error("sandbox", "unknown sandbox strategy '" + mode + "'");
        return std::make_unique<UnavailableSandbox>();
    }

    if (mode == "auto" || mode == "container") {
        auto container = std::make_unique<ContainerSandbox>(policy, ctx, config);
        if (container->probe()) {
            ctx.logger.info("sandbox", "using container strategy");
            return container;
        }
        if (mode == "container") {
            ctx.logger.error("sandbox", "container strategy requested but runtime is unavailable");
            return std::make_unique<UnavailableSandbox>();
        }
    }

    auto restricted = std::make_unique<RestrictedInterpreterSandbox>(policy, ctx, config);
    if (restricted->probe()) {
        ctx.logger.warn("sandbox", "using restricted-interpreter strategy (reduced isolation)");
        return restricted;
    }

    ctx.logger.error("sandbox", "no sandbox strategy available; executions will be refused");
    return std::make_unique<UnavailableSandbox>();
}

}
}
