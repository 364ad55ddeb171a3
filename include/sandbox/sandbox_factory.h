#pragma once

#include "sandbox/sandbox.h"
#include "policy/policy_store.h"
#include "core/context.h"
#include "utils/config.h"
#include <memory>

namespace warden {
namespace sandbox {

// strategy "auto" prefers a container, then the restricted interpreter.
// "container" and "restricted" pin a strategy and never fall back; if the
// pinned one cannot start, the result is an UnavailableSandbox.
class SandboxFactory {
public:
    static std::unique_ptr<Sandbox> create(policy::PolicyStorePtr policy, core::Context& ctx,
                                           const utils::SandboxConfig& config);
};

}
}
