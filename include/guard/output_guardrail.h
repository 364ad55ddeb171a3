#pragma once

#include "policy/policy_store.h"
#include "core/context.h"
#include "core/types.h"
#include <string>
#include <vector>

namespace warden {
namespace guard {

constexpr const char* kRedactionPlaceholder = "[REDACTED]";

class OutputGuardrail {
public:
    OutputGuardrail(policy::PolicyStorePtr policy, core::Context& ctx);

    // Redacts data-leak matches in stdout, the error message and textual
    // artifacts. Never blocks; image payloads are left untouched.
    core::ExecutionResult filter(core::ExecutionResult result, const std::string& sessionId = "") const;

    uint32_t redactText(std::string& text, std::vector<std::string>& matchedRules,
                        std::vector<std::string>& warnings) const;

private:
    policy::PolicyStorePtr policy_;
    core::Context& ctx_;
};

}
}
