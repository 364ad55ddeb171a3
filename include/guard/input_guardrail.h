#pragma once

#include "policy/policy_store.h"
#include "core/context.h"
#include <string>
#include <vector>

namespace warden {
namespace guard {

enum class InputDecision {
    ALLOW = 0,
    BLOCK
};

struct InputVerdict {
    InputDecision decision = InputDecision::ALLOW;
    std::string ruleId;
    std::vector<std::string> warnings;

    bool allowed() const { return decision == InputDecision::ALLOW; }
};

constexpr size_t kMaxScreenedMessageBytes = 16 * 1024;

class InputGuardrail {
public:
    InputGuardrail(policy::PolicyStorePtr policy, core::Context& ctx);

    // First blocking intent rule wins. Warn rules are collected and do not
    // stop evaluation. Always emits one audit record.
    InputVerdict screen(const std::string& sessionId, const std::string& message) const;

    void setLogRejectedMessage(bool enable) { logRejectedMessage_ = enable; }

private:
    policy::PolicyStorePtr policy_;
    core::Context& ctx_;
    bool logRejectedMessage_ = false;
};

}
}
