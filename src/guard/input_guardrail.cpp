#include "guard/input_guardrail.h"

namespace warden {
namespace guard {

InputGuardrail::InputGuardrail(policy::PolicyStorePtr policy, core::Context& ctx)
    : policy_(std::move(policy)), ctx_(ctx) {}

InputVerdict InputGuardrail::screen(const std::string& sessionId, const std::string& message) const {
    InputVerdict verdict;

    if (message.size() > kMaxScreenedMessageBytes) {
        verdict.decision = InputDecision::BLOCK;
        verdict.ruleId = "intent.message_too_large";
    } else {
        for (const auto& rule : policy_->rulesFor(policy::RuleCategory::INTENT)) {
            if (!rule.matches(message)) continue;
            if (rule.action == policy::RuleAction::WARN) {
                verdict.warnings.push_back(rule.id);
                continue;
            }
            verdict.decision = InputDecision::BLOCK;
            verdict.ruleId = rule.id;
            break;
        }
    }

    AuditRecord rec;
    rec.sessionId = sessionId;
    rec.stage = "input";
    if (!verdict.allowed()) {
        rec.ruleId = verdict.ruleId;
        rec.decision = "block";
        ctx_.logger.warn("input", "session " + sessionId + " blocked by " + verdict.ruleId);
        if (logRejectedMessage_) {
            rec.message = message;
            ctx_.logger.debug("input", "rejected message: " + (ctx_.logger.isAllowSensitiveLogging()
                ? message : utils::Logger::redactSensitive(message, "message")));
        }
    } else if (!verdict.warnings.empty()) {
        rec.ruleId = verdict.warnings.front();
        rec.decision = "warn";
        ctx_.logger.info("input", "session " + sessionId + " flagged by " + verdict.warnings.front());
    } else {
        rec.decision = "allow";
    }
    ctx_.audit.record(std::move(rec));
    return verdict;
}

}
}
