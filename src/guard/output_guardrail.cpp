#include "guard/output_guardrail.h"
#include <regex>
#include <algorithm>

namespace warden {
namespace guard {

OutputGuardrail::OutputGuardrail(policy::PolicyStorePtr policy, core::Context& ctx)
    : policy_(std::move(policy)), ctx_(ctx) {}

uint32_t OutputGuardrail::redactText(std::string& text, std::vector<std::string>& matchedRules,
                                     std::vector<std::string>& warnings) const {
    uint32_t total = 0;
    for (const auto& rule : policy_->rulesFor(policy::RuleCategory::DATA_LEAK)) {
        if (!rule.matcher) continue;
        if (rule.action == policy::RuleAction::WARN) {
            if (rule.matches(text) &&
                std::find(warnings.begin(), warnings.end(), rule.id) == warnings.end()) {
                warnings.push_back(rule.id);
            }
            continue;
        }

        std::string out;
        uint32_t hits = 0;
        size_t last = 0;
        auto begin = std::sregex_iterator(text.begin(), text.end(), *rule.matcher);
        for (auto it = begin; it != std::sregex_iterator(); ++it) {
            if (it->length(0) == 0) continue;
            size_t pos = static_cast<size_t>(it->position(0));
            out.append(text, last, pos - last);
            out += kRedactionPlaceholder;
            last = pos + static_cast<size_t>(it->length(0));
            hits++;
        }
        if (hits == 0) continue;
        out.append(text, last, std::string::npos);
        text.swap(out);
        total += hits;
        if (std::find(matchedRules.begin(), matchedRules.end(), rule.id) == matchedRules.end()) {
            matchedRules.push_back(rule.id);
        }
    }
    return total;
}

core::ExecutionResult OutputGuardrail::filter(core::ExecutionResult result, const std::string& sessionId) const {
    std::vector<std::string> matched;
    std::vector<std::string> warnings;
    uint32_t count = 0;

    count += redactText(result.stdoutText, matched, warnings);
    count += redactText(result.errorMessage, matched, warnings);
    for (auto& artifact : result.artifacts) {
        if (artifact.kind == core::ArtifactKind::PLOT_IMAGE) continue;
        count += redactText(artifact.payload, matched, warnings);
    }

    result.redactionsApplied += count;
    for (const auto& w : warnings) {
        if (std::find(result.warnings.begin(), result.warnings.end(), w) == result.warnings.end()) {
            result.warnings.push_back(w);
        }
    }

    if (count > 0 || !warnings.empty()) {
        AuditRecord rec;
        rec.sessionId = sessionId;
        rec.stage = "output";
        rec.ruleId = !matched.empty() ? matched.front() : warnings.front();
        rec.decision = count > 0 ? "redact" : "warn";
        ctx_.audit.record(std::move(rec));
    }
    if (count > 0) {
        ctx_.counters.redactions += count;
        ctx_.logger.info("output", "session " + sessionId + ": " + std::to_string(count) + " span(s) redacted");
    }
    return result;
}

}
}
