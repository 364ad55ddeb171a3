#pragma once

#include "policy/policy_store.h"
#include <string>
#include <vector>

namespace warden {
namespace guard {

enum class CodeDecision {
    CLEAR = 0,
    BLOCK
};

struct CodeVerdict {
    CodeDecision decision = CodeDecision::BLOCK;
    std::vector<std::string> violations;
    std::vector<std::string> details;
    std::vector<std::string> stripped;
    std::vector<std::string> warnings;
    std::string sanitizedCode;

    bool clear() const { return decision == CodeDecision::CLEAR; }
    bool sanitized() const { return !stripped.empty(); }
};

// One logical statement: offsets into ScannedSource::text, leading
// indentation excluded.
struct SourceStatement {
    size_t begin = 0;
    size_t end = 0;
};

struct ScannedSource {
    std::string text;    // comments removed, literals intact
    std::string masked;  // same offsets, literal contents blanked
    std::vector<SourceStatement> statements;
};

ScannedSource scanSource(const std::string& code);

constexpr size_t kMaxCodeBytes = 128 * 1024;

class CodeValidator {
public:
    explicit CodeValidator(policy::PolicyStorePtr policy);

    // Deterministic for a given code string and policy version. Anything
    // that cannot be stripped blocks.
    CodeVerdict validate(const std::string& code) const;

private:
    struct Analysis;
    Analysis analyze(const std::string& code) const;

    policy::PolicyStorePtr policy_;
};

}
}
