#pragma once

#include "core/error.h"
#include <string>
#include <vector>
#include <set>
#include <map>
#include <memory>
#include <regex>
#include <cstdint>

namespace warden {
namespace policy {

enum class RuleCategory {
    INTENT = 0,
    CODE,
    DATA_LEAK
};

enum class RuleAction {
    BLOCK = 0,
    REDACT,
    WARN
};

const char* categoryName(RuleCategory category);
const char* actionName(RuleAction action);
bool parseCategory(const std::string& name, RuleCategory& out);
bool parseAction(const std::string& name, RuleAction& out);

struct PolicyRule {
    std::string id;
    RuleCategory category = RuleCategory::INTENT;
    std::string pattern;
    bool ignoreCase = false;
    RuleAction action = RuleAction::BLOCK;
    std::string description;
    std::shared_ptr<const std::regex> matcher;

    bool matches(const std::string& text) const;
};

struct RuleSpec {
    std::string id;
    RuleCategory category;
    std::string pattern;
    RuleAction action;
    bool ignoreCase;
    std::string description;
};

// Read-only after construction. Shared between guardrail stages and
// threads without locking; hand it around as std::shared_ptr<const PolicyStore>.
class PolicyStore {
public:
    PolicyStore();

    static PolicyStore defaults();
    static Result<PolicyStore> fromRules(const std::vector<RuleSpec>& specs);
    static Result<PolicyStore> fromJson(const std::string& text);
    static Result<PolicyStore> loadFromJson(const std::string& path);

    const std::vector<PolicyRule>& rules() const { return rules_; }
    const std::vector<PolicyRule>& rulesFor(RuleCategory category) const;
    const PolicyRule* findRule(const std::string& id) const;

    const std::set<std::string>& allowedImports() const { return allowedImports_; }
    const std::set<std::string>& sanitizableImports() const { return sanitizableImports_; }
    const std::vector<std::string>& vettedBuiltins() const { return vettedBuiltins_; }
    const std::map<std::string, std::string>& preloadedModules() const { return preloadedModules_; }

    bool isImportAllowed(const std::string& module) const;
    bool isImportSanitizable(const std::string& module) const;

    uint64_t version() const { return version_; }
    size_t size() const { return rules_.size(); }
    bool empty() const { return rules_.empty(); }

private:
    Result<void> addRule(const RuleSpec& spec);
    void finalize();

    std::vector<PolicyRule> rules_;
    std::vector<PolicyRule> intentRules_;
    std::vector<PolicyRule> codeRules_;
    std::vector<PolicyRule> dataLeakRules_;
    std::set<std::string> allowedImports_;
    std::set<std::string> sanitizableImports_;
    std::vector<std::string> vettedBuiltins_;
    std::map<std::string, std::string> preloadedModules_;
    uint64_t version_ = 0;
};

using PolicyStorePtr = std::shared_ptr<const PolicyStore>;

std::vector<RuleSpec> defaultRuleSpecs();

}
}
