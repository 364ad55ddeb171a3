#include "guard/code_validator.h"
#include <regex>
#include <algorithm>

namespace warden {
namespace guard {

namespace {

struct ImportItem {
    std::string module;
    std::string bound;
    std::string original;
};

struct ParsedImport {
    bool isFrom = false;
    bool wildcard = false;
    std::string fromClause;
    std::vector<ImportItem> items;
};

bool isBlank(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
}

std::string trimCopy(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && isBlank(s[b])) b++;
    while (e > b && isBlank(s[e - 1])) e--;
    return s.substr(b, e - b);
}

std::string joinContinuations(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); i++) {
        if (s[i] == '\\' && i + 1 < s.size() && s[i + 1] == '\n') {
            out.push_back(' ');
            i++;
            continue;
        }
        out.push_back(s[i] == '\n' ? ' ' : s[i]);
    }
    return out;
}

std::vector<std::string> splitCommas(const std::string& s) {
    std::vector<std::string> parts;
    size_t start = 0;
    for (size_t i = 0; i <= s.size(); i++) {
        if (i == s.size() || s[i] == ',') {
            parts.push_back(trimCopy(s.substr(start, i - start)));
            start = i + 1;
        }
    }
    return parts;
}

bool parseImport(const std::string& statement, ParsedImport& out) {
    static const std::regex importRe(R"(^import\s+(.+)$)");
    static const std::regex fromRe(R"(^from\s+(\.*[A-Za-z_][\w.]*|\.+)\s+import\s+(.+)$)");
    static const std::regex itemRe(R"(^([A-Za-z_][\w.]*)(?:\s+as\s+([A-Za-z_]\w*))?$)");

    std::string s = trimCopy(joinContinuations(statement));
    std::smatch m;
    std::string list;
    if (std::regex_match(s, m, fromRe)) {
        out.isFrom = true;
        out.fromClause = m[1].str();
        list = m[2].str();
        if (!list.empty() && list.front() == '(') {
            if (list.back() != ')') return false;
            list = list.substr(1, list.size() - 2);
        }
    } else if (std::regex_match(s, m, importRe)) {
        list = m[1].str();
    } else {
        return false;
    }

    for (const auto& part : splitCommas(list)) {
        if (part.empty()) {
            // Trailing comma inside a parenthesised from-import.
            if (out.isFrom) continue;
            return false;
        }
        if (out.isFrom && part == "*") {
            out.wildcard = true;
            out.items.push_back({out.fromClause, "*", part});
            continue;
        }
        std::smatch im;
        if (!std::regex_match(part, im, itemRe)) return false;
        ImportItem item;
        item.original = part;
        std::string name = im[1].str();
        std::string alias = im[2].matched ? im[2].str() : "";
        if (out.isFrom) {
            item.module = out.fromClause;
            item.bound = alias.empty() ? name : alias;
        } else {
            item.module = name;
            item.bound = alias.empty() ? name.substr(0, name.find('.')) : alias;
        }
        out.items.push_back(item);
    }
    return !out.items.empty();
}

// Finds the import clause in a statement. Returns npos when there is none;
// `from` clauses that are not imports (yield from, raise from) are skipped.
size_t findImportClause(const std::string& masked, ParsedImport& parsed, bool& unparsed) {
    static const std::regex keywordRe(R"((?:^|[^.\w])(from|import)\b)");
    unparsed = false;
    auto begin = std::sregex_iterator(masked.begin(), masked.end(), keywordRe);
    for (auto it = begin; it != std::sregex_iterator(); ++it) {
        size_t pos = static_cast<size_t>(it->position(1));
        ParsedImport candidate;
        if (parseImport(masked.substr(pos), candidate)) {
            parsed = candidate;
            return pos;
        }
        if ((*it)[1].str() == "import") {
            unparsed = true;
            return pos;
        }
    }
    return std::string::npos;
}

bool isReferenced(const std::string& name, const ScannedSource& src, size_t self,
                  const std::vector<bool>& removed) {
    const std::regex refRe("(?:^|[^.\\w])" + name + "\\b");
    for (size_t i = 0; i < src.statements.size(); i++) {
        if (i == self || removed[i]) continue;
        const auto& st = src.statements[i];
        std::string masked = src.masked.substr(st.begin, st.end - st.begin);
        if (std::regex_search(masked, refRe)) return true;
    }
    return false;
}

void addUnique(std::vector<std::string>& list, const std::string& value) {
    if (std::find(list.begin(), list.end(), value) == list.end()) {
        list.push_back(value);
    }
}

}

ScannedSource scanSource(const std::string& code) {
    ScannedSource out;
    out.text.reserve(code.size());
    out.masked.reserve(code.size());

    const size_t n = code.size();
    size_t i = 0;
    while (i < n) {
        char c = code[i];
        if (c == '#') {
            while (i < n && code[i] != '\n') i++;
            continue;
        }
        if (c == '\'' || c == '"') {
            bool triple = i + 2 < n && code[i + 1] == c && code[i + 2] == c;
            size_t qlen = triple ? 3 : 1;
            out.text.append(code, i, qlen);
            out.masked.append(qlen, c);
            i += qlen;
            while (i < n) {
                char d = code[i];
                if (d == '\\' && i + 1 < n) {
                    out.text.append(code, i, 2);
                    out.masked.append(2, ' ');
                    i += 2;
                    continue;
                }
                if (d == c && (!triple || (i + 2 < n && code[i + 1] == c && code[i + 2] == c))) {
                    out.text.append(code, i, qlen);
                    out.masked.append(qlen, c);
                    i += qlen;
                    break;
                }
                if (d == '\n' && !triple) break;
                out.text.push_back(d);
                out.masked.push_back(' ');
                i++;
            }
            continue;
        }
        out.text.push_back(c);
        out.masked.push_back(c);
        i++;
    }

    auto push = [&out](size_t b, size_t e) {
        while (b < e && (isBlank(out.masked[b]) || out.masked[b] == '\\')) b++;
        while (e > b && (isBlank(out.masked[e - 1]) || out.masked[e - 1] == '\\')) e--;
        if (b < e) out.statements.push_back({b, e});
    };

    int depth = 0;
    size_t start = 0;
    const std::string& m = out.masked;
    for (size_t k = 0; k < m.size(); k++) {
        char c = m[k];
        if (c == '(' || c == '[' || c == '{') {
            depth++;
        } else if (c == ')' || c == ']' || c == '}') {
            depth = std::max(0, depth - 1);
        } else if (c == '\\' && k + 1 < m.size() && m[k + 1] == '\n') {
            k++;
        } else if ((c == '\n' || c == ';') && depth == 0) {
            push(start, k);
            start = k + 1;
        }
    }
    push(start, m.size());
    return out;
}

struct CodeValidator::Analysis {
    CodeDecision decision = CodeDecision::BLOCK;
    std::vector<std::string> violations;
    std::vector<std::string> details;
    std::vector<std::string> stripped;
    std::vector<std::string> warnings;
    std::string sanitizedCode;
};

CodeValidator::CodeValidator(policy::PolicyStorePtr policy) : policy_(std::move(policy)) {}

CodeValidator::Analysis CodeValidator::analyze(const std::string& code) const {
    Analysis a;

    if (trimCopy(code).empty()) {
        a.violations.push_back("code.empty");
        return a;
    }
    if (code.size() > kMaxCodeBytes) {
        a.violations.push_back("code.too_large");
        return a;
    }
    if (code.find('\0') != std::string::npos) {
        a.violations.push_back("code.binary");
        return a;
    }

    ScannedSource src = scanSource(code);
    const auto& rules = policy_->rulesFor(policy::RuleCategory::CODE);

    for (const auto& rule : rules) {
        if (rule.action == policy::RuleAction::REDACT) continue;
        if (!rule.matches(src.text)) continue;
        if (rule.action == policy::RuleAction::WARN) {
            addUnique(a.warnings, rule.id);
        } else {
            addUnique(a.violations, rule.id);
        }
    }

    const size_t count = src.statements.size();
    std::vector<bool> removed(count, false);
    std::vector<std::string> replacement(count);

    for (size_t i = 0; i < count; i++) {
        const auto& st = src.statements[i];
        std::string text = src.text.substr(st.begin, st.end - st.begin);
        for (const auto& rule : rules) {
            if (rule.action != policy::RuleAction::REDACT) continue;
            if (rule.matches(text)) {
                removed[i] = true;
                a.stripped.push_back(rule.id);
                break;
            }
        }
    }

    for (size_t i = 0; i < count; i++) {
        if (removed[i]) continue;
        const auto& st = src.statements[i];
        std::string masked = src.masked.substr(st.begin, st.end - st.begin);

        ParsedImport parsed;
        bool unparsed = false;
        size_t pos = findImportClause(masked, parsed, unparsed);
        if (pos == std::string::npos) continue;
        if (unparsed) {
            addUnique(a.violations, "code.import.unparsed");
            continue;
        }

        const bool pure = pos == 0;
        std::vector<std::string> kept;
        bool dropped = false;
        bool blocked = false;
        for (const auto& item : parsed.items) {
            if (policy_->isImportAllowed(item.module)) {
                kept.push_back(item.original);
                continue;
            }
            bool strippable = pure && !parsed.wildcard &&
                              policy_->isImportSanitizable(item.module) &&
                              !isReferenced(item.bound, src, i, removed);
            if (strippable) {
                dropped = true;
                a.stripped.push_back("code.import.unused");
                a.details.push_back("stripped import:" + item.module);
            } else {
                blocked = true;
                addUnique(a.violations, "code.import.disallowed");
                a.details.push_back("import:" + item.module);
            }
        }

        if (blocked || !dropped) continue;
        if (kept.empty()) {
            removed[i] = true;
        } else if (parsed.isFrom) {
            std::string joined;
            for (size_t k = 0; k < kept.size(); k++) {
                joined += (k ? ", " : "") + kept[k];
            }
            replacement[i] = "from " + parsed.fromClause + " import " + joined;
        } else {
            std::string joined;
            for (size_t k = 0; k < kept.size(); k++) {
                joined += (k ? ", " : "") + kept[k];
            }
            replacement[i] = "import " + joined;
        }
    }

    if (!a.violations.empty()) {
        a.decision = CodeDecision::BLOCK;
        return a;
    }

    a.decision = CodeDecision::CLEAR;
    if (a.stripped.empty()) return a;

    std::string out;
    size_t prev = 0;
    for (size_t i = 0; i < count; i++) {
        const auto& st = src.statements[i];
        if (!removed[i] && replacement[i].empty()) continue;
        out.append(src.text, prev, st.begin - prev);
        out += removed[i] ? std::string("pass") : replacement[i];
        prev = st.end;
    }
    out.append(src.text, prev, std::string::npos);
    a.sanitizedCode = out;
    return a;
}

CodeVerdict CodeValidator::validate(const std::string& code) const {
    Analysis first = analyze(code);

    CodeVerdict verdict;
    verdict.decision = first.decision;
    verdict.violations = first.violations;
    verdict.details = first.details;
    verdict.warnings = first.warnings;

    if (first.decision != CodeDecision::CLEAR) return verdict;

    verdict.stripped = first.stripped;
    if (first.stripped.empty()) return verdict;

    // The rewrite has to stand on its own; anything left over fails closed.
    Analysis second = analyze(first.sanitizedCode);
    if (second.decision != CodeDecision::CLEAR || !second.stripped.empty()) {
        verdict.decision = CodeDecision::BLOCK;
        verdict.violations = second.violations;
        addUnique(verdict.violations, "code.sanitize.incomplete");
        verdict.stripped.clear();
        return verdict;
    }
    verdict.sanitizedCode = first.sanitizedCode;
    return verdict;
}

}
}
