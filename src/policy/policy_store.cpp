#include "policy/policy_store.h"
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>
#include <algorithm>
#include <stdexcept>

namespace warden {
namespace policy {

using json = nlohmann::json;

namespace {

const char* kCardPattern = R"(\b(?:\d{4}[ -]?){3}\d{4}\b|\b3[47]\d{2}[ -]?\d{6}[ -]?\d{5}\b)";
const char* kSsnPattern = R"(\b\d{3}-\d{2}-\d{4}\b)";

uint64_t fnv1a(uint64_t hash, const std::string& data) {
    for (unsigned char c : data) {
        hash ^= c;
        hash *= 1099511628211ULL;
    }
    hash ^= 0xff;
    hash *= 1099511628211ULL;
    return hash;
}

bool readStringList(const json& j, const char* key, std::vector<std::string>& out, std::string& err) {
    if (!j.contains(key)) return true;
    const json& arr = j.at(key);
    if (!arr.is_array()) {
        err = std::string(key) + " must be an array of strings";
        return false;
    }
    for (const auto& item : arr) {
        if (!item.is_string()) {
            err = std::string(key) + " must be an array of strings";
            return false;
        }
        out.push_back(item.get<std::string>());
    }
    return true;
}

}

const char* categoryName(RuleCategory category) {
    switch (category) {
        case RuleCategory::INTENT: return "intent";
        case RuleCategory::CODE: return "code";
        case RuleCategory::DATA_LEAK: return "data-leak";
    }
    return "unknown";
}

const char* actionName(RuleAction action) {
    switch (action) {
        case RuleAction::BLOCK: return "block";
        case RuleAction::REDACT: return "redact";
        case RuleAction::WARN: return "warn";
    }
    return "unknown";
}

bool parseCategory(const std::string& name, RuleCategory& out) {
    if (name == "intent") { out = RuleCategory::INTENT; return true; }
    if (name == "code") { out = RuleCategory::CODE; return true; }
    if (name == "data-leak" || name == "data_leak") { out = RuleCategory::DATA_LEAK; return true; }
    return false;
}

bool parseAction(const std::string& name, RuleAction& out) {
    if (name == "block") { out = RuleAction::BLOCK; return true; }
    if (name == "redact") { out = RuleAction::REDACT; return true; }
    if (name == "warn") { out = RuleAction::WARN; return true; }
    return false;
}

bool PolicyRule::matches(const std::string& text) const {
    return matcher && std::regex_search(text, *matcher);
}

std::vector<RuleSpec> defaultRuleSpecs() {
    const auto B = RuleAction::BLOCK;
    const auto R = RuleAction::REDACT;
    const auto W = RuleAction::WARN;
    const auto I = RuleCategory::INTENT;
    const auto C = RuleCategory::CODE;
    const auto D = RuleCategory::DATA_LEAK;

    return {
        {"intent.prompt_override", I,
         R"(\b(ignore|disregard|forget|override)\b.{0,40}\b(instructions|rules|guardrails|system prompt|restrictions)\b)",
         B, true, "Attempts to override assistant instructions"},
        {"intent.exploitation", I,
         R"(\b(hack|hacking|exploit|bypass|inject|injection|malicious|virus|malware|ransomware|breach|crack|rootkit|backdoor|privilege escalation)\b)",
         B, true, "Exploitation or attack vocabulary"},
        {"intent.credential_theft", I,
         R"(\b(steal|dump|exfiltrate|harvest|leak)\b.{0,40}\b(credentials?|passwords?|api keys?|tokens?|secrets?|cookies?|hashes)\b|/etc/(passwd|shadow))",
         B, true, "Credential theft"},
        {"intent.system_compromise", I,
         R"(\b(unauthorized|reverse shell|escape (the )?sandbox|sandbox escape|disable (the )?(security|guardrails?|sandbox)|run (a )?shell command|spawn (a )?shell)\b)",
         B, true, "Host or sandbox compromise"},
        {"intent.destructive_action", I,
         R"(\b(delete|remove|wipe|erase|destroy|format)\b.{0,40}\b(files?|folders?|director(y|ies)|disk|drive|system|server|database)\b|rm\s+-[a-z]*[rf])",
         B, true, "Destructive filesystem or system operation"},
        {"intent.dynamic_execution", I,
         R"(\b(exec|eval)\s*\(|os\.system\b|\bsubprocess\b)",
         B, true, "Explicit request for dynamic code execution"},
        {"intent.sensitive_ssn", I, kSsnPattern, B, false, "Government identifier typed into the request"},
        {"intent.sensitive_card", I, kCardPattern, B, false, "Payment card number typed into the request"},
        {"intent.privacy_concern", I,
         R"(\b(identify individuals|personal information|private data|confidential|de-?anonymi[sz]e)\b)",
         W, true, "Analysis may touch personal data"},

        {"code.process.subprocess", C, R"(\bsubprocess\b)", B, false, "Subprocess module"},
        {"code.process.os_exec", C,
         R"(os\s*\.\s*(system|popen|exec\w*|spawn\w*|fork\w*|kill\w*|startfile|posix_spawn\w*)\b)",
         B, false, "os process primitives"},
        {"code.process.modules", C,
         R"((?:^|[^.\w])(pty|multiprocessing|ctypes|cffi|signal|resource|threading|asyncio)\s*\.)",
         B, false, "Process, thread or native interface modules"},
        {"code.eval.builtin", C, R"((?:^|[^.\w])(eval|exec|execfile|compile)\b|\.\s*(eval|exec)\s*\()",
         B, false, "Dynamic evaluation builtin"},
        {"code.eval.import", C, R"(\b__import__\b|\bimportlib\b)", B, false, "Dynamic import"},
        {"code.eval.introspection", C,
         R"(\b(globals|locals|vars|getattr|setattr|delattr|breakpoint|memoryview)\s*\()",
         B, false, "Namespace introspection"},
        {"code.eval.dunder", C,
         R"(__(builtins|class|bases|base|subclasses|globals|code|mro|dict|loader|spec|getattribute|reduce|reduce_ex|closure|func|self)__)",
         B, false, "Dunder attribute escape"},
        {"code.eval.private_attr", C, R"(\.\s*_\w)", B, false, "Private attribute access"},
        {"code.eval.host_module_attr", C,
         R"(\.\s*(os|sys|posix|subprocess|builtins|importlib|shutil|socket|ctypes|pty)\b)",
         B, false, "Host module reached through another module"},
        {"code.fs.open", C, R"(\bopen\s*\()", B, false, "Raw file open"},
        {"code.fs.write", C,
         R"(\.(to_excel|to_parquet|to_pickle|to_sql|to_hdf|to_feather|to_stata|write_text|write_bytes|unlink|rmdir|mkdir|makedirs|rename|replace_file|chmod|chown|touch)\s*\()",
         B, false, "Filesystem mutation"},
        {"code.fs.write_path", C,
         R"(\.(to_csv|to_json|to_html|savefig|write_html|write_image)\s*\(\s*[rbfuRBFU]?['"])",
         B, false, "Writing output to a file path"},
        {"code.fs.read_path", C,
         R"(\bread_(csv|excel|json|parquet|pickle|table|html|sql|fwf|hdf|feather|sas|stata|xml)\s*\(\s*[rbfuRBFU]?['"])",
         B, false, "Reading host files or URLs"},
        {"code.fs.modules", C, R"((?:^|[^.\w])(shutil|pathlib|tempfile|glob|fileinput)\s*\.)", B, false, "Filesystem modules"},
        {"code.net.socket", C,
         R"((?:^|[^.\w])(socket|urllib\d?|requests|httpx|aiohttp|ftplib|smtplib|telnetlib|paramiko|http\.client|xmlrpc)\b)",
         B, false, "Network access"},
        {"code.shell.command", C, R"(rm\s+-[a-zA-Z]*[rf]|/bin/(ba|z|da)?sh\b|\b(curl|wget|nc|ncat)\s+-)", B, false, "Shell command text"},
        {"code.io.input", C, R"(\b(input|raw_input)\s*\()", B, false, "Interactive input"},
        {"code.sanitize.warnings_filter", C, R"(^\s*warnings\s*\.\s*(filterwarnings|simplefilter)\s*\(.*\)\s*$)",
         R, false, "Warnings configuration, stripped"},
        {"code.sanitize.recursion_limit", C, R"(^\s*sys\s*\.\s*setrecursionlimit\s*\(.*\)\s*$)",
         R, false, "Interpreter tuning, stripped"},

        {"data.ssn", D, kSsnPattern, R, false, "US social security number"},
        {"data.payment_card", D, kCardPattern, R, false, "Payment card number"},
        {"data.email", D, R"(\b[A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\.[A-Za-z]{2,}\b)", R, false, "Email address"},
        {"data.password", D, R"(\b(password|passwd|pwd)\s*[:=]\s*\S+)", R, true, "Password assignment"},
        {"data.api_key", D, R"(\bapi[_ -]?key\s*[:=]\s*\S+)", R, true, "API key assignment"},
        {"data.token", D, R"(\b(token|secret|bearer)\s*[:=]\s*\S+)", R, true, "Token or secret assignment"},
        {"data.aws_access_key", D, R"(\bAKIA[0-9A-Z]{16}\b)", R, false, "Cloud access key id"},
        {"data.private_key", D, R"(-----BEGIN [A-Z ]*PRIVATE KEY-----)", R, false, "Private key block"},
    };
}

PolicyStore::PolicyStore() = default;

Result<void> PolicyStore::addRule(const RuleSpec& spec) {
    if (spec.id.empty()) {
        return Error(ErrorCode::INVALID_CONFIG, "policy rule without id");
    }
    if (findRule(spec.id)) {
        return Error(ErrorCode::INVALID_CONFIG, "duplicate policy rule id " + spec.id);
    }

    PolicyRule rule;
    rule.id = spec.id;
    rule.category = spec.category;
    rule.pattern = spec.pattern;
    rule.ignoreCase = spec.ignoreCase;
    rule.action = spec.action;
    rule.description = spec.description;

    auto flags = std::regex::ECMAScript | std::regex::optimize;
    if (spec.ignoreCase) flags |= std::regex::icase;
    try {
        rule.matcher = std::make_shared<const std::regex>(spec.pattern, flags);
    } catch (const std::regex_error& e) {
        return Error(ErrorCode::INVALID_CONFIG, "rule " + spec.id + ": bad pattern: " + e.what());
    }
    rules_.push_back(std::move(rule));
    return {};
}

void PolicyStore::finalize() {
    intentRules_.clear();
    codeRules_.clear();
    dataLeakRules_.clear();
    for (const auto& rule : rules_) {
        switch (rule.category) {
            case RuleCategory::INTENT: intentRules_.push_back(rule); break;
            case RuleCategory::CODE: codeRules_.push_back(rule); break;
            case RuleCategory::DATA_LEAK: dataLeakRules_.push_back(rule); break;
        }
    }

    uint64_t hash = 14695981039346656037ULL;
    for (const auto& rule : rules_) {
        hash = fnv1a(hash, rule.id);
        hash = fnv1a(hash, categoryName(rule.category));
        hash = fnv1a(hash, rule.pattern);
        hash = fnv1a(hash, rule.ignoreCase ? "i" : "");
        hash = fnv1a(hash, actionName(rule.action));
    }
    for (const auto& m : allowedImports_) hash = fnv1a(hash, "allow:" + m);
    for (const auto& m : sanitizableImports_) hash = fnv1a(hash, "strip:" + m);
    for (const auto& b : vettedBuiltins_) hash = fnv1a(hash, "builtin:" + b);
    for (const auto& [alias, module] : preloadedModules_) hash = fnv1a(hash, "preload:" + alias + "=" + module);
    version_ = hash;
}

PolicyStore PolicyStore::defaults() {
    PolicyStore store;
    for (const auto& spec : defaultRuleSpecs()) {
        // Built-in patterns are compiled here once; a failure is a programming error.
        auto added = store.addRule(spec);
        if (added.failed()) {
            throw std::logic_error(added.error().message);
        }
    }
    store.allowedImports_ = {
        "pandas", "numpy", "matplotlib", "plotly", "seaborn", "scipy",
        "math", "statistics", "json", "re", "datetime", "collections",
        "itertools", "functools", "operator", "random", "decimal", "fractions",
        "string", "textwrap", "io", "base64", "typing", "dataclasses", "calendar"
    };
    store.sanitizableImports_ = {"os", "sys", "warnings", "time", "pprint"};
    store.vettedBuiltins_ = {
        "abs", "all", "any", "bool", "dict", "divmod", "enumerate", "filter",
        "float", "format", "frozenset", "hasattr", "int", "isinstance", "len",
        "list", "map", "max", "min", "pow", "print", "range", "repr", "reversed",
        "round", "set", "slice", "sorted", "str", "sum", "tuple", "zip",
        "True", "False", "None", "Exception", "ArithmeticError", "KeyError",
        "TypeError", "ValueError", "IndexError", "ZeroDivisionError",
        "AttributeError", "StopIteration", "MemoryError"
    };
    store.preloadedModules_ = {
        {"pd", "pandas"}, {"np", "numpy"}, {"plt", "matplotlib.pyplot"},
        {"px", "plotly.express"}, {"go", "plotly.graph_objects"},
        {"math", "math"}, {"statistics", "statistics"}
    };
    store.finalize();
    return store;
}

Result<PolicyStore> PolicyStore::fromRules(const std::vector<RuleSpec>& specs) {
    PolicyStore base = defaults();
    PolicyStore store;
    store.allowedImports_ = base.allowedImports_;
    store.sanitizableImports_ = base.sanitizableImports_;
    store.vettedBuiltins_ = base.vettedBuiltins_;
    store.preloadedModules_ = base.preloadedModules_;
    for (const auto& spec : specs) {
        auto added = store.addRule(spec);
        if (added.failed()) return added.error();
    }
    store.finalize();
    return store;
}

Result<PolicyStore> PolicyStore::fromJson(const std::string& text) {
    json doc = json::parse(text, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return Error(ErrorCode::PARSE_ERROR, "policy document is not a JSON object");
    }

    bool extendDefaults = doc.value("extends_defaults", true);
    PolicyStore store;
    if (extendDefaults) {
        store = defaults();
    }

    if (doc.contains("rules")) {
        const json& rules = doc.at("rules");
        if (!rules.is_array()) {
            return Error(ErrorCode::PARSE_ERROR, "rules must be an array");
        }
        for (const auto& r : rules) {
            if (!r.is_object() || !r.contains("id") || !r.contains("pattern") ||
                !r.at("id").is_string() || !r.at("pattern").is_string()) {
                return Error(ErrorCode::PARSE_ERROR, "each rule needs string id and pattern");
            }
            RuleSpec spec;
            spec.id = r.at("id").get<std::string>();
            spec.pattern = r.at("pattern").get<std::string>();
            std::string category = r.value("category", std::string("intent"));
            std::string action = r.value("action", std::string("block"));
            if (!parseCategory(category, spec.category)) {
                return Error(ErrorCode::INVALID_CONFIG, "rule " + spec.id + ": unknown category " + category);
            }
            if (!parseAction(action, spec.action)) {
                return Error(ErrorCode::INVALID_CONFIG, "rule " + spec.id + ": unknown action " + action);
            }
            spec.ignoreCase = r.value("ignore_case", false);
            spec.description = r.value("description", std::string());
            auto added = store.addRule(spec);
            if (added.failed()) return added.error();
        }
    }

    std::string err;
    std::vector<std::string> allowed, sanitizable, builtins;
    if (!readStringList(doc, "allowed_imports", allowed, err) ||
        !readStringList(doc, "sanitizable_imports", sanitizable, err) ||
        !readStringList(doc, "vetted_builtins", builtins, err)) {
        return Error(ErrorCode::PARSE_ERROR, err);
    }
    if (doc.contains("allowed_imports")) store.allowedImports_ = std::set<std::string>(allowed.begin(), allowed.end());
    if (doc.contains("sanitizable_imports")) store.sanitizableImports_ = std::set<std::string>(sanitizable.begin(), sanitizable.end());
    if (doc.contains("vetted_builtins")) store.vettedBuiltins_ = builtins;

    if (doc.contains("preloaded_modules")) {
        const json& pre = doc.at("preloaded_modules");
        if (!pre.is_object()) {
            return Error(ErrorCode::PARSE_ERROR, "preloaded_modules must be an object");
        }
        store.preloadedModules_.clear();
        for (auto it = pre.begin(); it != pre.end(); ++it) {
            if (!it.value().is_string()) {
                return Error(ErrorCode::PARSE_ERROR, "preloaded_modules values must be strings");
            }
            store.preloadedModules_[it.key()] = it.value().get<std::string>();
        }
    }

    store.finalize();
    return store;
}

Result<PolicyStore> PolicyStore::loadFromJson(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Error(ErrorCode::IO_ERROR, "cannot open policy file " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return fromJson(buffer.str());
}

const std::vector<PolicyRule>& PolicyStore::rulesFor(RuleCategory category) const {
    switch (category) {
        case RuleCategory::INTENT: return intentRules_;
        case RuleCategory::CODE: return codeRules_;
        case RuleCategory::DATA_LEAK: return dataLeakRules_;
    }
    return intentRules_;
}

const PolicyRule* PolicyStore::findRule(const std::string& id) const {
    for (const auto& rule : rules_) {
        if (rule.id == id) return &rule;
    }
    return nullptr;
}

bool PolicyStore::isImportAllowed(const std::string& module) const {
    std::string root = module.substr(0, module.find('.'));
    return allowedImports_.count(root) > 0;
}

bool PolicyStore::isImportSanitizable(const std::string& module) const {
    std::string root = module.substr(0, module.find('.'));
    return sanitizableImports_.count(root) > 0;
}

}
}
