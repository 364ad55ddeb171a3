#include "core/coordinator.h"
#include "core/context.h"
#include "core/session_store.h"
#include "guard/audit_log.h"
#include "policy/policy_store.h"
#include "sandbox/sandbox_factory.h"
#include "utils/config.h"
#include "utils/logger.h"
#include <nlohmann/json.hpp>
#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>
#include <memory>
#include <csignal>
#include <getopt.h>

namespace warden {

using json = nlohmann::json;

static const char* kVersion = "0.3.0";

struct CliOptions {
    std::string configPath;
    std::string sessionId = "cli";
    std::string codeFile;
    std::string dataFile;
    std::string dataName;
    std::string message;
    std::string policyFile;
    std::string strategy;
    std::vector<std::string> overrides;
    bool showStatus = false;
    bool showHelp = false;
    bool showVersion = false;
    bool verbose = false;
};

static core::CancellationToken* g_cancel = nullptr;

static void signalHandler(int) {
    if (g_cancel) g_cancel->cancel();
}

void registerSignalHandlers() {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
}

void printHelp(const char* prog) {
    std::cout << "Usage: " << prog << " [options]\n\n"
              << "Runs analysis code through the guarded execution pipeline and prints\n"
              << "the result as JSON.\n\n"
              << "Options:\n"
              << "  -h, --help              Show this help\n"
              << "  -v, --version           Show version\n"
              << "  -c, --config FILE       Load key=value configuration\n"
              << "  -s, --session ID        Session id (default: cli)\n"
              << "  -f, --code-file FILE    Python code to execute ('-' for stdin)\n"
              << "  -d, --data-file FILE    CSV dataset handed to the code as df/rows\n"
              << "  -n, --data-name NAME    Dataset name (default: file name)\n"
              << "  -m, --message TEXT      User message to screen before execution\n"
              << "  -p, --policy FILE       JSON policy file\n"
              << "  -S, --strategy NAME     auto | container | restricted\n"
              << "  -o, --set KEY=VALUE     Override a configuration key\n"
              << "  -t, --status            Print coordinator status and exit\n"
              << "  -V, --verbose           Log to the console\n";
}

void printVersion() {
    std::cout << "warden " << kVersion << "\n";
}

bool parseArgs(int argc, char* argv[], CliOptions& opts) {
    static struct option longOptions[] = {
        {"help", no_argument, nullptr, 'h'},
        {"version", no_argument, nullptr, 'v'},
        {"config", required_argument, nullptr, 'c'},
        {"session", required_argument, nullptr, 's'},
        {"code-file", required_argument, nullptr, 'f'},
        {"data-file", required_argument, nullptr, 'd'},
        {"data-name", required_argument, nullptr, 'n'},
        {"message", required_argument, nullptr, 'm'},
        {"policy", required_argument, nullptr, 'p'},
        {"strategy", required_argument, nullptr, 'S'},
        {"set", required_argument, nullptr, 'o'},
        {"status", no_argument, nullptr, 't'},
        {"verbose", no_argument, nullptr, 'V'},
        {nullptr, 0, nullptr, 0}
    };

    int opt;
    int optionIndex = 0;

    while ((opt = getopt_long(argc, argv, "hvc:s:f:d:n:m:p:S:o:tV", longOptions, &optionIndex)) != -1) {
        switch (opt) {
            case 'h':
                opts.showHelp = true;
                return true;
            case 'v':
                opts.showVersion = true;
                return true;
            case 'c':
                opts.configPath = optarg;
                break;
            case 's':
                opts.sessionId = optarg;
                break;
            case 'f':
                opts.codeFile = optarg;
                break;
            case 'd':
                opts.dataFile = optarg;
                break;
            case 'n':
                opts.dataName = optarg;
                break;
            case 'm':
                opts.message = optarg;
                break;
            case 'p':
                opts.policyFile = optarg;
                break;
            case 'S':
                opts.strategy = optarg;
                break;
            case 'o':
                opts.overrides.push_back(optarg);
                break;
            case 't':
                opts.showStatus = true;
                break;
            case 'V':
                opts.verbose = true;
                break;
            default:
                return false;
        }
    }

    if (!opts.showStatus && opts.codeFile.empty()) {
        std::cerr << "warden: --code-file is required\n";
        return false;
    }
    return true;
}

Result<std::string> readInput(const std::string& path) {
    std::ostringstream ss;
    if (path == "-") {
        ss << std::cin.rdbuf();
        return ss.str();
    }
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return Error(ErrorCode::IO_ERROR, "cannot open " + path);
    }
    ss << file.rdbuf();
    return ss.str();
}

std::string baseName(const std::string& path) {
    size_t slash = path.find_last_of('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

json resultToJson(const core::ExecutionResult& r) {
    json j;
    j["status"] = core::statusName(r.status);
    j["message"] = core::describeStatus(r.status);
    j["stdout"] = r.stdoutText;
    j["redactions_applied"] = r.redactionsApplied;
    j["strategy"] = core::strategyName(r.strategy);
    j["final_state"] = core::requestStateName(r.finalState);
    j["wall_time_ms"] = r.wallTimeMs;
    if (!r.errorMessage.empty()) j["error"] = r.errorMessage;
    if (!r.violations.empty()) j["violations"] = r.violations;
    if (!r.blockedCategory.empty()) j["blocked_category"] = r.blockedCategory;
    if (!r.warnings.empty()) j["warnings"] = r.warnings;

    json artifacts = json::array();
    for (const auto& a : r.artifacts) {
        artifacts.push_back({{"kind", core::artifactKindName(a.kind)}, {"payload", a.payload}});
    }
    j["artifacts"] = artifacts;
    return j;
}

json statusToJson(const core::CoordinatorStatus& s) {
    json j;
    j["guardrails_active"] = s.guardrailsActive;
    j["sandbox_strategy_in_use"] = core::strategyName(s.sandboxStrategyInUse);
    j["policy_version"] = s.policyVersion;
    j["stats"] = {
        {"total_requests", s.stats.totalRequests},
        {"input_blocked", s.stats.inputBlocked},
        {"code_blocked", s.stats.codeBlocked},
        {"code_sanitized", s.stats.codeSanitized},
        {"executions", s.stats.executions},
        {"succeeded", s.stats.succeeded},
        {"timeouts", s.stats.timeouts},
        {"resource_exceeded", s.stats.resourceExceeded},
        {"runtime_errors", s.stats.runtimeErrors},
        {"sandbox_unavailable", s.stats.sandboxUnavailable},
        {"session_busy", s.stats.sessionBusy},
        {"cancelled", s.stats.cancelled},
        {"redactions", s.stats.redactions}
    };
    return j;
}

bool applyOverrides(utils::Config& config, const std::vector<std::string>& overrides) {
    for (const auto& kv : overrides) {
        size_t eq = kv.find('=');
        if (eq == std::string::npos || eq == 0) {
            std::cerr << "warden: invalid --set value '" << kv << "' (expected KEY=VALUE)\n";
            return false;
        }
        config.set(kv.substr(0, eq), kv.substr(eq + 1));
    }
    return true;
}

policy::PolicyStorePtr loadPolicy(const std::string& path, utils::Logger& logger) {
    if (path.empty()) {
        return std::make_shared<const policy::PolicyStore>(policy::PolicyStore::defaults());
    }
    auto loaded = policy::PolicyStore::loadFromJson(path);
    if (loaded.failed()) {
        logger.error("main", "policy load failed: " + loaded.error().message);
        std::cerr << "warden: " << loaded.error().message << "\n";
        return nullptr;
    }
    logger.info("main", "loaded policy " + path + " (" + std::to_string(loaded.value().size()) + " rules)");
    return std::make_shared<const policy::PolicyStore>(std::move(loaded.value()));
}

int run(const CliOptions& opts) {
    utils::Config config;
    config.loadDefaults();
    if (!opts.configPath.empty()) {
        auto loaded = config.load(opts.configPath);
        if (loaded.failed()) {
            std::cerr << "warden: " << loaded.error().message << "\n";
            return 1;
        }
    }
    if (!opts.policyFile.empty()) config.set("policy.file", opts.policyFile);
    if (!opts.strategy.empty()) config.set("sandbox.strategy", opts.strategy);
    if (!applyOverrides(config, opts.overrides)) return 1;

    auto problems = config.validate();
    if (!problems.empty()) {
        for (const auto& p : problems) std::cerr << "warden: config: " << p << "\n";
        return 1;
    }

    utils::LoggingConfig logCfg = config.getLoggingConfig();
    utils::Logger logger;
    logger.setLevel(utils::parseLogLevel(logCfg.level));
    logger.enableConsole(opts.verbose || logCfg.console);
    logger.setMaxFileSize(logCfg.maxFileBytes);
    logger.setMaxFiles(logCfg.maxFiles);
    if (!logCfg.file.empty() && !logger.open(logCfg.file)) {
        std::cerr << "warden: cannot open log file " << logCfg.file << "\n";
    }

    guard::AuditLog audit;
    utils::AuditConfig auditCfg = config.getAuditConfig();
    if (!auditCfg.file.empty() && !audit.open(auditCfg.file)) {
        logger.warn("main", "cannot open audit file " + auditCfg.file);
    }

    core::Context ctx(logger, audit);
    policy::PolicyStorePtr policy = loadPolicy(config.getString("policy.file"), logger);
    if (!policy) return 1;

    auto executor = sandbox::SandboxFactory::create(policy, ctx, config.getSandboxConfig());
    auto store = std::make_shared<core::InMemorySessionStore>();
    core::Coordinator coordinator(ctx, policy, std::move(executor), store,
                                  core::CoordinatorOptions::fromConfig(config));

    if (opts.showStatus) {
        std::cout << statusToJson(coordinator.status()).dump(2) << "\n";
        return 0;
    }

    auto code = readInput(opts.codeFile);
    if (code.failed()) {
        std::cerr << "warden: " << code.error().message << "\n";
        return 1;
    }

    core::ExecutionRequest request;
    request.sessionId = opts.sessionId;
    request.userMessage = opts.message;
    request.code = code.value();
    request.limits = config.getResourceLimits();
    if (!opts.dataFile.empty()) {
        auto csv = readInput(opts.dataFile);
        if (csv.failed()) {
            std::cerr << "warden: " << csv.error().message << "\n";
            return 1;
        }
        core::DataContext data;
        data.name = opts.dataName.empty() ? baseName(opts.dataFile) : opts.dataName;
        data.csv = csv.value();
        request.dataContext = data;
    }

    auto cancel = std::make_shared<core::CancellationToken>();
    g_cancel = cancel.get();
    registerSignalHandlers();

    core::ExecutionResult result = coordinator.submit(request, cancel);
    g_cancel = nullptr;
    std::cout << resultToJson(result).dump(2, ' ', false, json::error_handler_t::replace) << "\n";
    logger.flush();
    return result.status == core::ExecutionStatus::OK ? 0 : 2;
}

}

int main(int argc, char* argv[]) {
    warden::CliOptions opts;
    if (!warden::parseArgs(argc, argv, opts)) {
        warden::printHelp(argv[0]);
        return 1;
    }
    if (opts.showHelp) {
        warden::printHelp(argv[0]);
        return 0;
    }
    if (opts.showVersion) {
        warden::printVersion();
        return 0;
    }
    try {
        return warden::run(opts);
    } catch (const std::exception& e) {
        std::cerr << "warden: fatal: " << e.what() << "\n";
        return 1;
    }
}
