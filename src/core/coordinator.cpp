#include "core/coordinator.h"
#include "guard/input_guardrail.h"
#include "guard/code_validator.h"
#include "guard/output_guardrail.h"
#include "utils/threading.h"
#include <algorithm>
#include <stdexcept>

namespace warden {
namespace core {

namespace {

constexpr std::chrono::seconds kLockWaitSlack(5);

void appendUnique(std::vector<std::string>& list, const std::vector<std::string>& values) {
    for (const auto& v : values) {
        if (std::find(list.begin(), list.end(), v) == list.end()) {
            list.push_back(v);
        }
    }
}

}

CoordinatorOptions CoordinatorOptions::fromConfig(const utils::Config& config) {
    CoordinatorOptions opts;
    opts.guardrailsEnabled = config.getBool("guardrails.enabled", true);

    utils::SessionConfig session = config.getSessionConfig();
    if (!parseLockPolicy(session.lockPolicy, opts.lockPolicy)) {
        opts.lockPolicy = LockPolicy::WAIT;
    }
    if (config.has("session.lock_wait_seconds")) {
        opts.lockWait = std::chrono::seconds(session.lockWaitSeconds);
    }
    opts.sessionTtlSeconds = session.ttlSeconds;
    opts.workers = static_cast<size_t>(std::max(1, config.getInt("coordinator.workers", 4)));
    opts.logRejectedMessage = config.getAuditConfig().logRejectedMessage;
    return opts;
}

struct Coordinator::Impl {
    Context& ctx;
    policy::PolicyStorePtr policy;
    std::unique_ptr<sandbox::Sandbox> sandbox;
    std::shared_ptr<SessionStore> store;
    CoordinatorOptions options;

    guard::InputGuardrail input;
    guard::CodeValidator validator;
    guard::OutputGuardrail output;
    SessionLockTable locks;
    std::unique_ptr<utils::ThreadPool> pool;
    std::mutex poolMtx;

    Impl(Context& c, policy::PolicyStorePtr p, std::unique_ptr<sandbox::Sandbox> s,
         std::shared_ptr<SessionStore> st, const CoordinatorOptions& o)
        : ctx(c), policy(std::move(p)), sandbox(std::move(s)), store(std::move(st)), options(o),
          input(policy, ctx), validator(policy), output(policy, ctx) {
        input.setLogRejectedMessage(options.logRejectedMessage);
    }

    ExecutionResult run(const ExecutionRequest& request, const CancellationToken* cancel);
    ExecutionResult process(const ExecutionRequest& request, const CancellationToken* cancel);
    ExecutionResult finish(ExecutionResult result, RequestState state, const ExecutionRequest& request);
    DataContext resolveData(const ExecutionRequest& request);
    void countFailure(ExecutionStatus status);
    utils::ThreadPool& workers();
};

ExecutionResult Coordinator::Impl::finish(ExecutionResult result, RequestState state,
                                          const ExecutionRequest& request) {
    result.finalState = state;
    if (result.status != ExecutionStatus::OK && result.errorMessage.empty()) {
        result.errorMessage = describeStatus(result.status);
    }
    ctx.logger.info("coordinator", "session " + request.sessionId + " -> " + statusName(result.status) +
                    " [" + requestStateName(state) + "] via " + strategyName(result.strategy));
    return result;
}

DataContext Coordinator::Impl::resolveData(const ExecutionRequest& request) {
    if (request.dataContext) {
        if (store) {
            auto saved = store->put(request.sessionId, *request.dataContext, options.sessionTtlSeconds);
            if (saved.failed()) {
                ctx.logger.warn("coordinator", "session " + request.sessionId + ": data context not stored (" +
                                saved.error().message + ")");
            }
        }
        return *request.dataContext;
    }
    if (!store) return DataContext();

    auto stored = store->get(request.sessionId);
    if (stored.ok()) return stored.value();
    ctx.logger.debug("coordinator", "session " + request.sessionId + ": no stored data context (" +
                     stored.error().message + ")");
    return DataContext();
}

void Coordinator::Impl::countFailure(ExecutionStatus status) {
    switch (status) {
        case ExecutionStatus::TIMEOUT: ctx.counters.timeouts++; break;
        case ExecutionStatus::RESOURCE_EXCEEDED: ctx.counters.resourceExceeded++; break;
        case ExecutionStatus::RUNTIME_ERROR: ctx.counters.runtimeErrors++; break;
        case ExecutionStatus::SANDBOX_UNAVAILABLE: ctx.counters.sandboxUnavailable++; break;
        case ExecutionStatus::SESSION_BUSY: ctx.counters.sessionBusy++; break;
        case ExecutionStatus::CANCELLED: ctx.counters.cancelled++; break;
        default: break;
    }
}

ExecutionResult Coordinator::Impl::process(const ExecutionRequest& request, const CancellationToken* cancel) {
    ExecutionResult result;
    result.strategy = sandbox->strategy();

    // Received -> InputChecked
    if (options.guardrailsEnabled && !request.userMessage.empty()) {
        guard::InputVerdict verdict = input.screen(request.sessionId, request.userMessage);
        appendUnique(result.warnings, verdict.warnings);
        if (!verdict.allowed()) {
            ctx.counters.inputBlocked++;
            result.status = ExecutionStatus::POLICY_BLOCKED;
            result.violations.push_back(verdict.ruleId);
            result.blockedCategory = policy::categoryName(policy::RuleCategory::INTENT);
            return finish(result, RequestState::BLOCKED, request);
        }
    }

    // InputChecked -> CodeChecked
    guard::CodeVerdict verdict = validator.validate(request.code);
    {
        guard::AuditRecord rec;
        rec.sessionId = request.sessionId;
        rec.stage = "code";
        if (!verdict.clear()) {
            rec.decision = "block";
            rec.ruleId = verdict.violations.empty() ? "" : verdict.violations.front();
        } else if (verdict.sanitized()) {
            rec.decision = "sanitize";
            rec.ruleId = verdict.stripped.front();
        } else {
            rec.decision = "clear";
        }
        ctx.audit.record(std::move(rec));
    }
    appendUnique(result.warnings, verdict.warnings);
    if (!verdict.clear()) {
        ctx.counters.codeBlocked++;
        result.status = ExecutionStatus::POLICY_BLOCKED;
        result.violations = verdict.violations;
        result.blockedCategory = policy::categoryName(policy::RuleCategory::CODE);
        ctx.logger.warn("coordinator", "session " + request.sessionId + ": code blocked by " +
                        (verdict.violations.empty() ? std::string("validator") : verdict.violations.front()));
        return finish(result, RequestState::BLOCKED, request);
    }

    std::string code = request.code;
    if (verdict.sanitized()) {
        ctx.counters.codeSanitized++;
        code = verdict.sanitizedCode;
        appendUnique(result.warnings, verdict.stripped);
        ctx.logger.info("coordinator", "session " + request.sessionId + ": " +
                        std::to_string(verdict.stripped.size()) + " statement(s) stripped");
    }

    // CodeChecked -> Executing
    SessionLockTable::Guard lock;
    if (options.lockPolicy == LockPolicy::REJECT) {
        lock = locks.tryAcquire(request.sessionId);
    } else {
        auto wait = options.lockWait.count() > 0
            ? options.lockWait
            : std::chrono::duration_cast<std::chrono::milliseconds>(
                  std::chrono::seconds(request.limits.maxWallSeconds) + kLockWaitSlack);
        lock = locks.acquire(request.sessionId, wait, cancel);
    }
    if (!lock) {
        result.status = (cancel && cancel->isCancelled()) ? ExecutionStatus::CANCELLED : ExecutionStatus::SESSION_BUSY;
        countFailure(result.status);
        ctx.logger.warn("coordinator", "session " + request.sessionId + " busy (" +
                        lockPolicyName(options.lockPolicy) + ")");
        return finish(output.filter(result, request.sessionId), RequestState::FAILED, request);
    }

    DataContext data = resolveData(request);
    ctx.counters.executions++;
    ExecutionResult executed = sandbox->execute(code, data, request.limits, cancel);
    executed.strategy = sandbox->strategy();
    appendUnique(executed.warnings, result.warnings);

    if (executed.status == ExecutionStatus::CANCELLED || (cancel && cancel->isCancelled())) {
        executed.status = ExecutionStatus::CANCELLED;
        executed.stdoutText.clear();
        executed.artifacts.clear();
        executed.errorMessage.clear();
    }

    // Executing -> OutputFiltered
    ExecutionResult filtered = output.filter(std::move(executed), request.sessionId);

    if (filtered.status == ExecutionStatus::OK) {
        ctx.counters.succeeded++;
        return finish(filtered, RequestState::DONE, request);
    }
    countFailure(filtered.status);
    return finish(filtered, RequestState::FAILED, request);
}

ExecutionResult Coordinator::Impl::run(const ExecutionRequest& request, const CancellationToken* cancel) {
    ctx.counters.totalRequests++;
    try {
        return process(request, cancel);
    } catch (const std::exception& e) {
        ctx.logger.error("coordinator", "session " + request.sessionId + ": internal failure: " + e.what());
        ExecutionResult result;
        result.status = ExecutionStatus::RUNTIME_ERROR;
        result.strategy = sandbox->strategy();
        result.errorMessage = describeStatus(ExecutionStatus::RUNTIME_ERROR);
        ctx.counters.runtimeErrors++;
        return finish(result, RequestState::FAILED, request);
    }
}

utils::ThreadPool& Coordinator::Impl::workers() {
    std::lock_guard<std::mutex> lock(poolMtx);
    if (!pool) {
        pool = std::make_unique<utils::ThreadPool>(options.workers);
    }
    return *pool;
}

Coordinator::Coordinator(Context& ctx, policy::PolicyStorePtr policy,
                         std::unique_ptr<sandbox::Sandbox> executor,
                         std::shared_ptr<SessionStore> store,
                         const CoordinatorOptions& options) {
    if (!policy) throw std::invalid_argument("coordinator requires a policy store");
    if (!executor) executor = std::make_unique<sandbox::UnavailableSandbox>();
    impl_ = std::make_unique<Impl>(ctx, std::move(policy), std::move(executor), std::move(store), options);
    ctx.logger.info("coordinator", std::string("ready: strategy ") + impl_->sandbox->name() +
                    ", guardrails " + (options.guardrailsEnabled ? "on" : "off") +
                    ", lock policy " + lockPolicyName(options.lockPolicy));
}

Coordinator::~Coordinator() {
    shutdown();
}

ExecutionResult Coordinator::submit(const ExecutionRequest& request, CancellationTokenPtr cancel) {
    return impl_->run(request, cancel.get());
}

std::future<ExecutionResult> Coordinator::submitAsync(ExecutionRequest request, CancellationTokenPtr cancel) {
    Impl* impl = impl_.get();
    return impl->workers().enqueue([impl, request, cancel]() {
        return impl->run(request, cancel.get());
    });
}

CoordinatorStatus Coordinator::status() const {
    CoordinatorStatus s;
    s.guardrailsActive = impl_->options.guardrailsEnabled && !impl_->policy->empty();
    s.sandboxStrategyInUse = impl_->sandbox->isAvailable() ? impl_->sandbox->strategy()
                                                           : SandboxStrategy::UNAVAILABLE;
    s.policyVersion = impl_->policy->version();
    s.stats = impl_->ctx.counters.snapshot();
    return s;
}

SessionStore* Coordinator::sessionStore() const {
    return impl_->store.get();
}

const CoordinatorOptions& Coordinator::options() const {
    return impl_->options;
}

void Coordinator::shutdown() {
    std::unique_ptr<utils::ThreadPool> pool;
    {
        std::lock_guard<std::mutex> lock(impl_->poolMtx);
        pool = std::move(impl_->pool);
    }
    if (pool) pool->shutdown();
}

}
}
