#pragma once

#include "utils/logger.h"
#include "guard/audit_log.h"
#include <atomic>
#include <cstdint>

namespace warden {
namespace core {

struct CoreStats {
    uint64_t totalRequests = 0;
    uint64_t inputBlocked = 0;
    uint64_t codeBlocked = 0;
    uint64_t codeSanitized = 0;
    uint64_t executions = 0;
    uint64_t succeeded = 0;
    uint64_t timeouts = 0;
    uint64_t resourceExceeded = 0;
    uint64_t runtimeErrors = 0;
    uint64_t sandboxUnavailable = 0;
    uint64_t sessionBusy = 0;
    uint64_t cancelled = 0;
    uint64_t redactions = 0;
};

struct Counters {
    std::atomic<uint64_t> totalRequests{0};
    std::atomic<uint64_t> inputBlocked{0};
    std::atomic<uint64_t> codeBlocked{0};
    std::atomic<uint64_t> codeSanitized{0};
    std::atomic<uint64_t> executions{0};
    std::atomic<uint64_t> succeeded{0};
    std::atomic<uint64_t> timeouts{0};
    std::atomic<uint64_t> resourceExceeded{0};
    std::atomic<uint64_t> runtimeErrors{0};
    std::atomic<uint64_t> sandboxUnavailable{0};
    std::atomic<uint64_t> sessionBusy{0};
    std::atomic<uint64_t> cancelled{0};
    std::atomic<uint64_t> redactions{0};

    CoreStats snapshot() const {
        CoreStats s;
        s.totalRequests = totalRequests;
        s.inputBlocked = inputBlocked;
        s.codeBlocked = codeBlocked;
        s.codeSanitized = codeSanitized;
        s.executions = executions;
        s.succeeded = succeeded;
        s.timeouts = timeouts;
        s.resourceExceeded = resourceExceeded;
        s.runtimeErrors = runtimeErrors;
        s.sandboxUnavailable = sandboxUnavailable;
        s.sessionBusy = sessionBusy;
        s.cancelled = cancelled;
        s.redactions = redactions;
        return s;
    }
};

// Logging, audit and counters for one embedding of the core. Components
// keep a reference; the owner must outlive them.
struct Context {
    utils::Logger& logger;
    guard::AuditLog& audit;
    Counters counters;

    Context(utils::Logger& l, guard::AuditLog& a) : logger(l), audit(a) {}
};

}
}
