#pragma once

#include <string>
#include <vector>
#include <memory>
#include <cstdint>

namespace warden {
namespace guard {

struct AuditRecord {
    uint64_t timestampMs = 0;
    std::string sessionId;
    std::string stage;
    std::string ruleId;
    std::string decision;
    std::string message;
};

// Append-only trail of guardrail decisions. Each record is also written as
// one JSON line when a file is attached.
class AuditLog {
public:
    AuditLog();
    ~AuditLog();

    bool open(const std::string& path);
    void close();

    void record(AuditRecord rec);
    std::vector<AuditRecord> recent(size_t count = 100) const;
    uint64_t count() const;
    void clear();

    static std::string toJsonLine(const AuditRecord& rec);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
}
