#include "guard/audit_log.h"
#include <nlohmann/json.hpp>
#include <fstream>
#include <mutex>
#include <deque>
#include <chrono>

namespace warden {
namespace guard {

struct AuditLog::Impl {
    mutable std::mutex mtx;
    std::ofstream file;
    std::deque<AuditRecord> records;
    size_t maxRecords = 1000;
    uint64_t total = 0;
};

AuditLog::AuditLog() : impl_(std::make_unique<Impl>()) {}
AuditLog::~AuditLog() { close(); }

bool AuditLog::open(const std::string& path) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (impl_->file.is_open()) impl_->file.close();
    impl_->file.open(path, std::ios::app);
    return impl_->file.is_open();
}

void AuditLog::close() {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (impl_->file.is_open()) {
        impl_->file.flush();
        impl_->file.close();
    }
}

void AuditLog::record(AuditRecord rec) {
    if (rec.timestampMs == 0) {
        rec.timestampMs = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count());
    }
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (impl_->file.is_open()) {
        impl_->file << toJsonLine(rec) << "\n";
        impl_->file.flush();
    }
    impl_->records.push_back(std::move(rec));
    while (impl_->records.size() > impl_->maxRecords) {
        impl_->records.pop_front();
    }
    impl_->total++;
}

std::vector<AuditRecord> AuditLog::recent(size_t count) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    size_t start = impl_->records.size() > count ? impl_->records.size() - count : 0;
    return std::vector<AuditRecord>(impl_->records.begin() + static_cast<std::ptrdiff_t>(start), impl_->records.end());
}

uint64_t AuditLog::count() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->total;
}

void AuditLog::clear() {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->records.clear();
    impl_->total = 0;
}

std::string AuditLog::toJsonLine(const AuditRecord& rec) {
    nlohmann::json j;
    j["timestamp"] = rec.timestampMs;
    j["session_id"] = rec.sessionId;
    j["stage"] = rec.stage;
    j["rule_id"] = rec.ruleId.empty() ? nlohmann::json(nullptr) : nlohmann::json(rec.ruleId);
    j["decision"] = rec.decision;
    if (!rec.message.empty()) j["message"] = rec.message;
    // Invalid UTF-8 in a rejected message must not throw.
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}
}
