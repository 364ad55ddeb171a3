#pragma once

#include "core/error.h"
#include "core/types.h"
#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <cstdint>

namespace warden {
namespace utils {

struct SandboxConfig {
    std::string strategy = "auto";
    std::string containerRuntime = "docker";
    std::string containerImage = "python:3.12-slim";
    std::string pythonPath;
    uint32_t pidsLimit = 64;
    uint32_t probeTimeoutSeconds = 5;
    uint32_t cleanupTimeoutSeconds = 10;
};

struct SessionConfig {
    std::string lockPolicy = "wait";
    uint32_t lockWaitSeconds = 35;
    uint32_t ttlSeconds = 3600;
};

struct AuditConfig {
    std::string file;
    bool logRejectedMessage = false;
};

struct LoggingConfig {
    std::string level = "info";
    std::string file;
    bool console = false;
    uint64_t maxFileBytes = 10 * 1024 * 1024;
    uint32_t maxFiles = 5;
};

class Config {
public:
    Config();
    ~Config();

    Config(const Config& other);
    Config& operator=(const Config& other);

    Result<void> load(const std::string& path);
    bool save(const std::string& path) const;
    void loadDefaults();

    std::string getString(const std::string& key, const std::string& def = "") const;
    int getInt(const std::string& key, int def = 0) const;
    int64_t getInt64(const std::string& key, int64_t def = 0) const;
    double getDouble(const std::string& key, double def = 0.0) const;
    bool getBool(const std::string& key, bool def = false) const;
    std::vector<std::string> getList(const std::string& key) const;

    void set(const std::string& key, const std::string& value);
    void set(const std::string& key, const char* value);
    void set(const std::string& key, int value);
    void set(const std::string& key, int64_t value);
    void set(const std::string& key, double value);
    void set(const std::string& key, bool value);

    bool has(const std::string& key) const;
    void remove(const std::string& key);
    std::vector<std::string> keys(const std::string& prefix = "") const;

    // Typed views. Out-of-range numbers fall back to defaults and are
    // reported by validate().
    core::ResourceLimits getResourceLimits() const;
    SandboxConfig getSandboxConfig() const;
    SessionConfig getSessionConfig() const;
    AuditConfig getAuditConfig() const;
    LoggingConfig getLoggingConfig() const;

    std::vector<std::string> validate() const;

    size_t size() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
}
