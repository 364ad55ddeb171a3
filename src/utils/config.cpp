#include "utils/config.h"
#include <unordered_map>
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <mutex>

namespace warden {
namespace utils {

namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r");
    return s.substr(start, end - start + 1);
}

}

struct Config::Impl {
    std::unordered_map<std::string, std::string> data;
    std::string configPath;
    mutable std::mutex mtx;

    bool lookup(const std::string& key, std::string& out) const {
        std::lock_guard<std::mutex> lock(mtx);
        auto it = data.find(key);
        if (it == data.end()) return false;
        out = it->second;
        return true;
    }
};

Config::Config() : impl_(std::make_unique<Impl>()) {
    loadDefaults();
}

Config::~Config() = default;

Config::Config(const Config& other) : impl_(std::make_unique<Impl>()) {
    std::lock_guard<std::mutex> lock(other.impl_->mtx);
    impl_->data = other.impl_->data;
    impl_->configPath = other.impl_->configPath;
}

Config& Config::operator=(const Config& other) {
    if (this == &other) return *this;
    std::unordered_map<std::string, std::string> copy;
    std::string path;
    {
        std::lock_guard<std::mutex> lock(other.impl_->mtx);
        copy = other.impl_->data;
        path = other.impl_->configPath;
    }
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->data = std::move(copy);
    impl_->configPath = std::move(path);
    return *this;
}

void Config::loadDefaults() {
    set("sandbox.max_wall_seconds", 30);
    set("sandbox.max_memory_bytes", static_cast<int64_t>(512LL * 1024 * 1024));
    set("sandbox.max_cpu_fraction", "0.5");
    set("sandbox.network_enabled", false);
    set("sandbox.filesystem_mode", "none");
    set("sandbox.max_output_bytes", 1024 * 1024);
    set("sandbox.strategy", "auto");
    set("sandbox.container_runtime", "docker");
    set("sandbox.container_image", "python:3.12-slim");
    set("sandbox.pids_limit", 64);

    set("session.lock_policy", "wait");
    set("session.ttl_seconds", 3600);

    set("guardrails.enabled", true);
    set("audit.log_rejected_message", false);

    set("log.level", "info");
    set("log.console", false);
    set("log.max_file_bytes", static_cast<int64_t>(10 * 1024 * 1024));
    set("log.max_files", 5);

    set("coordinator.workers", 4);
}

Result<void> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Error(ErrorCode::IO_ERROR, "cannot open config file " + path);
    }

    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->configPath = path;
    std::string line;
    int lineNo = 0;

    while (std::getline(file, line)) {
        lineNo++;
        std::string stripped = trim(line);
        if (stripped.empty() || stripped[0] == '#') continue;

        auto pos = stripped.find('=');
        if (pos == std::string::npos) {
            return Error(ErrorCode::PARSE_ERROR, path + ":" + std::to_string(lineNo) + ": expected key=value");
        }
        std::string key = trim(stripped.substr(0, pos));
        std::string value = trim(stripped.substr(pos + 1));
        if (key.empty()) {
            return Error(ErrorCode::PARSE_ERROR, path + ":" + std::to_string(lineNo) + ": empty key");
        }
        impl_->data[key] = value;
    }
    return {};
}

bool Config::save(const std::string& path) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    std::string savePath = path.empty() ? impl_->configPath : path;
    if (savePath.empty()) return false;

    std::ofstream file(savePath);
    if (!file.is_open()) return false;

    file << "# Warden Configuration\n\n";

    std::vector<std::string> sortedKeys;
    for (const auto& [key, value] : impl_->data) {
        sortedKeys.push_back(key);
    }
    std::sort(sortedKeys.begin(), sortedKeys.end());

    std::string lastPrefix;
    for (const auto& key : sortedKeys) {
        auto pos = key.find('.');
        std::string prefix = pos != std::string::npos ? key.substr(0, pos) : "";
        if (prefix != lastPrefix && !lastPrefix.empty()) {
            file << "\n";
        }
        lastPrefix = prefix;
        file << key << "=" << impl_->data.at(key) << "\n";
    }
    return static_cast<bool>(file);
}

std::string Config::getString(const std::string& key, const std::string& def) const {
    std::string v;
    return impl_->lookup(key, v) ? v : def;
}

int Config::getInt(const std::string& key, int def) const {
    std::string v;
    if (!impl_->lookup(key, v)) return def;
    try { return std::stoi(v); }
    catch (const std::exception&) { return def; }
}

int64_t Config::getInt64(const std::string& key, int64_t def) const {
    std::string v;
    if (!impl_->lookup(key, v)) return def;
    try { return std::stoll(v); }
    catch (const std::exception&) { return def; }
}

double Config::getDouble(const std::string& key, double def) const {
    std::string v;
    if (!impl_->lookup(key, v)) return def;
    try { return std::stod(v); }
    catch (const std::exception&) { return def; }
}

bool Config::getBool(const std::string& key, bool def) const {
    std::string val;
    if (!impl_->lookup(key, val)) return def;
    std::transform(val.begin(), val.end(), val.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (val == "true" || val == "1" || val == "yes" || val == "on") return true;
    if (val == "false" || val == "0" || val == "no" || val == "off") return false;
    return def;
}

std::vector<std::string> Config::getList(const std::string& key) const {
    std::vector<std::string> result;
    std::string v;
    if (!impl_->lookup(key, v)) return result;

    std::istringstream iss(v);
    std::string item;
    while (std::getline(iss, item, ',')) {
        item = trim(item);
        if (!item.empty()) result.push_back(item);
    }
    return result;
}

void Config::set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->data[key] = value;
}

void Config::set(const std::string& key, const char* value) {
    set(key, std::string(value));
}

void Config::set(const std::string& key, int value) {
    set(key, std::to_string(value));
}

void Config::set(const std::string& key, int64_t value) {
    set(key, std::to_string(value));
}

void Config::set(const std::string& key, double value) {
    std::ostringstream oss;
    oss << value;
    set(key, oss.str());
}

void Config::set(const std::string& key, bool value) {
    set(key, std::string(value ? "true" : "false"));
}

bool Config::has(const std::string& key) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->data.find(key) != impl_->data.end();
}

void Config::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->data.erase(key);
}

std::vector<std::string> Config::keys(const std::string& prefix) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    std::vector<std::string> result;
    for (const auto& [key, value] : impl_->data) {
        if (prefix.empty() || key.compare(0, prefix.size(), prefix) == 0) {
            result.push_back(key);
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

core::ResourceLimits Config::getResourceLimits() const {
    core::ResourceLimits limits;
    int wall = getInt("sandbox.max_wall_seconds", 30);
    if (wall > 0) limits.maxWallSeconds = static_cast<uint32_t>(wall);
    int64_t mem = getInt64("sandbox.max_memory_bytes", static_cast<int64_t>(limits.maxMemoryBytes));
    if (mem > 0) limits.maxMemoryBytes = static_cast<uint64_t>(mem);
    double cpu = getDouble("sandbox.max_cpu_fraction", 0.5);
    if (cpu > 0.0) limits.maxCpuFraction = cpu;
    limits.networkEnabled = getBool("sandbox.network_enabled", false);
    core::FilesystemMode mode;
    if (core::parseFilesystemMode(getString("sandbox.filesystem_mode", "none"), mode)) {
        limits.filesystemMode = mode;
    }
    int64_t out = getInt64("sandbox.max_output_bytes", static_cast<int64_t>(limits.maxOutputBytes));
    if (out > 0) limits.maxOutputBytes = static_cast<uint64_t>(out);
    return limits;
}

SandboxConfig Config::getSandboxConfig() const {
    SandboxConfig cfg;
    cfg.strategy = getString("sandbox.strategy", "auto");
    cfg.containerRuntime = getString("sandbox.container_runtime", "docker");
    cfg.containerImage = getString("sandbox.container_image", "python:3.12-slim");
    cfg.pythonPath = getString("sandbox.python_path", "");
    if (cfg.pythonPath == "auto") cfg.pythonPath.clear();
    cfg.pidsLimit = static_cast<uint32_t>(std::max(1, getInt("sandbox.pids_limit", 64)));
    cfg.probeTimeoutSeconds = static_cast<uint32_t>(std::max(1, getInt("sandbox.probe_timeout_seconds", 5)));
    cfg.cleanupTimeoutSeconds = static_cast<uint32_t>(std::max(1, getInt("sandbox.cleanup_timeout_seconds", 10)));
    return cfg;
}

SessionConfig Config::getSessionConfig() const {
    SessionConfig cfg;
    cfg.lockPolicy = getString("session.lock_policy", "wait");
    int defaultWait = static_cast<int>(getResourceLimits().maxWallSeconds) + 5;
    cfg.lockWaitSeconds = static_cast<uint32_t>(std::max(0, getInt("session.lock_wait_seconds", defaultWait)));
    cfg.ttlSeconds = static_cast<uint32_t>(std::max(1, getInt("session.ttl_seconds", 3600)));
    return cfg;
}

AuditConfig Config::getAuditConfig() const {
    AuditConfig cfg;
    cfg.file = getString("audit.file", "");
    cfg.logRejectedMessage = getBool("audit.log_rejected_message", false);
    return cfg;
}

LoggingConfig Config::getLoggingConfig() const {
    LoggingConfig cfg;
    cfg.level = getString("log.level", "info");
    cfg.file = getString("log.file", "");
    cfg.console = getBool("log.console", false);
    cfg.maxFileBytes = static_cast<uint64_t>(std::max<int64_t>(4096, getInt64("log.max_file_bytes", 10 * 1024 * 1024)));
    cfg.maxFiles = static_cast<uint32_t>(std::max(1, getInt("log.max_files", 5)));
    return cfg;
}

std::vector<std::string> Config::validate() const {
    std::vector<std::string> problems;
    if (getInt("sandbox.max_wall_seconds", 30) <= 0) {
        problems.push_back("sandbox.max_wall_seconds must be positive");
    }
    if (getInt64("sandbox.max_memory_bytes", 1) <= 0) {
        problems.push_back("sandbox.max_memory_bytes must be positive");
    }
    double cpu = getDouble("sandbox.max_cpu_fraction", 0.5);
    if (cpu <= 0.0 || cpu > 64.0) {
        problems.push_back("sandbox.max_cpu_fraction must be in (0, 64]");
    }
    core::FilesystemMode mode;
    if (!core::parseFilesystemMode(getString("sandbox.filesystem_mode", "none"), mode)) {
        problems.push_back("sandbox.filesystem_mode must be none or read-only");
    }
    std::string strategy = getString("sandbox.strategy", "auto");
    if (strategy != "auto" && strategy != "container" && strategy != "restricted") {
        problems.push_back("sandbox.strategy must be auto, container or restricted");
    }
    std::string policy = getString("session.lock_policy", "wait");
    if (policy != "wait" && policy != "reject") {
        problems.push_back("session.lock_policy must be wait or reject");
    }
    return problems;
}

size_t Config::size() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->data.size();
}

}
}
