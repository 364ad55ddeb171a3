#include "utils/logger.h"
#include <fstream>
#include <ctime>
#include <iostream>
#include <mutex>
#include <atomic>
#include <thread>
#include <sstream>
#include <filesystem>
#include <algorithm>
#include <cctype>
#include <deque>
#include <cstdlib>

namespace warden {
namespace utils {

static uint64_t getThreadId() {
    std::hash<std::thread::id> hasher;
    return hasher(std::this_thread::get_id());
}

static std::string sanitizeSecrets(const std::string& in) {
    std::string s = in;
    const std::vector<std::string> keys = {"password", "passwd", "secret", "api_key", "apikey", "token", "private_key"};
    for (const auto& k : keys) {
        size_t pos = 0;
        while ((pos = s.find(k, pos)) != std::string::npos) {
            size_t i = pos + k.size();
            while (i < s.size() && (s[i] == ' ' || s[i] == '"' || s[i] == '\'' || s[i] == ':' || s[i] == '=')) i++;
            size_t sep = i;
            size_t end = sep;
            while (end < s.size() && s[end] != '"' && s[end] != '\'' && s[end] != ' ' && s[end] != ',' && s[end] != ')' && s[end] != ';' && s[end] != '\n') end++;
            if (sep < end && sep > pos + k.size()) {
                s.replace(sep, end - sep, "[REDACTED]");
                pos = sep + 10;
            } else {
                pos += k.size();
            }
        }
    }
    return s;
}

LogLevel parseLogLevel(const std::string& name, LogLevel def) {
    std::string n = name;
    std::transform(n.begin(), n.end(), n.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (n == "trace") return LogLevel::TRACE;
    if (n == "debug") return LogLevel::DEBUG;
    if (n == "info") return LogLevel::INFO;
    if (n == "warn" || n == "warning") return LogLevel::WARN;
    if (n == "error") return LogLevel::ERROR;
    if (n == "fatal") return LogLevel::FATAL;
    if (n == "off") return LogLevel::OFF;
    return def;
}

const char* logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
        default: return "?????";
    }
}

struct Logger::Impl {
    std::atomic<LogLevel> currentLevel{LogLevel::INFO};
    std::ofstream logFile;
    std::string logPath;
    mutable std::mutex mtx;
    std::atomic<bool> consoleEnabled{true};
    uint64_t maxFileSize = 10 * 1024 * 1024;
    uint32_t maxFiles = 5;
    std::atomic<uint64_t> logCount{0};
    std::atomic<uint64_t> errorCount{0};
    std::function<void(const LogEntry&)> logCallback;
    std::deque<LogEntry> recentLogs;
    size_t maxRecentLogs = 1000;
    std::atomic<bool> allowSensitive{false};

    void rotateLocked();
    void write(LogLevel level, const std::string& category, const std::string& msg);
};

void Logger::Impl::rotateLocked() {
    if (logPath.empty()) return;
    if (logFile.is_open()) logFile.close();

    std::error_code ec;
    for (int i = static_cast<int>(maxFiles) - 1; i >= 1; i--) {
        std::string oldPath = logPath + "." + std::to_string(i);
        std::string newPath = logPath + "." + std::to_string(i + 1);
        if (std::filesystem::exists(oldPath, ec)) {
            if (i == static_cast<int>(maxFiles) - 1) {
                std::filesystem::remove(oldPath, ec);
            } else {
                std::filesystem::rename(oldPath, newPath, ec);
            }
        }
    }
    if (std::filesystem::exists(logPath, ec)) {
        std::filesystem::rename(logPath, logPath + ".1", ec);
    }
    logFile.open(logPath, std::ios::app);
}

void Logger::Impl::write(LogLevel level, const std::string& category, const std::string& msg) {
    if (level < currentLevel.load()) return;

    std::string outMsg = allowSensitive ? msg : sanitizeSecrets(msg);

    std::lock_guard<std::mutex> lock(mtx);

    time_t now = std::time(nullptr);
    struct tm tmBuf;
    localtime_r(&now, &tmBuf);
    char timeBuf[64];
    std::strftime(timeBuf, sizeof(timeBuf), "%Y-%m-%d %H:%M:%S", &tmBuf);

    std::ostringstream oss;
    oss << timeBuf << " [" << logLevelName(level) << "]";
    if (!category.empty()) {
        oss << " [" << category << "]";
    }
    oss << " " << outMsg << "\n";
    std::string line = oss.str();

    if (consoleEnabled) {
        if (level >= LogLevel::ERROR) {
            std::cerr << line;
        } else {
            std::cout << line;
        }
    }

    if (logFile.is_open()) {
        logFile << line;
        logFile.flush();
        if (logFile.tellp() > static_cast<std::streampos>(maxFileSize)) {
            rotateLocked();
        }
    }

    logCount++;
    if (level >= LogLevel::ERROR) errorCount++;

    LogEntry entry;
    entry.level = level;
    entry.message = outMsg;
    entry.category = category;
    entry.timestamp = static_cast<uint64_t>(now);
    entry.threadId = getThreadId();

    recentLogs.push_back(entry);
    while (recentLogs.size() > maxRecentLogs) {
        recentLogs.pop_front();
    }

    if (logCallback) {
        logCallback(entry);
    }
}

Logger::Logger() : impl_(std::make_unique<Impl>()) {
    const char* env = std::getenv("WARDEN_ALLOW_SENSITIVE_LOGS");
    if (env && *env) {
        std::string v(env);
        if (v == "1" || v == "true" || v == "TRUE") impl_->allowSensitive = true;
    }
}

Logger::~Logger() { close(); }

bool Logger::open(const std::string& path) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->logPath = path;

    std::error_code ec;
    std::filesystem::path p(path);
    if (p.has_parent_path()) {
        std::filesystem::create_directories(p.parent_path(), ec);
    }
    impl_->logFile.open(path, std::ios::app);
    return impl_->logFile.is_open();
}

void Logger::close() {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (impl_->logFile.is_open()) {
        impl_->logFile.flush();
        impl_->logFile.close();
    }
}

void Logger::setLevel(LogLevel level) { impl_->currentLevel = level; }
LogLevel Logger::getLevel() const { return impl_->currentLevel; }

void Logger::enableConsole(bool enable) { impl_->consoleEnabled = enable; }

void Logger::setMaxFileSize(uint64_t bytes) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->maxFileSize = bytes;
}

void Logger::setMaxFiles(uint32_t count) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->maxFiles = count;
}

void Logger::trace(const std::string& category, const std::string& msg) { impl_->write(LogLevel::TRACE, category, msg); }
void Logger::debug(const std::string& category, const std::string& msg) { impl_->write(LogLevel::DEBUG, category, msg); }
void Logger::info(const std::string& category, const std::string& msg) { impl_->write(LogLevel::INFO, category, msg); }
void Logger::warn(const std::string& category, const std::string& msg) { impl_->write(LogLevel::WARN, category, msg); }
void Logger::error(const std::string& category, const std::string& msg) { impl_->write(LogLevel::ERROR, category, msg); }

void Logger::log(LogLevel level, const std::string& category, const std::string& msg) {
    impl_->write(level, category, msg);
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (impl_->logFile.is_open()) {
        impl_->logFile.flush();
    }
}

void Logger::onLog(std::function<void(const LogEntry&)> callback) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->logCallback = std::move(callback);
}

uint64_t Logger::getLogCount() const { return impl_->logCount; }
uint64_t Logger::getErrorCount() const { return impl_->errorCount; }

std::vector<LogEntry> Logger::getRecentLogs(size_t count) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    std::vector<LogEntry> result;
    size_t start = impl_->recentLogs.size() > count ? impl_->recentLogs.size() - count : 0;
    for (size_t i = start; i < impl_->recentLogs.size(); i++) {
        result.push_back(impl_->recentLogs[i]);
    }
    return result;
}

void Logger::clearLogs() {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->recentLogs.clear();
    impl_->logCount = 0;
    impl_->errorCount = 0;
}

void Logger::setAllowSensitiveLogging(bool allow) { impl_->allowSensitive = allow; }
bool Logger::isAllowSensitiveLogging() const { return impl_->allowSensitive; }

std::string Logger::redactSensitive(const std::string& data, const std::string& type) {
    (void)data;
    return "[REDACTED_" + type + "]";
}

}
}
