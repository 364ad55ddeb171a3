#pragma once

#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <cstdint>

namespace warden {
namespace utils {

enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    FATAL = 5,
    OFF = 6
};

struct LogEntry {
    LogLevel level;
    std::string message;
    std::string category;
    uint64_t timestamp;
    uint64_t threadId;
};

LogLevel parseLogLevel(const std::string& name, LogLevel def = LogLevel::INFO);
const char* logLevelName(LogLevel level);

// Owned by the embedding application and handed to components through
// core::Context. Thread-safe.
class Logger {
public:
    Logger();
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    bool open(const std::string& path);
    void close();
    void setLevel(LogLevel level);
    LogLevel getLevel() const;
    void enableConsole(bool enable);
    void setMaxFileSize(uint64_t bytes);
    void setMaxFiles(uint32_t count);

    void trace(const std::string& category, const std::string& msg);
    void debug(const std::string& category, const std::string& msg);
    void info(const std::string& category, const std::string& msg);
    void warn(const std::string& category, const std::string& msg);
    void error(const std::string& category, const std::string& msg);

    void log(LogLevel level, const std::string& category, const std::string& msg);

    void flush();
    void onLog(std::function<void(const LogEntry&)> callback);

    uint64_t getLogCount() const;
    uint64_t getErrorCount() const;
    std::vector<LogEntry> getRecentLogs(size_t count = 100) const;
    void clearLogs();

    void setAllowSensitiveLogging(bool allow);
    bool isAllowSensitiveLogging() const;
    static std::string redactSensitive(const std::string& data, const std::string& type = "secret");

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};


}
}
