#pragma once
#include <string>

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR_LEVEL
};

class ILogger {
public:
    virtual ~ILogger() = default;
    virtual void info(const std::string& message) = 0;

    virtual void error(const std::string& message) = 0;

    virtual void warn(const std::string& message) = 0;

    virtual void debug(const std::string& message) = 0;

    virtual void setLogLevel(LogLevel level) = 0;

    virtual LogLevel getLogLevel() const = 0;

    virtual void log(LogLevel level, const std::string& message) = 0;
};

inline std::string toString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::ERROR_LEVEL: return "ERROR";
        default: return "UNKNOWN";
    }
}

// 解析日志级别（大小写敏感，与配置文件保持一致），未知值返回 false
inline bool parseLogLevel(const std::string& value, LogLevel& level) {
    if (value == "DEBUG") { level = LogLevel::DEBUG; return true; }
    if (value == "INFO") { level = LogLevel::INFO; return true; }
    if (value == "WARN" || value == "WARNING") { level = LogLevel::WARNING; return true; }
    if (value == "ERROR") { level = LogLevel::ERROR_LEVEL; return true; }
    return false;
}
