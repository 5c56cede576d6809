#pragma once
#include "ILogger.hpp"
#include <fstream>
#include <mutex>
#include <string>

class ConsoleLogger : public ILogger {
private:
    LogLevel level;
    // 可选的日志文件，与控制台输出同步写入
    std::ofstream logFile;
    mutable std::mutex mutex;

public:
    explicit ConsoleLogger(LogLevel minLevel = LogLevel::INFO);

    // 打开日志文件（追加模式），失败返回 false
    bool openLogFile(const std::string& path);

    void info(const std::string& message) override;

    void error(const std::string& message) override;

    void warn(const std::string& message) override;

    void debug(const std::string& message) override;

    void setLogLevel(LogLevel level) override;

    LogLevel getLogLevel() const override;

    void log(LogLevel level, const std::string& message) override;
};
