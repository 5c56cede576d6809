// src/utils/ConsoleLogger.cpp
#include "ConsoleLogger.hpp"
#include <iostream>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <ctime>

static std::string getCurrentTime() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&time_t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

ConsoleLogger::ConsoleLogger(LogLevel minLevel) : level(minLevel) {}

bool ConsoleLogger::openLogFile(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex);
    logFile.open(path, std::ios::out | std::ios::app);
    return logFile.is_open();
}

void ConsoleLogger::info(const std::string& message) {
    log(LogLevel::INFO, message);
}

void ConsoleLogger::error(const std::string& message) {
    log(LogLevel::ERROR_LEVEL, message);
}

void ConsoleLogger::warn(const std::string& message) {
    log(LogLevel::WARNING, message);
}

void ConsoleLogger::debug(const std::string& message) {
    log(LogLevel::DEBUG, message);
}

void ConsoleLogger::setLogLevel(LogLevel newLevel) {
    std::lock_guard<std::mutex> lock(mutex);
    level = newLevel;
}

LogLevel ConsoleLogger::getLogLevel() const {
    std::lock_guard<std::mutex> lock(mutex);
    return level;
}

void ConsoleLogger::log(LogLevel msgLevel, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex);
    if (msgLevel < level) {
        return;
    }

    std::string line = "[" + getCurrentTime() + "] [" + toString(msgLevel) + "] " + message;
    if (msgLevel == LogLevel::ERROR_LEVEL) {
        std::cerr << line << std::endl;
    } else {
        std::cout << line << std::endl;
    }

    // 文件日志记录所有达到级别的消息
    if (logFile.is_open()) {
        logFile << line << '\n';
        logFile.flush();
    }
}
