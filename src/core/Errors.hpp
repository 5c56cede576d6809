#pragma once
#include <stdexcept>
#include <string>

// 作业定义不合法：在任何 I/O 之前抛出
class ValidationError : public std::runtime_error {
public:
    explicit ValidationError(const std::string& message)
        : std::runtime_error(message) {}
};

// 目标端不可达或不可写：作业级致命错误
class ConnectorError : public std::runtime_error {
public:
    explicit ConnectorError(const std::string& message)
        : std::runtime_error(message) {}
};

// 枚举过程中的单路径警告，不中断遍历
struct EnumerationWarning {
    std::string path;
    std::string message;
};
