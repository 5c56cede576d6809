#pragma once
#include <string>
#include <memory>
#include <istream>
#include <filesystem>
#include <cstdint>

// 一次暂存写入。析构时若既未提升也未丢弃，则自动丢弃暂存内容。
class IStagingHandle {
public:
    virtual ~IStagingHandle() = default;

    // 追加写入，失败抛出 std::runtime_error（携带系统错误信息）
    virtual void write(const char* data, size_t length) = 0;

    // 刷盘并关闭写入端，之后只能读回、提升或丢弃
    virtual void close() = 0;

    // 设置暂存内容的修改时间（关闭后调用）
    virtual void setModificationTime(std::filesystem::file_time_type time) = 0;

    virtual uint64_t bytesWritten() const = 0;

    // 暂存位置的描述（日志用）
    virtual std::string location() const = 0;

    // 是否仍持有暂存资源（未提升、未丢弃）
    virtual bool isActive() const = 0;
};

// 备份目标的存储能力接口。路径均为相对目标根的 '/' 分隔路径。
class ITargetConnector {
public:
    virtual ~ITargetConnector() = default;

    // 作业开始前检查目标可达且可写，失败抛出 ConnectorError
    virtual void prepare() = 0;

    virtual bool exists(const std::string& path) = 0;

    // 打开一个暂存写入，提升之前 finalPath 上看不到新内容
    virtual std::unique_ptr<IStagingHandle> openStagingWrite(const std::string& finalPath) = 0;

    // 读回已关闭的暂存内容（用于校验）
    virtual std::unique_ptr<std::istream> readStaged(IStagingHandle& handle) = 0;

    // 原子地让暂存内容成为 finalPath 的内容，失败抛出 std::runtime_error 且 finalPath 不变
    virtual void promote(IStagingHandle& handle, const std::string& finalPath) = 0;

    // 清理暂存内容，不抛异常
    virtual void discard(IStagingHandle& handle) noexcept = 0;

    // 读回已提升的最终文件
    virtual std::unique_ptr<std::istream> readBack(const std::string& finalPath) = 0;

    // 目标端剩余空间（字节），未知时返回 UINT64_MAX
    virtual uint64_t availableSpace() = 0;

    virtual std::string describe() const = 0;

    // 目标位于本地文件系统时返回其根目录，枚举时跳过；其他目标返回空
    virtual std::string localRoot() const {
        return std::string();
    }
};
