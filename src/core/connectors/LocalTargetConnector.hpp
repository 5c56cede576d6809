#pragma once
#include <string>
#include <memory>
#include <filesystem>
#include <chrono>
#include "ITargetConnector.hpp"

namespace fs = std::filesystem;

class ILogger;

// 本地文件系统上的暂存文件，持有写入用的文件描述符
class LocalStagingHandle : public IStagingHandle {
private:
    friend class LocalTargetConnector;

    fs::path stagingPath;
    int fd;
    uint64_t written;
    bool active;

    void closeQuietly() noexcept;
    void removeQuietly() noexcept;

public:
    LocalStagingHandle(const fs::path& path, int fileDescriptor);
    ~LocalStagingHandle() override;

    LocalStagingHandle(const LocalStagingHandle&) = delete;
    LocalStagingHandle& operator=(const LocalStagingHandle&) = delete;

    void write(const char* data, size_t length) override;
    void close() override;
    void setModificationTime(fs::file_time_type time) override;
    uint64_t bytesWritten() const override;
    std::string location() const override;
    bool isActive() const override;

    const fs::path& getStagingPath() const {
        return this->stagingPath;
    }
};

// 本地目录作为备份目标。暂存文件默认与目标文件位于同一目录，
// 这样提升只需一次 rename。
class LocalTargetConnector : public ITargetConnector {
private:
    fs::path root;
    // 可选的暂存目录；与目标不在同一设备时提升改为复制 + fsync + rename
    fs::path scratchDirectory;
    bool cleanupStaleStaging;
    ILogger* logger;

    fs::path resolve(const std::string& relativePath) const;
    fs::path makeStagingPath(const fs::path& directory, const fs::path& finalPath) const;
    std::unique_ptr<LocalStagingHandle> createStagingFile(const fs::path& directory, const fs::path& finalPath) const;
    void promoteAcrossDevices(LocalStagingHandle& handle, const fs::path& destination);
    void ensureRootAccessible() const;

public:
    // 暂存文件名中的标记，用于识别上次中断遗留的暂存文件
    static const char* const STAGING_MARKER;
    // 修改时间早于此值的暂存文件才视为遗留
    static const std::chrono::minutes STALE_STAGING_AGE;

    LocalTargetConnector(const std::string& rootPath, ILogger* log,
                         const std::string& scratchDir = "", bool cleanupStale = true);

    void prepare() override;
    bool exists(const std::string& path) override;
    std::unique_ptr<IStagingHandle> openStagingWrite(const std::string& finalPath) override;
    std::unique_ptr<std::istream> readStaged(IStagingHandle& handle) override;
    void promote(IStagingHandle& handle, const std::string& finalPath) override;
    void discard(IStagingHandle& handle) noexcept override;
    std::unique_ptr<std::istream> readBack(const std::string& finalPath) override;
    uint64_t availableSpace() override;
    std::string describe() const override;
    std::string localRoot() const override;

    // 删除目标根目录与暂存目录下遗留的暂存文件，返回删除数量。
    // 未超过 STALE_STAGING_AGE 的暂存文件保留
    size_t removeStaleStaging();

    static bool isStagingFileName(const std::string& fileName);
};
