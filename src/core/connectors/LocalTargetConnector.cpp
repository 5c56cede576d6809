#include "LocalTargetConnector.hpp"
#include "../Errors.hpp"
#include "../../utils/FileSystem.hpp"
#include "../../utils/Checksum.hpp"
#include "../../utils/ILogger.hpp"
#include <fstream>
#include <stdexcept>
#include <vector>

#include <sys/stat.h>
#include <sys/types.h>
#include <fcntl.h>
#include <unistd.h>
#include <errno.h>

const char* const LocalTargetConnector::STAGING_MARKER = ".sbstage-";
const std::chrono::minutes LocalTargetConnector::STALE_STAGING_AGE(15);

namespace {
const size_t STAGING_SUFFIX_HEX = 16;
}

// ---------------- LocalStagingHandle ----------------

LocalStagingHandle::LocalStagingHandle(const fs::path& path, int fileDescriptor)
    : stagingPath(path), fd(fileDescriptor), written(0), active(true) {}

LocalStagingHandle::~LocalStagingHandle() {
    closeQuietly();
    // 未提升也未丢弃的暂存文件在任何退出路径上都要清理
    if (active) {
        removeQuietly();
    }
}

void LocalStagingHandle::closeQuietly() noexcept {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

void LocalStagingHandle::removeQuietly() noexcept {
    std::error_code ec;
    fs::remove(stagingPath, ec);
    active = false;
}

void LocalStagingHandle::write(const char* data, size_t length) {
    if (fd < 0) {
        throw std::runtime_error("Staging file is not open for writing: " + stagingPath.string());
    }
    size_t offset = 0;
    while (offset < length) {
        ssize_t n = ::write(fd, data + offset, length - offset);
        if (n < 0) {
            int err = errno;
            if (err == EINTR) {
                continue;
            }
            throw std::runtime_error(FileSystem::errnoMessage("Write to staging file failed: " + stagingPath.string(), err));
        }
        offset += static_cast<size_t>(n);
        written += static_cast<uint64_t>(n);
    }
}

void LocalStagingHandle::close() {
    if (fd < 0) {
        return;
    }
    if (::fsync(fd) != 0) {
        int err = errno;
        closeQuietly();
        throw std::runtime_error(FileSystem::errnoMessage("fsync of staging file failed: " + stagingPath.string(), err));
    }
    int rc = ::close(fd);
    int err = errno;
    fd = -1;
    if (rc != 0) {
        throw std::runtime_error(FileSystem::errnoMessage("Close of staging file failed: " + stagingPath.string(), err));
    }
}

void LocalStagingHandle::setModificationTime(fs::file_time_type time) {
    std::error_code ec;
    fs::last_write_time(stagingPath, time, ec);
    if (ec) {
        throw std::runtime_error("Failed to set modification time on " + stagingPath.string() + " (" + ec.message() + ")");
    }
}

uint64_t LocalStagingHandle::bytesWritten() const {
    return written;
}

std::string LocalStagingHandle::location() const {
    return stagingPath.string();
}

bool LocalStagingHandle::isActive() const {
    return active;
}

// ---------------- LocalTargetConnector ----------------

LocalTargetConnector::LocalTargetConnector(const std::string& rootPath, ILogger* log,
                                           const std::string& scratchDir, bool cleanupStale)
    : root(fs::absolute(fs::path(rootPath)).lexically_normal()),
      scratchDirectory(scratchDir.empty() ? fs::path() : fs::absolute(fs::path(scratchDir)).lexically_normal()),
      cleanupStaleStaging(cleanupStale), logger(log) {}

bool LocalTargetConnector::isStagingFileName(const std::string& fileName) {
    // 只认 .<文件名>.sbstage-<16位小写十六进制>，标记必须位于结尾
    const std::string marker(STAGING_MARKER);
    size_t tail = marker.size() + STAGING_SUFFIX_HEX;
    if (fileName.size() < tail + 2 || fileName[0] != '.') {
        return false;
    }
    size_t markerPos = fileName.size() - tail;
    if (fileName.compare(markerPos, marker.size(), marker) != 0) {
        return false;
    }
    for (size_t i = markerPos + marker.size(); i < fileName.size(); ++i) {
        char c = fileName[i];
        if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) {
            return false;
        }
    }
    return true;
}

fs::path LocalTargetConnector::resolve(const std::string& relativePath) const {
    std::string normalized;
    if (!FileSystem::normalizeRelativePath(relativePath, normalized)) {
        throw std::invalid_argument("Invalid target path: '" + relativePath + "'");
    }
    return root / fs::path(normalized);
}

void LocalTargetConnector::ensureRootAccessible() const {
    if (!FileSystem::isWritableDirectory(root.string())) {
        throw ConnectorError("Target directory is not accessible: " + root.string());
    }
}

void LocalTargetConnector::prepare() {
    if (!FileSystem::createDirectories(root.string())) {
        throw ConnectorError("Failed to create target directory: " + root.string());
    }
    ensureRootAccessible();

    if (!scratchDirectory.empty()) {
        if (!FileSystem::createDirectories(scratchDirectory.string()) ||
            !FileSystem::isWritableDirectory(scratchDirectory.string())) {
            throw ConnectorError("Scratch directory is not writable: " + scratchDirectory.string());
        }
        if (!FileSystem::isSameDevice(scratchDirectory.string(), root.string()) && logger) {
            logger->warn("Scratch directory " + scratchDirectory.string() +
                         " is on a different device; promotion will copy before rename");
        }
    }

    if (cleanupStaleStaging) {
        size_t removed = removeStaleStaging();
        if (removed > 0 && logger) {
            logger->info("Removed " + std::to_string(removed) + " stale staging file(s) from " + root.string());
        }
    }
}

size_t LocalTargetConnector::removeStaleStaging() {
    size_t removed = 0;
    std::vector<fs::path> directories{root};
    if (!scratchDirectory.empty()) {
        directories.push_back(scratchDirectory);
    }

    for (const auto& directory : directories) {
        std::error_code ec;
        std::vector<fs::path> stale;
        fs::recursive_directory_iterator it(directory, fs::directory_options::skip_permission_denied, ec);
        for (fs::recursive_directory_iterator end; !ec && it != end; it.increment(ec)) {
            std::error_code typeEc;
            if (!it->is_regular_file(typeEc) || !isStagingFileName(it->path().filename().string())) {
                continue;
            }
            // 较新的暂存文件可能属于另一个正在写入同一目标的作业
            std::error_code timeEc;
            auto modified = fs::last_write_time(it->path(), timeEc);
            if (timeEc || fs::file_time_type::clock::now() - modified < STALE_STAGING_AGE) {
                continue;
            }
            stale.push_back(it->path());
        }
        if (ec && logger) {
            logger->warn("Stale staging scan stopped in " + directory.string() + " (" + ec.message() + ")");
        }
        for (const auto& path : stale) {
            if (FileSystem::removeFile(path.string())) {
                ++removed;
                if (logger) {
                    logger->debug("Removed stale staging file: " + path.string());
                }
            }
        }
    }
    return removed;
}

bool LocalTargetConnector::exists(const std::string& path) {
    return FileSystem::exists(resolve(path).string());
}

fs::path LocalTargetConnector::makeStagingPath(const fs::path& directory, const fs::path& finalPath) const {
    // .<文件名>.sbstage-<随机串>，隐藏文件且不会与最终文件重名
    std::string name = "." + finalPath.filename().string() + STAGING_MARKER + Checksum::randomHex(8);
    return directory / name;
}

std::unique_ptr<LocalStagingHandle> LocalTargetConnector::createStagingFile(const fs::path& directory,
                                                                             const fs::path& finalPath) const {
    for (int attempt = 0; attempt < 8; ++attempt) {
        fs::path stagingPath = makeStagingPath(directory, finalPath);
        // 0666 经 umask 处理后即目标目录下新文件的默认权限
        int fd = ::open(stagingPath.c_str(), O_CREAT | O_EXCL | O_WRONLY | O_CLOEXEC, 0666);
        if (fd >= 0) {
            return std::make_unique<LocalStagingHandle>(stagingPath, fd);
        }
        int err = errno;
        if (err != EEXIST) {
            throw std::runtime_error(FileSystem::errnoMessage("Failed to create staging file " + stagingPath.string(), err));
        }
    }
    throw std::runtime_error("Failed to allocate a unique staging file in " + directory.string());
}

std::unique_ptr<IStagingHandle> LocalTargetConnector::openStagingWrite(const std::string& finalPath) {
    // 目标根目录消失属于作业级错误
    ensureRootAccessible();

    fs::path destination = resolve(finalPath);
    fs::path parent = destination.parent_path();
    if (!FileSystem::createDirectories(parent.string())) {
        throw std::runtime_error("Failed to create target directory: " + parent.string());
    }

    fs::path stagingDirectory = scratchDirectory.empty() ? parent : scratchDirectory;
    auto handle = createStagingFile(stagingDirectory, destination);
    if (logger) {
        logger->debug("Staging " + finalPath + " at " + handle->location());
    }
    return handle;
}

std::unique_ptr<std::istream> LocalTargetConnector::readStaged(IStagingHandle& handle) {
    auto* local = dynamic_cast<LocalStagingHandle*>(&handle);
    if (!local || !local->isActive()) {
        throw std::invalid_argument("Staging handle does not belong to this connector or is no longer active");
    }
    auto in = std::make_unique<std::ifstream>(local->getStagingPath(), std::ios::binary);
    if (!*in) {
        throw std::runtime_error("Failed to open staging file for read-back: " + local->location());
    }
    return in;
}

void LocalTargetConnector::promoteAcrossDevices(LocalStagingHandle& handle, const fs::path& destination) {
    // 先复制到目标目录中的第二个暂存文件并刷盘，再在同一设备内 rename
    auto sibling = createStagingFile(destination.parent_path(), destination);
    std::ifstream in(handle.getStagingPath(), std::ios::binary);
    if (!in) {
        throw std::runtime_error("Failed to reopen staging file: " + handle.location());
    }
    std::vector<char> buffer(64 * 1024);
    while (in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize got = in.gcount();
        if (got > 0) {
            sibling->write(buffer.data(), static_cast<size_t>(got));
        }
    }
    if (in.bad()) {
        throw std::runtime_error("Read error while copying staging file: " + handle.location());
    }
    sibling->close();

    std::error_code timeEc;
    auto mtime = fs::last_write_time(handle.getStagingPath(), timeEc);
    if (!timeEc) {
        sibling->setModificationTime(mtime);
    }

    if (::rename(sibling->getStagingPath().c_str(), destination.c_str()) != 0) {
        int err = errno;
        throw std::runtime_error(FileSystem::errnoMessage("Failed to promote " + sibling->location() +
                                                          " to " + destination.string(), err));
    }
    sibling->active = false;
    handle.removeQuietly();
}

void LocalTargetConnector::promote(IStagingHandle& handle, const std::string& finalPath) {
    auto* local = dynamic_cast<LocalStagingHandle*>(&handle);
    if (!local || !local->isActive()) {
        throw std::invalid_argument("Staging handle does not belong to this connector or is no longer active");
    }
    local->close();

    fs::path destination = resolve(finalPath);
    fs::path parent = destination.parent_path();

    if (!FileSystem::isSameDevice(local->getStagingPath().parent_path().string(), parent.string())) {
        promoteAcrossDevices(*local, destination);
    } else {
        if (::rename(local->getStagingPath().c_str(), destination.c_str()) != 0) {
            int err = errno;
            throw std::runtime_error(FileSystem::errnoMessage("Failed to promote " + local->location() +
                                                              " to " + destination.string(), err));
        }
        local->active = false;
    }

    if (!FileSystem::syncDirectory(parent.string()) && logger) {
        logger->warn("Failed to sync directory after promotion: " + parent.string());
    }
}

void LocalTargetConnector::discard(IStagingHandle& handle) noexcept {
    auto* local = dynamic_cast<LocalStagingHandle*>(&handle);
    if (!local) {
        return;
    }
    local->closeQuietly();
    if (local->isActive()) {
        local->removeQuietly();
    }
}

std::unique_ptr<std::istream> LocalTargetConnector::readBack(const std::string& finalPath) {
    fs::path destination = resolve(finalPath);
    auto in = std::make_unique<std::ifstream>(destination, std::ios::binary);
    if (!*in) {
        throw std::runtime_error("Failed to open target file for read-back: " + destination.string());
    }
    return in;
}

uint64_t LocalTargetConnector::availableSpace() {
    const fs::path& spaceDir = scratchDirectory.empty() ? root : scratchDirectory;
    return FileSystem::availableSpace(spaceDir.string());
}

std::string LocalTargetConnector::describe() const {
    std::string desc = "local:" + root.string();
    if (!scratchDirectory.empty()) {
        desc += " (scratch: " + scratchDirectory.string() + ")";
    }
    return desc;
}

std::string LocalTargetConnector::localRoot() const {
    return root.string();
}
