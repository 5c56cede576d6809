#include "FileSystem.hpp"
#include <cstring>
#include <limits>

#include <sys/stat.h>
#include <sys/types.h>
#include <fcntl.h>
#include <unistd.h>
#include <errno.h>

bool FileSystem::exists(const std::string& path) {
    std::error_code ec;
    // 使用symlink_status检查文件是否存在，不解析符号链接
    fs::file_status status = fs::symlink_status(path, ec);
    return status.type() != fs::file_type::not_found && !ec;
}

bool FileSystem::createDirectories(const std::string& path) {
    std::error_code ec;
    fs::file_status status = fs::status(path, ec);
    if (!ec && status.type() == fs::file_type::directory) {
        return true;
    }

    fs::create_directories(path, ec);
    if (ec) {
        return false;
    }
    return fs::is_directory(path, ec) && !ec;
}

bool FileSystem::removeFile(const std::string& path) {
    std::error_code ec;
    bool result = fs::remove(path, ec);
    return !ec && result;
}

bool FileSystem::syncDirectory(const std::string& path) {
    int dirFd = ::open(path.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (dirFd < 0) {
        return false;
    }
    bool ok = ::fsync(dirFd) == 0;
    ::close(dirFd);
    return ok;
}

bool FileSystem::isSameDevice(const std::string& first, const std::string& second) {
    struct stat a {};
    struct stat b {};
    if (::stat(first.c_str(), &a) != 0 || ::stat(second.c_str(), &b) != 0) {
        return false;
    }
    return a.st_dev == b.st_dev;
}

bool FileSystem::isWritableDirectory(const std::string& path) {
    std::error_code ec;
    if (!fs::is_directory(path, ec) || ec) {
        return false;
    }
    return ::access(path.c_str(), W_OK | X_OK) == 0;
}

uint64_t FileSystem::availableSpace(const std::string& path) {
    std::error_code ec;
    fs::space_info info = fs::space(path, ec);
    if (ec) {
        return std::numeric_limits<uint64_t>::max();
    }
    return info.available;
}

bool FileSystem::normalizeRelativePath(const std::string& path, std::string& normalized) {
    fs::path p(path);
    if (path.empty() || p.is_absolute()) {
        return false;
    }
    fs::path clean = p.lexically_normal();
    for (const auto& part : clean) {
        if (part == "..") {
            return false;
        }
    }
    normalized = clean.generic_string();
    return !normalized.empty() && normalized != ".";
}

std::string FileSystem::errnoMessage(const std::string& what, int err) {
    return what + " (" + std::strerror(err) + ")";
}
