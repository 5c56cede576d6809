#pragma once
#include <string>
#include <filesystem>
#include <cstdint>
#include <system_error>

namespace fs = std::filesystem;

class FileSystem {
public:
    // 检查文件或目录是否存在（不解析符号链接）
    static bool exists(const std::string& path);

    // 创建目录（包括父目录），已存在时返回 true
    static bool createDirectories(const std::string& path);

    // 删除单个文件，文件不存在也视为失败
    static bool removeFile(const std::string& path);

    // 对目录做 fsync，使 rename 等元数据操作落盘
    static bool syncDirectory(const std::string& path);

    // 两个路径是否位于同一文件系统（rename 只在同一设备内原子）
    static bool isSameDevice(const std::string& first, const std::string& second);

    // 路径是否为当前进程可写的目录
    static bool isWritableDirectory(const std::string& path);

    // 所在文件系统的可用空间，失败返回 UINT64_MAX
    static uint64_t availableSpace(const std::string& path);

    // 把相对路径规范化为 '/' 分隔，拒绝绝对路径与 ".."，不合法时返回 false
    static bool normalizeRelativePath(const std::string& path, std::string& normalized);

    // 带 errno 描述的错误信息
    static std::string errnoMessage(const std::string& what, int err);
};
