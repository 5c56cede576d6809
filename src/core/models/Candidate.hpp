#pragma once
#include <string>
#include <filesystem>
#include <cstdint>

namespace fs = std::filesystem;

// 枚举器发现的一个待备份文件
class Candidate {
private:
    // 源文件绝对路径（遍历时的路径，符号链接不解析）
    fs::path absolutePath;
    // 相对于源根目录的路径，统一使用 '/' 分隔，用于计算目标路径
    std::string relativePath;

    uint64_t fileSize;
    fs::file_time_type modificationTime;
    bool hasModificationTime;

    // 是否通过了包含/排除模式（枚举器只产出 true 的候选）
    bool matched;

public:
    Candidate();
    Candidate(const fs::path& path, const std::string& relative);

    // 读取文件大小与修改时间，失败时大小为 0，返回 false
    bool initialize(const fs::path& path, const std::string& relative);

    const fs::path& getAbsolutePath() const;
    const std::string& getRelativePath() const;
    std::string getFileName() const;
    uint64_t getFileSize() const;

    fs::file_time_type getModificationTime() const;
    bool getHasModificationTime() const;

    bool isMatched() const;
    void setMatched(bool value);

    bool operator==(const Candidate& other) const;
    bool operator!=(const Candidate& other) const;
};
