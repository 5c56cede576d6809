#pragma once
#include <string>
#include <vector>
#include <set>
#include <functional>
#include <filesystem>
#include <cstdint>
#include "Errors.hpp"
#include "Matcher.hpp"
#include "models/Candidate.hpp"

namespace fs = std::filesystem;

class ILogger;

// 按需遍历源路径并产出候选文件。
// 顺序：深度优先，同一目录内按文件名字典序；调用 reset() 可重新枚举。
class Enumerator {
public:
    using WarningCallback = std::function<void(const EnumerationWarning&)>;

private:
    struct DirectoryFrame {
        fs::path directory;
        std::string relativePrefix;
        std::vector<std::string> entries;
        size_t index;
    };

    std::vector<std::string> roots;
    Matcher matcher;
    ILogger* logger;
    WarningCallback onWarning;

    size_t rootIndex;
    std::vector<DirectoryFrame> stack;
    // 本次枚举中已进入过的目录真实路径，用于规避符号链接环
    std::set<std::string> visitedDirectories;
    // 已跟随过的文件符号链接的目标真实路径
    std::set<std::string> followedFileLinks;
    // 不进入的目录真实路径（例如位于源目录内的备份目标）
    std::set<std::string> excludedTrees;
    uint64_t warningCount;

    void warn(const fs::path& path, const std::string& message);
    void pushDirectory(const fs::path& directory, const std::string& relativePrefix);
    bool startNextRoot(Candidate& out);

public:
    Enumerator(const std::vector<std::string>& sourceRoots, const Matcher& matcher, ILogger* log,
               WarningCallback warningCallback = nullptr);

    // 取下一个候选，没有更多候选时返回 false
    bool next(Candidate& out);

    // 遍历时跳过该目录及其子树，reset() 不清除
    void excludeTree(const fs::path& directory);

    // 丢弃遍历状态，从第一个根重新开始
    void reset();

    uint64_t getWarningCount() const;
};
