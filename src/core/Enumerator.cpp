#include "Enumerator.hpp"
#include "../utils/ILogger.hpp"
#include <algorithm>

Enumerator::Enumerator(const std::vector<std::string>& sourceRoots, const Matcher& matcher, ILogger* log,
                       WarningCallback warningCallback)
    : roots(sourceRoots), matcher(matcher), logger(log), onWarning(std::move(warningCallback)),
      rootIndex(0), warningCount(0) {}

void Enumerator::reset() {
    rootIndex = 0;
    stack.clear();
    visitedDirectories.clear();
    followedFileLinks.clear();
    warningCount = 0;
}

void Enumerator::excludeTree(const fs::path& directory) {
    std::error_code ec;
    fs::path realPath = fs::weakly_canonical(fs::absolute(directory), ec);
    excludedTrees.insert(ec ? fs::absolute(directory).lexically_normal().string() : realPath.string());
}

uint64_t Enumerator::getWarningCount() const {
    return warningCount;
}

void Enumerator::warn(const fs::path& path, const std::string& message) {
    ++warningCount;
    if (logger) {
        logger->warn("Enumeration warning: " + path.string() + ": " + message);
    }
    if (onWarning) {
        onWarning(EnumerationWarning{path.string(), message});
    }
}

void Enumerator::pushDirectory(const fs::path& directory, const std::string& relativePrefix) {
    std::error_code ec;
    fs::path realPath = fs::canonical(directory, ec);
    if (ec) {
        warn(directory, "cannot resolve directory (" + ec.message() + ")");
        return;
    }

    if (excludedTrees.count(realPath.string()) > 0) {
        if (logger) {
            logger->info("Skipping backup target inside source: " + directory.string());
        }
        return;
    }

    // 同一个真实目录只进入一次
    if (!visitedDirectories.insert(realPath.string()).second) {
        warn(directory, "directory already visited via " + realPath.string() +
                        ", symbolic link cycle skipped");
        return;
    }

    DirectoryFrame frame{directory, relativePrefix, {}, 0};
    fs::directory_iterator it(directory, ec);
    if (ec) {
        warn(directory, "cannot read directory (" + ec.message() + ")");
        return;
    }
    for (fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            break;
        }
        frame.entries.push_back(it->path().filename().string());
    }
    if (ec) {
        // 目录在遍历过程中出错（权限、被删除），跳过整个子树
        warn(directory, "error while reading directory (" + ec.message() + ")");
        return;
    }

    std::sort(frame.entries.begin(), frame.entries.end());
    stack.push_back(std::move(frame));
}

bool Enumerator::startNextRoot(Candidate& out) {
    const std::string& root = roots[rootIndex++];
    fs::path rootPath = fs::absolute(fs::path(root));

    std::error_code ec;
    fs::file_status status = fs::status(rootPath, ec);
    if (ec || !fs::exists(status)) {
        warn(rootPath, "source root not accessible" + (ec ? " (" + ec.message() + ")" : std::string()));
        return false;
    }

    if (fs::is_regular_file(status)) {
        // 单个文件作为源：相对路径就是文件名
        std::string relative = rootPath.filename().string();
        if (!matcher.match(relative)) {
            return false;
        }
        if (!out.initialize(rootPath, relative)) {
            warn(rootPath, "cannot read file attributes");
            return false;
        }
        out.setMatched(true);
        return true;
    }

    if (fs::is_directory(status)) {
        pushDirectory(rootPath, "");
        return false;
    }

    warn(rootPath, "unsupported file type for source root");
    return false;
}

bool Enumerator::next(Candidate& out) {
    for (;;) {
        if (stack.empty()) {
            if (rootIndex >= roots.size()) {
                return false;
            }
            if (startNextRoot(out)) {
                return true;
            }
            continue;
        }

        DirectoryFrame& frame = stack.back();
        if (frame.index >= frame.entries.size()) {
            stack.pop_back();
            continue;
        }

        const std::string name = frame.entries[frame.index++];
        const fs::path path = frame.directory / name;
        const std::string relative = frame.relativePrefix.empty() ? name : frame.relativePrefix + "/" + name;

        std::error_code ec;
        bool isLink = fs::is_symlink(fs::symlink_status(path, ec));
        fs::file_status status = fs::status(path, ec);
        if (ec || !fs::exists(status)) {
            if (isLink) {
                warn(path, "broken symbolic link");
            } else {
                warn(path, "entry vanished or not accessible" + (ec ? " (" + ec.message() + ")" : std::string()));
            }
            continue;
        }

        if (fs::is_directory(status)) {
            // 注意：pushDirectory 会使 frame 引用失效
            pushDirectory(path, relative);
            continue;
        }

        if (!fs::is_regular_file(status)) {
            if (logger) {
                logger->debug("Skipping special file: " + path.string());
            }
            continue;
        }

        if (!matcher.match(relative)) {
            continue;
        }

        if (isLink) {
            // 同一目标文件只经由符号链接跟随一次
            fs::path realPath = fs::canonical(path, ec);
            if (!ec && !followedFileLinks.insert(realPath.string()).second) {
                if (logger) {
                    logger->debug("Skipping symbolic link to already followed file: " + path.string() +
                                  " -> " + realPath.string());
                }
                continue;
            }
        }

        if (!out.initialize(path, relative)) {
            warn(path, "cannot read file attributes");
            continue;
        }
        out.setMatched(true);
        return true;
    }
}
