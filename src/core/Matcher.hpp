#pragma once
#include <string>
#include <vector>

// 包含/排除通配符模式匹配（*、?、[...]），纯函数，无副作用
class Matcher {
private:
    std::vector<std::string> includePatterns;
    std::vector<std::string> excludePatterns;
    bool caseSensitive;

public:
    Matcher() : includePatterns(), excludePatterns(), caseSensitive(true) {}
    Matcher(const std::vector<std::string>& includes, const std::vector<std::string>& excludes,
            bool caseSensitive = true);

    // 按当前模式集判断相对路径
    bool match(const std::string& relativePath) const;

    const std::vector<std::string>& getIncludePatterns() const {
        return this->includePatterns;
    }
    const std::vector<std::string>& getExcludePatterns() const {
        return this->excludePatterns;
    }
    bool isCaseSensitive() const {
        return this->caseSensitive;
    }

    std::string getFilterDescription() const;

    // 包含列表为空或至少命中一个包含模式，且不命中任何排除模式时返回 true。
    // 模式分别与文件名、相对路径以及以 '/' 开头的根锚定路径比较。
    static bool matches(const std::string& relativePath,
                        const std::vector<std::string>& includes,
                        const std::vector<std::string>& excludes,
                        bool caseSensitive = true);

    // 单个模式与整串比较，'*' 与 '?' 可以跨越 '/'
    static bool globMatch(const std::string& pattern, const std::string& text, bool caseSensitive = true);

    // 解析分号分隔的模式列表，去掉空白与空项，保持顺序
    static std::vector<std::string> parsePatternList(const std::string& list);
};
