#include "Matcher.hpp"
#include <cctype>

namespace {

char foldCase(char c, bool caseSensitive) {
    if (caseSensitive) {
        return c;
    }
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

bool inRange(char c, char low, char high, bool caseSensitive) {
    if (c >= low && c <= high) {
        return true;
    }
    if (caseSensitive) {
        return false;
    }
    char lower = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    char upper = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return (lower >= low && lower <= high) || (upper >= low && upper <= high);
}

// 匹配 [...] 字符类。返回 1 命中、0 未命中、-1 不是合法字符类（按字面量 '[' 处理）。
// 命中时 next 指向 ']' 之后的位置。
int matchBracket(const std::string& pattern, size_t start, char c, bool caseSensitive, size_t& next) {
    size_t i = start + 1;
    bool negate = false;
    if (i < pattern.size() && (pattern[i] == '!' || pattern[i] == '^')) {
        negate = true;
        ++i;
    }

    bool found = false;
    bool first = true;
    while (i < pattern.size()) {
        char pc = pattern[i];
        // 第一个字符可以是字面量 ']'
        if (pc == ']' && !first) {
            next = i + 1;
            return (found != negate) ? 1 : 0;
        }
        first = false;

        if (i + 2 < pattern.size() && pattern[i + 1] == '-' && pattern[i + 2] != ']') {
            if (inRange(c, pc, pattern[i + 2], caseSensitive)) {
                found = true;
            }
            i += 3;
        } else {
            if (foldCase(pc, caseSensitive) == foldCase(c, caseSensitive)) {
                found = true;
            }
            ++i;
        }
    }
    return -1;
}

bool matchesAny(const std::vector<std::string>& patterns, const std::vector<std::string>& forms,
                bool caseSensitive) {
    for (const auto& pattern : patterns) {
        for (const auto& form : forms) {
            if (Matcher::globMatch(pattern, form, caseSensitive)) {
                return true;
            }
        }
    }
    return false;
}

}  // namespace

Matcher::Matcher(const std::vector<std::string>& includes, const std::vector<std::string>& excludes,
                 bool caseSensitive)
    : includePatterns(includes), excludePatterns(excludes), caseSensitive(caseSensitive) {}

bool Matcher::match(const std::string& relativePath) const {
    return matches(relativePath, includePatterns, excludePatterns, caseSensitive);
}

bool Matcher::matches(const std::string& relativePath,
                      const std::vector<std::string>& includes,
                      const std::vector<std::string>& excludes,
                      bool caseSensitive) {
    // 待比较的三种形式：文件名、相对路径、根锚定路径
    std::vector<std::string> forms;
    size_t slash = relativePath.find_last_of('/');
    forms.push_back(slash == std::string::npos ? relativePath : relativePath.substr(slash + 1));
    forms.push_back(relativePath);
    forms.push_back("/" + relativePath);

    // 1. 排除模式优先级最高
    if (!excludes.empty() && matchesAny(excludes, forms, caseSensitive)) {
        return false;
    }

    // 2. 包含模式为空表示匹配全部
    if (!includes.empty()) {
        return matchesAny(includes, forms, caseSensitive);
    }
    return true;
}

bool Matcher::globMatch(const std::string& pattern, const std::string& text, bool caseSensitive) {
    size_t p = 0;
    size_t t = 0;
    size_t starP = std::string::npos;
    size_t starT = 0;

    while (t < text.size()) {
        if (p < pattern.size()) {
            char pc = pattern[p];
            if (pc == '*') {
                starP = p++;
                starT = t;
                continue;
            }
            if (pc == '?') {
                ++p;
                ++t;
                continue;
            }

            bool literal = true;
            if (pc == '[') {
                size_t next = 0;
                int r = matchBracket(pattern, p, text[t], caseSensitive, next);
                if (r == 1) {
                    p = next;
                    ++t;
                    continue;
                }
                literal = (r == -1);
            }
            if (literal && foldCase(pc, caseSensitive) == foldCase(text[t], caseSensitive)) {
                ++p;
                ++t;
                continue;
            }
        }

        // 回溯到上一个 '*'，让它多吞一个字符
        if (starP != std::string::npos) {
            p = starP + 1;
            t = ++starT;
            continue;
        }
        return false;
    }

    while (p < pattern.size() && pattern[p] == '*') {
        ++p;
    }
    return p == pattern.size();
}

std::vector<std::string> Matcher::parsePatternList(const std::string& list) {
    std::vector<std::string> patterns;
    size_t start = 0;
    while (start <= list.size()) {
        size_t end = list.find(';', start);
        if (end == std::string::npos) {
            end = list.size();
        }
        std::string item = list.substr(start, end - start);

        size_t first = item.find_first_not_of(" \t\r\n");
        if (first != std::string::npos) {
            size_t last = item.find_last_not_of(" \t\r\n");
            patterns.push_back(item.substr(first, last - first + 1));
        }
        start = end + 1;
    }
    return patterns;
}

std::string Matcher::getFilterDescription() const {
    std::string desc = "Pattern Filter: ";

    if (includePatterns.empty() && excludePatterns.empty()) {
        desc += "no patterns, matches all files";
        return desc;
    }

    if (!includePatterns.empty()) {
        desc += "include (" + std::to_string(includePatterns.size()) + "): [";
        for (size_t i = 0; i < includePatterns.size(); ++i) {
            desc += includePatterns[i];
            if (i < includePatterns.size() - 1) {
                desc += ", ";
            }
        }
        desc += "]";
    }

    if (!includePatterns.empty() && !excludePatterns.empty()) {
        desc += ", ";
    }

    if (!excludePatterns.empty()) {
        desc += "exclude (" + std::to_string(excludePatterns.size()) + "): [";
        for (size_t i = 0; i < excludePatterns.size(); ++i) {
            desc += excludePatterns[i];
            if (i < excludePatterns.size() - 1) {
                desc += ", ";
            }
        }
        desc += "]";
    }

    desc += caseSensitive ? " (case-sensitive)" : " (case-insensitive)";
    return desc;
}
