#pragma once
#include <string>
#include "EngineSettings.hpp"
#include "models/JobDefinition.hpp"

namespace YAML { class Node; }

// 配置文件内容：作业定义 + 引擎参数
struct JobFile {
    JobDefinition job;
    EngineSettings settings;
};

// 读取 YAML 作业文件。格式错误或取值不合法时抛出 ValidationError。
class ConfigLoader {
private:
    static void loadSettings(const YAML::Node& node, EngineSettings& settings);
    static void loadJob(const YAML::Node& node, JobFile& out);
    static JobFile fromNode(const YAML::Node& root);

public:
    static JobFile loadFile(const std::string& path);
    static JobFile loadString(const std::string& text);

    // 模式既可以写成序列，也可以写成 ';' 分隔的字符串
    static std::vector<std::string> readPatterns(const YAML::Node& node, const std::string& key);
};
