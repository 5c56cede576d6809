#pragma once
#include <string>
#include <vector>
#include <set>
#include "../Types.hpp"

// 备份目标描述：连接器类型 + 位置
struct TargetDescriptor {
    std::string kind = "local";     // 连接器类型，目前只有 local
    std::string location;           // 目标根目录
};

// 一个备份作业的定义，由调用方创建，引擎只读
struct JobDefinition {
    std::string name;                           // 作业名称（日志与报告使用）
    std::vector<std::string> sourceRoots;       // 源路径（目录或单个文件）
    std::vector<std::string> includePatterns;   // 包含模式，有序
    std::vector<std::string> excludePatterns;   // 排除模式，有序，在包含之后判断
    TargetDescriptor target;
    ConflictPolicy conflictPolicy = ConflictPolicy::RENAME;
    // 非空时只处理这些相对路径（调用方对指定条目的重跑）
    std::set<std::string> onlyPaths;

    // 校验必填字段，不合法时抛出 ValidationError
    void validate() const;

    std::string describe() const;
};
