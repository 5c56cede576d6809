#pragma once
#include <string>
#include <cstddef>
#include "Types.hpp"
#include "../utils/ILogger.hpp"

// 引擎运行参数（配置文件 settings 段）
struct EngineSettings {
    size_t chunkSize = 64 * 1024;           // 流式复制与校验的块大小
    bool caseSensitive = true;              // 模式匹配是否区分大小写
    bool preserveTimestamps = true;         // 提升前把源文件修改时间写到暂存文件
    std::string scratchDirectory;           // 空表示暂存在目标文件旁边
    unsigned int maxConcurrentTransfers = 1;// 1 为顺序执行
    bool cleanupStaleStaging = true;        // 准备阶段清理上次中断遗留的暂存文件
    ConflictPolicy defaultConflictPolicy = ConflictPolicy::RENAME;
    LogLevel logLevel = LogLevel::INFO;
    std::string logFile;
};
