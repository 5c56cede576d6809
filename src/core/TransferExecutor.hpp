#pragma once
#include <string>
#include <cstddef>
#include "EngineSettings.hpp"
#include "models/TransferResult.hpp"

class ITargetConnector;
class ILogger;

// 单个条目的暂存 - 校验 - 提升。
// execute 不修改自身状态，可以被多个工作线程同时调用。
class TransferExecutor {
private:
    ITargetConnector& connector;
    ILogger* logger;
    size_t chunkSize;
    bool preserveTimestamps;

    TransferResult makeResult(const PlanItem& item, const std::string& runId) const;

public:
    TransferExecutor(ITargetConnector& targetConnector, ILogger* log, const EngineSettings& settings);

    // 条目级错误转换为 WRITE_FAILED / VERIFICATION_FAILED 结果；
    // 只有 ConnectorError（目标整体不可用）会抛出。
    TransferResult execute(const PlanItem& item, const std::string& runId = "") const;
};
