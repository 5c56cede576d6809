#pragma once
#include <string>
#include <mutex>
#include <cstdint>
#include "Types.hpp"
#include "EngineSettings.hpp"
#include "models/JobDefinition.hpp"
#include "models/JobResult.hpp"
#include "models/TransferResult.hpp"

class ILogger;
class IRecordSink;
class ITargetConnector;
class RunControl;
class Enumerator;
class ConflictResolver;
class TransferExecutor;
class Candidate;

// 一次备份运行：枚举 -> 冲突解析 -> 暂存/校验/提升 -> 记录。
// 状态：PENDING -> RUNNING -> COMPLETED / COMPLETED_WITH_ERRORS / ABORTED / FAILED
class JobRunner {
private:
    JobDefinition job;
    ITargetConnector& connector;
    ILogger* logger;
    IRecordSink* sink;
    EngineSettings settings;
    RunControl* control;

    // 当前任务状态
    JobStatus status;
    std::string runId;

    // 正在累积的结果；条目记录和 sink 回调都在这把锁下进行
    std::mutex resultMutex;
    JobResult result;
    uint64_t itemsQueued;
    uint64_t bytesDone;

    bool isSelected(const Candidate& candidate) const;
    TransferResult processCandidate(const Candidate& candidate, ConflictResolver& resolver,
                                    const TransferExecutor& executor);
    TransferResult failedItem(const Candidate& candidate, const std::string& message) const;
    void recordItem(const TransferResult& item);

    // 返回 true 表示被取消
    bool runSequential(Enumerator& enumerator, ConflictResolver& resolver, const TransferExecutor& executor);
    bool runConcurrent(Enumerator& enumerator, ConflictResolver& resolver, const TransferExecutor& executor);

    JobResult finish(JobStatus finalStatus, const std::string& message = "");

public:
    JobRunner(const JobDefinition& definition, ITargetConnector& targetConnector, ILogger* log,
              IRecordSink* recordSink = nullptr, const EngineSettings& engineSettings = EngineSettings(),
              RunControl* runControl = nullptr);

    // 执行一次运行。作业级失败也通过返回值（status == FAILED）报告，不抛异常。
    JobResult execute();

    JobStatus getStatus() const;
    const std::string& getRunId() const;

    // 在连接器都无法创建时生成失败结果，同样通知 sink
    static JobResult failedBeforeStart(const JobDefinition& definition, const std::string& message,
                                       ILogger* log, IRecordSink* recordSink);
};
