#pragma once
#include <string>
#include <vector>
#include <chrono>
#include <cstdint>
#include "TransferResult.hpp"
#include "../Types.hpp"
#include "../Errors.hpp"

// 一次运行的汇总结果，由 JobRunner 在结束时生成一次
struct JobResult {
    std::string runId;
    std::string jobName;
    JobStatus status = JobStatus::PENDING;

    uint64_t filesConsidered = 0;
    uint64_t filesWritten = 0;
    uint64_t filesSkipped = 0;
    uint64_t filesFailed = 0;
    uint64_t totalBytes = 0;

    std::chrono::system_clock::time_point startTime;
    std::chrono::system_clock::time_point endTime;

    // 作业级错误（校验失败、连接器错误）
    std::string errorMessage;
    std::vector<TransferResult> items;
    // 枚举阶段跳过的路径
    std::vector<EnumerationWarning> warnings;

    // 计数与条目结果一致：written + skipped + failed == considered
    bool isConsistent() const {
        if (filesWritten + filesSkipped + filesFailed != filesConsidered) {
            return false;
        }
        return items.size() == filesConsidered;
    }

    std::string summary() const {
        return "status=" + toString(status) +
               ", considered=" + std::to_string(filesConsidered) +
               ", written=" + std::to_string(filesWritten) +
               ", skipped=" + std::to_string(filesSkipped) +
               ", failed=" + std::to_string(filesFailed) +
               ", bytes=" + std::to_string(totalBytes);
    }
};
