#pragma once
#include <string>
#include <chrono>
#include <cstdint>
#include "Candidate.hpp"
#include "../Types.hpp"

// 冲突解析的产物：候选 + 目标路径 + 动作
struct PlanItem {
    Candidate candidate;
    std::string destinationPath;    // 目标端相对路径
    PlanAction action = PlanAction::WRITE;
    unsigned int renameSuffix = 0;  // action 为 RENAME 时的数字后缀
};

// 单个条目的处理结果，创建后不再修改
struct TransferResult {
    std::string runId;
    std::string sourcePath;
    std::string relativePath;
    std::string destinationPath;
    PlanAction action = PlanAction::WRITE;
    TransferStatus status = TransferStatus::SKIPPED;
    uint64_t bytesTransferred = 0;
    std::string checksum;           // 写入成功时的十六进制 SHA-256
    std::string errorMessage;
    std::chrono::milliseconds elapsed{0};

    bool isFailure() const {
        return status == TransferStatus::WRITE_FAILED || status == TransferStatus::VERIFICATION_FAILED;
    }
};

// 每处理完一个条目发出的进度事件
struct ProgressEvent {
    std::string runId;
    uint64_t itemsDone = 0;
    uint64_t itemsTotalSoFar = 0;
    uint64_t bytesDone = 0;
    std::string currentPath;
};
