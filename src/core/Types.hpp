#pragma once
#include <string>
#include <stdexcept>

enum class JobStatus {
    PENDING,
    RUNNING,
    COMPLETED,
    COMPLETED_WITH_ERRORS,
    ABORTED,
    FAILED
};

enum class ConflictPolicy {
    OVERWRITE,
    RENAME,
    SKIP
};

enum class PlanAction {
    WRITE,
    SKIP,
    RENAME
};

enum class TransferStatus {
    SUCCEEDED,
    VERIFICATION_FAILED,
    WRITE_FAILED,
    SKIPPED
};

inline std::string toString(JobStatus status) {
    switch (status) {
        case JobStatus::PENDING: return "PENDING";
        case JobStatus::RUNNING: return "RUNNING";
        case JobStatus::COMPLETED: return "COMPLETED";
        case JobStatus::COMPLETED_WITH_ERRORS: return "COMPLETED_WITH_ERRORS";
        case JobStatus::ABORTED: return "ABORTED";
        case JobStatus::FAILED: return "FAILED";
        default: return "UNKNOWN";
    }
}

inline std::string toString(ConflictPolicy policy) {
    switch (policy) {
        case ConflictPolicy::OVERWRITE: return "overwrite";
        case ConflictPolicy::RENAME: return "rename";
        case ConflictPolicy::SKIP: return "skip";
        default: return "unknown";
    }
}

inline std::string toString(PlanAction action) {
    switch (action) {
        case PlanAction::WRITE: return "write";
        case PlanAction::SKIP: return "skip";
        case PlanAction::RENAME: return "rename";
        default: return "unknown";
    }
}

inline std::string toString(TransferStatus status) {
    switch (status) {
        case TransferStatus::SUCCEEDED: return "SUCCEEDED";
        case TransferStatus::VERIFICATION_FAILED: return "VERIFICATION_FAILED";
        case TransferStatus::WRITE_FAILED: return "WRITE_FAILED";
        case TransferStatus::SKIPPED: return "SKIPPED";
        default: return "UNKNOWN";
    }
}

// 终态：一旦进入不再迁移
inline bool isTerminal(JobStatus status) {
    return status == JobStatus::COMPLETED || status == JobStatus::COMPLETED_WITH_ERRORS ||
           status == JobStatus::ABORTED || status == JobStatus::FAILED;
}

// 解析冲突策略字符串，未知值抛出 std::invalid_argument
inline ConflictPolicy parseConflictPolicy(const std::string& value) {
    if (value == "overwrite") return ConflictPolicy::OVERWRITE;
    if (value == "rename") return ConflictPolicy::RENAME;
    if (value == "skip") return ConflictPolicy::SKIP;
    throw std::invalid_argument("Unknown conflict policy: " + value);
}
