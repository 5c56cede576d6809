#pragma once
#include <string>
#include <set>
#include <mutex>
#include "Types.hpp"
#include "models/Candidate.hpp"
#include "models/TransferResult.hpp"

class ITargetConnector;
class ILogger;

// 根据冲突策略决定目标路径与动作。
// 同一次运行中已分配的目标名记录在 claimedNames 中，名称探测与占用在同一把锁内完成，
// 并发派发时多个条目也不会分到同一个名字。
class ConflictResolver {
private:
    ITargetConnector& connector;
    ILogger* logger;
    std::mutex mutex;
    std::set<std::string> claimedNames;

    bool isTaken(const std::string& path, bool knownToExist);

public:
    static const unsigned int MAX_RENAME_ATTEMPTS = 9999;

    ConflictResolver(ITargetConnector& targetConnector, ILogger* log);

    // destinationExists 由调用方通过连接器查询；rename 时继续通过连接器探测可用名称。
    // 重命名候选耗尽时抛出 std::runtime_error。
    PlanItem resolve(const Candidate& candidate, bool destinationExists, ConflictPolicy policy);

    // 自行查询目标是否存在
    PlanItem resolve(const Candidate& candidate, ConflictPolicy policy);

    // "name.ext" -> "name (n).ext"，保留目录部分
    static std::string renamedPath(const std::string& path, unsigned int suffix);
};
