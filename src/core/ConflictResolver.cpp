#include "ConflictResolver.hpp"
#include "connectors/ITargetConnector.hpp"
#include "../utils/ILogger.hpp"
#include <filesystem>
#include <stdexcept>

namespace fs = std::filesystem;

ConflictResolver::ConflictResolver(ITargetConnector& targetConnector, ILogger* log)
    : connector(targetConnector), logger(log) {}

bool ConflictResolver::isTaken(const std::string& path, bool knownToExist) {
    if (claimedNames.count(path) > 0) {
        return true;
    }
    return knownToExist || connector.exists(path);
}

std::string ConflictResolver::renamedPath(const std::string& path, unsigned int suffix) {
    fs::path original(path);
    std::string renamed = original.stem().string() + " (" + std::to_string(suffix) + ")" +
                          original.extension().string();
    fs::path parent = original.parent_path();
    return parent.empty() ? renamed : (parent / renamed).generic_string();
}

PlanItem ConflictResolver::resolve(const Candidate& candidate, ConflictPolicy policy) {
    return resolve(candidate, connector.exists(candidate.getRelativePath()), policy);
}

PlanItem ConflictResolver::resolve(const Candidate& candidate, bool destinationExists, ConflictPolicy policy) {
    PlanItem item;
    item.candidate = candidate;
    item.destinationPath = candidate.getRelativePath();

    std::lock_guard<std::mutex> lock(mutex);
    bool taken = claimedNames.count(item.destinationPath) > 0 || destinationExists;

    switch (policy) {
        case ConflictPolicy::SKIP:
            item.action = taken ? PlanAction::SKIP : PlanAction::WRITE;
            break;

        case ConflictPolicy::OVERWRITE:
            // 旧文件只有在新文件校验通过后才会被原子替换
            item.action = PlanAction::WRITE;
            break;

        case ConflictPolicy::RENAME:
            if (!taken) {
                item.action = PlanAction::WRITE;
                break;
            }
            for (unsigned int suffix = 1; suffix <= MAX_RENAME_ATTEMPTS; ++suffix) {
                std::string attempt = renamedPath(candidate.getRelativePath(), suffix);
                if (!isTaken(attempt, false)) {
                    item.destinationPath = attempt;
                    item.action = PlanAction::RENAME;
                    item.renameSuffix = suffix;
                    break;
                }
            }
            if (item.action != PlanAction::RENAME) {
                throw std::runtime_error("No free destination name for " + candidate.getRelativePath() +
                                         " after " + std::to_string(MAX_RENAME_ATTEMPTS) + " attempts");
            }
            break;
    }

    if (item.action != PlanAction::SKIP) {
        claimedNames.insert(item.destinationPath);
    }
    if (logger) {
        logger->debug("Resolved " + candidate.getRelativePath() + " -> " + item.destinationPath +
                      " [" + toString(item.action) + "]");
    }
    return item;
}
