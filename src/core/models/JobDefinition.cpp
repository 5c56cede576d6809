#include "JobDefinition.hpp"
#include "../Errors.hpp"

void JobDefinition::validate() const {
    if (sourceRoots.empty()) {
        throw ValidationError("Job '" + name + "' has no source roots");
    }
    for (const auto& root : sourceRoots) {
        if (root.empty()) {
            throw ValidationError("Job '" + name + "' contains an empty source root");
        }
    }
    if (target.kind.empty() || target.location.empty()) {
        throw ValidationError("Job '" + name + "' has an empty target descriptor");
    }
}

std::string JobDefinition::describe() const {
    std::string desc = "Job '" + name + "': " + std::to_string(sourceRoots.size()) + " source(s) -> " +
                       target.kind + ":" + target.location + ", policy=" + toString(conflictPolicy);
    if (!includePatterns.empty()) {
        desc += ", include=" + std::to_string(includePatterns.size());
    }
    if (!excludePatterns.empty()) {
        desc += ", exclude=" + std::to_string(excludePatterns.size());
    }
    if (!onlyPaths.empty()) {
        desc += ", only=" + std::to_string(onlyPaths.size()) + " item(s)";
    }
    return desc;
}
