#include "ConfigLoader.hpp"
#include "Errors.hpp"
#include "Matcher.hpp"
#include <yaml-cpp/yaml.h>
#include <stdexcept>

namespace {

// 字段存在时严格转换，类型不对抛出 YAML::Exception
template <typename T>
T readValue(const YAML::Node& node, const std::string& key, const T& fallback) {
    const YAML::Node value = node[key];
    if (!value || value.IsNull()) {
        return fallback;
    }
    return value.as<T>();
}

} // namespace

std::vector<std::string> ConfigLoader::readPatterns(const YAML::Node& node, const std::string& key) {
    std::vector<std::string> patterns;
    const YAML::Node value = node[key];
    if (!value || value.IsNull()) {
        return patterns;
    }
    if (value.IsSequence()) {
        for (const auto& item : value) {
            std::string pattern = item.as<std::string>();
            if (!pattern.empty()) {
                patterns.push_back(pattern);
            }
        }
        return patterns;
    }
    if (value.IsScalar()) {
        return Matcher::parsePatternList(value.as<std::string>());
    }
    throw ValidationError("'" + key + "' must be a string or a list");
}

void ConfigLoader::loadSettings(const YAML::Node& node, EngineSettings& settings) {
    if (node["chunk_size_kb"]) {
        long long kb = node["chunk_size_kb"].as<long long>();
        if (kb <= 0) {
            throw ValidationError("settings.chunk_size_kb must be positive");
        }
        settings.chunkSize = static_cast<size_t>(kb) * 1024;
    }
    settings.caseSensitive = readValue<bool>(node, "case_sensitive", settings.caseSensitive);
    settings.preserveTimestamps = readValue<bool>(node, "preserve_timestamps", settings.preserveTimestamps);
    settings.scratchDirectory = readValue<std::string>(node, "scratch_directory", settings.scratchDirectory);
    if (node["max_concurrent_transfers"]) {
        int jobs = node["max_concurrent_transfers"].as<int>();
        if (jobs < 1) {
            throw ValidationError("settings.max_concurrent_transfers must be at least 1");
        }
        settings.maxConcurrentTransfers = static_cast<unsigned int>(jobs);
    }
    settings.cleanupStaleStaging = readValue<bool>(node, "cleanup_stale_staging", settings.cleanupStaleStaging);
    if (node["default_conflict_policy"]) {
        try {
            settings.defaultConflictPolicy = parseConflictPolicy(node["default_conflict_policy"].as<std::string>());
        } catch (const std::invalid_argument& e) {
            throw ValidationError(std::string("settings.default_conflict_policy: ") + e.what());
        }
    }
    if (node["log_level"]) {
        std::string level = node["log_level"].as<std::string>();
        if (!parseLogLevel(level, settings.logLevel)) {
            throw ValidationError("settings.log_level: unknown level '" + level + "'");
        }
    }
    settings.logFile = readValue<std::string>(node, "log_file", settings.logFile);
}

void ConfigLoader::loadJob(const YAML::Node& node, JobFile& out) {
    JobDefinition& job = out.job;
    job.name = readValue<std::string>(node, "name", "");

    const YAML::Node sources = node["sources"];
    if (sources) {
        if (sources.IsSequence()) {
            for (const auto& source : sources) {
                job.sourceRoots.push_back(source.as<std::string>());
            }
        } else if (sources.IsScalar()) {
            job.sourceRoots.push_back(sources.as<std::string>());
        } else {
            throw ValidationError("job.sources must be a string or a list");
        }
    }

    job.includePatterns = readPatterns(node, "include");
    job.excludePatterns = readPatterns(node, "exclude");

    const YAML::Node target = node["target"];
    if (target) {
        if (target.IsScalar()) {
            job.target.location = target.as<std::string>();
        } else if (target.IsMap()) {
            job.target.kind = readValue<std::string>(target, "kind", job.target.kind);
            job.target.location = readValue<std::string>(target, "location", "");
        } else {
            throw ValidationError("job.target must be a path or a map");
        }
    }

    job.conflictPolicy = out.settings.defaultConflictPolicy;
    if (node["conflict_policy"]) {
        try {
            job.conflictPolicy = parseConflictPolicy(node["conflict_policy"].as<std::string>());
        } catch (const std::invalid_argument& e) {
            throw ValidationError(std::string("job.conflict_policy: ") + e.what());
        }
    }

    const YAML::Node only = node["only_paths"];
    if (only) {
        if (!only.IsSequence()) {
            throw ValidationError("job.only_paths must be a list");
        }
        for (const auto& path : only) {
            job.onlyPaths.insert(path.as<std::string>());
        }
    }
}

JobFile ConfigLoader::fromNode(const YAML::Node& root) {
    if (!root.IsMap()) {
        throw ValidationError("Configuration must be a map with 'settings' and 'job' sections");
    }
    JobFile out;
    try {
        if (root["settings"]) {
            loadSettings(root["settings"], out.settings);
        }
        if (!root["job"] || !root["job"].IsMap()) {
            throw ValidationError("missing job section");
        }
        loadJob(root["job"], out);
    } catch (const YAML::Exception& e) {
        throw ValidationError(std::string("Invalid configuration: ") + e.what());
    }
    return out;
}

JobFile ConfigLoader::loadFile(const std::string& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw ValidationError("Cannot load configuration " + path + ": " + e.what());
    }
    try {
        return fromNode(root);
    } catch (const ValidationError& e) {
        throw ValidationError(path + ": " + e.what());
    }
}

JobFile ConfigLoader::loadString(const std::string& text) {
    YAML::Node root;
    try {
        root = YAML::Load(text);
    } catch (const YAML::Exception& e) {
        throw ValidationError(std::string("Cannot parse configuration: ") + e.what());
    }
    return fromNode(root);
}
