#include "RecordSinks.hpp"
#include "../utils/ILogger.hpp"
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <ctime>

namespace {

std::string formatTime(const std::chrono::system_clock::time_point& tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tmValue{};
    gmtime_r(&t, &tmValue);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &tmValue);
    return buffer;
}

} // namespace

LoggingRecordSink::LoggingRecordSink(ILogger* log, uint64_t progressEvery)
    : logger(log), progressInterval(progressEvery) {}

void LoggingRecordSink::onProgress(const ProgressEvent& event) {
    if (!logger || progressInterval == 0 || event.itemsDone % progressInterval != 0) {
        return;
    }
    logger->info("Progress: " + std::to_string(event.itemsDone) + "/" +
                 std::to_string(event.itemsTotalSoFar) + " items, " +
                 std::to_string(event.bytesDone) + " bytes");
}

void LoggingRecordSink::onItemResult(const TransferResult& result) {
    if (!logger) {
        return;
    }
    std::string line = toString(result.status) + " " + result.relativePath;
    if (result.destinationPath != result.relativePath) {
        line += " -> " + result.destinationPath;
    }
    if (result.isFailure()) {
        logger->warn(line + ": " + result.errorMessage);
    } else {
        logger->debug(line);
    }
}

void LoggingRecordSink::onJobResult(const JobResult& result) {
    if (!logger) {
        return;
    }
    std::string line = "Job " + result.jobName + " [" + result.runId + "] finished: " + result.summary();
    if (result.status == JobStatus::COMPLETED) {
        logger->info(line);
    } else if (result.status == JobStatus::COMPLETED_WITH_ERRORS || result.status == JobStatus::ABORTED) {
        logger->warn(line);
    } else {
        logger->error(line + (result.errorMessage.empty() ? "" : ": " + result.errorMessage));
    }
}

YamlReportSink::YamlReportSink(const std::string& path, ILogger* log)
    : reportPath(path), logger(log), written(false) {}

void YamlReportSink::onProgress(const ProgressEvent&) {}

void YamlReportSink::onItemResult(const TransferResult&) {}

std::string YamlReportSink::render(const JobResult& result) {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "run_id" << YAML::Value << result.runId;
    out << YAML::Key << "job" << YAML::Value << result.jobName;
    out << YAML::Key << "status" << YAML::Value << toString(result.status);
    out << YAML::Key << "started" << YAML::Value << formatTime(result.startTime);
    out << YAML::Key << "finished" << YAML::Value << formatTime(result.endTime);
    if (!result.errorMessage.empty()) {
        out << YAML::Key << "error" << YAML::Value << result.errorMessage;
    }

    out << YAML::Key << "counts" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "considered" << YAML::Value << result.filesConsidered;
    out << YAML::Key << "written" << YAML::Value << result.filesWritten;
    out << YAML::Key << "skipped" << YAML::Value << result.filesSkipped;
    out << YAML::Key << "failed" << YAML::Value << result.filesFailed;
    out << YAML::Key << "bytes" << YAML::Value << result.totalBytes;
    out << YAML::EndMap;

    out << YAML::Key << "items" << YAML::Value << YAML::BeginSeq;
    for (const auto& item : result.items) {
        out << YAML::BeginMap;
        out << YAML::Key << "source" << YAML::Value << item.sourcePath;
        out << YAML::Key << "relative" << YAML::Value << item.relativePath;
        out << YAML::Key << "destination" << YAML::Value << item.destinationPath;
        out << YAML::Key << "action" << YAML::Value << toString(item.action);
        out << YAML::Key << "status" << YAML::Value << toString(item.status);
        out << YAML::Key << "bytes" << YAML::Value << item.bytesTransferred;
        if (!item.checksum.empty()) {
            out << YAML::Key << "sha256" << YAML::Value << item.checksum;
        }
        if (!item.errorMessage.empty()) {
            out << YAML::Key << "error" << YAML::Value << item.errorMessage;
        }
        out << YAML::Key << "elapsed_ms" << YAML::Value << static_cast<long long>(item.elapsed.count());
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    if (!result.warnings.empty()) {
        out << YAML::Key << "warnings" << YAML::Value << YAML::BeginSeq;
        for (const auto& warning : result.warnings) {
            out << YAML::BeginMap;
            out << YAML::Key << "path" << YAML::Value << warning.path;
            out << YAML::Key << "message" << YAML::Value << warning.message;
            out << YAML::EndMap;
        }
        out << YAML::EndSeq;
    }
    out << YAML::EndMap;
    return std::string(out.c_str()) + "\n";
}

void YamlReportSink::onJobResult(const JobResult& result) {
    std::ofstream file(reportPath, std::ios::trunc);
    if (!file) {
        // 报告写不出来不影响作业结果
        if (logger) {
            logger->error("Cannot write report file: " + reportPath);
        }
        return;
    }
    file << render(result);
    file.close();
    if (!file) {
        if (logger) {
            logger->error("Failed to write report file: " + reportPath);
        }
        return;
    }
    written = true;
    if (logger) {
        logger->info("Report written to " + reportPath);
    }
}

bool YamlReportSink::isWritten() const {
    return written;
}

void CompositeRecordSink::add(IRecordSink* sink) {
    if (sink) {
        sinks.push_back(sink);
    }
}

bool CompositeRecordSink::empty() const {
    return sinks.empty();
}

void CompositeRecordSink::onProgress(const ProgressEvent& event) {
    for (auto* sink : sinks) sink->onProgress(event);
}

void CompositeRecordSink::onItemResult(const TransferResult& result) {
    for (auto* sink : sinks) sink->onItemResult(result);
}

void CompositeRecordSink::onJobResult(const JobResult& result) {
    for (auto* sink : sinks) sink->onJobResult(result);
}
