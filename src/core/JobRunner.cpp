#include "JobRunner.hpp"
#include "Errors.hpp"
#include "Matcher.hpp"
#include "Enumerator.hpp"
#include "ConflictResolver.hpp"
#include "TransferExecutor.hpp"
#include "TransferPool.hpp"
#include "RunControl.hpp"
#include "IRecordSink.hpp"
#include "connectors/ITargetConnector.hpp"
#include "../utils/Checksum.hpp"
#include "../utils/FileSystem.hpp"
#include "../utils/ILogger.hpp"
#include <deque>
#include <future>
#include <chrono>

JobRunner::JobRunner(const JobDefinition& definition, ITargetConnector& targetConnector, ILogger* log,
                     IRecordSink* recordSink, const EngineSettings& engineSettings, RunControl* runControl)
    : job(definition), connector(targetConnector), logger(log), sink(recordSink),
      settings(engineSettings), control(runControl), status(JobStatus::PENDING),
      itemsQueued(0), bytesDone(0) {}

JobStatus JobRunner::getStatus() const {
    return status;
}

const std::string& JobRunner::getRunId() const {
    return runId;
}

bool JobRunner::isSelected(const Candidate& candidate) const {
    if (job.onlyPaths.empty()) {
        return true;
    }
    return job.onlyPaths.count(candidate.getRelativePath()) > 0;
}

TransferResult JobRunner::failedItem(const Candidate& candidate, const std::string& message) const {
    TransferResult item;
    item.runId = runId;
    item.sourcePath = candidate.getAbsolutePath().string();
    item.relativePath = candidate.getRelativePath();
    item.destinationPath = candidate.getRelativePath();
    item.action = PlanAction::WRITE;
    item.status = TransferStatus::WRITE_FAILED;
    item.errorMessage = message;
    return item;
}

TransferResult JobRunner::processCandidate(const Candidate& candidate, ConflictResolver& resolver,
                                           const TransferExecutor& executor) {
    PlanItem plan;
    try {
        plan = resolver.resolve(candidate, job.conflictPolicy);
    } catch (const ConnectorError&) {
        throw;
    } catch (const std::exception& e) {
        // 名称探测耗尽或目标路径不合法：只影响这一个条目
        if (logger) {
            logger->error("Cannot plan " + candidate.getRelativePath() + ": " + e.what());
        }
        return failedItem(candidate, e.what());
    }
    return executor.execute(plan, runId);
}

void JobRunner::recordItem(const TransferResult& item) {
    std::lock_guard<std::mutex> lock(resultMutex);
    result.items.push_back(item);
    ++result.filesConsidered;
    switch (item.status) {
        case TransferStatus::SUCCEEDED:
            ++result.filesWritten;
            result.totalBytes += item.bytesTransferred;
            bytesDone += item.bytesTransferred;
            break;
        case TransferStatus::SKIPPED:
            ++result.filesSkipped;
            break;
        case TransferStatus::WRITE_FAILED:
        case TransferStatus::VERIFICATION_FAILED:
            ++result.filesFailed;
            break;
    }

    if (sink) {
        ProgressEvent event;
        event.runId = runId;
        event.itemsDone = result.filesConsidered;
        event.itemsTotalSoFar = itemsQueued;
        event.bytesDone = bytesDone;
        event.currentPath = item.relativePath;
        sink->onItemResult(item);
        sink->onProgress(event);
    }
}

bool JobRunner::runSequential(Enumerator& enumerator, ConflictResolver& resolver, const TransferExecutor& executor) {
    Candidate candidate;
    for (;;) {
        if (control && control->checkpoint()) {
            return true;
        }
        if (!enumerator.next(candidate)) {
            return false;
        }
        if (!isSelected(candidate)) {
            continue;
        }
        ++itemsQueued;
        recordItem(processCandidate(candidate, resolver, executor));
    }
}

bool JobRunner::runConcurrent(Enumerator& enumerator, ConflictResolver& resolver, const TransferExecutor& executor) {
    const size_t limit = settings.maxConcurrentTransfers;
    TransferPool pool(executor, limit, runId);
    std::deque<std::future<TransferResult>> inFlight;
    bool cancelled = false;
    bool fatal = false;
    std::string fatalMessage;

    // 按派发顺序收取结果
    auto collectFront = [&]() {
        std::future<TransferResult> next = std::move(inFlight.front());
        inFlight.pop_front();
        try {
            recordItem(next.get());
        } catch (const ConnectorError& e) {
            // 目标不可用的条目不计入结果，作业以第一个错误失败
            if (!fatal) {
                fatal = true;
                fatalMessage = e.what();
            }
            std::lock_guard<std::mutex> lock(resultMutex);
            --itemsQueued;
        }
    };

    Candidate candidate;
    while (!fatal) {
        if (control && control->checkpoint()) {
            cancelled = true;
            break;
        }
        if (!enumerator.next(candidate)) {
            break;
        }
        if (!isSelected(candidate)) {
            continue;
        }
        while (inFlight.size() >= limit && !fatal) {
            collectFront();
        }
        if (fatal) {
            break;
        }
        {
            std::lock_guard<std::mutex> lock(resultMutex);
            ++itemsQueued;
        }
        // 解析在派发线程上完成，名称分配顺序与枚举顺序一致
        PlanItem plan;
        try {
            plan = resolver.resolve(candidate, job.conflictPolicy);
        } catch (const ConnectorError& e) {
            fatal = true;
            fatalMessage = e.what();
            std::lock_guard<std::mutex> lock(resultMutex);
            --itemsQueued;
            break;
        } catch (const std::exception& e) {
            if (logger) {
                logger->error("Cannot plan " + candidate.getRelativePath() + ": " + e.what());
            }
            recordItem(failedItem(candidate, e.what()));
            continue;
        }
        inFlight.push_back(pool.submit(plan));
    }

    while (!inFlight.empty()) {
        collectFront();
    }
    if (fatal) {
        throw ConnectorError(fatalMessage);
    }
    return cancelled;
}

JobResult JobRunner::finish(JobStatus finalStatus, const std::string& message) {
    status = finalStatus;
    std::lock_guard<std::mutex> lock(resultMutex);
    result.status = finalStatus;
    result.endTime = std::chrono::system_clock::now();
    result.errorMessage = message;

    if (logger) {
        std::string line = "Backup " + toString(finalStatus) + ": " + result.summary();
        if (!message.empty()) {
            line += " (" + message + ")";
        }
        if (finalStatus == JobStatus::COMPLETED) {
            logger->info(line);
        } else if (finalStatus == JobStatus::FAILED) {
            logger->error(line);
        } else {
            logger->warn(line);
        }
    }
    if (sink) {
        sink->onJobResult(result);
    }
    return result;
}

JobResult JobRunner::execute() {
    {
        std::lock_guard<std::mutex> lock(resultMutex);
        result = JobResult();
        result.jobName = job.name;
        result.startTime = std::chrono::system_clock::now();
        itemsQueued = 0;
        bytesDone = 0;
    }
    status = JobStatus::RUNNING;

    try {
        runId = Checksum::randomHex(8);
    } catch (const std::exception& e) {
        runId.clear();
        return finish(JobStatus::FAILED, e.what());
    }
    result.runId = runId;

    if (logger) {
        logger->info("Starting backup [" + runId + "]: " + job.describe());
    }

    // 1. 作业定义校验，不做任何 I/O
    try {
        job.validate();
    } catch (const ValidationError& e) {
        if (logger) {
            logger->error(std::string("Invalid job definition: ") + e.what());
        }
        return finish(JobStatus::FAILED, e.what());
    }

    for (const auto& root : job.sourceRoots) {
        if (!FileSystem::exists(root)) {
            if (logger) {
                logger->error("Source not found: " + root);
            }
            return finish(JobStatus::FAILED, "Source root does not exist: " + root);
        }
    }

    // 2. 目标端准备
    try {
        connector.prepare();
    } catch (const ConnectorError& e) {
        if (logger) {
            logger->error(std::string("Target unavailable: ") + e.what());
        }
        return finish(JobStatus::FAILED, e.what());
    }

    Matcher matcher(job.includePatterns, job.excludePatterns, settings.caseSensitive);
    if (logger) {
        logger->debug("Filter: " + matcher.getFilterDescription());
    }
    Enumerator enumerator(job.sourceRoots, matcher, logger, [this](const EnumerationWarning& warning) {
        std::lock_guard<std::mutex> lock(resultMutex);
        result.warnings.push_back(warning);
    });
    // 目标目录在源目录之内时不能把本次的输出再备份一遍
    std::string targetRoot = connector.localRoot();
    if (!targetRoot.empty()) {
        enumerator.excludeTree(targetRoot);
    }
    ConflictResolver resolver(connector, logger);
    TransferExecutor executor(connector, logger, settings);

    // 3. 逐条处理
    bool cancelled = false;
    try {
        if (settings.maxConcurrentTransfers > 1) {
            cancelled = runConcurrent(enumerator, resolver, executor);
        } else {
            cancelled = runSequential(enumerator, resolver, executor);
        }
    } catch (const ConnectorError& e) {
        if (logger) {
            logger->error(std::string("Target became unavailable: ") + e.what());
        }
        return finish(JobStatus::FAILED, e.what());
    } catch (const std::exception& e) {
        return finish(JobStatus::FAILED, e.what());
    }

    if (cancelled) {
        return finish(JobStatus::ABORTED, "Cancelled");
    }
    bool hasFailures;
    {
        std::lock_guard<std::mutex> lock(resultMutex);
        hasFailures = result.filesFailed > 0;
    }
    return finish(hasFailures ? JobStatus::COMPLETED_WITH_ERRORS : JobStatus::COMPLETED);
}

JobResult JobRunner::failedBeforeStart(const JobDefinition& definition, const std::string& message,
                                       ILogger* log, IRecordSink* recordSink) {
    JobResult failed;
    failed.jobName = definition.name;
    failed.status = JobStatus::FAILED;
    failed.startTime = std::chrono::system_clock::now();
    failed.endTime = failed.startTime;
    failed.errorMessage = message;
    if (log) {
        log->error("Backup FAILED: " + message);
    }
    if (recordSink) {
        recordSink->onJobResult(failed);
    }
    return failed;
}
