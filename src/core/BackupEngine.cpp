// core/BackupEngine.cpp
#include "BackupEngine.hpp"
#include "Errors.hpp"
#include "JobRunner.hpp"
#include "connectors/LocalTargetConnector.hpp"
#include <memory>

std::unique_ptr<ITargetConnector> BackupEngine::createConnector(const TargetDescriptor& target,
                                                                const EngineSettings& settings, ILogger* logger) {
    if (target.kind == "local") {
        return std::make_unique<LocalTargetConnector>(
            target.location, logger, settings.scratchDirectory, settings.cleanupStaleStaging);
    }
    throw ValidationError("Unknown target kind: '" + target.kind + "'");
}

JobResult BackupEngine::backup(const JobDefinition& job, const EngineSettings& settings, ILogger* logger,
                               IRecordSink* sink, RunControl* control) {
    std::unique_ptr<ITargetConnector> connector;
    try {
        job.validate();
        connector = createConnector(job.target, settings, logger);
    } catch (const ValidationError& e) {
        return JobRunner::failedBeforeStart(job, e.what(), logger, sink);
    }
    JobRunner runner(job, *connector, logger, sink, settings, control);
    return runner.execute();
}
