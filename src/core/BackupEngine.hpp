#pragma once
#include <string>
#include <memory>
#include "EngineSettings.hpp"
#include "models/JobDefinition.hpp"
#include "models/JobResult.hpp"

class ILogger;
class IRecordSink;
class ITargetConnector;
class RunControl;

class BackupEngine {
public:
    // 按目标类型创建连接器，未知类型抛出 ValidationError
    static std::unique_ptr<ITargetConnector> createConnector(const TargetDescriptor& target,
                                                             const EngineSettings& settings, ILogger* logger);

    static JobResult backup(const JobDefinition& job, const EngineSettings& settings, ILogger* logger,
                            IRecordSink* sink = nullptr, RunControl* control = nullptr);
};
