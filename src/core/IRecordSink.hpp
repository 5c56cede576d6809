#pragma once
#include "models/TransferResult.hpp"
#include "models/JobResult.hpp"

// 运行记录的接收方。JobRunner 保证调用是串行的：
// 每个条目一次 onItemResult + onProgress，运行结束一次 onJobResult。
class IRecordSink {
public:
    virtual ~IRecordSink() = default;
    virtual void onProgress(const ProgressEvent& event) = 0;
    virtual void onItemResult(const TransferResult& result) = 0;
    virtual void onJobResult(const JobResult& result) = 0;
};
