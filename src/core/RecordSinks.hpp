#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include "IRecordSink.hpp"

class ILogger;

// 把记录写到日志
class LoggingRecordSink : public IRecordSink {
private:
    ILogger* logger;
    // 每隔多少个条目输出一次进度，0 表示不输出
    uint64_t progressInterval;

public:
    explicit LoggingRecordSink(ILogger* log, uint64_t progressEvery = 100);

    void onProgress(const ProgressEvent& event) override;
    void onItemResult(const TransferResult& result) override;
    void onJobResult(const JobResult& result) override;
};

// 运行结束时把作业结果写成 YAML 报告
class YamlReportSink : public IRecordSink {
private:
    std::string reportPath;
    ILogger* logger;
    bool written;

public:
    YamlReportSink(const std::string& path, ILogger* log);

    void onProgress(const ProgressEvent& event) override;
    void onItemResult(const TransferResult& result) override;
    void onJobResult(const JobResult& result) override;

    bool isWritten() const;

    // 报告内容，测试与写文件共用
    static std::string render(const JobResult& result);
};

// 转发给多个接收方，不持有它们
class CompositeRecordSink : public IRecordSink {
private:
    std::vector<IRecordSink*> sinks;

public:
    void add(IRecordSink* sink);
    bool empty() const;

    void onProgress(const ProgressEvent& event) override;
    void onItemResult(const TransferResult& result) override;
    void onJobResult(const JobResult& result) override;
};
