#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <filesystem>
#include <fstream>
#include <string>
#include <yaml-cpp/yaml.h>
#include "core/RecordSinks.hpp"
#include "utils/ILogger.hpp"

namespace fs = std::filesystem;
using ::testing::_;
using ::testing::HasSubstr;
using ::testing::NiceMock;

// 模拟ILogger接口
class MockLogger : public ILogger {
public:
    MOCK_METHOD(void, info, (const std::string& message), (override));
    MOCK_METHOD(void, error, (const std::string& message), (override));
    MOCK_METHOD(void, warn, (const std::string& message), (override));
    MOCK_METHOD(void, debug, (const std::string& message), (override));
    MOCK_METHOD(void, setLogLevel, (LogLevel level), (override));
    MOCK_METHOD(LogLevel, getLogLevel, (), (const, override));
    MOCK_METHOD(void, log, (LogLevel level, const std::string& message), (override));
};

class MockRecordSink : public IRecordSink {
public:
    MOCK_METHOD(void, onProgress, (const ProgressEvent& event), (override));
    MOCK_METHOD(void, onItemResult, (const TransferResult& result), (override));
    MOCK_METHOD(void, onJobResult, (const JobResult& result), (override));
};

class RecordSinksTest : public ::testing::Test {
protected:
    fs::path testDir = fs::temp_directory_path() / "safebackup_sinks_test";
    NiceMock<MockLogger> logger;
    JobResult job;

    void SetUp() override {
        fs::create_directories(testDir);

        TransferResult written;
        written.runId = "0011223344556677";
        written.sourcePath = "/data/report.docx";
        written.relativePath = "report.docx";
        written.destinationPath = "report (1).docx";
        written.action = PlanAction::RENAME;
        written.status = TransferStatus::SUCCEEDED;
        written.bytesTransferred = 17;
        written.checksum = "abc123";

        TransferResult failed;
        failed.runId = written.runId;
        failed.sourcePath = "/data/notes.txt";
        failed.relativePath = "notes.txt";
        failed.destinationPath = "notes.txt";
        failed.status = TransferStatus::VERIFICATION_FAILED;
        failed.errorMessage = "Checksum mismatch";

        job.runId = written.runId;
        job.jobName = "documents";
        job.status = JobStatus::COMPLETED_WITH_ERRORS;
        job.filesConsidered = 2;
        job.filesWritten = 1;
        job.filesFailed = 1;
        job.totalBytes = 17;
        job.startTime = std::chrono::system_clock::now();
        job.endTime = job.startTime;
        job.items = {written, failed};
        job.warnings.push_back(EnumerationWarning{"/data/loop", "symbolic link cycle skipped"});
    }

    void TearDown() override {
        fs::remove_all(testDir);
    }
};

// YAML 报告包含计数、条目和警告
TEST_F(RecordSinksTest, YamlReportContents) {
    fs::path reportPath = testDir / "report.yaml";
    YamlReportSink sink(reportPath.string(), &logger);
    sink.onJobResult(job);
    ASSERT_TRUE(sink.isWritten());

    YAML::Node report = YAML::LoadFile(reportPath.string());
    EXPECT_EQ(report["run_id"].as<std::string>(), "0011223344556677");
    EXPECT_EQ(report["status"].as<std::string>(), "COMPLETED_WITH_ERRORS");
    EXPECT_EQ(report["counts"]["considered"].as<int>(), 2);
    EXPECT_EQ(report["counts"]["failed"].as<int>(), 1);
    ASSERT_EQ(report["items"].size(), 2u);
    EXPECT_EQ(report["items"][0]["destination"].as<std::string>(), "report (1).docx");
    EXPECT_EQ(report["items"][0]["action"].as<std::string>(), "rename");
    EXPECT_EQ(report["items"][0]["sha256"].as<std::string>(), "abc123");
    EXPECT_EQ(report["items"][1]["error"].as<std::string>(), "Checksum mismatch");
    EXPECT_FALSE(report["items"][1]["sha256"]);
    ASSERT_EQ(report["warnings"].size(), 1u);
    EXPECT_EQ(report["warnings"][0]["path"].as<std::string>(), "/data/loop");
}

// 报告路径不可写时只记录错误
TEST_F(RecordSinksTest, YamlReportUnwritable) {
    EXPECT_CALL(logger, error(HasSubstr("report"))).Times(1);
    YamlReportSink sink((testDir / "missing_dir" / "report.yaml").string(), &logger);
    sink.onJobResult(job);
    EXPECT_FALSE(sink.isWritten());
}

// 日志 sink：失败条目记为警告，作业结果按状态选级别
TEST_F(RecordSinksTest, LoggingSinkLevels) {
    EXPECT_CALL(logger, warn(HasSubstr("notes.txt"))).Times(1);
    EXPECT_CALL(logger, warn(HasSubstr("finished"))).Times(1);
    EXPECT_CALL(logger, debug(HasSubstr("report.docx"))).Times(1);

    LoggingRecordSink sink(&logger);
    sink.onItemResult(job.items[0]);
    sink.onItemResult(job.items[1]);
    sink.onJobResult(job);
}

// 进度按间隔输出
TEST_F(RecordSinksTest, LoggingSinkProgressInterval) {
    EXPECT_CALL(logger, info(HasSubstr("Progress: 2/"))).Times(1);
    LoggingRecordSink sink(&logger, 2);
    ProgressEvent event;
    for (uint64_t i = 1; i <= 3; ++i) {
        event.itemsDone = i;
        event.itemsTotalSoFar = 3;
        sink.onProgress(event);
    }
}

// 组合 sink 转发给每个成员
TEST_F(RecordSinksTest, CompositeForwards) {
    MockRecordSink first;
    MockRecordSink second;
    EXPECT_CALL(first, onItemResult(_)).Times(2);
    EXPECT_CALL(second, onItemResult(_)).Times(2);
    EXPECT_CALL(first, onProgress(_)).Times(1);
    EXPECT_CALL(second, onProgress(_)).Times(1);
    EXPECT_CALL(first, onJobResult(_)).Times(1);
    EXPECT_CALL(second, onJobResult(_)).Times(1);

    CompositeRecordSink composite;
    EXPECT_TRUE(composite.empty());
    composite.add(&first);
    composite.add(nullptr);
    composite.add(&second);
    EXPECT_FALSE(composite.empty());

    composite.onItemResult(job.items[0]);
    composite.onItemResult(job.items[1]);
    composite.onProgress(ProgressEvent());
    composite.onJobResult(job);
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    ::testing::InitGoogleMock(&argc, argv);
    return RUN_ALL_TESTS();
}
