#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <filesystem>
#include <fstream>
#include <future>
#include <string>
#include <vector>
#include "core/Errors.hpp"
#include "core/TransferExecutor.hpp"
#include "core/TransferPool.hpp"
#include "core/connectors/LocalTargetConnector.hpp"
#include "utils/ILogger.hpp"

namespace fs = std::filesystem;
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

class TransferPoolTest : public ::testing::Test {
protected:
    fs::path testDir = fs::temp_directory_path() / "safebackup_pool_test";
    fs::path sourceDir = testDir / "source";
    fs::path targetDir = testDir / "target";
    NiceMock<MockLogger> logger;
    EngineSettings settings;

    void SetUp() override {
        fs::remove_all(testDir);
        fs::create_directories(sourceDir);
        for (int i = 0; i < 12; ++i) {
            std::ofstream(sourceDir / ("file" + std::to_string(i) + ".txt")) << "content " << i;
        }
    }

    void TearDown() override {
        fs::remove_all(testDir);
    }

    PlanItem plan(int i) {
        std::string name = "file" + std::to_string(i) + ".txt";
        PlanItem item;
        item.candidate = Candidate(sourceDir / name, name);
        item.destinationPath = name;
        return item;
    }
};

// 每个 future 对应各自提交的条目
TEST_F(TransferPoolTest, ResultsMatchSubmissions) {
    LocalTargetConnector connector(targetDir.string(), &logger);
    connector.prepare();
    TransferExecutor executor(connector, &logger, settings);

    std::vector<std::future<TransferResult>> futures;
    {
        TransferPool pool(executor, 4, "run42");
        EXPECT_EQ(pool.size(), 4u);
        for (int i = 0; i < 12; ++i) {
            futures.push_back(pool.submit(plan(i)));
        }
    }

    for (int i = 0; i < 12; ++i) {
        TransferResult result = futures[i].get();
        EXPECT_EQ(result.status, TransferStatus::SUCCEEDED);
        EXPECT_EQ(result.runId, "run42");
        EXPECT_EQ(result.destinationPath, "file" + std::to_string(i) + ".txt");
        EXPECT_TRUE(fs::exists(targetDir / result.destinationPath));
    }
}

// 目标不可用的 ConnectorError 通过 future 传回
TEST_F(TransferPoolTest, ConnectorErrorReachesCaller) {
    LocalTargetConnector connector(targetDir.string(), &logger);
    connector.prepare();
    fs::remove_all(targetDir);
    TransferExecutor executor(connector, &logger, settings);

    TransferPool pool(executor, 0, "run1");
    EXPECT_EQ(pool.size(), 1u);
    std::future<TransferResult> future = pool.submit(plan(0));
    EXPECT_THROW(future.get(), ConnectorError);
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    ::testing::InitGoogleMock(&argc, argv);
    return RUN_ALL_TESTS();
}
