#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <filesystem>
#include <fstream>
#include <set>
#include <string>
#include <thread>
#include <vector>
#include <mutex>
#include "core/ConflictResolver.hpp"
#include "core/connectors/ITargetConnector.hpp"
#include "utils/ILogger.hpp"

namespace fs = std::filesystem;
using ::testing::_;
using ::testing::Return;
using ::testing::NiceMock;

// 只关心 exists 的目标连接器
class MockTargetConnector : public ITargetConnector {
public:
    MOCK_METHOD(void, prepare, (), (override));
    MOCK_METHOD(bool, exists, (const std::string& path), (override));
    MOCK_METHOD(std::unique_ptr<IStagingHandle>, openStagingWrite, (const std::string& finalPath), (override));
    MOCK_METHOD(std::unique_ptr<std::istream>, readStaged, (IStagingHandle& handle), (override));
    MOCK_METHOD(void, promote, (IStagingHandle& handle, const std::string& finalPath), (override));
    MOCK_METHOD(void, discard, (IStagingHandle& handle), (noexcept, override));
    MOCK_METHOD(std::unique_ptr<std::istream>, readBack, (const std::string& finalPath), (override));
    MOCK_METHOD(uint64_t, availableSpace, (), (override));
    MOCK_METHOD(std::string, describe, (), (const, override));
};

class ConflictResolverTest : public ::testing::Test {
protected:
    fs::path testDir = fs::temp_directory_path() / "safebackup_resolver_test";
    NiceMock<MockTargetConnector> connector;

    void SetUp() override {
        fs::create_directories(testDir / "docs");
        std::ofstream(testDir / "docs" / "report.docx") << "report";
        ON_CALL(connector, exists(_)).WillByDefault(Return(false));
    }

    void TearDown() override {
        fs::remove_all(testDir);
    }

    Candidate candidate(const std::string& relative = "docs/report.docx") {
        return Candidate(testDir / "docs" / "report.docx", relative);
    }
};

TEST_F(ConflictResolverTest, RenamedPath) {
    EXPECT_EQ(ConflictResolver::renamedPath("report.docx", 1), "report (1).docx");
    EXPECT_EQ(ConflictResolver::renamedPath("docs/report.docx", 12), "docs/report (12).docx");
    EXPECT_EQ(ConflictResolver::renamedPath("Makefile", 2), "Makefile (2)");
}

// 目标不存在时任何策略都直接写入
TEST_F(ConflictResolverTest, NoConflictWrites) {
    for (ConflictPolicy policy : {ConflictPolicy::OVERWRITE, ConflictPolicy::RENAME, ConflictPolicy::SKIP}) {
        ConflictResolver fresh(connector, nullptr);
        PlanItem item = fresh.resolve(candidate(), false, policy);
        EXPECT_EQ(item.action, PlanAction::WRITE);
        EXPECT_EQ(item.destinationPath, "docs/report.docx");
    }
}

TEST_F(ConflictResolverTest, SkipWhenExisting) {
    ConflictResolver resolver(connector, nullptr);
    PlanItem item = resolver.resolve(candidate(), true, ConflictPolicy::SKIP);
    EXPECT_EQ(item.action, PlanAction::SKIP);
    EXPECT_EQ(item.destinationPath, "docs/report.docx");
}

TEST_F(ConflictResolverTest, OverwriteWhenExisting) {
    ConflictResolver resolver(connector, nullptr);
    PlanItem item = resolver.resolve(candidate(), true, ConflictPolicy::OVERWRITE);
    EXPECT_EQ(item.action, PlanAction::WRITE);
    EXPECT_EQ(item.destinationPath, "docs/report.docx");
}

// 已存在 report.docx 时新文件写到 report (1).docx
TEST_F(ConflictResolverTest, RenameToFirstFreeSuffix) {
    EXPECT_CALL(connector, exists("docs/report (1).docx")).WillOnce(Return(true));
    EXPECT_CALL(connector, exists("docs/report (2).docx")).WillOnce(Return(false));

    ConflictResolver resolver(connector, nullptr);
    PlanItem item = resolver.resolve(candidate(), true, ConflictPolicy::RENAME);
    EXPECT_EQ(item.action, PlanAction::RENAME);
    EXPECT_EQ(item.destinationPath, "docs/report (2).docx");
    EXPECT_EQ(item.renameSuffix, 2u);
}

// 查询连接器的重载
TEST_F(ConflictResolverTest, QueriesConnectorForExistence) {
    EXPECT_CALL(connector, exists("docs/report.docx")).WillOnce(Return(true));
    ConflictResolver resolver(connector, nullptr);
    PlanItem item = resolver.resolve(candidate(), ConflictPolicy::RENAME);
    EXPECT_EQ(item.destinationPath, "docs/report (1).docx");
}

// 同一次运行内已分配的名字不会再分配
TEST_F(ConflictResolverTest, ClaimedNamesAreNotReused) {
    ConflictResolver resolver(connector, nullptr);
    PlanItem first = resolver.resolve(candidate(), false, ConflictPolicy::RENAME);
    PlanItem second = resolver.resolve(candidate(), false, ConflictPolicy::RENAME);
    PlanItem third = resolver.resolve(candidate(), false, ConflictPolicy::SKIP);

    EXPECT_EQ(first.destinationPath, "docs/report.docx");
    EXPECT_EQ(second.destinationPath, "docs/report (1).docx");
    EXPECT_EQ(third.action, PlanAction::SKIP);
}

// 候选名称耗尽
TEST_F(ConflictResolverTest, RenameExhaustionThrows) {
    ON_CALL(connector, exists(_)).WillByDefault(Return(true));
    ConflictResolver resolver(connector, nullptr);
    EXPECT_THROW(resolver.resolve(candidate(), true, ConflictPolicy::RENAME), std::runtime_error);
}

// 多线程同时解析同一目标时名称唯一
TEST_F(ConflictResolverTest, ConcurrentRenameAllocatesUniqueNames) {
    ConflictResolver resolver(connector, nullptr);
    std::mutex namesMutex;
    std::set<std::string> names;
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < 25; ++i) {
                PlanItem item = resolver.resolve(candidate(), false, ConflictPolicy::RENAME);
                std::lock_guard<std::mutex> lock(namesMutex);
                names.insert(item.destinationPath);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_EQ(names.size(), 200u);
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    ::testing::InitGoogleMock(&argc, argv);
    return RUN_ALL_TESTS();
}
