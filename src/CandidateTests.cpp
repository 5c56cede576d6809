#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>
#include "core/models/Candidate.hpp"

namespace fs = std::filesystem;

// Candidate类测试用例
class CandidateTest : public ::testing::Test {
protected:
    fs::path testDir = fs::temp_directory_path() / "safebackup_candidate_test";
    fs::path testFile = testDir / "docs" / "report.docx";

    void SetUp() override {
        fs::create_directories(testFile.parent_path());
        std::ofstream(testFile) << "This is a test file.";
    }

    void TearDown() override {
        fs::remove_all(testDir);
    }
};

// 测试读取文件属性
TEST_F(CandidateTest, InitializeReadsAttributes) {
    Candidate candidate(testFile, "docs/report.docx");
    EXPECT_EQ(candidate.getAbsolutePath(), testFile);
    EXPECT_EQ(candidate.getRelativePath(), "docs/report.docx");
    EXPECT_EQ(candidate.getFileName(), "report.docx");
    EXPECT_EQ(candidate.getFileSize(), 20u);
    EXPECT_TRUE(candidate.getHasModificationTime());
    EXPECT_EQ(candidate.getModificationTime(), fs::last_write_time(testFile));
}

// 测试不存在的文件
TEST_F(CandidateTest, MissingFile) {
    Candidate candidate;
    EXPECT_FALSE(candidate.initialize(testDir / "missing.txt", "missing.txt"));
    EXPECT_EQ(candidate.getFileSize(), 0u);
    EXPECT_FALSE(candidate.getHasModificationTime());
}

TEST_F(CandidateTest, Equality) {
    Candidate a(testFile, "docs/report.docx");
    Candidate b(testFile, "docs/report.docx");
    Candidate c(testFile, "report.docx");
    EXPECT_TRUE(a == b);
    EXPECT_TRUE(a != c);
    EXPECT_FALSE(a.isMatched());
    a.setMatched(true);
    EXPECT_TRUE(a.isMatched());
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
