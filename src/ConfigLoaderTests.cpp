#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>
#include "core/ConfigLoader.hpp"
#include "core/Errors.hpp"

namespace fs = std::filesystem;

// 完整配置
TEST(ConfigLoaderTest, FullDocument) {
    JobFile file = ConfigLoader::loadString(R"(
settings:
  chunk_size_kb: 128
  case_sensitive: false
  preserve_timestamps: false
  scratch_directory: /tmp/scratch
  max_concurrent_transfers: 4
  cleanup_stale_staging: false
  log_level: DEBUG
  log_file: /tmp/safebackup.log
job:
  name: documents
  sources:
    - /home/user/docs
    - /home/user/sheets
  include: "*.docx;*.xlsx"
  exclude:
    - "*/temp/*"
    - "*.tmp"
  target:
    kind: local
    location: /mnt/backup
  conflict_policy: skip
  only_paths:
    - report.docx
)");

    EXPECT_EQ(file.settings.chunkSize, 128u * 1024);
    EXPECT_FALSE(file.settings.caseSensitive);
    EXPECT_FALSE(file.settings.preserveTimestamps);
    EXPECT_EQ(file.settings.scratchDirectory, "/tmp/scratch");
    EXPECT_EQ(file.settings.maxConcurrentTransfers, 4u);
    EXPECT_FALSE(file.settings.cleanupStaleStaging);
    EXPECT_EQ(file.settings.logLevel, LogLevel::DEBUG);
    EXPECT_EQ(file.settings.logFile, "/tmp/safebackup.log");

    EXPECT_EQ(file.job.name, "documents");
    ASSERT_EQ(file.job.sourceRoots.size(), 2u);
    EXPECT_EQ(file.job.sourceRoots[1], "/home/user/sheets");
    ASSERT_EQ(file.job.includePatterns.size(), 2u);
    EXPECT_EQ(file.job.includePatterns[1], "*.xlsx");
    ASSERT_EQ(file.job.excludePatterns.size(), 2u);
    EXPECT_EQ(file.job.excludePatterns[0], "*/temp/*");
    EXPECT_EQ(file.job.target.kind, "local");
    EXPECT_EQ(file.job.target.location, "/mnt/backup");
    EXPECT_EQ(file.job.conflictPolicy, ConflictPolicy::SKIP);
    EXPECT_EQ(file.job.onlyPaths.count("report.docx"), 1u);
}

// 省略的字段使用默认值
TEST(ConfigLoaderTest, Defaults) {
    JobFile file = ConfigLoader::loadString(R"(
job:
  sources: /data
  target: /backup
)");
    EngineSettings defaults;
    EXPECT_EQ(file.settings.chunkSize, defaults.chunkSize);
    EXPECT_TRUE(file.settings.caseSensitive);
    EXPECT_EQ(file.settings.maxConcurrentTransfers, 1u);
    EXPECT_EQ(file.job.sourceRoots.size(), 1u);
    EXPECT_EQ(file.job.target.kind, "local");
    EXPECT_EQ(file.job.target.location, "/backup");
    EXPECT_EQ(file.job.conflictPolicy, ConflictPolicy::RENAME);
    EXPECT_TRUE(file.job.includePatterns.empty());
}

// settings 中的默认冲突策略作用于作业
TEST(ConfigLoaderTest, DefaultConflictPolicyFromSettings) {
    JobFile file = ConfigLoader::loadString(R"(
settings:
  default_conflict_policy: overwrite
job:
  sources: [/data]
  target: /backup
)");
    EXPECT_EQ(file.job.conflictPolicy, ConflictPolicy::OVERWRITE);
}

// 非法取值
TEST(ConfigLoaderTest, InvalidValues) {
    EXPECT_THROW(ConfigLoader::loadString("job:\n  conflict_policy: merge\n"), ValidationError);
    EXPECT_THROW(ConfigLoader::loadString("settings:\n  max_concurrent_transfers: 0\njob:\n  name: x\n"), ValidationError);
    EXPECT_THROW(ConfigLoader::loadString("settings:\n  chunk_size_kb: -1\njob:\n  name: x\n"), ValidationError);
    EXPECT_THROW(ConfigLoader::loadString("settings:\n  log_level: loud\njob:\n  name: x\n"), ValidationError);
    EXPECT_THROW(ConfigLoader::loadString("settings:\n  case_sensitive: maybe\njob:\n  name: x\n"), ValidationError);
    EXPECT_THROW(ConfigLoader::loadString("settings: {}\n"), ValidationError);
    EXPECT_THROW(ConfigLoader::loadString("- just\n- a list\n"), ValidationError);
    EXPECT_THROW(ConfigLoader::loadString("job: [unterminated\n"), ValidationError);
}

// 从文件读取
TEST(ConfigLoaderTest, LoadFile) {
    fs::path dir = fs::temp_directory_path() / "safebackup_config_test";
    fs::create_directories(dir);
    fs::path path = dir / "job.yaml";
    std::ofstream(path) << "job:\n  name: nightly\n  sources: [/a, /b]\n  target: {location: /c}\n";

    JobFile file = ConfigLoader::loadFile(path.string());
    EXPECT_EQ(file.job.name, "nightly");
    EXPECT_EQ(file.job.sourceRoots.size(), 2u);
    EXPECT_EQ(file.job.target.location, "/c");

    EXPECT_THROW(ConfigLoader::loadFile((dir / "missing.yaml").string()), ValidationError);
    fs::remove_all(dir);
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
