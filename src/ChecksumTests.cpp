#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <set>
#include "utils/Checksum.hpp"

namespace fs = std::filesystem;

class ChecksumTest : public ::testing::Test {
protected:
    fs::path testDir = fs::temp_directory_path() / "safebackup_checksum_test";

    void SetUp() override {
        fs::create_directories(testDir);
    }

    void TearDown() override {
        fs::remove_all(testDir);
    }
};

// 已知向量
TEST_F(ChecksumTest, KnownDigests) {
    EXPECT_EQ(Checksum::sha256String(""),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(Checksum::sha256String("abc"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

// 分块大小不影响结果
TEST_F(ChecksumTest, ChunkSizeDoesNotChangeDigest) {
    std::string data(100000, 'x');
    for (size_t i = 0; i < data.size(); i += 7) {
        data[i] = static_cast<char>('a' + i % 26);
    }
    std::istringstream small(data);
    std::istringstream large(data);
    EXPECT_EQ(Checksum::sha256Hex(small, 13), Checksum::sha256Hex(large, 64 * 1024));
    std::istringstream again(data);
    EXPECT_EQ(Checksum::sha256String(data), Checksum::sha256Hex(again));
}

// 增量 update 与一次性计算一致
TEST_F(ChecksumTest, IncrementalUpdate) {
    Sha256 hash;
    hash.update("a", 1);
    hash.update("bc", 2);
    EXPECT_EQ(hash.finalHex(), Checksum::sha256String("abc"));
}

TEST_F(ChecksumTest, FileDigest) {
    fs::path file = testDir / "data.bin";
    std::ofstream(file, std::ios::binary) << "Content of file 1";
    EXPECT_EQ(Checksum::sha256File(file.string()), Checksum::sha256String("Content of file 1"));
    EXPECT_THROW(Checksum::sha256File((testDir / "missing.bin").string()), std::runtime_error);
}

TEST_F(ChecksumTest, RandomHex) {
    std::set<std::string> seen;
    for (int i = 0; i < 16; ++i) {
        std::string value = Checksum::randomHex(8);
        EXPECT_EQ(value.size(), 16u);
        EXPECT_EQ(value.find_first_not_of("0123456789abcdef"), std::string::npos);
        seen.insert(value);
    }
    EXPECT_EQ(seen.size(), 16u);
}

TEST_F(ChecksumTest, ToHex) {
    const uint8_t bytes[] = {0x00, 0x0f, 0xa5, 0xff};
    EXPECT_EQ(Checksum::toHex(bytes, sizeof(bytes)), "000fa5ff");
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
