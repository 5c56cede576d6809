#pragma once
#include <cstddef>
#include <cstdint>
#include <istream>
#include <string>

struct evp_md_ctx_st;

// 流式 SHA-256 计算（基于 OpenSSL EVP）
class Sha256 {
private:
    evp_md_ctx_st* ctx;
    bool finished;

public:
    Sha256();
    ~Sha256();

    Sha256(const Sha256&) = delete;
    Sha256& operator=(const Sha256&) = delete;

    // 追加数据，OpenSSL 出错时抛出 std::runtime_error
    void update(const void* data, size_t length);

    // 返回小写十六进制摘要，之后不能再调用 update
    std::string finalHex();
};

class Checksum {
public:
    // 按块读取整个流并计算 SHA-256，读取失败抛出 std::runtime_error
    static std::string sha256Hex(std::istream& in, size_t chunkSize = 64 * 1024);

    // 计算文件的 SHA-256，打开失败抛出 std::runtime_error
    static std::string sha256File(const std::string& path, size_t chunkSize = 64 * 1024);

    static std::string sha256String(const std::string& data);

    // 生成 byteCount 个随机字节的十六进制表示（用于运行 ID 与暂存文件名）
    static std::string randomHex(size_t byteCount);

    static std::string toHex(const uint8_t* data, size_t length);
};
