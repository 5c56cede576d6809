#include "Checksum.hpp"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <fstream>
#include <stdexcept>
#include <vector>

Sha256::Sha256() : ctx(EVP_MD_CTX_new()), finished(false) {
    if (!ctx) {
        throw std::runtime_error("Failed to allocate digest context");
    }
    if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1) {
        EVP_MD_CTX_free(ctx);
        throw std::runtime_error("Failed to initialize SHA-256 digest");
    }
}

Sha256::~Sha256() {
    EVP_MD_CTX_free(ctx);
}

void Sha256::update(const void* data, size_t length) {
    if (finished) {
        throw std::logic_error("Digest already finalized");
    }
    if (length == 0) {
        return;
    }
    if (EVP_DigestUpdate(ctx, data, length) != 1) {
        throw std::runtime_error("SHA-256 update failed");
    }
}

std::string Sha256::finalHex() {
    if (finished) {
        throw std::logic_error("Digest already finalized");
    }
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLength = 0;
    if (EVP_DigestFinal_ex(ctx, digest, &digestLength) != 1) {
        throw std::runtime_error("SHA-256 finalization failed");
    }
    finished = true;
    return Checksum::toHex(digest, digestLength);
}

std::string Checksum::sha256Hex(std::istream& in, size_t chunkSize) {
    Sha256 hasher;
    std::vector<char> buffer(chunkSize > 0 ? chunkSize : 64 * 1024);
    while (in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize got = in.gcount();
        if (got > 0) {
            hasher.update(buffer.data(), static_cast<size_t>(got));
        }
    }
    // eof 是正常结束，badbit 表示读取出错
    if (in.bad()) {
        throw std::runtime_error("Read error while computing checksum");
    }
    return hasher.finalHex();
}

std::string Checksum::sha256File(const std::string& path, size_t chunkSize) {
    std::ifstream inFile(path, std::ios::binary);
    if (!inFile) {
        throw std::runtime_error("Failed to open file for checksum: " + path);
    }
    return sha256Hex(inFile, chunkSize);
}

std::string Checksum::sha256String(const std::string& data) {
    Sha256 hasher;
    hasher.update(data.data(), data.size());
    return hasher.finalHex();
}

std::string Checksum::randomHex(size_t byteCount) {
    std::vector<uint8_t> bytes(byteCount);
    if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
        throw std::runtime_error("Failed to generate random bytes");
    }
    return toHex(bytes.data(), bytes.size());
}

std::string Checksum::toHex(const uint8_t* data, size_t length) {
    static const char* hex = "0123456789abcdef";
    std::string result;
    result.reserve(length * 2);
    for (size_t i = 0; i < length; ++i) {
        result += hex[(data[i] >> 4) & 0xF];
        result += hex[data[i] & 0xF];
    }
    return result;
}
