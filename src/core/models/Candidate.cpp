#include "Candidate.hpp"

Candidate::Candidate()
    : fileSize(0), modificationTime(), hasModificationTime(false), matched(false) {}

Candidate::Candidate(const fs::path& path, const std::string& relative)
    : fileSize(0), modificationTime(), hasModificationTime(false), matched(false) {
    initialize(path, relative);
}

bool Candidate::initialize(const fs::path& path, const std::string& relative) {
    this->absolutePath = path;
    this->relativePath = relative;
    this->fileSize = 0;
    this->hasModificationTime = false;

    // 这里使用 status 而不是 symlink_status：符号链接指向的内容才是要备份的数据
    std::error_code ec;
    auto size = fs::file_size(path, ec);
    if (ec) {
        return false;
    }
    this->fileSize = size;

    std::error_code timeEc;
    auto fileTime = fs::last_write_time(path, timeEc);
    if (!timeEc) {
        this->modificationTime = fileTime;
        this->hasModificationTime = true;
    }
    return true;
}

const fs::path& Candidate::getAbsolutePath() const {
    return this->absolutePath;
}

const std::string& Candidate::getRelativePath() const {
    return this->relativePath;
}

std::string Candidate::getFileName() const {
    return this->absolutePath.filename().string();
}

uint64_t Candidate::getFileSize() const {
    return this->fileSize;
}

fs::file_time_type Candidate::getModificationTime() const {
    return this->modificationTime;
}

bool Candidate::getHasModificationTime() const {
    return this->hasModificationTime;
}

bool Candidate::isMatched() const {
    return this->matched;
}

void Candidate::setMatched(bool value) {
    this->matched = value;
}

bool Candidate::operator==(const Candidate& other) const {
    return this->absolutePath == other.absolutePath && this->relativePath == other.relativePath;
}

bool Candidate::operator!=(const Candidate& other) const {
    return !(*this == other);
}
