#include "TransferExecutor.hpp"
#include "Errors.hpp"
#include "connectors/ITargetConnector.hpp"
#include "../utils/Checksum.hpp"
#include "../utils/FileSystem.hpp"
#include "../utils/ILogger.hpp"
#include <chrono>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <vector>
#include <cerrno>

TransferExecutor::TransferExecutor(ITargetConnector& targetConnector, ILogger* log, const EngineSettings& settings)
    : connector(targetConnector), logger(log),
      chunkSize(settings.chunkSize > 0 ? settings.chunkSize : 64 * 1024),
      preserveTimestamps(settings.preserveTimestamps) {}

TransferResult TransferExecutor::makeResult(const PlanItem& item, const std::string& runId) const {
    TransferResult result;
    result.runId = runId;
    result.sourcePath = item.candidate.getAbsolutePath().string();
    result.relativePath = item.candidate.getRelativePath();
    result.destinationPath = item.destinationPath;
    result.action = item.action;
    return result;
}

TransferResult TransferExecutor::execute(const PlanItem& item, const std::string& runId) const {
    auto startTime = std::chrono::steady_clock::now();
    TransferResult result = makeResult(item, runId);

    auto finish = [&](TransferStatus status, const std::string& message) {
        result.status = status;
        result.errorMessage = message;
        result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - startTime);
        return result;
    };

    if (item.action == PlanAction::SKIP) {
        if (logger) {
            logger->debug("Skipped existing destination: " + item.destinationPath);
        }
        return finish(TransferStatus::SKIPPED, "");
    }

    const std::string sourcePath = item.candidate.getAbsolutePath().string();

    // 空间不足时不创建暂存文件
    uint64_t available = connector.availableSpace();
    if (available < item.candidate.getFileSize()) {
        std::string message = "Insufficient space on target: need " + std::to_string(item.candidate.getFileSize()) +
                              " bytes, " + std::to_string(available) + " available";
        if (logger) {
            logger->error("Copy failed: " + sourcePath + ": " + message);
        }
        return finish(TransferStatus::WRITE_FAILED, message);
    }

    std::ifstream source(item.candidate.getAbsolutePath(), std::ios::binary);
    if (!source) {
        int err = errno;
        std::string message = FileSystem::errnoMessage("Cannot open source file " + sourcePath, err);
        if (logger) {
            logger->error("Copy failed: " + message);
        }
        return finish(TransferStatus::WRITE_FAILED, message);
    }

    std::unique_ptr<IStagingHandle> staging;
    try {
        staging = connector.openStagingWrite(item.destinationPath);

        // 1. 流式复制，同时计算写入数据的 SHA-256
        Sha256 streamed;
        std::vector<char> buffer(chunkSize);
        while (source) {
            source.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            std::streamsize got = source.gcount();
            if (got > 0) {
                streamed.update(buffer.data(), static_cast<size_t>(got));
                staging->write(buffer.data(), static_cast<size_t>(got));
            }
        }
        if (source.bad()) {
            throw std::runtime_error("Read error on source file " + sourcePath);
        }
        staging->close();
        result.bytesTransferred = staging->bytesWritten();

        if (preserveTimestamps && item.candidate.getHasModificationTime()) {
            try {
                staging->setModificationTime(item.candidate.getModificationTime());
            } catch (const std::runtime_error& e) {
                if (logger) {
                    logger->warn(e.what());
                }
            }
        }

        // 2. 读回暂存内容重新计算校验和
        std::string streamedHex = streamed.finalHex();
        auto readBack = connector.readStaged(*staging);
        std::string stagedHex = Checksum::sha256Hex(*readBack, chunkSize);
        readBack.reset();

        if (streamedHex != stagedHex) {
            connector.discard(*staging);
            std::string message = "Checksum mismatch: streamed " + streamedHex + ", read back " + stagedHex;
            if (logger) {
                logger->error("Verification failed: " + sourcePath + " -> " + item.destinationPath + ": " + message);
            }
            return finish(TransferStatus::VERIFICATION_FAILED, message);
        }

        // 3. 校验通过后原子提升
        connector.promote(*staging, item.destinationPath);
        result.checksum = streamedHex;
    } catch (const ConnectorError&) {
        if (staging) {
            connector.discard(*staging);
        }
        throw;
    } catch (const std::exception& e) {
        if (staging) {
            result.bytesTransferred = staging->bytesWritten();
            connector.discard(*staging);
        }
        if (logger) {
            logger->error("Copy failed: " + sourcePath + " -> " + item.destinationPath + ": " + e.what());
        }
        return finish(TransferStatus::WRITE_FAILED, e.what());
    }

    if (logger) {
        logger->info("Copied " + sourcePath + " -> " + item.destinationPath + " (" +
                     std::to_string(result.bytesTransferred) + " bytes, sha256 " + result.checksum + ")");
    }
    return finish(TransferStatus::SUCCEEDED, "");
}
