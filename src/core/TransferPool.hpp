#pragma once
#include <string>
#include <vector>
#include <queue>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <future>
#include <cstddef>
#include "models/TransferResult.hpp"

class TransferExecutor;

// 固定数量的传输线程。条目按提交顺序取出执行，
// 结果（包括 ConnectorError）通过 future 交回派发线程。
class TransferPool {
private:
    struct Job {
        PlanItem plan;
        std::promise<TransferResult> promise;
    };

    const TransferExecutor& executor;
    std::string runId;

    std::vector<std::thread> workers;
    std::queue<Job> jobs;
    std::mutex queueMutex;
    std::condition_variable condition;
    bool stopping;

    void workerLoop();

public:
    TransferPool(const TransferExecutor& transferExecutor, size_t workerCount, const std::string& id);
    // 等待已提交的条目全部执行完再返回
    ~TransferPool();

    TransferPool(const TransferPool&) = delete;
    TransferPool& operator=(const TransferPool&) = delete;

    std::future<TransferResult> submit(const PlanItem& plan);

    size_t size() const {
        return this->workers.size();
    }
};
