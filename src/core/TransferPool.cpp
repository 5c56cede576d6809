#include "TransferPool.hpp"
#include "TransferExecutor.hpp"
#include <exception>
#include <utility>

TransferPool::TransferPool(const TransferExecutor& transferExecutor, size_t workerCount, const std::string& id)
    : executor(transferExecutor), runId(id), stopping(false) {
    if (workerCount == 0) {
        workerCount = 1;
    }
    for (size_t i = 0; i < workerCount; ++i) {
        workers.emplace_back(&TransferPool::workerLoop, this);
    }
}

TransferPool::~TransferPool() {
    {
        std::lock_guard<std::mutex> lock(queueMutex);
        stopping = true;
    }
    condition.notify_all();
    for (auto& worker : workers) {
        worker.join();
    }
}

std::future<TransferResult> TransferPool::submit(const PlanItem& plan) {
    Job job;
    job.plan = plan;
    std::future<TransferResult> future = job.promise.get_future();
    {
        std::lock_guard<std::mutex> lock(queueMutex);
        jobs.push(std::move(job));
    }
    condition.notify_one();
    return future;
}

void TransferPool::workerLoop() {
    for (;;) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(queueMutex);
            condition.wait(lock, [this]() { return stopping || !jobs.empty(); });
            // 停止时仍把队列中剩余的条目做完
            if (jobs.empty()) {
                return;
            }
            job = std::move(jobs.front());
            jobs.pop();
        }

        try {
            job.promise.set_value(executor.execute(job.plan, runId));
        } catch (...) {
            // 异常交给 future 的持有者处理
            job.promise.set_exception(std::current_exception());
        }
    }
}
