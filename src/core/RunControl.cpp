#include "RunControl.hpp"
#include <chrono>

RunControl::RunControl(const std::atomic<bool>* interruptFlag)
    : cancelRequested(false), paused(false), externalInterrupt(interruptFlag) {}

void RunControl::requestCancel() {
    {
        std::lock_guard<std::mutex> lock(mutex);
        cancelRequested = true;
    }
    // 唤醒处于暂停中的运行
    cv.notify_all();
}

bool RunControl::isCancelRequested() const {
    return cancelRequested || (externalInterrupt && externalInterrupt->load());
}

void RunControl::pause() {
    std::lock_guard<std::mutex> lock(mutex);
    paused = true;
}

void RunControl::resume() {
    {
        std::lock_guard<std::mutex> lock(mutex);
        paused = false;
    }
    cv.notify_all();
}

bool RunControl::isPaused() const {
    return paused;
}

bool RunControl::checkpoint() {
    std::unique_lock<std::mutex> lock(mutex);
    while (paused && !isCancelRequested()) {
        // 外部中断标志不会 notify，定期醒来检查
        cv.wait_for(lock, std::chrono::milliseconds(200));
    }
    return isCancelRequested();
}
