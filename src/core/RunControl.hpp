#pragma once
#include <atomic>
#include <mutex>
#include <condition_variable>

// 运行控制：取消、暂停、恢复。
// 只在条目之间检查，正在复制的文件总会完成或干净地失败。
class RunControl {
private:
    std::atomic<bool> cancelRequested;
    std::atomic<bool> paused;
    // 外部中断标志（例如信号处理函数设置），可为空
    const std::atomic<bool>* externalInterrupt;
    std::mutex mutex;
    std::condition_variable cv;

public:
    explicit RunControl(const std::atomic<bool>* interruptFlag = nullptr);

    void requestCancel();
    bool isCancelRequested() const;

    void pause();
    void resume();
    bool isPaused() const;

    // 条目边界调用：暂停时阻塞直到恢复或取消。返回 true 表示应当中止运行。
    bool checkpoint();
};
