// common/utils/cancellation.h
#ifndef AGENTGRAPH_COMMON_UTILS_CANCELLATION_H
#define AGENTGRAPH_COMMON_UTILS_CANCELLATION_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace agentgraph {

// 每次运行一个；并发分支与能力调用共享
class CancellationToken {
public:
    void cancel() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            cancelled_.store(true);
        }
        cv_.notify_all();
    }

    bool is_cancelled() const { return cancelled_.load(); }

    // 等待 timeout 或取消；返回 true 表示已取消
    template <typename Rep, typename Period>
    bool wait_for(std::chrono::duration<Rep, Period> timeout) const {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this] { return cancelled_.load(); });
    }

private:
    std::atomic<bool> cancelled_{false};
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
};

} // namespace agentgraph

#endif // AGENTGRAPH_COMMON_UTILS_CANCELLATION_H
