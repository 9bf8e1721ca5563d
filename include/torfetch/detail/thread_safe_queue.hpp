#pragma once

#include <condition_variable>
#include <mutex>
#include <queue>
#include <utility>

namespace torfetch::detail {

template <typename T>
class ThreadSafeQueue {
public:
    void push(T value) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            queue_.push(std::move(value));
        }
        ready_.notify_one();
    }

    // Blocks until a value is available. Returns false once the queue is
    // closed and drained.
    bool waitPop(T& result) {
        std::unique_lock<std::mutex> lock(mutex_);
        ready_.wait(lock, [this] { return !queue_.empty() || closed_; });
        if (queue_.empty()) {
            return false;
        }
        result = std::move(queue_.front());
        queue_.pop();
        return true;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        ready_.notify_all();
    }

private:
    std::queue<T> queue_;
    std::mutex mutex_;
    std::condition_variable ready_;
    bool closed_{false};
};

} // namespace torfetch::detail
