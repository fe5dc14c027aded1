#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <utility>

/**
 * Unbounded multi-producer queue with blocking pop.
 *
 * `push` never blocks. After `close()` further pushes are refused and
 * consumers drain what is left, then get false.
 */
template<typename T>
class BlockingQueue {
public:
    bool push(T item) {
        {
            std::lock_guard<std::mutex> lk(mutex_);
            if (closed_) return false;
            queue_.push_back(std::move(item));
        }
        cv_.notify_one();
        return true;
    }

    /// Returns false once the queue is closed and empty.
    bool pop(T& out) {
        std::unique_lock<std::mutex> lk(mutex_);
        cv_.wait(lk, [this] { return !queue_.empty() || closed_; });
        return take(out);
    }

    /// Like pop(), but gives up after `timeout`.
    template<typename Rep, typename Period>
    bool pop_for(T& out, std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lk(mutex_);
        cv_.wait_for(lk, timeout, [this] { return !queue_.empty() || closed_; });
        return take(out);
    }

    void close() {
        {
            std::lock_guard<std::mutex> lk(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lk(mutex_);
        return closed_;
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lk(mutex_);
        return queue_.size();
    }

private:
    bool take(T& out) {
        if (queue_.empty()) return false;
        out = std::move(queue_.front());
        queue_.pop_front();
        return true;
    }

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<T> queue_;
    bool closed_ = false;
};
