#ifndef EVENT_CHANNEL_HPP
#define EVENT_CHANNEL_HPP

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <utility>

// Multi-producer, single-consumer FIFO. Items pushed after close() are discarded.
// pop() blocks until an item arrives or the channel is closed and drained.
template <typename T>
class EventChannel {
public:
    bool push(T item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) return false;
            pending_.push_back(std::move(item));
        }
        cv_.notify_one();
        return true;
    }

    bool pop(T& out) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [&] { return !pending_.empty() || closed_; });
        if (pending_.empty()) return false;

        out = std::move(pending_.front());
        pending_.pop_front();
        return true;
    }

    // Returns false on timeout or when closed and drained.
    template <typename Rep, typename Period>
    bool popFor(T& out, std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!cv_.wait_for(lock, timeout, [&] { return !pending_.empty() || closed_; })) return false;
        if (pending_.empty()) return false;

        out = std::move(pending_.front());
        pending_.pop_front();
        return true;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    // Drops everything still queued without closing.
    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_.clear();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return pending_.size();
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<T> pending_;
    bool closed_ = false;
};

#endif
