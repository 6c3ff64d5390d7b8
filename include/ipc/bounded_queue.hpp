#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace durin::ipc {

enum class PushResult {
    Ok,
    Dropped,
    Closed,
};

// Fixed-capacity FIFO shared between link workers. A push into a full queue
// drops the new item instead of blocking past its timeout.
template <typename T>
class BoundedQueue {
public:
    explicit BoundedQueue(std::size_t capacity)
        : capacity_(capacity) {}

    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;

    bool valid() const { return capacity_ > 0; }
    std::size_t capacity() const { return capacity_; }

    PushResult tryPush(T value) {
        std::lock_guard<std::mutex> lock(mutex_);
        return pushLocked(std::move(value));
    }

    PushResult pushFor(T value, std::chrono::microseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (timeout.count() > 0) {
            not_full_.wait_for(lock, timeout, [this]() { return closed_ || items_.size() < capacity_; });
        }
        return pushLocked(std::move(value));
    }

    std::optional<T> tryPop() {
        std::unique_lock<std::mutex> lock(mutex_);
        if (closed_ || items_.empty()) {
            return std::nullopt;
        }
        T out = std::move(items_.front());
        items_.pop_front();
        popped_ += 1;
        lock.unlock();
        not_full_.notify_one();
        return out;
    }

    // Wakes blocked pushers; later pushes report Closed and pops return empty.
    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return;
            }
            closed_ = true;
            items_.clear();
        }
        not_full_.notify_all();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    uint64_t dropCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return dropped_;
    }

    uint64_t pushCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return pushed_;
    }

    uint64_t popCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return popped_;
    }

private:
    PushResult pushLocked(T&& value) {
        if (closed_) {
            return PushResult::Closed;
        }
        if (items_.size() >= capacity_) {
            dropped_ += 1;
            return PushResult::Dropped;
        }
        items_.push_back(std::move(value));
        pushed_ += 1;
        return PushResult::Ok;
    }

    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable not_full_;
    std::deque<T> items_;
    bool closed_{false};
    uint64_t pushed_{0};
    uint64_t popped_{0};
    uint64_t dropped_{0};
};

}  // namespace durin::ipc
