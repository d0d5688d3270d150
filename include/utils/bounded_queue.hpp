#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace livetranslate {
namespace utils {

/**
 * Fixed-capacity blocking FIFO connecting one producer thread to one consumer.
 *
 * push() blocks while the queue is full and returns false once the queue is
 * closed. pop() blocks while the queue is empty; after close() it drains
 * what is left, then returns std::nullopt.
 */
template<typename T>
class BoundedQueue {
public:
    enum class PopStatus {
        ITEM,
        CLOSED,
        TIMEOUT
    };

    explicit BoundedQueue(size_t capacity)
        : capacity_(capacity == 0 ? 1 : capacity), closed_(false) {}

    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;

    bool push(T item) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_full_.wait(lock, [this] { return closed_ || items_.size() < capacity_; });
        if (closed_) {
            return false;
        }
        items_.push_back(std::move(item));
        lock.unlock();
        not_empty_.notify_one();
        return true;
    }

    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait(lock, [this] { return closed_ || !items_.empty(); });
        return takeLocked(lock);
    }

    // Waits until the deadline; TIMEOUT leaves `out` untouched
    PopStatus popUntil(std::chrono::steady_clock::time_point deadline, T& out) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!not_empty_.wait_until(lock, deadline, [this] { return closed_ || !items_.empty(); })) {
            return PopStatus::TIMEOUT;
        }
        std::optional<T> item = takeLocked(lock);
        if (!item) {
            return PopStatus::CLOSED;
        }
        out = std::move(*item);
        return PopStatus::ITEM;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    bool isClosed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    size_t capacity() const { return capacity_; }

private:
    std::optional<T> takeLocked(std::unique_lock<std::mutex>& lock) {
        if (items_.empty()) {
            return std::nullopt;
        }
        T item = std::move(items_.front());
        items_.pop_front();
        lock.unlock();
        not_full_.notify_one();
        return item;
    }

    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::deque<T> items_;
    bool closed_;
};

} // namespace utils
} // namespace livetranslate
