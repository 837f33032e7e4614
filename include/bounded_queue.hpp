// bounded_queue.hpp
#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <utility>

// Multi-producer queue with a fixed capacity. Producers never lose an
// element: tryPush refuses when full, pushFor waits for room.
template <typename T>
class BoundedQueue {
public:
    explicit BoundedQueue(size_t capacity) : capacity_(capacity ? capacity : 1) {}

    // False when full or closed; value is left untouched then.
    bool tryPush(T& value) {
        {
            std::lock_guard<std::mutex> lock(mtx_);
            if (closed_ || items_.size() >= capacity_) return false;
            items_.push_back(std::move(value));
        }
        notEmpty_.notify_one();
        return true;
    }

    // Waits up to timeout for room; false on timeout or when closed.
    template <typename Rep, typename Period>
    bool pushFor(T& value, const std::chrono::duration<Rep, Period>& timeout) {
        {
            std::unique_lock<std::mutex> lock(mtx_);
            notFull_.wait_for(lock, timeout, [&] { return closed_ || items_.size() < capacity_; });
            if (closed_ || items_.size() >= capacity_) return false;
            items_.push_back(std::move(value));
        }
        notEmpty_.notify_one();
        return true;
    }

    bool tryPop(T& out) {
        {
            std::lock_guard<std::mutex> lock(mtx_);
            if (items_.empty()) return false;
            out = std::move(items_.front());
            items_.pop_front();
        }
        notFull_.notify_one();
        return true;
    }

    // Waits up to timeout; false on timeout or when closed and drained.
    template <typename Rep, typename Period>
    bool popFor(T& out, const std::chrono::duration<Rep, Period>& timeout) {
        {
            std::unique_lock<std::mutex> lock(mtx_);
            notEmpty_.wait_for(lock, timeout, [&] { return closed_ || !items_.empty(); });
            if (items_.empty()) return false;
            out = std::move(items_.front());
            items_.pop_front();
        }
        notFull_.notify_one();
        return true;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mtx_);
            closed_ = true;
        }
        notEmpty_.notify_all();
        notFull_.notify_all();
    }

    void clear() {
        {
            std::lock_guard<std::mutex> lock(mtx_);
            items_.clear();
        }
        notFull_.notify_all();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return items_.size();
    }

    bool full() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return items_.size() >= capacity_;
    }

    size_t capacity() const { return capacity_; }

private:
    const size_t capacity_;
    mutable std::mutex mtx_;
    std::condition_variable notEmpty_;
    std::condition_variable notFull_;
    std::deque<T> items_;
    bool closed_ = false;
};
