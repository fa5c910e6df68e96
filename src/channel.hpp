// src/channel.hpp
// Closeable producer-consumer queue, optionally bounded.

#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>

namespace pushgate {

template <typename T>
class Channel {
public:
    // capacity 0 = unbounded.
    explicit Channel(size_t capacity = 0) : capacity_(capacity) {}

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    // Blocks while a bounded channel is full. Returns false once closed.
    bool push(T value) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_full_.wait(lock, [this] {
            return closed_ || capacity_ == 0 || queue_.size() < capacity_;
        });
        if (closed_) return false;

        bool was_empty = queue_.empty();
        queue_.push(std::move(value));
        lock.unlock();

        // Only wake the consumer if it's likely sleeping (queue was empty)
        if (was_empty) {
            not_empty_.notify_one();
        }
        return true;
    }

    // Never blocks. Returns false if the channel is closed or full.
    bool try_push(T value) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (closed_ || (capacity_ != 0 && queue_.size() >= capacity_)) return false;

        bool was_empty = queue_.empty();
        queue_.push(std::move(value));
        lock.unlock();

        if (was_empty) {
            not_empty_.notify_one();
        }
        return true;
    }

    // Blocks until a value is available. Returns nullopt once the channel is
    // closed and drained.
    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait(lock, [this] { return closed_ || !queue_.empty(); });
        if (queue_.empty()) return std::nullopt;

        T value = std::move(queue_.front());
        queue_.pop();
        lock.unlock();
        not_full_.notify_one();
        return value;
    }

    // Idempotent. Pending values can still be popped.
    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) return;
            closed_ = true;
        }
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

private:
    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::queue<T> queue_;
    bool closed_ = false;
};

} // namespace pushgate
