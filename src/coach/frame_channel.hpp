#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

// Bounded FIFO handing snapshots from the polling loop to any number of readers.
// When full, the oldest entry is dropped so a slow reader always sees recent data.
template <typename T>
class FrameChannel {
public:
    explicit FrameChannel(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

    void push(T value) {
        std::lock_guard lock(mu_);
        if (queue_.size() == capacity_) {
            queue_.pop_front();
            ++dropped_;
        }
        queue_.push_back(std::move(value));
    }

    std::optional<T> pop() {
        std::lock_guard lock(mu_);
        if (queue_.empty()) return std::nullopt;
        T value = std::move(queue_.front());
        queue_.pop_front();
        return value;
    }

    void clear() {
        std::lock_guard lock(mu_);
        queue_.clear();
        dropped_ = 0;
    }

    size_t size() const {
        std::lock_guard lock(mu_);
        return queue_.size();
    }

    size_t dropped() const {
        std::lock_guard lock(mu_);
        return dropped_;
    }

private:
    mutable std::mutex mu_;
    std::deque<T> queue_;
    size_t capacity_;
    size_t dropped_ = 0;
};
