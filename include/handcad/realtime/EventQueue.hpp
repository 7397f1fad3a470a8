/* SPDX-License-Identifier: MIT */
/*
 * Bounded, never-blocking event queue
 */

#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include <vector>

namespace handcad {
namespace realtime {

/**
 * Thread-safe bounded queue for discrete events
 *
 * Single producer / single consumer. The producer never waits: pushing into
 * a full queue evicts the oldest element and counts it as dropped.
 */
template<typename T>
class EventQueue {
public:
    explicit EventQueue(size_t max_size = 64)
        : max_size_(max_size > 0 ? max_size : 1) {}

    /**
     * Append an event
     * @return false if an older event had to be dropped to make room
     */
    bool tryPush(T item) {
        std::lock_guard<std::mutex> lock(mutex_);
        bool dropped = false;
        if (queue_.size() >= max_size_) {
            queue_.pop_front();
            dropped_++;
            dropped = true;
        }
        queue_.push_back(std::move(item));
        return !dropped;
    }

    /**
     * Remove and return all queued events, oldest first
     */
    std::vector<T> drain() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<T> items;
        items.reserve(queue_.size());
        for (auto& item : queue_) {
            items.push_back(std::move(item));
        }
        queue_.clear();
        return items;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    size_t capacity() const { return max_size_; }

    /**
     * Total number of events evicted because the queue was full
     */
    size_t dropped() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return dropped_;
    }

private:
    mutable std::mutex mutex_;
    std::deque<T> queue_;
    size_t max_size_;
    size_t dropped_ = 0;
};

} // namespace realtime
} // namespace handcad
