/* SPDX-License-Identifier: MIT */
/*
 * Latest-value handoff between the acquisition and scene threads
 */

#pragma once

#include <cstdint>
#include <memory>
#include <mutex>

namespace handcad {
namespace realtime {

/**
 * Single-slot exchange for immutable snapshots
 *
 * The producer replaces the slot on every publish; the consumer reads
 * whichever value is current. Neither side waits for the other: the lock
 * only guards a pointer swap, and published values are never mutated.
 */
template<typename T>
class SnapshotExchange {
public:
    using Ptr = std::shared_ptr<const T>;

    /**
     * Publish a new value, replacing the previous one
     * @return Sequence number of the published value (starting at 1)
     */
    std::uint64_t publish(T value) {
        Ptr next = std::make_shared<const T>(std::move(value));
        std::lock_guard<std::mutex> lock(mutex_);
        latest_.swap(next);
        return ++sequence_;
    }

    /**
     * Most recent value, or nullptr before the first publish
     */
    Ptr latest() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return latest_;
    }

    /**
     * Number of values published so far
     */
    std::uint64_t sequence() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sequence_;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        latest_.reset();
    }

private:
    mutable std::mutex mutex_;
    Ptr latest_;
    std::uint64_t sequence_ = 0;
};

} // namespace realtime
} // namespace handcad
