/**
 * @file GestureHistory.hpp
 * @brief Bounded history of recognized coarse gestures
 *
 * @copyright 2025 HandCAD Project
 * @license MIT License
 */

#ifndef HANDCAD_GESTURE_GESTURE_HISTORY_HPP
#define HANDCAD_GESTURE_GESTURE_HISTORY_HPP

#include <memory>
#include <vector>
#include "GestureTypes.hpp"

namespace handcad {
namespace gesture {

/**
 * @brief One accepted gesture
 */
struct GestureHistoryEntry {
    CoarseGesture gesture = CoarseGesture::UNKNOWN;
    float confidence = 0.0f;
    core::TimePoint timestamp;
};

/**
 * @brief Insertion-ordered FIFO of gesture entries
 *
 * When full, pushing evicts the oldest entry.
 *
 * Thread-safety: Not thread-safe. External synchronization required.
 */
class GestureHistory {
public:
    /**
     * @brief Constructor with capacity
     *
     * @param capacity Maximum number of entries to keep (default: 10, minimum 1)
     */
    explicit GestureHistory(size_t capacity = 10);

    ~GestureHistory();

    // Disable copy, allow move
    GestureHistory(const GestureHistory&) = delete;
    GestureHistory& operator=(const GestureHistory&) = delete;
    GestureHistory(GestureHistory&&) noexcept;
    GestureHistory& operator=(GestureHistory&&) noexcept;

    void push(const GestureHistoryEntry& entry);

    size_t size() const;

    bool is_full() const;

    bool is_empty() const;

    void clear();

    size_t capacity() const;

    /**
     * @brief Get recent entries (newest first)
     *
     * @param count Number of entries to retrieve (0 = all)
     */
    std::vector<GestureHistoryEntry> get_recent(size_t count = 0) const;

    /**
     * @brief Oldest entry (throws std::runtime_error if empty)
     */
    GestureHistoryEntry oldest() const;

    /**
     * @brief Newest entry (throws std::runtime_error if empty)
     */
    GestureHistoryEntry newest() const;

    /**
     * @brief Number of stored entries for a gesture
     */
    size_t count(CoarseGesture gesture) const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace gesture
} // namespace handcad

#endif // HANDCAD_GESTURE_GESTURE_HISTORY_HPP
