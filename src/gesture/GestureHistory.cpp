/**
 * @file GestureHistory.cpp
 * @brief Implementation of the gesture history buffer
 */

#include "handcad/gesture/GestureHistory.hpp"
#include <algorithm>
#include <deque>
#include <stdexcept>

namespace handcad {
namespace gesture {

/**
 * @brief PIMPL implementation for GestureHistory
 */
class GestureHistory::Impl {
public:
    std::deque<GestureHistoryEntry> buffer;
    size_t max_capacity;

    explicit Impl(size_t capacity)
        : max_capacity(std::max<size_t>(capacity, 1)) {
    }

    void push(const GestureHistoryEntry& entry) {
        if (buffer.size() >= max_capacity) {
            buffer.pop_front();  // Remove oldest
        }
        buffer.push_back(entry);
    }
};

GestureHistory::GestureHistory(size_t capacity)
    : pImpl(std::make_unique<Impl>(capacity)) {
}

GestureHistory::~GestureHistory() = default;

GestureHistory::GestureHistory(GestureHistory&&) noexcept = default;
GestureHistory& GestureHistory::operator=(GestureHistory&&) noexcept = default;

void GestureHistory::push(const GestureHistoryEntry& entry) {
    pImpl->push(entry);
}

size_t GestureHistory::size() const {
    return pImpl->buffer.size();
}

bool GestureHistory::is_full() const {
    return pImpl->buffer.size() >= pImpl->max_capacity;
}

bool GestureHistory::is_empty() const {
    return pImpl->buffer.empty();
}

void GestureHistory::clear() {
    pImpl->buffer.clear();
}

size_t GestureHistory::capacity() const {
    return pImpl->max_capacity;
}

std::vector<GestureHistoryEntry> GestureHistory::get_recent(size_t count) const {
    const auto& buffer = pImpl->buffer;
    size_t num_entries = (count == 0 || count > buffer.size()) ? buffer.size() : count;

    std::vector<GestureHistoryEntry> result;
    result.reserve(num_entries);

    // Newest first
    for (size_t i = 0; i < num_entries; ++i) {
        result.push_back(buffer[buffer.size() - 1 - i]);
    }

    return result;
}

GestureHistoryEntry GestureHistory::oldest() const {
    if (pImpl->buffer.empty()) {
        throw std::runtime_error("GestureHistory is empty");
    }
    return pImpl->buffer.front();
}

GestureHistoryEntry GestureHistory::newest() const {
    if (pImpl->buffer.empty()) {
        throw std::runtime_error("GestureHistory is empty");
    }
    return pImpl->buffer.back();
}

size_t GestureHistory::count(CoarseGesture gesture) const {
    return static_cast<size_t>(std::count_if(
        pImpl->buffer.begin(), pImpl->buffer.end(),
        [gesture](const GestureHistoryEntry& entry) { return entry.gesture == gesture; }));
}

} // namespace gesture
} // namespace handcad
