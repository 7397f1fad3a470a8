/**
 * @file types.hpp
 * @brief Common type definitions for HandCAD
 *
 * Result codes carried by core::Exception and the shared monotonic clock.
 */

#ifndef HANDCAD_CORE_TYPES_HPP
#define HANDCAD_CORE_TYPES_HPP

#include <chrono>

namespace handcad {
namespace core {

/**
 * @brief Result codes for HandCAD operations
 */
enum class ResultCode {
    SUCCESS = 0,
    ERROR_INVALID_LANDMARKS = -1,
    ERROR_NOT_INITIALIZED = -2,
    ERROR_CONFIG_INVALID = -3,
    ERROR_THREAD_FAILURE = -4
};

/// Monotonic clock used for every timestamp in the gesture core
using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

/**
 * @brief Seconds elapsed between two time points (may be negative)
 */
inline double seconds_between(TimePoint from, TimePoint to) {
    return std::chrono::duration<double>(to - from).count();
}

} // namespace core
} // namespace handcad

#endif // HANDCAD_CORE_TYPES_HPP
