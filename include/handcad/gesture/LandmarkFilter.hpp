/**
 * @file LandmarkFilter.hpp
 * @brief Constant-velocity Kalman smoothing of fingertip landmarks
 *
 * Removes detector jitter from the five fingertips of one tracked hand
 * before any geometric reasoning runs on them.
 *
 * @copyright 2025 HandCAD Project
 * @license MIT License
 */

#ifndef HANDCAD_GESTURE_LANDMARK_FILTER_HPP
#define HANDCAD_GESTURE_LANDMARK_FILTER_HPP

#include <memory>
#include "GestureTypes.hpp"

namespace handcad {
namespace gesture {

/**
 * @brief Landmark filter configuration
 */
struct LandmarkFilterConfig {
    float process_noise = 0.01f;        ///< Process noise (lower = smoother)
    float measurement_noise = 0.1f;     ///< Measurement noise (higher = more smoothing)
    float initial_covariance = 0.1f;    ///< Initial state uncertainty

    /**
     * @brief Validate configuration
     */
    bool is_valid() const {
        return process_noise > 0.0f &&
               measurement_noise > 0.0f &&
               initial_covariance > 0.0f;
    }
};

/**
 * @brief Per-hand fingertip filter
 *
 * Owns one 6-state (position + velocity) / 3-measurement Kalman filter per
 * fingertip. A filter is seeded from the first observation of its fingertip
 * and advanced on every update() call; non-fingertip landmarks pass through.
 *
 * The velocities returned are frame-to-frame differences of the filtered
 * position, not the filter's internal velocity estimate. They are absent on
 * the first frame after construction or reset().
 *
 * Not thread-safe; a filter instance belongs to the acquisition thread.
 */
class LandmarkFilter {
public:
    LandmarkFilter();

    explicit LandmarkFilter(const LandmarkFilterConfig& config);

    ~LandmarkFilter();

    // Disable copy, allow move
    LandmarkFilter(const LandmarkFilter&) = delete;
    LandmarkFilter& operator=(const LandmarkFilter&) = delete;
    LandmarkFilter(LandmarkFilter&&) noexcept;
    LandmarkFilter& operator=(LandmarkFilter&&) noexcept;

    /**
     * @brief Filter one frame of a tracked hand
     *
     * @param raw Raw landmarks for this hand
     * @return Landmarks with smoothed fingertips plus fingertip velocities
     */
    FilteredHand update(const HandLandmarks& raw);

    /**
     * @brief Drop all filter state (hand lost)
     */
    void reset();

    /**
     * @brief True once at least one frame has been filtered since the last reset
     */
    bool is_initialized() const;

    /**
     * @brief Posterior variance of a fingertip's x position
     *
     * @return Variance, or a negative value if the fingertip has no filter yet
     *         or the index is not a fingertip
     */
    float position_variance(LandmarkIndex fingertip) const;

    /**
     * @brief Apply new noise parameters to current and future filters
     */
    void configure(const LandmarkFilterConfig& config);

    LandmarkFilterConfig get_config() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace gesture
} // namespace handcad

#endif // HANDCAD_GESTURE_LANDMARK_FILTER_HPP
