/**
 * @file PrecisionGestureDetector.hpp
 * @brief Continuous CAD gestures for direct manipulation
 *
 * Four independent detectors run on every call:
 * - precision_point: index extended, others closed, index tip stable
 * - pinch: thumb and index tips closer than the pinch threshold, with strength
 * - spread_scale: mean adjacent fingertip distance, always reported
 * - three_finger_control: index, middle and ring extended, pinky closed
 *
 * @copyright 2025 HandCAD Project
 * @license MIT License
 */

#ifndef HANDCAD_GESTURE_PRECISION_GESTURE_DETECTOR_HPP
#define HANDCAD_GESTURE_PRECISION_GESTURE_DETECTOR_HPP

#include "GestureTypes.hpp"

namespace handcad {
namespace gesture {

/**
 * @brief Precision detector configuration
 */
struct PrecisionDetectorConfig {
    float pinch_threshold = 0.05f;                  ///< Pinch when thumb-index distance is below this
    float stability_velocity_threshold = 0.01f;     ///< Max index-tip displacement per frame for pointing
    float spread_threshold = 0.3f;                  ///< Mean fingertip distance for a confident spread
    float thumb_alignment_threshold = 0.7f;
    ExtensionJoint extension_joint = ExtensionJoint::MCP;

    bool is_valid() const {
        return pinch_threshold > 0.0f &&
               stability_velocity_threshold > 0.0f &&
               spread_threshold > 0.0f &&
               thumb_alignment_threshold >= -1.0f && thumb_alignment_threshold <= 1.0f;
    }
};

/**
 * @brief Precision gesture detector
 *
 * Stateless apart from its configuration; safe to call with any frame order.
 */
class PrecisionGestureDetector {
public:
    PrecisionGestureDetector() = default;

    explicit PrecisionGestureDetector(const PrecisionDetectorConfig& config);

    /**
     * @brief Run all four detectors
     *
     * @param hand Filtered landmarks
     * @param velocities Fingertip velocities from the landmark filter; without
     *        an index-tip entry the pointing stability gate fails
     * @return Detectors that fired; spread_scale is always present
     */
    PrecisionGestureResult detect(const HandLandmarks& hand,
                                  const VelocityMap& velocities) const;

    void configure(const PrecisionDetectorConfig& config);

    const PrecisionDetectorConfig& get_config() const { return config_; }

private:
    PrecisionDetectorConfig config_;
};

} // namespace gesture
} // namespace handcad

#endif // HANDCAD_GESTURE_PRECISION_GESTURE_DETECTOR_HPP
