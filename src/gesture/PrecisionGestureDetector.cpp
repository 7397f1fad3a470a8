/**
 * @file PrecisionGestureDetector.cpp
 * @brief Implementation of the precision gesture detector
 */

#include "handcad/gesture/PrecisionGestureDetector.hpp"
#include "handcad/gesture/HandGeometry.hpp"
#include <handcad/core/Logger.hpp>
#include <algorithm>

namespace handcad {
namespace gesture {

namespace {

constexpr float kPointConfidence = 0.9f;
constexpr float kPinchConfidence = 0.9f;
constexpr float kSpreadConfidence = 0.7f;
constexpr float kThreeFingerConfidence = 0.8f;

/// Spread distance to scale factor gain
constexpr float kSpreadGain = 3.0f;

bool is_stable(const VelocityMap& velocities, LandmarkIndex tip, float threshold) {
    auto it = velocities.find(tip);
    if (it == velocities.end()) {
        return false;
    }
    return cv::norm(it->second) < threshold;
}

} // namespace

PrecisionGestureDetector::PrecisionGestureDetector(const PrecisionDetectorConfig& config)
    : config_(config.is_valid() ? config : PrecisionDetectorConfig{}) {
}

PrecisionGestureResult PrecisionGestureDetector::detect(const HandLandmarks& hand,
                                                        const VelocityMap& velocities) const {
    PrecisionGestureResult result;

    const FingerStates fingers = geometry::finger_states(
        hand, config_.extension_joint, config_.thumb_alignment_threshold);

    // Precision point
    const bool pointing = fingers.index && !fingers.middle && !fingers.ring && !fingers.pinky;
    if (pointing &&
        is_stable(velocities, LandmarkIndex::INDEX_TIP, config_.stability_velocity_threshold)) {
        PrecisionGesture point;
        point.kind = PrecisionGestureKind::PRECISION_POINT;
        point.confidence = kPointConfidence;
        point.position = hand[LandmarkIndex::INDEX_TIP];
        point.direction = geometry::pointing_direction(hand);
        result[point.kind] = point;
    }

    // Pinch with strength
    const float pinch = geometry::pinch_distance(hand);
    if (pinch < config_.pinch_threshold) {
        PrecisionGesture grab;
        grab.kind = PrecisionGestureKind::PINCH;
        grab.confidence = kPinchConfidence;
        grab.position = (hand[LandmarkIndex::THUMB_TIP] + hand[LandmarkIndex::INDEX_TIP]) * 0.5f;
        grab.strength = std::clamp(1.0f - pinch / config_.pinch_threshold, 0.0f, 1.0f);
        result[grab.kind] = grab;
    }

    // Spread scale (no hard gate)
    const float spread = geometry::finger_spread(hand);
    PrecisionGesture scale;
    scale.kind = PrecisionGestureKind::SPREAD_SCALE;
    scale.confidence = spread > config_.spread_threshold ? kSpreadConfidence : 0.0f;
    scale.position = geometry::stable_palm_center(hand);
    scale.scale_factor = spread * kSpreadGain;
    result[scale.kind] = scale;

    // Three-finger control
    if (fingers.index && fingers.middle && fingers.ring && !fingers.pinky) {
        PrecisionGesture control;
        control.kind = PrecisionGestureKind::THREE_FINGER_CONTROL;
        control.confidence = kThreeFingerConfidence;
        control.position = hand[LandmarkIndex::MIDDLE_TIP];
        control.direction = geometry::secondary_finger_direction(hand);
        result[control.kind] = control;
    }

    return result;
}

void PrecisionGestureDetector::configure(const PrecisionDetectorConfig& config) {
    if (config.is_valid()) {
        config_ = config;
    } else {
        LOG_WARNING("PrecisionGestureDetector: ignoring invalid configuration");
    }
}

} // namespace gesture
} // namespace handcad
