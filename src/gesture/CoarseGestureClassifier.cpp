/**
 * @file CoarseGestureClassifier.cpp
 * @brief Implementation of the coarse gesture classifier
 */

#include "handcad/gesture/CoarseGestureClassifier.hpp"
#include "handcad/gesture/HandGeometry.hpp"
#include <handcad/core/Logger.hpp>

namespace handcad {
namespace gesture {

namespace {

// Fixed rule confidences
constexpr float kFistConfidence = 0.8f;
constexpr float kThumbsUpConfidence = 0.9f;
constexpr float kPeaceConfidence = 0.9f;
constexpr float kOpenPalmConfidence = 0.9f;
constexpr float kPinchConfidence = 0.8f;
constexpr float kRockSignConfidence = 0.8f;

} // namespace

CoarseGestureClassifier::CoarseGestureClassifier()
    : CoarseGestureClassifier(CoarseClassifierConfig{}) {
}

CoarseGestureClassifier::CoarseGestureClassifier(const CoarseClassifierConfig& config)
    : config_(config.is_valid() ? config : CoarseClassifierConfig{})
    , history_(config_.history_capacity)
    , history_gate_(config_.gesture_cooldown_s) {
    for (CoarseGesture gesture : kCoarseGestures) {
        last_confidences_[gesture] = 0.0f;
    }
}

GestureConfidenceMap CoarseGestureClassifier::score(const HandLandmarks& hand) const {
    const FingerStates fingers = geometry::finger_states(
        hand, config_.extension_joint, config_.thumb_alignment_threshold);
    const int extended = fingers.count();
    const float pinch = geometry::pinch_distance(hand);

    GestureConfidenceMap scores;

    scores[CoarseGesture::FIST] = extended <= 1 ? kFistConfidence : 0.0f;

    scores[CoarseGesture::THUMBS_UP] =
        (fingers.thumb && !fingers.index && !fingers.middle && !fingers.ring && !fingers.pinky)
            ? kThumbsUpConfidence : 0.0f;

    scores[CoarseGesture::PEACE] =
        (!fingers.thumb && fingers.index && fingers.middle && !fingers.ring && !fingers.pinky)
            ? kPeaceConfidence : 0.0f;

    scores[CoarseGesture::OPEN_PALM] = extended >= 4 ? kOpenPalmConfidence : 0.0f;

    scores[CoarseGesture::PINCH] = pinch < config_.pinch_threshold ? kPinchConfidence : 0.0f;

    scores[CoarseGesture::ROCK_SIGN] =
        (fingers.index && fingers.pinky && !fingers.middle && !fingers.ring)
            ? kRockSignConfidence : 0.0f;

    return scores;
}

CoarseGestureResult CoarseGestureClassifier::classify(const HandLandmarks& hand,
                                                      core::TimePoint now) {
    CoarseGestureResult result;
    result.confidences = score(hand);

    // First maximum in evaluation order wins
    CoarseGesture best = CoarseGesture::UNKNOWN;
    float best_confidence = 0.0f;
    for (CoarseGesture gesture : kCoarseGestures) {
        const float confidence = result.confidences[gesture];
        if (confidence > best_confidence) {
            best = gesture;
            best_confidence = confidence;
        }
    }

    result.confidence = best_confidence;
    result.gesture = best_confidence > config_.acceptance_threshold ? best : CoarseGesture::UNKNOWN;

    if (result.gesture != CoarseGesture::UNKNOWN && history_gate_.try_acquire(now)) {
        history_.push({result.gesture, result.confidence, now});
        LOG_DEBUG("CoarseGestureClassifier: hand " + std::to_string(hand.hand_index) +
                  " recorded " + to_string(result.gesture) +
                  " (history=" + std::to_string(history_.size()) + ")");
    }

    last_confidences_ = result.confidences;
    return result;
}

void CoarseGestureClassifier::reset() {
    history_.clear();
    history_gate_.reset();
    for (auto& entry : last_confidences_) {
        entry.second = 0.0f;
    }
}

void CoarseGestureClassifier::configure(const CoarseClassifierConfig& config) {
    if (!config.is_valid()) {
        LOG_WARNING("CoarseGestureClassifier: ignoring invalid configuration");
        return;
    }
    config_ = config;
    history_ = GestureHistory(config_.history_capacity);
    history_gate_ = CooldownGate(config_.gesture_cooldown_s);
}

} // namespace gesture
} // namespace handcad
