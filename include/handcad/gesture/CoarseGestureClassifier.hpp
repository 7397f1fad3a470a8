/**
 * @file CoarseGestureClassifier.hpp
 * @brief Confidence-scored classifier over the six discrete hand gestures
 *
 * Each gesture has an independent geometric rule that yields a fixed
 * confidence when it holds. The arg-max wins; ties resolve in the order of
 * kCoarseGestures (fist, thumbs_up, peace, open_palm, pinch, rock_sign).
 *
 * @copyright 2025 HandCAD Project
 * @license MIT License
 */

#ifndef HANDCAD_GESTURE_COARSE_GESTURE_CLASSIFIER_HPP
#define HANDCAD_GESTURE_COARSE_GESTURE_CLASSIFIER_HPP

#include "CooldownGate.hpp"
#include "GestureHistory.hpp"
#include "GestureTypes.hpp"

namespace handcad {
namespace gesture {

/**
 * @brief Coarse classifier configuration
 */
struct CoarseClassifierConfig {
    float pinch_threshold = 0.05f;              ///< Pinch when thumb-index distance is below this
    float thumb_alignment_threshold = 0.7f;     ///< Cosine threshold for thumb extension
    float acceptance_threshold = 0.5f;          ///< Winner must score strictly above this
    double gesture_cooldown_s = 1.0;            ///< Minimum interval between history appends
    size_t history_capacity = 10;               ///< Gesture history length
    ExtensionJoint extension_joint = ExtensionJoint::PIP;

    bool is_valid() const {
        return pinch_threshold > 0.0f &&
               thumb_alignment_threshold >= -1.0f && thumb_alignment_threshold <= 1.0f &&
               acceptance_threshold >= 0.0f && acceptance_threshold < 1.0f &&
               gesture_cooldown_s >= 0.0 &&
               history_capacity > 0;
    }
};

/**
 * @brief Per-frame classification result
 */
struct CoarseGestureResult {
    CoarseGesture gesture = CoarseGesture::UNKNOWN;
    float confidence = 0.0f;                ///< Highest score, even when the result is UNKNOWN
    GestureConfidenceMap confidences;       ///< Score for each of the six gestures
};

/**
 * @brief Coarse gesture classifier for one hand
 *
 * The classification itself is recomputed from scratch every call; only the
 * gesture history (and its append cooldown) carries state.
 */
class CoarseGestureClassifier {
public:
    CoarseGestureClassifier();

    explicit CoarseGestureClassifier(const CoarseClassifierConfig& config);

    /**
     * @brief Classify one frame
     *
     * A result above the acceptance threshold is appended to the history when
     * at least gesture_cooldown_s has passed since the previous append.
     *
     * @param hand Filtered landmarks
     * @param now Frame time used for the history cooldown
     */
    CoarseGestureResult classify(const HandLandmarks& hand, core::TimePoint now);

    /**
     * @brief Scores only, without touching the history
     */
    GestureConfidenceMap score(const HandLandmarks& hand) const;

    /**
     * @brief Confidences from the most recent classify() call
     */
    const GestureConfidenceMap& last_confidences() const { return last_confidences_; }

    const GestureHistory& history() const { return history_; }

    /**
     * @brief Clear history, cooldown and retained confidences
     */
    void reset();

    /**
     * @brief Replace configuration (history is resized and cleared)
     */
    void configure(const CoarseClassifierConfig& config);

    const CoarseClassifierConfig& get_config() const { return config_; }

private:
    CoarseClassifierConfig config_;
    GestureHistory history_;
    CooldownGate history_gate_;
    GestureConfidenceMap last_confidences_;
};

} // namespace gesture
} // namespace handcad

#endif // HANDCAD_GESTURE_COARSE_GESTURE_CLASSIFIER_HPP
