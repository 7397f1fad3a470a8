/**
 * @file HandGeometry.hpp
 * @brief Stateless geometric measurements over a hand landmark set
 *
 * Every function is pure: the same landmarks always produce bit-identical
 * results. Degenerate geometry yields documented fallback values instead of
 * failing.
 *
 * @copyright 2025 HandCAD Project
 * @license MIT License
 */

#ifndef HANDCAD_GESTURE_HAND_GEOMETRY_HPP
#define HANDCAD_GESTURE_HAND_GEOMETRY_HPP

#include <opencv2/core.hpp>
#include <opencv2/core/quaternion.hpp>
#include "GestureTypes.hpp"

namespace handcad {
namespace gesture {

/// Default cosine threshold for the thumb alignment test
constexpr float kDefaultThumbAlignment = 0.7f;

/// Direction returned when a finger vector has zero length
const cv::Point3f kCanonicalForward(0.0f, 0.0f, 1.0f);

/**
 * @brief Extension flags for the five fingers
 */
struct FingerStates {
    bool thumb = false;
    bool index = false;
    bool middle = false;
    bool ring = false;
    bool pinky = false;

    int count() const {
        return static_cast<int>(thumb) + static_cast<int>(index) +
               static_cast<int>(middle) + static_cast<int>(ring) +
               static_cast<int>(pinky);
    }

    bool all() const { return count() == 5; }

    bool operator==(const FingerStates& other) const {
        return thumb == other.thumb && index == other.index &&
               middle == other.middle && ring == other.ring &&
               pinky == other.pinky;
    }
};

namespace geometry {

/**
 * @brief Thumb extension by alignment
 *
 * Cosine similarity in the image plane (x, y) between wrist->thumb MCP and
 * thumb MCP->thumb tip must exceed the threshold. Zero-length vectors give false.
 */
bool is_thumb_extended(const HandLandmarks& hand,
                       float alignment_threshold = kDefaultThumbAlignment);

/**
 * @brief Non-thumb finger extension: tip strictly above the reference joint
 *
 * Camera y grows downward, so "above" means a smaller y value.
 * Finger::THUMB ignores the joint and returns
 * is_thumb_extended(hand, thumb_alignment_threshold).
 */
bool is_finger_extended(const HandLandmarks& hand, Finger finger, ExtensionJoint joint,
                        float thumb_alignment_threshold = kDefaultThumbAlignment);

/**
 * @brief Extension flags for all five fingers
 */
FingerStates finger_states(const HandLandmarks& hand,
                           ExtensionJoint joint,
                           float thumb_alignment_threshold = kDefaultThumbAlignment);

/**
 * @brief 3D distance between thumb tip and index tip
 */
float pinch_distance(const HandLandmarks& hand);

/**
 * @brief Mean of wrist, thumb CMC and the four finger MCP joints
 */
cv::Point3f stable_palm_center(const HandLandmarks& hand);

/**
 * @brief Palm orientation as a rotation
 *
 * The rotation's columns are the wrist->middle MCP axis, the in-plane
 * perpendicular and the palm normal (wrist->middle x wrist->pinky).
 * Zero-length or colinear inputs return the identity rotation.
 */
cv::Quatf hand_orientation(const HandLandmarks& hand);

/**
 * @brief Unit vector from index PIP to index tip (canonical forward if degenerate)
 */
cv::Point3f pointing_direction(const HandLandmarks& hand);

/**
 * @brief Unit vector from middle PIP to middle tip (canonical forward if degenerate)
 */
cv::Point3f secondary_finger_direction(const HandLandmarks& hand);

/**
 * @brief Mean distance between adjacent fingertips (index-middle, middle-ring, ring-pinky)
 */
float finger_spread(const HandLandmarks& hand);

} // namespace geometry
} // namespace gesture
} // namespace handcad

#endif // HANDCAD_GESTURE_HAND_GEOMETRY_HPP
