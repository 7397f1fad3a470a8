/**
 * @file GestureTypes.hpp
 * @brief Core data types for the gesture recognition core
 *
 * Defines the 21-point hand topology, the closed tag sets produced by each
 * classifier, and the per-frame result records exchanged with the scene side.
 *
 * @copyright 2025 HandCAD Project
 * @license MIT License
 */

#ifndef HANDCAD_GESTURE_TYPES_HPP
#define HANDCAD_GESTURE_TYPES_HPP

#include <handcad/core/types.hpp>
#include <opencv2/core.hpp>
#include <array>
#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace handcad {
namespace gesture {

/// Number of landmarks produced by the upstream hand-pose detector
constexpr std::size_t kNumLandmarks = 21;

/// Maximum number of simultaneously tracked hands
constexpr int kMaxHands = 2;

/**
 * @brief Hand landmark indices (MediaPipe hand topology)
 *
 * The index meaning is a closed contract with the detector: wrist, thumb
 * CMC/MCP/IP/tip, then MCP/PIP/DIP/tip for index, middle, ring and pinky.
 */
enum class LandmarkIndex : int {
    WRIST = 0,
    THUMB_CMC = 1,
    THUMB_MCP = 2,
    THUMB_IP = 3,
    THUMB_TIP = 4,
    INDEX_MCP = 5,
    INDEX_PIP = 6,
    INDEX_DIP = 7,
    INDEX_TIP = 8,
    MIDDLE_MCP = 9,
    MIDDLE_PIP = 10,
    MIDDLE_DIP = 11,
    MIDDLE_TIP = 12,
    RING_MCP = 13,
    RING_PIP = 14,
    RING_DIP = 15,
    RING_TIP = 16,
    PINKY_MCP = 17,
    PINKY_PIP = 18,
    PINKY_DIP = 19,
    PINKY_TIP = 20
};

/// Fingertips smoothed by the landmark filter (thumb, index, middle, ring, pinky)
constexpr std::array<LandmarkIndex, 5> kFingertips = {
    LandmarkIndex::THUMB_TIP,
    LandmarkIndex::INDEX_TIP,
    LandmarkIndex::MIDDLE_TIP,
    LandmarkIndex::RING_TIP,
    LandmarkIndex::PINKY_TIP
};

enum class Finger {
    THUMB = 0,
    INDEX,
    MIDDLE,
    RING,
    PINKY
};

/**
 * @brief Joint a fingertip is compared against for the extension test
 *
 * The thumb ignores this and always uses the alignment test.
 */
enum class ExtensionJoint {
    PIP,    ///< Proximal interphalangeal joint
    MCP     ///< Metacarpophalangeal (finger base) joint
};

/**
 * @brief One hand's 21 landmarks for a single camera frame
 *
 * x/y are normalized to [0, 1] in camera space (y grows downward),
 * z is the detector's relative depth.
 */
struct HandLandmarks {
    std::array<cv::Point3f, kNumLandmarks> points;

    /// Hand slot reported by the detector (0 or 1)
    int hand_index = 0;

    /// Capture timestamp
    core::TimePoint timestamp;

    const cv::Point3f& operator[](LandmarkIndex index) const {
        return points[static_cast<std::size_t>(index)];
    }

    cv::Point3f& operator[](LandmarkIndex index) {
        return points[static_cast<std::size_t>(index)];
    }

    /**
     * @brief Build a landmark set from detector output
     *
     * @throws core::InvalidLandmarksException if the point count is not 21,
     *         the hand index is outside [0, kMaxHands) or a coordinate is not finite
     */
    static HandLandmarks from_points(const std::vector<cv::Point3f>& points,
                                     int hand_index = 0,
                                     core::TimePoint timestamp = core::TimePoint());

    /**
     * @brief Re-check an already built landmark set
     *
     * @throws core::InvalidLandmarksException under the same rules as from_points()
     */
    void validate() const;
};

/// Frame-to-frame fingertip displacement, keyed by fingertip index
using VelocityMap = std::map<LandmarkIndex, cv::Point3f>;

/**
 * @brief Landmark filter output for one hand
 */
struct FilteredHand {
    HandLandmarks landmarks;    ///< Fingertips smoothed, other joints passed through
    VelocityMap velocities;     ///< Empty on the first frame after (re)acquisition
};

// ===== Coarse gestures =====

enum class CoarseGesture {
    UNKNOWN = 0,
    FIST,
    THUMBS_UP,
    PEACE,
    OPEN_PALM,
    PINCH,
    ROCK_SIGN
};

/// Scored gestures in evaluation order; ties resolve to the earliest entry
constexpr std::array<CoarseGesture, 6> kCoarseGestures = {
    CoarseGesture::FIST,
    CoarseGesture::THUMBS_UP,
    CoarseGesture::PEACE,
    CoarseGesture::OPEN_PALM,
    CoarseGesture::PINCH,
    CoarseGesture::ROCK_SIGN
};

/// Confidence per scored gesture; all six keys are always present
using GestureConfidenceMap = std::map<CoarseGesture, float>;

/**
 * @brief Snake-case identifier ("fist", "thumbs_up", ...)
 */
std::string to_string(CoarseGesture gesture);

/**
 * @brief Human-readable label ("FIST", "THUMBS UP", ...)
 */
std::string display_name(CoarseGesture gesture);

// ===== Precision gestures =====

enum class PrecisionGestureKind {
    PRECISION_POINT,
    PINCH,
    SPREAD_SCALE,
    THREE_FINGER_CONTROL
};

/**
 * @brief One precision detector's output
 *
 * Only the payload fields relevant to the kind are meaningful:
 * direction (precision_point, three_finger_control), strength (pinch),
 * scale_factor (spread_scale).
 */
struct PrecisionGesture {
    PrecisionGestureKind kind = PrecisionGestureKind::PRECISION_POINT;
    float confidence = 0.0f;
    cv::Point3f position;
    cv::Point3f direction{0.0f, 0.0f, 1.0f};
    float strength = 0.0f;
    float scale_factor = 0.0f;
};

/// Detectors that fired this frame (spread_scale is always present)
using PrecisionGestureResult = std::map<PrecisionGestureKind, PrecisionGesture>;

std::string to_string(PrecisionGestureKind kind);

// ===== CAD tools =====

enum class CadTool {
    SELECT,
    CREATE,
    MOVE,
    SCALE,
    ROTATE,
    EXTRUDE
};

struct ToolSelection {
    CadTool tool = CadTool::SELECT;
    float confidence = 0.0f;
};

std::string to_string(CadTool tool);

// ===== Actions =====

/**
 * @brief Scene action triggered by a coarse gesture in normal mode
 */
enum class GestureAction {
    SPAWN_DRONE,        ///< fist
    SHOOT_BULLET,       ///< peace
    SPAWN_BOX,          ///< pinch
    ROTATE_ALL,         ///< thumbs_up
    EXPLOSION,          ///< rock_sign
    CAMERA_CONTROL      ///< open_palm (continuous, cooldown exempt)
};

std::string to_string(GestureAction action);

} // namespace gesture
} // namespace handcad

#endif // HANDCAD_GESTURE_TYPES_HPP
