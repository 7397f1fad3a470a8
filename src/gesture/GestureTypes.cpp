/**
 * @file GestureTypes.cpp
 * @brief Landmark validation and tag-name tables
 */

#include "handcad/gesture/GestureTypes.hpp"
#include <handcad/core/exception.h>
#include <algorithm>
#include <cmath>

namespace handcad {
namespace gesture {

namespace {

bool is_finite(const cv::Point3f& p) {
    return std::isfinite(p.x) && std::isfinite(p.y) && std::isfinite(p.z);
}

void check_hand_index(int hand_index) {
    if (hand_index < 0 || hand_index >= kMaxHands) {
        HANDCAD_THROW(core::InvalidLandmarksException,
                      "Hand index " + std::to_string(hand_index) + " out of range [0, " +
                      std::to_string(kMaxHands) + ")");
    }
}

} // namespace

HandLandmarks HandLandmarks::from_points(const std::vector<cv::Point3f>& points,
                                         int hand_index,
                                         core::TimePoint timestamp) {
    if (points.size() != kNumLandmarks) {
        HANDCAD_THROW(core::InvalidLandmarksException,
                      "Expected " + std::to_string(kNumLandmarks) + " landmarks, got " +
                      std::to_string(points.size()));
    }

    HandLandmarks landmarks;
    std::copy(points.begin(), points.end(), landmarks.points.begin());
    landmarks.hand_index = hand_index;
    landmarks.timestamp = timestamp;
    landmarks.validate();
    return landmarks;
}

void HandLandmarks::validate() const {
    check_hand_index(hand_index);

    for (std::size_t i = 0; i < points.size(); ++i) {
        if (!is_finite(points[i])) {
            HANDCAD_THROW(core::InvalidLandmarksException,
                          "Landmark " + std::to_string(i) + " of hand " +
                          std::to_string(hand_index) + " is not finite");
        }
    }
}

std::string to_string(CoarseGesture gesture) {
    switch (gesture) {
        case CoarseGesture::UNKNOWN:   return "unknown";
        case CoarseGesture::FIST:      return "fist";
        case CoarseGesture::THUMBS_UP: return "thumbs_up";
        case CoarseGesture::PEACE:     return "peace";
        case CoarseGesture::OPEN_PALM: return "open_palm";
        case CoarseGesture::PINCH:     return "pinch";
        case CoarseGesture::ROCK_SIGN: return "rock_sign";
    }
    return "unknown";
}

std::string display_name(CoarseGesture gesture) {
    switch (gesture) {
        case CoarseGesture::UNKNOWN:   return "UNKNOWN";
        case CoarseGesture::FIST:      return "FIST";
        case CoarseGesture::THUMBS_UP: return "THUMBS UP";
        case CoarseGesture::PEACE:     return "PEACE";
        case CoarseGesture::OPEN_PALM: return "OPEN PALM";
        case CoarseGesture::PINCH:     return "PINCH";
        case CoarseGesture::ROCK_SIGN: return "ROCK SIGN";
    }
    return "UNKNOWN";
}

std::string to_string(PrecisionGestureKind kind) {
    switch (kind) {
        case PrecisionGestureKind::PRECISION_POINT:      return "precision_point";
        case PrecisionGestureKind::PINCH:                return "pinch";
        case PrecisionGestureKind::SPREAD_SCALE:         return "spread_scale";
        case PrecisionGestureKind::THREE_FINGER_CONTROL: return "three_finger_control";
    }
    return "unknown";
}

std::string to_string(CadTool tool) {
    switch (tool) {
        case CadTool::SELECT:  return "select";
        case CadTool::CREATE:  return "create";
        case CadTool::MOVE:    return "move";
        case CadTool::SCALE:   return "scale";
        case CadTool::ROTATE:  return "rotate";
        case CadTool::EXTRUDE: return "extrude";
    }
    return "unknown";
}

std::string to_string(GestureAction action) {
    switch (action) {
        case GestureAction::SPAWN_DRONE:    return "spawn_drone";
        case GestureAction::SHOOT_BULLET:   return "shoot_bullet";
        case GestureAction::SPAWN_BOX:      return "spawn_box";
        case GestureAction::ROTATE_ALL:     return "rotate_all";
        case GestureAction::EXPLOSION:      return "explosion";
        case GestureAction::CAMERA_CONTROL: return "camera_control";
    }
    return "unknown";
}

} // namespace gesture
} // namespace handcad
