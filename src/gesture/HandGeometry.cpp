/**
 * @file HandGeometry.cpp
 * @brief Implementation of hand geometry helpers
 */

#include "handcad/gesture/HandGeometry.hpp"
#include <array>
#include <cmath>

namespace handcad {
namespace gesture {
namespace geometry {

namespace {

/// Vectors shorter than this are treated as zero length
constexpr float kEpsilon = 1e-6f;

struct FingerJoints {
    LandmarkIndex mcp;
    LandmarkIndex pip;
    LandmarkIndex tip;
};

FingerJoints joints_of(Finger finger) {
    switch (finger) {
        case Finger::THUMB:
            return {LandmarkIndex::THUMB_MCP, LandmarkIndex::THUMB_IP, LandmarkIndex::THUMB_TIP};
        case Finger::INDEX:
            return {LandmarkIndex::INDEX_MCP, LandmarkIndex::INDEX_PIP, LandmarkIndex::INDEX_TIP};
        case Finger::MIDDLE:
            return {LandmarkIndex::MIDDLE_MCP, LandmarkIndex::MIDDLE_PIP, LandmarkIndex::MIDDLE_TIP};
        case Finger::RING:
            return {LandmarkIndex::RING_MCP, LandmarkIndex::RING_PIP, LandmarkIndex::RING_TIP};
        case Finger::PINKY:
            return {LandmarkIndex::PINKY_MCP, LandmarkIndex::PINKY_PIP, LandmarkIndex::PINKY_TIP};
    }
    return {LandmarkIndex::INDEX_MCP, LandmarkIndex::INDEX_PIP, LandmarkIndex::INDEX_TIP};
}

cv::Point3f normalized_or_forward(const cv::Point3f& v) {
    const float length = static_cast<float>(cv::norm(v));
    if (length < kEpsilon) {
        return kCanonicalForward;
    }
    return v / length;
}

cv::Point3f direction_between(const HandLandmarks& hand, LandmarkIndex from, LandmarkIndex to) {
    return normalized_or_forward(hand[to] - hand[from]);
}

} // namespace

bool is_thumb_extended(const HandLandmarks& hand, float alignment_threshold) {
    const cv::Point3f& wrist = hand[LandmarkIndex::WRIST];
    const cv::Point3f& mcp = hand[LandmarkIndex::THUMB_MCP];
    const cv::Point3f& tip = hand[LandmarkIndex::THUMB_TIP];

    const cv::Point2f base(mcp.x - wrist.x, mcp.y - wrist.y);
    const cv::Point2f finger(tip.x - mcp.x, tip.y - mcp.y);

    const float base_len = static_cast<float>(cv::norm(base));
    const float finger_len = static_cast<float>(cv::norm(finger));
    if (base_len < kEpsilon || finger_len < kEpsilon) {
        return false;
    }

    const float cosine = base.dot(finger) / (base_len * finger_len);
    return cosine > alignment_threshold;
}

bool is_finger_extended(const HandLandmarks& hand, Finger finger, ExtensionJoint joint,
                        float thumb_alignment_threshold) {
    if (finger == Finger::THUMB) {
        return is_thumb_extended(hand, thumb_alignment_threshold);
    }

    const FingerJoints joints = joints_of(finger);
    LandmarkIndex reference = joints.pip;
    switch (joint) {
        case ExtensionJoint::PIP: reference = joints.pip; break;
        case ExtensionJoint::MCP: reference = joints.mcp; break;
    }

    return hand[joints.tip].y < hand[reference].y;
}

FingerStates finger_states(const HandLandmarks& hand,
                           ExtensionJoint joint,
                           float thumb_alignment_threshold) {
    FingerStates states;
    states.thumb = is_finger_extended(hand, Finger::THUMB, joint, thumb_alignment_threshold);
    states.index = is_finger_extended(hand, Finger::INDEX, joint);
    states.middle = is_finger_extended(hand, Finger::MIDDLE, joint);
    states.ring = is_finger_extended(hand, Finger::RING, joint);
    states.pinky = is_finger_extended(hand, Finger::PINKY, joint);
    return states;
}

float pinch_distance(const HandLandmarks& hand) {
    return static_cast<float>(cv::norm(hand[LandmarkIndex::THUMB_TIP] - hand[LandmarkIndex::INDEX_TIP]));
}

cv::Point3f stable_palm_center(const HandLandmarks& hand) {
    static const std::array<LandmarkIndex, 6> kPalmPoints = {
        LandmarkIndex::WRIST,
        LandmarkIndex::THUMB_CMC,
        LandmarkIndex::INDEX_MCP,
        LandmarkIndex::MIDDLE_MCP,
        LandmarkIndex::RING_MCP,
        LandmarkIndex::PINKY_MCP
    };

    cv::Point3f sum(0.0f, 0.0f, 0.0f);
    for (LandmarkIndex index : kPalmPoints) {
        sum += hand[index];
    }
    return sum / static_cast<float>(kPalmPoints.size());
}

cv::Quatf hand_orientation(const HandLandmarks& hand) {
    const cv::Quatf identity(1.0f, 0.0f, 0.0f, 0.0f);

    const cv::Point3f& wrist = hand[LandmarkIndex::WRIST];
    const cv::Vec3f v1(hand[LandmarkIndex::MIDDLE_MCP] - wrist);
    const cv::Vec3f v2(hand[LandmarkIndex::PINKY_MCP] - wrist);

    const float len1 = static_cast<float>(cv::norm(v1));
    const float len2 = static_cast<float>(cv::norm(v2));
    if (len1 < kEpsilon || len2 < kEpsilon) {
        return identity;
    }

    const cv::Vec3f axis = v1 / len1;
    const cv::Vec3f normal = axis.cross(v2 / len2);
    const float normal_len = static_cast<float>(cv::norm(normal));
    if (normal_len < kEpsilon) {
        // Colinear: no plane to take a normal of
        return identity;
    }

    const cv::Vec3f z = normal / normal_len;
    const cv::Vec3f y = z.cross(axis);

    const cv::Matx33f rotation(axis[0], y[0], z[0],
                               axis[1], y[1], z[1],
                               axis[2], y[2], z[2]);
    return cv::Quatf::createFromRotMat(rotation);
}

cv::Point3f pointing_direction(const HandLandmarks& hand) {
    return direction_between(hand, LandmarkIndex::INDEX_PIP, LandmarkIndex::INDEX_TIP);
}

cv::Point3f secondary_finger_direction(const HandLandmarks& hand) {
    return direction_between(hand, LandmarkIndex::MIDDLE_PIP, LandmarkIndex::MIDDLE_TIP);
}

float finger_spread(const HandLandmarks& hand) {
    static const std::array<LandmarkIndex, 4> kTips = {
        LandmarkIndex::INDEX_TIP,
        LandmarkIndex::MIDDLE_TIP,
        LandmarkIndex::RING_TIP,
        LandmarkIndex::PINKY_TIP
    };

    float total = 0.0f;
    for (std::size_t i = 0; i + 1 < kTips.size(); ++i) {
        total += static_cast<float>(cv::norm(hand[kTips[i + 1]] - hand[kTips[i]]));
    }
    return total / static_cast<float>(kTips.size() - 1);
}

} // namespace geometry
} // namespace gesture
} // namespace handcad
