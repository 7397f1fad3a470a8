/**
 * @file HandPoseFixtures.hpp
 * @brief Synthetic hand poses shared by the unit tests
 *
 * Upright right hand in normalized camera space (y grows downward):
 * wrist at (0.5, 0.8), finger MCP joints on y = 0.6. An extended finger
 * has its PIP/DIP/tip above the MCP (y 0.5/0.45/0.40); a curled finger
 * folds back below it (y 0.55/0.6/0.65). The extended thumb continues the
 * wrist->thumb MCP line; the curled thumb folds toward the palm.
 */

#pragma once

#include <handcad/gesture/GestureTypes.hpp>
#include <initializer_list>

namespace handcad {
namespace test {

using gesture::Finger;
using gesture::HandLandmarks;
using gesture::LandmarkIndex;

struct PoseSpec {
    bool thumb = false;
    bool index = false;
    bool middle = false;
    bool ring = false;
    bool pinky = false;
};

inline void set_finger(HandLandmarks& hand, LandmarkIndex mcp, float x, bool extended) {
    const int base = static_cast<int>(mcp);
    hand.points[base] = cv::Point3f(x, 0.6f, 0.0f);
    if (extended) {
        hand.points[base + 1] = cv::Point3f(x, 0.50f, 0.0f);
        hand.points[base + 2] = cv::Point3f(x, 0.45f, 0.0f);
        hand.points[base + 3] = cv::Point3f(x, 0.40f, 0.0f);
    } else {
        hand.points[base + 1] = cv::Point3f(x, 0.55f, 0.0f);
        hand.points[base + 2] = cv::Point3f(x, 0.60f, 0.0f);
        hand.points[base + 3] = cv::Point3f(x, 0.65f, 0.0f);
    }
}

/**
 * @brief Build a hand with the given fingers extended
 */
inline HandLandmarks make_hand(const PoseSpec& pose, int hand_index = 0) {
    HandLandmarks hand;
    hand.hand_index = hand_index;

    hand[LandmarkIndex::WRIST] = cv::Point3f(0.50f, 0.80f, 0.0f);
    hand[LandmarkIndex::THUMB_CMC] = cv::Point3f(0.44f, 0.75f, 0.0f);
    hand[LandmarkIndex::THUMB_MCP] = cv::Point3f(0.38f, 0.70f, 0.0f);
    if (pose.thumb) {
        hand[LandmarkIndex::THUMB_IP] = cv::Point3f(0.32f, 0.65f, 0.0f);
        hand[LandmarkIndex::THUMB_TIP] = cv::Point3f(0.26f, 0.60f, 0.0f);
    } else {
        hand[LandmarkIndex::THUMB_IP] = cv::Point3f(0.42f, 0.66f, 0.0f);
        hand[LandmarkIndex::THUMB_TIP] = cv::Point3f(0.46f, 0.72f, 0.0f);
    }

    set_finger(hand, LandmarkIndex::INDEX_MCP, 0.44f, pose.index);
    set_finger(hand, LandmarkIndex::MIDDLE_MCP, 0.50f, pose.middle);
    set_finger(hand, LandmarkIndex::RING_MCP, 0.56f, pose.ring);
    set_finger(hand, LandmarkIndex::PINKY_MCP, 0.62f, pose.pinky);
    return hand;
}

inline HandLandmarks fist_hand()       { return make_hand({false, false, false, false, false}); }
inline HandLandmarks thumbs_up_hand()  { return make_hand({true, false, false, false, false}); }
inline HandLandmarks peace_hand()      { return make_hand({false, true, true, false, false}); }
inline HandLandmarks open_palm_hand()  { return make_hand({true, true, true, true, true}); }
inline HandLandmarks rock_sign_hand()  { return make_hand({false, true, false, false, true}); }
inline HandLandmarks pointing_hand()   { return make_hand({false, true, false, false, false}); }
inline HandLandmarks three_finger_hand() { return make_hand({false, true, true, true, false}); }
inline HandLandmarks four_finger_hand()  { return make_hand({false, true, true, true, true}); }
inline HandLandmarks phone_hand()      { return make_hand({true, true, false, false, true}); }

/**
 * @brief Index, middle and ring extended with the thumb tip `distance` to the
 *        right of the index tip (thumb not extended)
 */
inline HandLandmarks pinch_hand(float distance) {
    HandLandmarks hand = make_hand({false, true, true, true, false});
    const cv::Point3f tip = hand[LandmarkIndex::INDEX_TIP];
    hand[LandmarkIndex::THUMB_IP] = cv::Point3f(tip.x + distance, 0.50f, 0.0f);
    hand[LandmarkIndex::THUMB_TIP] = cv::Point3f(tip.x + distance, tip.y, tip.z);
    return hand;
}

inline std::vector<cv::Point3f> to_points(const HandLandmarks& hand) {
    return std::vector<cv::Point3f>(hand.points.begin(), hand.points.end());
}

/**
 * @brief Translate every landmark
 */
inline HandLandmarks shifted(HandLandmarks hand, const cv::Point3f& offset) {
    for (auto& point : hand.points) {
        point += offset;
    }
    return hand;
}

} // namespace test
} // namespace handcad
