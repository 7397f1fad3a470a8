/**
 * @file test_gesture_recognition_system.cpp
 * @brief Integration tests for GestureRecognitionSystem
 *
 * Validates:
 * - Frame validation rejects malformed input without touching state
 * - Mode toggle by holding the open palm
 * - Action dispatch in normal mode, tool selection in precision mode
 * - Per-hand filter reset when a hand leaves the frame
 * - Statistics
 */

#include <gtest/gtest.h>
#include <handcad/gesture/GestureRecognitionSystem.hpp>
#include <handcad/core/Logger.hpp>
#include <handcad/core/exception.h>
#include "HandPoseFixtures.hpp"
#include <chrono>
#include <cmath>
#include <limits>

using namespace handcad;
using namespace handcad::gesture;

class GestureRecognitionSystemTest : public ::testing::Test {
protected:
    void SetUp() override {
        core::Logger::getInstance().setLevel(core::LogLevel::ERROR);
        t0_ = core::Clock::now();
    }

    core::TimePoint at(double seconds) const {
        return t0_ + std::chrono::duration_cast<core::Clock::duration>(
                         std::chrono::duration<double>(seconds));
    }

    /// Feed the same pose every 0.125 s starting at `start`, collecting events
    std::vector<GestureEvent> hold(GestureRecognitionSystem& system,
                                   const HandLandmarks& hand,
                                   int frames,
                                   double start = 0.0) {
        std::vector<GestureEvent> events;
        for (int i = 0; i < frames; ++i) {
            GestureSnapshot snapshot = system.process_frame({hand}, at(start + i * 0.125));
            events.insert(events.end(), snapshot.events.begin(), snapshot.events.end());
        }
        return events;
    }

    static int count(const std::vector<GestureEvent>& events, GestureEventType type) {
        int n = 0;
        for (const auto& event : events) {
            if (event.type == type) {
                ++n;
            }
        }
        return n;
    }

    GestureRecognitionSystem system_;
    core::TimePoint t0_;
};

/**
 * Test 1: Single hand frame produces a full hand result
 */
TEST_F(GestureRecognitionSystemTest, ProcessSingleHand) {
    GestureSnapshot snapshot = system_.process_frame({test::peace_hand()}, at(0));

    EXPECT_EQ(snapshot.frame_id, 0u);
    EXPECT_FALSE(snapshot.precision_mode);
    ASSERT_EQ(snapshot.hands.size(), 1u);

    const HandResult* primary = snapshot.primary();
    ASSERT_NE(primary, nullptr);
    EXPECT_EQ(primary->coarse.gesture, CoarseGesture::PEACE);
    EXPECT_NEAR(primary->palm_center.x, 0.51f, 1e-5f);
    EXPECT_NEAR(std::abs(primary->orientation.w), 0.70711f, 1e-4f);
    EXPECT_TRUE(primary->precision.empty());
    EXPECT_FALSE(primary->tool.has_value());
}

/**
 * Test 2: Malformed frames are rejected and leave state untouched
 */
TEST_F(GestureRecognitionSystemTest, MalformedFrameRejected) {
    HandLandmarks nan_hand = test::fist_hand();
    nan_hand[LandmarkIndex::INDEX_TIP].x = std::numeric_limits<float>::quiet_NaN();
    EXPECT_THROW(system_.process_frame({nan_hand}, at(0)), core::InvalidLandmarksException);

    HandLandmarks bad_index = test::fist_hand();
    bad_index.hand_index = 2;
    EXPECT_THROW(system_.process_frame({bad_index}, at(0)), core::InvalidLandmarksException);

    EXPECT_THROW(system_.process_frame({test::make_hand({}, 0), test::make_hand({}, 1), test::make_hand({}, 0)}, at(0)),
                 core::InvalidLandmarksException);

    GestureSystemStats stats = system_.get_stats();
    EXPECT_EQ(stats.frames_rejected, 3u);
    EXPECT_EQ(stats.frames_processed, 0u);
    EXPECT_FALSE(system_.get_last_error().empty());

    // No frame id consumed, no filter seeded, no action spent
    GestureSnapshot snapshot = system_.process_frame({test::fist_hand()}, at(0));
    EXPECT_EQ(snapshot.frame_id, 0u);
    EXPECT_TRUE(snapshot.primary()->filtered.velocities.empty());
    EXPECT_EQ(snapshot.action, GestureAction::SPAWN_DRONE);
}

/**
 * Test 3: Duplicate hand indices
 */
TEST_F(GestureRecognitionSystemTest, DuplicateHandIndexRejected) {
    try {
        system_.process_frame({test::fist_hand(), test::peace_hand()}, at(0));
        FAIL() << "Expected InvalidLandmarksException";
    } catch (const core::InvalidLandmarksException& e) {
        EXPECT_EQ(e.getResultCode(), core::ResultCode::ERROR_INVALID_LANDMARKS);
        EXPECT_NE(e.getMessage().find("Duplicate"), std::string::npos);
    }
}

/**
 * Test 4: Hands are reported sorted, the lowest index is primary
 */
TEST_F(GestureRecognitionSystemTest, TwoHandsSortedByIndex) {
    HandLandmarks right = test::make_hand({false, true, true, false, false}, 1);
    HandLandmarks left = test::make_hand({false, false, false, false, false}, 0);

    GestureSnapshot snapshot = system_.process_frame({right, left}, at(0));
    ASSERT_EQ(snapshot.hands.size(), 2u);
    EXPECT_EQ(snapshot.hands[0].hand_index, 0);
    EXPECT_EQ(snapshot.hands[1].hand_index, 1);
    EXPECT_EQ(snapshot.primary()->coarse.gesture, CoarseGesture::FIST);
    EXPECT_EQ(snapshot.hands[1].coarse.gesture, CoarseGesture::PEACE);

    // Only the primary hand dispatches
    EXPECT_EQ(snapshot.action, GestureAction::SPAWN_DRONE);
}

/**
 * Test 5: Empty frame is valid
 */
TEST_F(GestureRecognitionSystemTest, EmptyFrame) {
    GestureSnapshot snapshot = system_.process_frame({}, at(0));
    EXPECT_TRUE(snapshot.hands.empty());
    EXPECT_EQ(snapshot.primary(), nullptr);
    EXPECT_FALSE(snapshot.action.has_value());
    EXPECT_TRUE(snapshot.events.empty());
}

/**
 * Test 6: A hand leaving the frame restarts its filter
 */
TEST_F(GestureRecognitionSystemTest, AbsentHandFilterReset) {
    system_.process_frame({test::pointing_hand()}, at(0.0));
    GestureSnapshot snapshot = system_.process_frame({test::pointing_hand()}, at(0.1));
    EXPECT_FALSE(snapshot.primary()->filtered.velocities.empty());

    system_.process_frame({test::make_hand({}, 1)}, at(0.2));

    snapshot = system_.process_frame({test::pointing_hand()}, at(0.3));
    EXPECT_TRUE(snapshot.primary()->filtered.velocities.empty());
}

/**
 * Test 7: Open palm held for the hold time toggles precision mode
 */
TEST_F(GestureRecognitionSystemTest, OpenPalmHoldTogglesMode) {
    // Arming frame plus 7 steps: not yet
    std::vector<GestureEvent> events = hold(system_, test::open_palm_hand(), 8);
    EXPECT_EQ(count(events, GestureEventType::MODE_TOGGLED), 0);
    EXPECT_FALSE(system_.is_precision_mode());

    // Open palm is camera control: no action events in normal mode
    EXPECT_EQ(count(events, GestureEventType::ACTION_DISPATCHED), 0);

    GestureSnapshot snapshot = system_.process_frame({test::open_palm_hand()}, at(1.0));
    EXPECT_TRUE(snapshot.mode_toggled);
    EXPECT_TRUE(snapshot.precision_mode);
    EXPECT_TRUE(system_.is_precision_mode());
    EXPECT_EQ(snapshot.toggle_state, ModeToggleState::COOLING);

    ASSERT_GE(snapshot.events.size(), 1u);
    EXPECT_EQ(snapshot.events[0].type, GestureEventType::MODE_TOGGLED);
    EXPECT_TRUE(snapshot.events[0].precision_mode);

    // Open palm is the scale tool once precision mode is on
    ASSERT_TRUE(snapshot.tool_selection.has_value());
    EXPECT_EQ(snapshot.tool_selection->tool, CadTool::SCALE);

    EXPECT_EQ(system_.get_stats().toggles_fired, 1u);
}

/**
 * Test 8: Short open palm does not toggle
 */
TEST_F(GestureRecognitionSystemTest, ReleasedPalmDoesNotToggle) {
    hold(system_, test::open_palm_hand(), 8);

    // Hand leaves the frame one step before the toggle would fire
    GestureSnapshot snapshot = system_.process_frame({}, at(1.0));
    EXPECT_FALSE(snapshot.mode_toggled);
    EXPECT_EQ(snapshot.toggle_state, ModeToggleState::IDLE);

    // A new hold starts from scratch
    std::vector<GestureEvent> events = hold(system_, test::open_palm_hand(), 8, 1.125);
    EXPECT_EQ(count(events, GestureEventType::MODE_TOGGLED), 0);
    EXPECT_FALSE(system_.is_precision_mode());
}

/**
 * Test 9: Actions dispatched with the global cooldown
 */
TEST_F(GestureRecognitionSystemTest, ActionDispatchInNormalMode) {
    GestureSnapshot first = system_.process_frame({test::fist_hand()}, at(0.0));
    ASSERT_EQ(first.events.size(), 1u);
    EXPECT_EQ(first.events[0].type, GestureEventType::ACTION_DISPATCHED);
    EXPECT_EQ(first.events[0].gesture, CoarseGesture::FIST);
    EXPECT_EQ(first.events[0].action, GestureAction::SPAWN_DRONE);

    GestureSnapshot second = system_.process_frame({test::fist_hand()}, at(0.5));
    EXPECT_FALSE(second.action.has_value());
    EXPECT_TRUE(second.events.empty());

    system_.process_frame({}, at(0.9));
    GestureSnapshot third = system_.process_frame({test::peace_hand()}, at(1.0));
    EXPECT_EQ(third.action, GestureAction::SHOOT_BULLET);

    EXPECT_EQ(system_.get_stats().actions_dispatched, 2u);
}

/**
 * Test 10: Precision mode runs detectors and reports tool changes once
 */
TEST_F(GestureRecognitionSystemTest, PrecisionModeToolSelection) {
    system_.set_precision_mode(true);

    GestureSnapshot snapshot = system_.process_frame({test::pointing_hand()}, at(0.0));
    ASSERT_EQ(snapshot.events.size(), 1u);
    EXPECT_EQ(snapshot.events[0].type, GestureEventType::TOOL_SELECTED);
    EXPECT_EQ(snapshot.events[0].tool.tool, CadTool::SELECT);
    EXPECT_FALSE(snapshot.action.has_value());

    // No velocity on the first frame, so no precision point yet
    EXPECT_EQ(snapshot.primary()->precision.count(PrecisionGestureKind::PRECISION_POINT), 0u);
    EXPECT_EQ(snapshot.primary()->precision.count(PrecisionGestureKind::SPREAD_SCALE), 1u);

    snapshot = system_.process_frame({test::pointing_hand()}, at(0.033));
    EXPECT_TRUE(snapshot.events.empty());
    EXPECT_EQ(snapshot.tool_selection->tool, CadTool::SELECT);
    EXPECT_EQ(snapshot.primary()->precision.count(PrecisionGestureKind::PRECISION_POINT), 1u);

    snapshot = system_.process_frame({test::peace_hand()}, at(0.066));
    ASSERT_EQ(snapshot.events.size(), 1u);
    EXPECT_EQ(snapshot.events[0].tool.tool, CadTool::CREATE);

    // Fist matches no tool
    system_.process_frame({}, at(0.1));
    snapshot = system_.process_frame({test::fist_hand()}, at(0.133));
    EXPECT_FALSE(snapshot.tool_selection.has_value());
    EXPECT_EQ(system_.get_stats().actions_dispatched, 0u);
}

/**
 * Test 11: Configuration validation and start mode
 */
TEST_F(GestureRecognitionSystemTest, Configuration) {
    GestureSystemConfig config;
    config.start_in_precision_mode = true;
    config.action_cooldown_s = 2.0;
    EXPECT_TRUE(system_.set_config(config));
    EXPECT_TRUE(system_.is_precision_mode());
    EXPECT_DOUBLE_EQ(system_.get_config().action_cooldown_s, 2.0);

    GestureSystemConfig bad;
    bad.mode_toggle_hold_s = 0.0;
    EXPECT_FALSE(system_.set_config(bad));
    EXPECT_DOUBLE_EQ(system_.get_config().mode_toggle_hold_s, 1.0);
    EXPECT_FALSE(system_.get_last_error().empty());
}

/**
 * Test 12: Reset keeps the current mode, reset_stats clears counters
 */
TEST_F(GestureRecognitionSystemTest, ResetAndStats) {
    system_.process_frame({test::fist_hand()}, at(0.0));
    system_.process_frame({test::fist_hand()}, at(0.1));
    EXPECT_EQ(system_.coarse_classifier(0).history().size(), 1u);

    system_.set_precision_mode(true);
    system_.reset();
    EXPECT_TRUE(system_.is_precision_mode());
    EXPECT_TRUE(system_.coarse_classifier(0).history().is_empty());

    GestureSystemStats stats = system_.get_stats();
    EXPECT_EQ(stats.frames_processed, 2u);
    EXPECT_GE(stats.avg_processing_time_ms, 0.0);

    system_.reset_stats();
    EXPECT_EQ(system_.get_stats().frames_processed, 0u);

    EXPECT_THROW(system_.coarse_classifier(2), std::out_of_range);
}
