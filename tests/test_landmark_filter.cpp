/**
 * @file test_landmark_filter.cpp
 * @brief Unit tests for LandmarkFilter
 *
 * Validates:
 * - First frame passes through with no velocities
 * - Non-fingertip landmarks are never modified
 * - Convergence of a stationary noisy fingertip
 * - Velocity is the frame-to-frame filtered displacement
 * - Reset behaves like a fresh filter
 */

#include <gtest/gtest.h>
#include <handcad/gesture/LandmarkFilter.hpp>
#include <handcad/core/Logger.hpp>
#include "HandPoseFixtures.hpp"
#include <cmath>
#include <random>
#include <vector>

using namespace handcad;
using namespace handcad::gesture;

class LandmarkFilterTest : public ::testing::Test {
protected:
    void SetUp() override {
        core::Logger::getInstance().setLevel(core::LogLevel::WARNING);
    }

    static double variance(const std::vector<float>& values) {
        double mean = 0.0;
        for (float v : values) {
            mean += v;
        }
        mean /= values.size();

        double sum = 0.0;
        for (float v : values) {
            sum += (v - mean) * (v - mean);
        }
        return sum / values.size();
    }

    LandmarkFilter filter_;
};

/**
 * Test 1: First frame after construction
 */
TEST_F(LandmarkFilterTest, FirstFramePassesThroughWithoutVelocities) {
    EXPECT_FALSE(filter_.is_initialized());

    const HandLandmarks raw = test::open_palm_hand();
    FilteredHand out = filter_.update(raw);

    EXPECT_TRUE(out.velocities.empty());
    EXPECT_TRUE(filter_.is_initialized());
    for (size_t i = 0; i < kNumLandmarks; ++i) {
        EXPECT_EQ(out.landmarks.points[i], raw.points[i]) << "landmark " << i;
    }
}

/**
 * Test 2: Second frame reports a velocity for every fingertip
 */
TEST_F(LandmarkFilterTest, SecondFrameHasFingertipVelocities) {
    filter_.update(test::open_palm_hand());
    FilteredHand out = filter_.update(test::open_palm_hand());

    ASSERT_EQ(out.velocities.size(), kFingertips.size());
    for (LandmarkIndex tip : kFingertips) {
        ASSERT_EQ(out.velocities.count(tip), 1u);
        EXPECT_NEAR(cv::norm(out.velocities[tip]), 0.0, 1e-6);
    }
}

/**
 * Test 3: Only fingertips are filtered
 */
TEST_F(LandmarkFilterTest, NonFingertipLandmarksPassThrough) {
    filter_.update(test::open_palm_hand());

    const HandLandmarks moved = test::shifted(test::open_palm_hand(), cv::Point3f(0.05f, 0.02f, 0.01f));
    FilteredHand out = filter_.update(moved);

    for (size_t i = 0; i < kNumLandmarks; ++i) {
        const auto index = static_cast<LandmarkIndex>(i);
        bool is_tip = false;
        for (LandmarkIndex tip : kFingertips) {
            is_tip = is_tip || tip == index;
        }
        if (is_tip) {
            // Smoothed: lags behind the jump
            EXPECT_LT(out.landmarks.points[i].x, moved.points[i].x) << "landmark " << i;
        } else {
            EXPECT_EQ(out.landmarks.points[i], moved.points[i]) << "landmark " << i;
        }
    }
}

/**
 * Test 4: Stationary fingertip with Gaussian noise converges
 */
TEST_F(LandmarkFilterTest, StationaryFingertipConverges) {
    std::mt19937 rng(42);
    std::normal_distribution<float> noise(0.0f, 0.005f);

    const HandLandmarks base = test::pointing_hand();
    const cv::Point3f truth = base[LandmarkIndex::INDEX_TIP];

    std::vector<float> variances;
    std::vector<float> raw_x;
    std::vector<float> filtered_x;

    const int kFrames = 300;
    for (int frame = 0; frame < kFrames; ++frame) {
        HandLandmarks noisy = base;
        noisy[LandmarkIndex::INDEX_TIP] += cv::Point3f(noise(rng), noise(rng), noise(rng));

        FilteredHand out = filter_.update(noisy);
        variances.push_back(filter_.position_variance(LandmarkIndex::INDEX_TIP));

        if (frame >= 50) {
            raw_x.push_back(noisy[LandmarkIndex::INDEX_TIP].x);
            filtered_x.push_back(out.landmarks[LandmarkIndex::INDEX_TIP].x);
        }
    }

    // Posterior uncertainty shrinks from the second correction on
    for (size_t i = 3; i < variances.size(); ++i) {
        EXPECT_LE(variances[i], variances[i - 1] + 1e-6f) << "frame " << i;
    }
    EXPECT_LT(variances.back(), variances.front());

    // Output is less noisy than the measurements and centered on the truth
    EXPECT_LT(variance(filtered_x), 0.8 * variance(raw_x));

    double mean = 0.0;
    for (float x : filtered_x) {
        mean += x;
    }
    mean /= filtered_x.size();
    EXPECT_NEAR(mean, truth.x, 0.002);
}

/**
 * Test 5: Velocity equals the difference of consecutive filtered positions
 */
TEST_F(LandmarkFilterTest, VelocityIsFilteredDisplacement) {
    HandLandmarks hand = test::pointing_hand();

    FilteredHand previous = filter_.update(hand);
    for (int frame = 1; frame < 10; ++frame) {
        hand = test::shifted(hand, cv::Point3f(0.01f, 0.0f, 0.0f));
        FilteredHand current = filter_.update(hand);

        const cv::Point3f expected = current.landmarks[LandmarkIndex::INDEX_TIP] -
                                     previous.landmarks[LandmarkIndex::INDEX_TIP];
        const cv::Point3f velocity = current.velocities.at(LandmarkIndex::INDEX_TIP);
        EXPECT_NEAR(velocity.x, expected.x, 1e-6);
        EXPECT_NEAR(velocity.y, expected.y, 1e-6);
        EXPECT_NEAR(velocity.z, expected.z, 1e-6);
        EXPECT_GT(velocity.x, 0.0f);

        previous = current;
    }
}

/**
 * Test 6: Reset drops state
 */
TEST_F(LandmarkFilterTest, ResetRestartsFromRawMeasurement) {
    filter_.update(test::pointing_hand());
    filter_.update(test::pointing_hand());

    filter_.reset();
    EXPECT_FALSE(filter_.is_initialized());
    EXPECT_LT(filter_.position_variance(LandmarkIndex::INDEX_TIP), 0.0f);

    const HandLandmarks moved = test::shifted(test::pointing_hand(), cv::Point3f(0.2f, 0.0f, 0.0f));
    FilteredHand out = filter_.update(moved);
    EXPECT_TRUE(out.velocities.empty());
    EXPECT_EQ(out.landmarks[LandmarkIndex::INDEX_TIP], moved[LandmarkIndex::INDEX_TIP]);
}

/**
 * Test 7: Variance query for a non-fingertip joint
 */
TEST_F(LandmarkFilterTest, PositionVarianceOnlyForFingertips) {
    filter_.update(test::pointing_hand());
    EXPECT_LT(filter_.position_variance(LandmarkIndex::WRIST), 0.0f);
    EXPECT_FLOAT_EQ(filter_.position_variance(LandmarkIndex::INDEX_TIP), 0.1f);
}

/**
 * Test 8: Invalid configuration is rejected
 */
TEST_F(LandmarkFilterTest, InvalidConfigurationIgnored) {
    LandmarkFilterConfig bad;
    bad.measurement_noise = 0.0f;
    EXPECT_FALSE(bad.is_valid());

    filter_.configure(bad);
    EXPECT_FLOAT_EQ(filter_.get_config().measurement_noise, 0.1f);

    LandmarkFilterConfig smoother;
    smoother.measurement_noise = 1.0f;
    filter_.configure(smoother);
    EXPECT_FLOAT_EQ(filter_.get_config().measurement_noise, 1.0f);
}
