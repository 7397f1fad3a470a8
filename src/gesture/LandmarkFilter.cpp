/**
 * @file LandmarkFilter.cpp
 * @brief Implementation of fingertip smoothing with Kalman filtering
 */

#include "handcad/gesture/LandmarkFilter.hpp"
#include <handcad/core/Logger.hpp>
#include <opencv2/video/tracking.hpp>
#include <array>

namespace handcad {
namespace gesture {

/**
 * @brief Kalman filter for a single fingertip
 *
 * State: [x, y, z, vx, vy, vz], measurement: [x, y, z]
 */
struct FingertipFilter {
    cv::KalmanFilter kalman;
    cv::Point3f last_output;
    bool initialized = false;

    FingertipFilter() {
        kalman.init(6, 3, 0);

        // Transition matrix (constant velocity model, one frame per step)
        kalman.transitionMatrix = (cv::Mat_<float>(6, 6) <<
            1, 0, 0, 1, 0, 0,  // x += vx
            0, 1, 0, 0, 1, 0,  // y += vy
            0, 0, 1, 0, 0, 1,  // z += vz
            0, 0, 0, 1, 0, 0,  // vx
            0, 0, 0, 0, 1, 0,  // vy
            0, 0, 0, 0, 0, 1   // vz
        );

        // Measurement matrix
        kalman.measurementMatrix = (cv::Mat_<float>(3, 6) <<
            1, 0, 0, 0, 0, 0,
            0, 1, 0, 0, 0, 0,
            0, 0, 1, 0, 0, 0
        );
    }

    void update_noise(const LandmarkFilterConfig& config) {
        cv::setIdentity(kalman.processNoiseCov, cv::Scalar::all(config.process_noise));
        cv::setIdentity(kalman.measurementNoiseCov, cv::Scalar::all(config.measurement_noise));
    }

    void seed(const cv::Point3f& measured, float initial_covariance) {
        kalman.statePost.at<float>(0) = measured.x;
        kalman.statePost.at<float>(1) = measured.y;
        kalman.statePost.at<float>(2) = measured.z;
        kalman.statePost.at<float>(3) = 0.0f;  // vx
        kalman.statePost.at<float>(4) = 0.0f;  // vy
        kalman.statePost.at<float>(5) = 0.0f;  // vz
        cv::setIdentity(kalman.errorCovPost, cv::Scalar::all(initial_covariance));

        last_output = measured;
        initialized = true;
    }

    cv::Point3f step(const cv::Point3f& measured) {
        kalman.predict();

        cv::Mat measurement = (cv::Mat_<float>(3, 1) <<
            measured.x,
            measured.y,
            measured.z
        );

        const cv::Mat& corrected = kalman.correct(measurement);

        last_output = cv::Point3f(corrected.at<float>(0),
                                  corrected.at<float>(1),
                                  corrected.at<float>(2));
        return last_output;
    }
};

/**
 * @brief PIMPL implementation for LandmarkFilter
 */
class LandmarkFilter::Impl {
public:
    LandmarkFilterConfig config;
    std::array<FingertipFilter, kFingertips.size()> filters;
    bool has_previous = false;

    void apply_noise() {
        for (auto& filter : filters) {
            filter.update_noise(config);
        }
    }

    static int slot_of(LandmarkIndex index) {
        for (std::size_t i = 0; i < kFingertips.size(); ++i) {
            if (kFingertips[i] == index) {
                return static_cast<int>(i);
            }
        }
        return -1;
    }
};

// ===== Public API Implementation =====

LandmarkFilter::LandmarkFilter()
    : LandmarkFilter(LandmarkFilterConfig{}) {
}

LandmarkFilter::LandmarkFilter(const LandmarkFilterConfig& config)
    : pImpl(std::make_unique<Impl>()) {
    pImpl->config = config.is_valid() ? config : LandmarkFilterConfig{};
    pImpl->apply_noise();
}

LandmarkFilter::~LandmarkFilter() = default;

LandmarkFilter::LandmarkFilter(LandmarkFilter&&) noexcept = default;
LandmarkFilter& LandmarkFilter::operator=(LandmarkFilter&&) noexcept = default;

FilteredHand LandmarkFilter::update(const HandLandmarks& raw) {
    FilteredHand result;
    result.landmarks = raw;

    for (std::size_t i = 0; i < kFingertips.size(); ++i) {
        const LandmarkIndex tip = kFingertips[i];
        FingertipFilter& filter = pImpl->filters[i];

        if (!filter.initialized) {
            // First observation: the raw position is the best estimate we have
            filter.seed(raw[tip], pImpl->config.initial_covariance);
            continue;
        }

        const cv::Point3f previous = filter.last_output;
        const cv::Point3f filtered = filter.step(raw[tip]);

        result.landmarks[tip] = filtered;
        if (pImpl->has_previous) {
            result.velocities[tip] = filtered - previous;
        }
    }

    pImpl->has_previous = true;
    return result;
}

void LandmarkFilter::reset() {
    if (pImpl->has_previous) {
        LOG_DEBUG("LandmarkFilter: reset hand filter state");
    }
    for (auto& filter : pImpl->filters) {
        filter.initialized = false;
    }
    pImpl->has_previous = false;
}

bool LandmarkFilter::is_initialized() const {
    return pImpl->has_previous;
}

float LandmarkFilter::position_variance(LandmarkIndex fingertip) const {
    const int slot = Impl::slot_of(fingertip);
    if (slot < 0 || !pImpl->filters[slot].initialized) {
        return -1.0f;
    }
    return pImpl->filters[slot].kalman.errorCovPost.at<float>(0, 0);
}

void LandmarkFilter::configure(const LandmarkFilterConfig& config) {
    if (config.is_valid()) {
        pImpl->config = config;

        // Update noise for existing filters
        pImpl->apply_noise();
    } else {
        LOG_WARNING("LandmarkFilter: ignoring invalid configuration");
    }
}

LandmarkFilterConfig LandmarkFilter::get_config() const {
    return pImpl->config;
}

} // namespace gesture
} // namespace handcad
