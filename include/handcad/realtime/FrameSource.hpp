/* SPDX-License-Identifier: MIT */
/*
 * Acquisition-side interface: where landmark frames come from
 */

#pragma once

#include <vector>
#include <opencv2/core.hpp>
#include <handcad/core/exception.h>
#include <handcad/core/types.hpp>

namespace handcad {
namespace realtime {

/**
 * Detector output for one hand, not yet validated
 */
struct RawHand {
    int hand_index = 0;
    std::vector<cv::Point3f> points;
};

/**
 * All hands detected in one camera tick
 */
struct HandFrameBatch {
    core::TimePoint timestamp;
    std::vector<RawHand> hands;     ///< Hands not detected this tick are simply absent
};

/**
 * Producer of landmark frames
 *
 * next() is called from the acquisition thread only; it may block until the
 * next camera tick. interrupt() may be called from any thread and must make
 * a blocked next() return promptly.
 */
class FrameSource {
public:
    virtual ~FrameSource() = default;

    /**
     * Wait for the next tick
     * @return false at end of stream or after interrupt()
     */
    virtual bool next(HandFrameBatch& batch) = 0;

    /**
     * A batch from this source was rejected as malformed
     *
     * Default implementation logs the failure.
     */
    virtual void onRejected(const core::Exception& error);

    /**
     * Unblock a pending next()
     */
    virtual void interrupt() {}
};

} // namespace realtime
} // namespace handcad
