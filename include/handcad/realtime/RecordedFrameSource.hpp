/* SPDX-License-Identifier: MIT */
/*
 * Frame source replaying a recorded landmark stream
 *
 * Recording format (YAML):
 *
 *   frames:
 *     - t: 0.000             # seconds since the start of the recording
 *       hands:
 *         - index: 0
 *           points: [[x, y, z], ...]   # 21 entries
 *     - t: 0.033
 *       hands: []            # no hand detected this tick
 */

#pragma once

#include <condition_variable>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <handcad/realtime/FrameSource.hpp>

namespace handcad {
namespace realtime {

class RecordedFrameSource : public FrameSource {
public:
    /**
     * @param realtime_pacing Wait until each frame's recorded time before returning it
     */
    explicit RecordedFrameSource(bool realtime_pacing = false);

    /**
     * Load a recording from file
     * @return false if the file cannot be read or is not a valid recording
     */
    bool load(const std::string& filename);

    /**
     * Load a recording from a YAML document held in memory
     */
    bool loadFromString(const std::string& yaml);

    bool next(HandFrameBatch& batch) override;

    void interrupt() override;

    /**
     * Restart playback from the first frame
     */
    void rewind();

    size_t frameCount() const;

    /**
     * Number of frames already returned by next()
     */
    size_t position() const;

    size_t rejectedCount() const;

    void onRejected(const core::Exception& error) override;

private:
    struct RecordedFrame {
        double t = 0.0;
        std::vector<RawHand> hands;
    };

    bool parse(const std::string& yaml, const std::string& origin);

    bool pacing_;
    std::vector<RecordedFrame> frames_;
    size_t position_ = 0;
    size_t rejected_ = 0;
    std::optional<core::TimePoint> start_time_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool interrupted_ = false;
};

} // namespace realtime
} // namespace handcad
