/* SPDX-License-Identifier: MIT */

#include <handcad/realtime/RecordedFrameSource.hpp>
#include <handcad/core/Logger.hpp>
#include <yaml-cpp/yaml.h>
#include <chrono>
#include <fstream>
#include <sstream>

namespace handcad {
namespace realtime {

RecordedFrameSource::RecordedFrameSource(bool realtime_pacing)
    : pacing_(realtime_pacing) {
}

bool RecordedFrameSource::load(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        LOG_ERROR("RecordedFrameSource: cannot open " + filename);
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse(buffer.str(), filename);
}

bool RecordedFrameSource::loadFromString(const std::string& yaml) {
    return parse(yaml, "<memory>");
}

bool RecordedFrameSource::parse(const std::string& yaml, const std::string& origin) {
    std::vector<RecordedFrame> frames;

    try {
        YAML::Node root = YAML::Load(yaml);
        YAML::Node frames_node = root["frames"];
        if (!frames_node || !frames_node.IsSequence()) {
            LOG_ERROR("RecordedFrameSource: " + origin + " has no 'frames' sequence");
            return false;
        }

        double previous_t = 0.0;
        for (const auto& frame_node : frames_node) {
            RecordedFrame frame;
            frame.t = frame_node["t"].as<double>();
            if (frame.t < previous_t) {
                LOG_ERROR("RecordedFrameSource: " + origin + " frame times go backwards at t=" +
                          std::to_string(frame.t));
                return false;
            }
            previous_t = frame.t;

            const YAML::Node hands_node = frame_node["hands"];
            if (hands_node && hands_node.IsSequence()) {
                for (const auto& hand_node : hands_node) {
                    RawHand hand;
                    hand.hand_index = hand_node["index"].as<int>(0);
                    for (const auto& point_node : hand_node["points"]) {
                        auto coords = point_node.as<std::vector<float>>();
                        if (coords.size() != 3) {
                            LOG_ERROR("RecordedFrameSource: " + origin +
                                      " point without 3 coordinates at t=" + std::to_string(frame.t));
                            return false;
                        }
                        hand.points.emplace_back(coords[0], coords[1], coords[2]);
                    }
                    frame.hands.push_back(std::move(hand));
                }
            }

            frames.push_back(std::move(frame));
        }
    } catch (const YAML::Exception& e) {
        LOG_ERROR("RecordedFrameSource: failed to parse " + origin + ": " + e.what());
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    frames_ = std::move(frames);
    position_ = 0;
    start_time_.reset();
    interrupted_ = false;

    LOG_INFO("RecordedFrameSource: loaded " + std::to_string(frames_.size()) +
             " frames from " + origin);
    return true;
}

bool RecordedFrameSource::next(HandFrameBatch& batch) {
    std::unique_lock<std::mutex> lock(mutex_);

    if (interrupted_ || position_ >= frames_.size()) {
        return false;
    }

    if (!start_time_) {
        start_time_ = core::Clock::now();
    }

    const RecordedFrame& frame = frames_[position_];
    const auto due = *start_time_ + std::chrono::duration_cast<core::Clock::duration>(
        std::chrono::duration<double>(frame.t));

    if (pacing_) {
        cv_.wait_until(lock, due, [this] { return interrupted_; });
        if (interrupted_) {
            return false;
        }
    }

    batch.timestamp = due;
    batch.hands = frame.hands;
    position_++;
    return true;
}

void RecordedFrameSource::interrupt() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        interrupted_ = true;
    }
    cv_.notify_all();
}

void RecordedFrameSource::rewind() {
    std::lock_guard<std::mutex> lock(mutex_);
    position_ = 0;
    start_time_.reset();
    interrupted_ = false;
}

size_t RecordedFrameSource::frameCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return frames_.size();
}

size_t RecordedFrameSource::position() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return position_;
}

size_t RecordedFrameSource::rejectedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rejected_;
}

void RecordedFrameSource::onRejected(const core::Exception& error) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        rejected_++;
    }
    FrameSource::onRejected(error);
}

} // namespace realtime
} // namespace handcad
