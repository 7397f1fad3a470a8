/**
 * @file ModeToggleStateMachine.cpp
 * @brief Implementation of the hold-to-toggle timer
 */

#include "handcad/gesture/ModeToggleStateMachine.hpp"
#include <handcad/core/Logger.hpp>
#include <algorithm>

namespace handcad {
namespace gesture {

std::string to_string(ModeToggleState state) {
    switch (state) {
        case ModeToggleState::IDLE:    return "idle";
        case ModeToggleState::ARMING:  return "arming";
        case ModeToggleState::COOLING: return "cooling";
    }
    return "idle";
}

ModeToggleStateMachine::ModeToggleStateMachine(double hold_time_s)
    : hold_time_(hold_time_s > 0.0 ? hold_time_s : 1.0) {
}

ModeToggleState ModeToggleStateMachine::state() const {
    if (timer_ > 0.0) {
        return ModeToggleState::ARMING;
    }
    if (timer_ < 0.0) {
        return ModeToggleState::COOLING;
    }
    return ModeToggleState::IDLE;
}

bool ModeToggleStateMachine::update(bool pose_held, double dt_s) {
    const double dt = std::max(0.0, dt_s);

    switch (state()) {
        case ModeToggleState::IDLE:
            if (pose_held) {
                timer_ = hold_time_;
            }
            return false;

        case ModeToggleState::ARMING:
            if (!pose_held) {
                timer_ = 0.0;
                return false;
            }
            timer_ -= dt;
            if (timer_ <= 0.0) {
                timer_ = -hold_time_;
                LOG_DEBUG("ModeToggleStateMachine: toggle fired after " +
                          std::to_string(hold_time_) + "s hold");
                return true;
            }
            return false;

        case ModeToggleState::COOLING:
            timer_ = std::min(0.0, timer_ + dt);
            return false;
    }
    return false;
}

void ModeToggleStateMachine::set_hold_time(double hold_time_s) {
    if (hold_time_s > 0.0) {
        hold_time_ = hold_time_s;
    } else {
        LOG_WARNING("ModeToggleStateMachine: ignoring non-positive hold time");
    }
}

} // namespace gesture
} // namespace handcad
