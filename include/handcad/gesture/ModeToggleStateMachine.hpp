/**
 * @file ModeToggleStateMachine.hpp
 * @brief Hold-to-toggle hysteresis timer
 *
 * Converts a sustained "all fingers extended" pose into a single toggle
 * event. A single signed timer encodes the state:
 *   t == 0  Idle
 *   t  > 0  Arming, seconds of hold remaining
 *   t  < 0  Cooling, negated seconds until re-arming is allowed
 *
 * @copyright 2025 HandCAD Project
 * @license MIT License
 */

#ifndef HANDCAD_GESTURE_MODE_TOGGLE_STATE_MACHINE_HPP
#define HANDCAD_GESTURE_MODE_TOGGLE_STATE_MACHINE_HPP

#include <string>

namespace handcad {
namespace gesture {

enum class ModeToggleState {
    IDLE,
    ARMING,
    COOLING
};

std::string to_string(ModeToggleState state);

class ModeToggleStateMachine {
public:
    /**
     * @param hold_time_s Seconds the pose must be held; also the cooldown after firing
     */
    explicit ModeToggleStateMachine(double hold_time_s = 1.0);

    /**
     * @brief Advance by one frame
     *
     * The frame that first sees the pose arms the timer without consuming dt.
     * While arming, a broken pose returns to idle. Cooling runs down
     * regardless of the pose.
     *
     * @param pose_held True when all five fingers are extended
     * @param dt_s Seconds since the previous frame (negative values count as 0)
     * @return true exactly on the frame the toggle fires
     */
    bool update(bool pose_held, double dt_s);

    ModeToggleState state() const;

    /**
     * @brief Raw signed timer value
     */
    double timer() const { return timer_; }

    double hold_time() const { return hold_time_; }

    /**
     * @brief Change the hold time (takes effect on the next arming)
     */
    void set_hold_time(double hold_time_s);

    /**
     * @brief Return to idle immediately
     */
    void reset() { timer_ = 0.0; }

private:
    double hold_time_;
    double timer_ = 0.0;
};

} // namespace gesture
} // namespace handcad

#endif // HANDCAD_GESTURE_MODE_TOGGLE_STATE_MACHINE_HPP
