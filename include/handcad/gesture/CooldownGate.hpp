/**
 * @file CooldownGate.hpp
 * @brief Minimum-interval gate for discrete triggers
 *
 * @copyright 2025 HandCAD Project
 * @license MIT License
 */

#ifndef HANDCAD_GESTURE_COOLDOWN_GATE_HPP
#define HANDCAD_GESTURE_COOLDOWN_GATE_HPP

#include <handcad/core/types.hpp>
#include <optional>

namespace handcad {
namespace gesture {

/**
 * @brief Accepts a trigger only when the cooldown has elapsed since the last accepted one
 *
 * The first trigger is always accepted. A trigger exactly `cooldown`
 * seconds after the previous one is accepted.
 */
class CooldownGate {
public:
    explicit CooldownGate(double cooldown_seconds = 0.0)
        : cooldown_(cooldown_seconds) {}

    /**
     * @brief True if a trigger at `now` would be accepted
     */
    bool ready(core::TimePoint now) const {
        return !last_ || core::seconds_between(*last_, now) >= cooldown_;
    }

    /**
     * @brief Record an accepted trigger without checking the gate
     */
    void mark(core::TimePoint now) { last_ = now; }

    /**
     * @brief Accept and record the trigger if the gate is open
     */
    bool try_acquire(core::TimePoint now) {
        if (!ready(now)) {
            return false;
        }
        last_ = now;
        return true;
    }

    void reset() { last_.reset(); }

    void set_cooldown(double cooldown_seconds) { cooldown_ = cooldown_seconds; }

    double cooldown() const { return cooldown_; }

    const std::optional<core::TimePoint>& last_trigger() const { return last_; }

private:
    double cooldown_;
    std::optional<core::TimePoint> last_;
};

} // namespace gesture
} // namespace handcad

#endif // HANDCAD_GESTURE_COOLDOWN_GATE_HPP
