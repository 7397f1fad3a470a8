/**
 * @file ActionDispatcher.hpp
 * @brief Cooldown-gated mapping from coarse gestures to scene actions
 *
 * @copyright 2025 HandCAD Project
 * @license MIT License
 */

#ifndef HANDCAD_GESTURE_ACTION_DISPATCHER_HPP
#define HANDCAD_GESTURE_ACTION_DISPATCHER_HPP

#include <optional>
#include "CooldownGate.hpp"
#include "GestureTypes.hpp"

namespace handcad {
namespace gesture {

/**
 * @brief Action for a gesture, ignoring any cooldown
 *
 * @return std::nullopt for UNKNOWN
 */
std::optional<GestureAction> action_for(CoarseGesture gesture);

/**
 * @brief Dispatches at most one discrete action per cooldown window
 *
 * open_palm maps to CAMERA_CONTROL, is never rejected and does not restart
 * the cooldown. Every other recognized gesture is rejected while
 * now - last_action_time < action_cooldown.
 */
class ActionDispatcher {
public:
    explicit ActionDispatcher(double action_cooldown_s = 0.8);

    /**
     * @brief Map a gesture to an action if the cooldown allows it
     *
     * @return The dispatched action, or std::nullopt if UNKNOWN or cooling down
     */
    std::optional<GestureAction> dispatch(CoarseGesture gesture, core::TimePoint now);

    void set_cooldown(double action_cooldown_s) { gate_.set_cooldown(action_cooldown_s); }

    double cooldown() const { return gate_.cooldown(); }

    void reset() { gate_.reset(); }

private:
    CooldownGate gate_;
};

} // namespace gesture
} // namespace handcad

#endif // HANDCAD_GESTURE_ACTION_DISPATCHER_HPP
