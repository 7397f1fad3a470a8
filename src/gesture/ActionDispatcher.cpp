/**
 * @file ActionDispatcher.cpp
 * @brief Implementation of the action dispatcher
 */

#include "handcad/gesture/ActionDispatcher.hpp"
#include <handcad/core/Logger.hpp>

namespace handcad {
namespace gesture {

std::optional<GestureAction> action_for(CoarseGesture gesture) {
    switch (gesture) {
        case CoarseGesture::UNKNOWN:   return std::nullopt;
        case CoarseGesture::FIST:      return GestureAction::SPAWN_DRONE;
        case CoarseGesture::THUMBS_UP: return GestureAction::ROTATE_ALL;
        case CoarseGesture::PEACE:     return GestureAction::SHOOT_BULLET;
        case CoarseGesture::OPEN_PALM: return GestureAction::CAMERA_CONTROL;
        case CoarseGesture::PINCH:     return GestureAction::SPAWN_BOX;
        case CoarseGesture::ROCK_SIGN: return GestureAction::EXPLOSION;
    }
    return std::nullopt;
}

ActionDispatcher::ActionDispatcher(double action_cooldown_s)
    : gate_(action_cooldown_s) {
}

std::optional<GestureAction> ActionDispatcher::dispatch(CoarseGesture gesture,
                                                        core::TimePoint now) {
    const std::optional<GestureAction> action = action_for(gesture);
    if (!action) {
        return std::nullopt;
    }

    // Continuous control: exempt from the cooldown and does not restart it
    if (*action == GestureAction::CAMERA_CONTROL) {
        return action;
    }

    if (!gate_.try_acquire(now)) {
        return std::nullopt;
    }

    LOG_INFO("ActionDispatcher: " + to_string(gesture) + " -> " + to_string(*action));
    return action;
}

} // namespace gesture
} // namespace handcad
