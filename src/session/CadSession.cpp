/**
 * @file CadSession.cpp
 * @brief Implementation of the scene-side session context
 */

#include "handcad/session/CadSession.hpp"
#include <handcad/core/Configuration.hpp>
#include <handcad/core/Logger.hpp>
#include <handcad/core/exception.h>
#include <algorithm>
#include <cmath>
#include <utility>

namespace handcad {
namespace session {

using gesture::CadTool;
using gesture::GestureAction;
using gesture::GestureEventType;
using gesture::LandmarkIndex;
using gesture::PrecisionGestureKind;

namespace {

// Routing thresholds per tool
constexpr float kPointThreshold = 0.8f;
constexpr float kPinchThreshold = 0.8f;
constexpr float kSpreadThreshold = 0.5f;
constexpr float kThreeFingerThreshold = 0.7f;

// Normalized hand space -> world units
constexpr float kWorldScaleX = 20.0f;
constexpr float kWorldScaleY = 15.0f;
constexpr float kWorldScaleZ = 10.0f;

constexpr float kRotationGain = 5.0f;

const gesture::PrecisionGesture* find_gesture(const gesture::HandResult& hand,
                                              PrecisionGestureKind kind,
                                              float min_confidence) {
    auto it = hand.precision.find(kind);
    if (it == hand.precision.end() || it->second.confidence <= min_confidence) {
        return nullptr;
    }
    return &it->second;
}

SceneCommand command(SceneCommandType type) {
    SceneCommand cmd;
    cmd.type = type;
    return cmd;
}

} // namespace

std::string to_string(PrimitiveType primitive) {
    switch (primitive) {
        case PrimitiveType::BOX:      return "box";
        case PrimitiveType::SPHERE:   return "sphere";
        case PrimitiveType::CYLINDER: return "cylinder";
        case PrimitiveType::PYRAMID:  return "pyramid";
    }
    return "box";
}

std::string to_string(SceneCommandType type) {
    switch (type) {
        case SceneCommandType::MODE_CHANGED:      return "mode_changed";
        case SceneCommandType::TOOL_CHANGED:      return "tool_changed";
        case SceneCommandType::SPAWN_DRONE:       return "spawn_drone";
        case SceneCommandType::SHOOT_BULLET:      return "shoot_bullet";
        case SceneCommandType::SPAWN_BOX:         return "spawn_box";
        case SceneCommandType::ROTATE_ALL:        return "rotate_all";
        case SceneCommandType::EXPLOSION:         return "explosion";
        case SceneCommandType::CAMERA_FOLLOW:     return "camera_follow";
        case SceneCommandType::SELECT_AT:         return "select_at";
        case SceneCommandType::PLACE_PRIMITIVE:   return "place_primitive";
        case SceneCommandType::MOVE_SELECTION:    return "move_selection";
        case SceneCommandType::SCALE_SELECTION:   return "scale_selection";
        case SceneCommandType::ROTATE_SELECTION:  return "rotate_selection";
        case SceneCommandType::EXTRUDE_SELECTION: return "extrude_selection";
    }
    return "unknown";
}

SessionConfig SessionConfig::from_configuration(const core::Configuration& configuration) {
    SessionConfig config;
    config.start_in_cad_mode = configuration.get<bool>("session.start_in_cad_mode", true);
    config.tool_acceptance_confidence =
        configuration.get<float>("session.tool_acceptance_confidence", 0.8f);
    config.tool_cooldown_s = configuration.get<double>("session.tool_cooldown_s", 1.0);
    config.grid_size = configuration.get<float>("session.grid_size", 0.5f);
    config.snap_to_grid = configuration.get<bool>("session.snap_to_grid", true);

    if (!config.is_valid()) {
        HANDCAD_THROW(core::ConfigurationException, "Invalid session configuration");
    }
    return config;
}

CadSession::CadSession()
    : CadSession(SessionConfig{}) {
}

CadSession::CadSession(const SessionConfig& config)
    : config_(config.is_valid() ? config : SessionConfig{})
    , cad_active_(config_.start_in_cad_mode) {
    for (CadTool tool : {CadTool::SELECT, CadTool::CREATE}) {
        tool_gates_.emplace(tool, gesture::CooldownGate(config_.tool_cooldown_s));
    }
}

std::vector<SceneCommand> CadSession::apply(const gesture::GestureSnapshot* snapshot,
                                            const std::vector<gesture::GestureEvent>& events,
                                            core::TimePoint now) {
    std::vector<SceneCommand> commands;

    for (const auto& event : events) {
        apply_event(event, commands);
    }

    if (!snapshot || (last_frame_id_ && *last_frame_id_ == snapshot->frame_id)) {
        return commands;
    }
    last_frame_id_ = snapshot->frame_id;

    const gesture::HandResult* primary = snapshot->primary();
    if (!primary) {
        return commands;
    }

    // Frames recognized before a mode request took effect carry the old mode
    if (snapshot->precision_mode != cad_active_) {
        return commands;
    }

    if (cad_active_) {
        route_cad(*primary, now, commands);
    } else if (snapshot->action && *snapshot->action == GestureAction::CAMERA_CONTROL) {
        route_camera(*primary, commands);
    }

    return commands;
}

void CadSession::apply_event(const gesture::GestureEvent& event,
                             std::vector<SceneCommand>& commands) {
    switch (event.type) {
        case GestureEventType::MODE_TOGGLED: {
            auto mode_commands = set_cad_active(event.precision_mode);
            commands.insert(commands.end(), mode_commands.begin(), mode_commands.end());
            break;
        }

        case GestureEventType::TOOL_SELECTED:
            if (cad_active_ && event.tool.confidence > config_.tool_acceptance_confidence) {
                if (auto changed = set_tool(event.tool.tool)) {
                    commands.push_back(*changed);
                }
            }
            break;

        case GestureEventType::ACTION_DISPATCHED: {
            if (cad_active_) {
                break;
            }
            switch (event.action) {
                case GestureAction::SPAWN_DRONE:
                    commands.push_back(command(SceneCommandType::SPAWN_DRONE));
                    break;
                case GestureAction::SHOOT_BULLET:
                    commands.push_back(command(SceneCommandType::SHOOT_BULLET));
                    break;
                case GestureAction::SPAWN_BOX:
                    commands.push_back(command(SceneCommandType::SPAWN_BOX));
                    break;
                case GestureAction::ROTATE_ALL:
                    commands.push_back(command(SceneCommandType::ROTATE_ALL));
                    break;
                case GestureAction::EXPLOSION:
                    commands.push_back(command(SceneCommandType::EXPLOSION));
                    break;
                case GestureAction::CAMERA_CONTROL:
                    // Continuous; driven from the snapshot
                    break;
            }
            break;
        }
    }
}

void CadSession::route_cad(const gesture::HandResult& hand, core::TimePoint now,
                           std::vector<SceneCommand>& commands) {
    switch (tool_) {
        case CadTool::SELECT:
        case CadTool::CREATE: {
            const auto* point = find_gesture(hand, PrecisionGestureKind::PRECISION_POINT, kPointThreshold);
            if (!point || !tool_gates_.at(tool_).try_acquire(now)) {
                break;
            }
            if (tool_ == CadTool::SELECT) {
                SceneCommand cmd = command(SceneCommandType::SELECT_AT);
                cmd.position = to_world(point->position);
                commands.push_back(cmd);
            } else {
                SceneCommand cmd = command(SceneCommandType::PLACE_PRIMITIVE);
                cmd.position = placement(point->position);
                cmd.primitive = primitive_;
                commands.push_back(cmd);
                LOG_INFO("CadSession: placing " + to_string(primitive_));
            }
            break;
        }

        case CadTool::MOVE:
            if (const auto* pinch = find_gesture(hand, PrecisionGestureKind::PINCH, kPinchThreshold)) {
                SceneCommand cmd = command(SceneCommandType::MOVE_SELECTION);
                cmd.position = placement(pinch->position);
                commands.push_back(cmd);
            }
            break;

        case CadTool::SCALE:
            if (const auto* spread = find_gesture(hand, PrecisionGestureKind::SPREAD_SCALE, kSpreadThreshold)) {
                SceneCommand cmd = command(SceneCommandType::SCALE_SELECTION);
                cmd.value = spread->scale_factor;
                commands.push_back(cmd);
            }
            break;

        case CadTool::ROTATE:
            if (const auto* control = find_gesture(hand, PrecisionGestureKind::THREE_FINGER_CONTROL,
                                                   kThreeFingerThreshold)) {
                SceneCommand cmd = command(SceneCommandType::ROTATE_SELECTION);
                cmd.value = (control->position.x - 0.5f) * kRotationGain;
                commands.push_back(cmd);
            }
            break;

        case CadTool::EXTRUDE:
            if (const auto* pinch = find_gesture(hand, PrecisionGestureKind::PINCH, kPinchThreshold)) {
                SceneCommand cmd = command(SceneCommandType::EXTRUDE_SELECTION);
                cmd.position = to_world(pinch->position);
                cmd.value = pinch->strength;
                commands.push_back(cmd);
            }
            break;
    }
}

void CadSession::route_camera(const gesture::HandResult& hand, std::vector<SceneCommand>& commands) {
    const cv::Point3f& tip = hand.filtered.landmarks[LandmarkIndex::INDEX_TIP];

    SceneCommand cmd = command(SceneCommandType::CAMERA_FOLLOW);
    cmd.position = cv::Point3f((tip.x - 0.5f) * 6.0f,
                               std::max(1.0f, 3.0f - (tip.y - 0.5f) * 6.0f),
                               -8.0f);
    commands.push_back(cmd);
}

std::vector<SceneCommand> CadSession::set_cad_active(bool active) {
    std::vector<SceneCommand> commands;
    if (mode_request_) {
        mode_request_(active);
    }
    if (active == cad_active_) {
        return commands;
    }

    cad_active_ = active;

    SceneCommand mode = command(SceneCommandType::MODE_CHANGED);
    mode.cad_active = active;
    commands.push_back(mode);
    LOG_INFO(std::string("CadSession: CAD mode ") + (active ? "ON" : "OFF"));

    if (active) {
        if (auto changed = set_tool(CadTool::SELECT)) {
            commands.push_back(*changed);
        }
    }
    return commands;
}

void CadSession::set_mode_request_handler(ModeRequestHandler handler) {
    mode_request_ = std::move(handler);
    if (mode_request_) {
        mode_request_(cad_active_);
    }
}

std::optional<SceneCommand> CadSession::set_tool(CadTool tool) {
    if (tool == tool_) {
        return std::nullopt;
    }

    tool_ = tool;
    LOG_INFO("CadSession: tool " + gesture::to_string(tool));

    SceneCommand cmd = command(SceneCommandType::TOOL_CHANGED);
    cmd.tool = tool;
    cmd.cad_active = cad_active_;
    return cmd;
}

PrimitiveType CadSession::cycle_primitive() {
    switch (primitive_) {
        case PrimitiveType::BOX:      primitive_ = PrimitiveType::SPHERE; break;
        case PrimitiveType::SPHERE:   primitive_ = PrimitiveType::CYLINDER; break;
        case PrimitiveType::CYLINDER: primitive_ = PrimitiveType::PYRAMID; break;
        case PrimitiveType::PYRAMID:  primitive_ = PrimitiveType::BOX; break;
    }
    LOG_DEBUG("CadSession: primitive " + to_string(primitive_));
    return primitive_;
}

cv::Point3f CadSession::to_world(const cv::Point3f& hand_position) const {
    return cv::Point3f((hand_position.x - 0.5f) * kWorldScaleX,
                       (0.5f - hand_position.y) * kWorldScaleY,
                       hand_position.z * kWorldScaleZ);
}

cv::Point3f CadSession::snap_to_grid(const cv::Point3f& world_position) const {
    const float g = config_.grid_size;
    return cv::Point3f(std::round(world_position.x / g) * g,
                       std::round(world_position.y / g) * g,
                       std::round(world_position.z / g) * g);
}

cv::Point3f CadSession::placement(const cv::Point3f& hand_position) const {
    const cv::Point3f world = to_world(hand_position);
    return config_.snap_to_grid ? snap_to_grid(world) : world;
}

} // namespace session
} // namespace handcad
