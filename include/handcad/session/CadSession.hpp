/**
 * @file CadSession.hpp
 * @brief Scene-side session context driven by gesture snapshots and events
 *
 * Owns the interactive state (CAD mode flag, current tool, current primitive,
 * per-tool cooldowns) and turns recognition output into scene commands for
 * the renderer, audio and UI collaborators. Lives on the scene thread only.
 *
 * @copyright 2025 HandCAD Project
 * @license MIT License
 */

#ifndef HANDCAD_SESSION_CAD_SESSION_HPP
#define HANDCAD_SESSION_CAD_SESSION_HPP

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include <handcad/gesture/CooldownGate.hpp>
#include <handcad/gesture/GestureRecognitionSystem.hpp>

namespace handcad {
namespace core {
class Configuration;
}
}

namespace handcad {
namespace session {

enum class PrimitiveType {
    BOX,
    SPHERE,
    CYLINDER,
    PYRAMID
};

std::string to_string(PrimitiveType primitive);

enum class SceneCommandType {
    MODE_CHANGED,       ///< cad_active
    TOOL_CHANGED,       ///< tool
    SPAWN_DRONE,
    SHOOT_BULLET,
    SPAWN_BOX,
    ROTATE_ALL,
    EXPLOSION,
    CAMERA_FOLLOW,      ///< position = camera target
    SELECT_AT,          ///< position
    PLACE_PRIMITIVE,    ///< position (snapped), primitive
    MOVE_SELECTION,     ///< position (snapped)
    SCALE_SELECTION,    ///< value = scale factor
    ROTATE_SELECTION,   ///< value = rotation about y
    EXTRUDE_SELECTION   ///< position, value = strength
};

std::string to_string(SceneCommandType type);

/**
 * @brief Instruction for the rendering/audio/UI collaborators
 *
 * Positions are in world units.
 */
struct SceneCommand {
    SceneCommandType type = SceneCommandType::MODE_CHANGED;
    cv::Point3f position;
    float value = 0.0f;
    PrimitiveType primitive = PrimitiveType::BOX;
    gesture::CadTool tool = gesture::CadTool::SELECT;
    bool cad_active = false;
};

struct SessionConfig {
    bool start_in_cad_mode = true;
    float tool_acceptance_confidence = 0.8f;    ///< TOOL_SELECTED must score above this
    double tool_cooldown_s = 1.0;               ///< Between select/create uses of the same tool
    float grid_size = 0.5f;
    bool snap_to_grid = true;

    bool is_valid() const {
        return tool_acceptance_confidence >= 0.0f && tool_acceptance_confidence <= 1.0f &&
               tool_cooldown_s >= 0.0 && grid_size > 0.0f;
    }

    /**
     * @brief Read the session section
     *
     * @throws core::ConfigurationException if the resulting values are invalid
     */
    static SessionConfig from_configuration(const core::Configuration& configuration);
};

class CadSession {
public:
    /**
     * @brief Receives the recognizer mode the session wants (true = precision)
     */
    using ModeRequestHandler = std::function<void(bool precision_mode)>;

    CadSession();

    explicit CadSession(const SessionConfig& config);

    /**
     * @brief Apply one scene tick
     *
     * Events are applied first, in order. Continuous CAD manipulation and
     * camera control then read the snapshot; a snapshot already seen on a
     * previous tick is not applied twice, and one recognized in the other
     * mode is not routed.
     *
     * @param snapshot Latest recognition snapshot, may be null
     * @param events Discrete events since the previous tick
     * @param now Tick time (per-tool cooldowns)
     * @return Commands for the scene collaborators, in order
     */
    std::vector<SceneCommand> apply(const gesture::GestureSnapshot* snapshot,
                                    const std::vector<gesture::GestureEvent>& events,
                                    core::TimePoint now);

    bool cad_active() const { return cad_active_; }

    /**
     * @brief Enter or leave CAD mode directly (entering resets the tool to SELECT)
     *
     * The mode is forwarded to the mode request handler, so the recognizer
     * produces precision results exactly while the session is in CAD mode.
     */
    std::vector<SceneCommand> set_cad_active(bool active);

    /**
     * @brief Link the session to the recognizer mode
     *
     * The handler is called immediately with the current mode and again on
     * every mode change, whether it came from an event or from set_cad_active().
     * It runs on the scene thread.
     */
    void set_mode_request_handler(ModeRequestHandler handler);

    gesture::CadTool current_tool() const { return tool_; }

    /**
     * @brief Direct tool override
     *
     * @return TOOL_CHANGED command if the tool changed
     */
    std::optional<SceneCommand> set_tool(gesture::CadTool tool);

    PrimitiveType current_primitive() const { return primitive_; }

    /**
     * @brief Advance box -> sphere -> cylinder -> pyramid -> box
     */
    PrimitiveType cycle_primitive();

    /**
     * @brief Map normalized hand coordinates to world units
     */
    cv::Point3f to_world(const cv::Point3f& hand_position) const;

    /**
     * @brief Round each coordinate to the nearest grid point
     */
    cv::Point3f snap_to_grid(const cv::Point3f& world_position) const;

    const SessionConfig& get_config() const { return config_; }

private:
    void apply_event(const gesture::GestureEvent& event, std::vector<SceneCommand>& commands);
    void route_cad(const gesture::HandResult& hand, core::TimePoint now,
                   std::vector<SceneCommand>& commands);
    void route_camera(const gesture::HandResult& hand, std::vector<SceneCommand>& commands);
    cv::Point3f placement(const cv::Point3f& hand_position) const;

    SessionConfig config_;
    bool cad_active_;
    gesture::CadTool tool_ = gesture::CadTool::SELECT;
    PrimitiveType primitive_ = PrimitiveType::BOX;
    std::map<gesture::CadTool, gesture::CooldownGate> tool_gates_;
    std::optional<std::uint64_t> last_frame_id_;
    ModeRequestHandler mode_request_;
};

} // namespace session
} // namespace handcad

#endif // HANDCAD_SESSION_CAD_SESSION_HPP
