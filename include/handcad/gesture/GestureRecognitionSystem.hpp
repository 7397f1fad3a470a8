/**
 * @file GestureRecognitionSystem.hpp
 * @brief Per-frame orchestration of the gesture recognition core
 *
 * Turns the landmark sets of one camera tick into an immutable snapshot:
 * filtered hands, coarse gestures, precision gestures and tool selection
 * (precision mode), mode toggles and dispatched actions (normal mode).
 *
 * @copyright 2025 HandCAD Project
 * @license MIT License
 */

#ifndef HANDCAD_GESTURE_RECOGNITION_SYSTEM_HPP
#define HANDCAD_GESTURE_RECOGNITION_SYSTEM_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include <opencv2/core/quaternion.hpp>
#include <handcad/gesture/CoarseGestureClassifier.hpp>
#include <handcad/gesture/GestureTypes.hpp>
#include <handcad/gesture/LandmarkFilter.hpp>
#include <handcad/gesture/ModeToggleStateMachine.hpp>
#include <handcad/gesture/PrecisionGestureDetector.hpp>
#include <handcad/gesture/ToolSelectionClassifier.hpp>

namespace handcad {
namespace core {
class Configuration;
}
}

namespace handcad {
namespace gesture {

/**
 * @brief Everything computed for one hand in one frame
 */
struct HandResult {
    int hand_index = 0;
    FilteredHand filtered;
    cv::Point3f palm_center;
    cv::Quatf orientation{1.0f, 0.0f, 0.0f, 0.0f};
    CoarseGestureResult coarse;
    PrecisionGestureResult precision;           ///< Empty outside precision mode
    std::optional<ToolSelection> tool;          ///< Only evaluated in precision mode
};

enum class GestureEventType {
    MODE_TOGGLED,
    ACTION_DISPATCHED,
    TOOL_SELECTED
};

std::string to_string(GestureEventType type);

/**
 * @brief Discrete event emitted by the recognition system
 *
 * Only the payload field matching the type is meaningful.
 */
struct GestureEvent {
    GestureEventType type = GestureEventType::MODE_TOGGLED;
    std::uint64_t frame_id = 0;
    core::TimePoint timestamp;
    bool precision_mode = false;                        ///< MODE_TOGGLED: mode after the toggle
    CoarseGesture gesture = CoarseGesture::UNKNOWN;     ///< ACTION_DISPATCHED: source gesture
    GestureAction action = GestureAction::SPAWN_DRONE;  ///< ACTION_DISPATCHED
    ToolSelection tool;                                 ///< TOOL_SELECTED
};

/**
 * @brief Immutable per-frame output published to the scene side
 */
struct GestureSnapshot {
    std::uint64_t frame_id = 0;
    core::TimePoint timestamp;
    bool precision_mode = false;                    ///< Mode after this frame
    std::vector<HandResult> hands;                  ///< Sorted by hand index
    std::optional<ToolSelection> tool_selection;    ///< Primary hand, precision mode only
    bool mode_toggled = false;
    std::optional<GestureAction> action;            ///< Primary hand, normal mode only
    ModeToggleState toggle_state = ModeToggleState::IDLE;
    std::vector<GestureEvent> events;               ///< Events raised by this frame

    /**
     * @brief Hand with the lowest index, or nullptr if no hand was present
     */
    const HandResult* primary() const {
        return hands.empty() ? nullptr : &hands.front();
    }
};

/**
 * @brief Recognition system configuration
 */
struct GestureSystemConfig {
    LandmarkFilterConfig filter;
    CoarseClassifierConfig coarse;
    PrecisionDetectorConfig precision;
    ToolSelectionConfig tool;
    double action_cooldown_s = 0.8;
    double mode_toggle_hold_s = 1.0;
    bool start_in_precision_mode = false;

    bool is_valid() const {
        return filter.is_valid() && coarse.is_valid() && precision.is_valid() &&
               tool.is_valid() && action_cooldown_s >= 0.0 && mode_toggle_hold_s > 0.0;
    }

    /**
     * @brief Read the gesture, filter, dispatch and mode_toggle sections
     *
     * @throws core::ConfigurationException if the resulting values are invalid
     */
    static GestureSystemConfig from_configuration(const core::Configuration& configuration);
};

/**
 * @brief Processing statistics
 */
struct GestureSystemStats {
    std::uint64_t frames_processed = 0;
    std::uint64_t frames_rejected = 0;
    std::uint64_t toggles_fired = 0;
    std::uint64_t actions_dispatched = 0;
    double avg_processing_time_ms = 0.0;
};

/**
 * @brief Gesture recognition core for up to two hands
 *
 * Owns one landmark filter and one coarse classifier per hand slot, plus the
 * shared precision detector, tool classifier, mode toggle and dispatcher.
 * The mode toggle and the dispatcher only listen to the primary hand
 * (lowest present index).
 *
 * process_frame() is meant to be called from a single thread; statistics
 * and the precision-mode flag may be read or set from any thread.
 *
 * Example usage:
 * @code
 * GestureRecognitionSystem system;
 * auto hand = HandLandmarks::from_points(points, 0, now);
 * GestureSnapshot snapshot = system.process_frame({hand}, now);
 * if (snapshot.action) {
 *     std::cout << to_string(*snapshot.action) << std::endl;
 * }
 * @endcode
 */
class GestureRecognitionSystem {
public:
    GestureRecognitionSystem();

    explicit GestureRecognitionSystem(const GestureSystemConfig& config);

    ~GestureRecognitionSystem();

    // Disable copy and move
    GestureRecognitionSystem(const GestureRecognitionSystem&) = delete;
    GestureRecognitionSystem& operator=(const GestureRecognitionSystem&) = delete;
    GestureRecognitionSystem(GestureRecognitionSystem&&) = delete;
    GestureRecognitionSystem& operator=(GestureRecognitionSystem&&) = delete;

    /**
     * @brief Process the hands detected in one camera tick
     *
     * All hands are validated before any state changes. Hand slots absent
     * from this tick have their filters reset.
     *
     * @param hands Zero, one or two landmark sets with distinct hand indices
     * @param now Tick timestamp (drives cooldowns and the mode toggle timer)
     * @return Snapshot describing this frame
     * @throws core::InvalidLandmarksException for malformed input
     */
    GestureSnapshot process_frame(const std::vector<HandLandmarks>& hands, core::TimePoint now);

    /**
     * @brief Override the operating mode
     */
    void set_precision_mode(bool enabled);

    bool is_precision_mode() const;

    /**
     * @brief Update configuration (filters and classifiers are reset)
     *
     * @return false if the configuration is invalid
     */
    bool set_config(const GestureSystemConfig& config);

    GestureSystemConfig get_config() const;

    /**
     * @brief Drop all temporal state (filters, histories, timers, cooldowns)
     */
    void reset();

    GestureSystemStats get_stats() const;

    void reset_stats();

    /**
     * @brief Message of the last rejected frame
     */
    std::string get_last_error() const;

    /**
     * @brief Coarse classifier of a hand slot (history inspection)
     *
     * @throws std::out_of_range for an invalid slot
     */
    const CoarseGestureClassifier& coarse_classifier(int hand_index) const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;  ///< PIMPL idiom for implementation hiding
};

} // namespace gesture
} // namespace handcad

#endif // HANDCAD_GESTURE_RECOGNITION_SYSTEM_HPP
