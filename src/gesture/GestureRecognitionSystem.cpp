/**
 * @file GestureRecognitionSystem.cpp
 * @brief Implementation of the per-frame gesture recognition pipeline
 */

#include "handcad/gesture/GestureRecognitionSystem.hpp"
#include "handcad/gesture/ActionDispatcher.hpp"
#include "handcad/gesture/HandGeometry.hpp"
#include <handcad/core/Configuration.hpp>
#include <handcad/core/Logger.hpp>
#include <handcad/core/exception.h>
#include <algorithm>
#include <array>
#include <atomic>
#include <mutex>
#include <stdexcept>

namespace handcad {
namespace gesture {

std::string to_string(GestureEventType type) {
    switch (type) {
        case GestureEventType::MODE_TOGGLED:      return "mode_toggled";
        case GestureEventType::ACTION_DISPATCHED: return "action_dispatched";
        case GestureEventType::TOOL_SELECTED:     return "tool_selected";
    }
    return "unknown";
}

GestureSystemConfig GestureSystemConfig::from_configuration(const core::Configuration& configuration) {
    GestureSystemConfig config;

    config.coarse.pinch_threshold = configuration.get<float>("gesture.pinch_threshold", 0.05f);
    config.coarse.thumb_alignment_threshold =
        configuration.get<float>("gesture.thumb_alignment_threshold", 0.7f);
    config.coarse.acceptance_threshold = configuration.get<float>("gesture.acceptance_threshold", 0.5f);
    config.coarse.gesture_cooldown_s = configuration.get<double>("gesture.gesture_cooldown_s", 1.0);

    const int history_capacity = configuration.get<int>("gesture.history_capacity", 10);
    if (history_capacity <= 0) {
        HANDCAD_THROW(core::ConfigurationException,
                      "gesture.history_capacity must be positive, got " +
                      std::to_string(history_capacity));
    }
    config.coarse.history_capacity = static_cast<size_t>(history_capacity);

    config.precision.pinch_threshold = config.coarse.pinch_threshold;
    config.precision.thumb_alignment_threshold = config.coarse.thumb_alignment_threshold;
    config.precision.stability_velocity_threshold =
        configuration.get<float>("gesture.stability_velocity_threshold", 0.01f);
    config.precision.spread_threshold = configuration.get<float>("gesture.spread_threshold", 0.3f);

    config.tool.thumb_alignment_threshold = config.coarse.thumb_alignment_threshold;

    config.filter.process_noise = configuration.get<float>("filter.process_noise", 0.01f);
    config.filter.measurement_noise = configuration.get<float>("filter.measurement_noise", 0.1f);
    config.filter.initial_covariance = configuration.get<float>("filter.initial_covariance", 0.1f);

    config.action_cooldown_s = configuration.get<double>("dispatch.action_cooldown_s", 0.8);
    config.mode_toggle_hold_s = configuration.get<double>("mode_toggle.hold_time_s", 1.0);

    if (!config.is_valid()) {
        HANDCAD_THROW(core::ConfigurationException, "Invalid gesture system configuration");
    }
    return config;
}

// PIMPL implementation
class GestureRecognitionSystem::Impl {
public:
    GestureSystemConfig config;

    // Per hand slot
    std::array<LandmarkFilter, kMaxHands> filters;
    std::array<CoarseGestureClassifier, kMaxHands> classifiers;

    // Shared across hands
    PrecisionGestureDetector precision_detector;
    ToolSelectionClassifier tool_classifier;
    ModeToggleStateMachine mode_toggle;
    ActionDispatcher dispatcher;

    std::atomic<bool> precision_mode{false};
    std::optional<core::TimePoint> last_frame_time;
    std::optional<CadTool> last_emitted_tool;
    std::uint64_t next_frame_id = 0;

    // Performance stats
    mutable std::mutex stats_mutex;
    GestureSystemStats stats;
    std::string last_error;

    void apply_config(const GestureSystemConfig& cfg) {
        config = cfg;
        for (auto& filter : filters) {
            filter.configure(cfg.filter);
            filter.reset();
        }
        for (auto& classifier : classifiers) {
            classifier.configure(cfg.coarse);
            classifier.reset();
        }
        precision_detector.configure(cfg.precision);
        tool_classifier.configure(cfg.tool);
        mode_toggle.set_hold_time(cfg.mode_toggle_hold_s);
        mode_toggle.reset();
        dispatcher.set_cooldown(cfg.action_cooldown_s);
        dispatcher.reset();
        precision_mode = cfg.start_in_precision_mode;
        last_frame_time.reset();
        last_emitted_tool.reset();
    }

    /**
     * @brief Validate all hands and return them sorted by hand index
     */
    std::vector<HandLandmarks> validated(const std::vector<HandLandmarks>& hands) const {
        if (hands.size() > static_cast<size_t>(kMaxHands)) {
            HANDCAD_THROW(core::InvalidLandmarksException,
                          "Too many hands in one frame: " + std::to_string(hands.size()));
        }

        std::vector<HandLandmarks> sorted = hands;
        for (const auto& hand : sorted) {
            hand.validate();
        }

        std::sort(sorted.begin(), sorted.end(),
                  [](const HandLandmarks& a, const HandLandmarks& b) {
                      return a.hand_index < b.hand_index;
                  });

        for (size_t i = 1; i < sorted.size(); ++i) {
            if (sorted[i].hand_index == sorted[i - 1].hand_index) {
                HANDCAD_THROW(core::InvalidLandmarksException,
                              "Duplicate hand index " + std::to_string(sorted[i].hand_index));
            }
        }
        return sorted;
    }

    void record_rejection(const std::string& message) {
        std::lock_guard<std::mutex> lock(stats_mutex);
        stats.frames_rejected++;
        last_error = message;
    }
};

GestureRecognitionSystem::GestureRecognitionSystem()
    : GestureRecognitionSystem(GestureSystemConfig{}) {
}

GestureRecognitionSystem::GestureRecognitionSystem(const GestureSystemConfig& config)
    : pImpl(std::make_unique<Impl>()) {
    if (!config.is_valid()) {
        LOG_WARNING("GestureRecognitionSystem: invalid configuration, using defaults");
        pImpl->apply_config(GestureSystemConfig{});
    } else {
        pImpl->apply_config(config);
    }
}

GestureRecognitionSystem::~GestureRecognitionSystem() = default;

GestureSnapshot GestureRecognitionSystem::process_frame(const std::vector<HandLandmarks>& hands,
                                                        core::TimePoint now) {
    auto frame_start = std::chrono::steady_clock::now();

    std::vector<HandLandmarks> sorted;
    try {
        sorted = pImpl->validated(hands);
    } catch (const core::InvalidLandmarksException& e) {
        pImpl->record_rejection(e.getMessage());
        LOG_WARNING("GestureRecognitionSystem: rejected frame: " + e.getMessage());
        throw;
    }

    // Frame time step for the mode toggle timer
    double dt = 0.0;
    if (pImpl->last_frame_time) {
        dt = std::max(0.0, core::seconds_between(*pImpl->last_frame_time, now));
    }
    pImpl->last_frame_time = now;

    GestureSnapshot snapshot;
    snapshot.frame_id = pImpl->next_frame_id++;
    snapshot.timestamp = now;

    // Reset filters of hands that disappeared
    std::array<bool, kMaxHands> present{};
    for (const auto& hand : sorted) {
        present[hand.hand_index] = true;
    }
    for (int slot = 0; slot < kMaxHands; ++slot) {
        if (!present[slot]) {
            pImpl->filters[slot].reset();
        }
    }

    // Filter and classify every hand
    for (const auto& hand : sorted) {
        HandResult result;
        result.hand_index = hand.hand_index;
        result.filtered = pImpl->filters[hand.hand_index].update(hand);

        const HandLandmarks& filtered = result.filtered.landmarks;
        result.palm_center = geometry::stable_palm_center(filtered);
        result.orientation = geometry::hand_orientation(filtered);
        result.coarse = pImpl->classifiers[hand.hand_index].classify(filtered, now);

        snapshot.hands.push_back(std::move(result));
    }

    const HandResult* primary = snapshot.primary();

    // Mode toggle (primary hand, all five fingers extended)
    bool pose_held = false;
    if (primary) {
        pose_held = geometry::finger_states(primary->filtered.landmarks,
                                            ExtensionJoint::MCP,
                                            pImpl->config.coarse.thumb_alignment_threshold).all();
    }

    if (pImpl->mode_toggle.update(pose_held, dt)) {
        // set_precision_mode() may run concurrently from the scene thread
        bool previous = pImpl->precision_mode.load();
        while (!pImpl->precision_mode.compare_exchange_weak(previous, !previous)) {
        }
        const bool enabled = !previous;
        pImpl->last_emitted_tool.reset();
        snapshot.mode_toggled = true;

        GestureEvent event;
        event.type = GestureEventType::MODE_TOGGLED;
        event.frame_id = snapshot.frame_id;
        event.timestamp = now;
        event.precision_mode = enabled;
        snapshot.events.push_back(event);

        LOG_INFO(std::string("GestureRecognitionSystem: mode toggled, precision mode ") +
                 (enabled ? "ON" : "OFF"));
    }
    snapshot.toggle_state = pImpl->mode_toggle.state();
    snapshot.precision_mode = pImpl->precision_mode;

    if (snapshot.precision_mode) {
        for (auto& result : snapshot.hands) {
            result.precision = pImpl->precision_detector.detect(result.filtered.landmarks,
                                                                result.filtered.velocities);
            result.tool = pImpl->tool_classifier.classify_tool(result.filtered.landmarks);
        }

        if (primary && primary->tool) {
            snapshot.tool_selection = primary->tool;

            // Report a selection once, when the pattern changes
            if (!pImpl->last_emitted_tool || *pImpl->last_emitted_tool != primary->tool->tool) {
                GestureEvent event;
                event.type = GestureEventType::TOOL_SELECTED;
                event.frame_id = snapshot.frame_id;
                event.timestamp = now;
                event.precision_mode = true;
                event.tool = *primary->tool;
                snapshot.events.push_back(event);

                LOG_DEBUG("GestureRecognitionSystem: tool pattern " + to_string(primary->tool->tool));
            }
            pImpl->last_emitted_tool = primary->tool->tool;
        } else {
            pImpl->last_emitted_tool.reset();
        }
    } else if (primary) {
        snapshot.action = pImpl->dispatcher.dispatch(primary->coarse.gesture, now);

        if (snapshot.action && *snapshot.action != GestureAction::CAMERA_CONTROL) {
            GestureEvent event;
            event.type = GestureEventType::ACTION_DISPATCHED;
            event.frame_id = snapshot.frame_id;
            event.timestamp = now;
            event.gesture = primary->coarse.gesture;
            event.action = *snapshot.action;
            snapshot.events.push_back(event);
        }
    }

    // Update performance stats
    auto frame_end = std::chrono::steady_clock::now();
    double total_time = std::chrono::duration<double, std::milli>(frame_end - frame_start).count();

    {
        std::lock_guard<std::mutex> lock(pImpl->stats_mutex);
        auto& stats = pImpl->stats;
        stats.avg_processing_time_ms =
            (stats.avg_processing_time_ms * stats.frames_processed + total_time) /
            (stats.frames_processed + 1);
        stats.frames_processed++;
        if (snapshot.mode_toggled) {
            stats.toggles_fired++;
        }
        for (const auto& event : snapshot.events) {
            if (event.type == GestureEventType::ACTION_DISPATCHED) {
                stats.actions_dispatched++;
            }
        }
    }

    return snapshot;
}

void GestureRecognitionSystem::set_precision_mode(bool enabled) {
    if (pImpl->precision_mode.exchange(enabled) != enabled) {
        LOG_INFO(std::string("GestureRecognitionSystem: precision mode set ") +
                 (enabled ? "ON" : "OFF"));
    }
}

bool GestureRecognitionSystem::is_precision_mode() const {
    return pImpl->precision_mode;
}

bool GestureRecognitionSystem::set_config(const GestureSystemConfig& config) {
    if (!config.is_valid()) {
        std::lock_guard<std::mutex> lock(pImpl->stats_mutex);
        pImpl->last_error = "Invalid configuration";
        return false;
    }

    pImpl->apply_config(config);
    return true;
}

GestureSystemConfig GestureRecognitionSystem::get_config() const {
    return pImpl->config;
}

void GestureRecognitionSystem::reset() {
    const bool mode = pImpl->precision_mode;
    pImpl->apply_config(pImpl->config);
    pImpl->precision_mode = mode;
}

GestureSystemStats GestureRecognitionSystem::get_stats() const {
    std::lock_guard<std::mutex> lock(pImpl->stats_mutex);
    return pImpl->stats;
}

void GestureRecognitionSystem::reset_stats() {
    std::lock_guard<std::mutex> lock(pImpl->stats_mutex);
    pImpl->stats = GestureSystemStats{};
}

std::string GestureRecognitionSystem::get_last_error() const {
    std::lock_guard<std::mutex> lock(pImpl->stats_mutex);
    return pImpl->last_error;
}

const CoarseGestureClassifier& GestureRecognitionSystem::coarse_classifier(int hand_index) const {
    if (hand_index < 0 || hand_index >= kMaxHands) {
        throw std::out_of_range("hand index " + std::to_string(hand_index));
    }
    return pImpl->classifiers[hand_index];
}

} // namespace gesture
} // namespace handcad
