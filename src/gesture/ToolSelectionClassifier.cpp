/**
 * @file ToolSelectionClassifier.cpp
 * @brief Implementation of the tool-selection ladder
 */

#include "handcad/gesture/ToolSelectionClassifier.hpp"
#include <handcad/core/Logger.hpp>

namespace handcad {
namespace gesture {

namespace {

constexpr float kToolConfidence = 0.9f;

} // namespace

ToolSelectionClassifier::ToolSelectionClassifier(const ToolSelectionConfig& config)
    : config_(config.is_valid() ? config : ToolSelectionConfig{}) {
}

std::optional<ToolSelection> ToolSelectionClassifier::classify_tool(const HandLandmarks& hand) const {
    return classify_tool(geometry::finger_states(
        hand, config_.extension_joint, config_.thumb_alignment_threshold));
}

std::optional<ToolSelection> ToolSelectionClassifier::classify_tool(const FingerStates& f) {
    auto selected = [](CadTool tool) {
        return std::optional<ToolSelection>(ToolSelection{tool, kToolConfidence});
    };

    if (f.index && !f.middle && !f.ring && !f.pinky) {
        return selected(CadTool::SELECT);
    }
    if (f.index && f.middle && !f.ring && !f.pinky) {
        return selected(CadTool::CREATE);
    }
    if (f.index && f.middle && f.ring && !f.pinky) {
        return selected(CadTool::MOVE);
    }
    if (f.index && f.middle && f.ring && f.pinky) {
        return selected(CadTool::SCALE);
    }
    if (f.thumb && f.index && !f.middle && !f.ring && f.pinky) {
        return selected(CadTool::ROTATE);
    }
    if (!f.thumb && f.index && !f.middle && !f.ring && f.pinky) {
        return selected(CadTool::EXTRUDE);
    }

    return std::nullopt;
}

void ToolSelectionClassifier::configure(const ToolSelectionConfig& config) {
    if (config.is_valid()) {
        config_ = config;
    } else {
        LOG_WARNING("ToolSelectionClassifier: ignoring invalid configuration");
    }
}

} // namespace gesture
} // namespace handcad
