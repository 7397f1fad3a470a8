/**
 * @file ToolSelectionClassifier.hpp
 * @brief Maps extended-finger patterns to CAD tools
 *
 * @copyright 2025 HandCAD Project
 * @license MIT License
 */

#ifndef HANDCAD_GESTURE_TOOL_SELECTION_CLASSIFIER_HPP
#define HANDCAD_GESTURE_TOOL_SELECTION_CLASSIFIER_HPP

#include <optional>
#include "GestureTypes.hpp"
#include "HandGeometry.hpp"

namespace handcad {
namespace gesture {

struct ToolSelectionConfig {
    float thumb_alignment_threshold = 0.7f;
    ExtensionJoint extension_joint = ExtensionJoint::MCP;

    bool is_valid() const {
        return thumb_alignment_threshold >= -1.0f && thumb_alignment_threshold <= 1.0f;
    }
};

/**
 * @brief Priority ladder over finger patterns
 *
 * Checked in order, first match wins:
 * 1. index only                                  -> SELECT
 * 2. index + middle                              -> CREATE
 * 3. index + middle + ring                       -> MOVE
 * 4. index + middle + ring + pinky               -> SCALE
 * 5. thumb + index + pinky, middle/ring closed   -> ROTATE
 * 6. index + pinky, thumb/middle/ring closed     -> EXTRUDE
 *
 * Rules 1-4 ignore the thumb. Rules 5 and 6 differ only by the thumb, so
 * the thumb alignment threshold decides between rotate and extrude.
 */
class ToolSelectionClassifier {
public:
    ToolSelectionClassifier() = default;

    explicit ToolSelectionClassifier(const ToolSelectionConfig& config);

    /**
     * @brief Classify the tool pattern of a hand
     *
     * @return Selected tool, or std::nullopt if no pattern matches
     */
    std::optional<ToolSelection> classify_tool(const HandLandmarks& hand) const;

    /**
     * @brief Same ladder over precomputed finger states
     */
    static std::optional<ToolSelection> classify_tool(const FingerStates& fingers);

    void configure(const ToolSelectionConfig& config);

    const ToolSelectionConfig& get_config() const { return config_; }

private:
    ToolSelectionConfig config_;
};

} // namespace gesture
} // namespace handcad

#endif // HANDCAD_GESTURE_TOOL_SELECTION_CLASSIFIER_HPP
