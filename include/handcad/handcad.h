#pragma once

/**
 * @file handcad.h
 * @brief Main header for the HandCAD gesture core
 *
 * Include this single header to access the gesture recognition core, the
 * realtime pipeline and the CAD session context.
 *
 * @copyright 2025 HandCAD Project
 */

// Core types and utilities
#include "handcad/core/types.hpp"
#include "handcad/core/Logger.hpp"
#include "handcad/core/Configuration.hpp"
#include "handcad/core/exception.h"

// Gesture recognition
#include "handcad/gesture/GestureTypes.hpp"
#include "handcad/gesture/LandmarkFilter.hpp"
#include "handcad/gesture/HandGeometry.hpp"
#include "handcad/gesture/GestureHistory.hpp"
#include "handcad/gesture/CooldownGate.hpp"
#include "handcad/gesture/CoarseGestureClassifier.hpp"
#include "handcad/gesture/PrecisionGestureDetector.hpp"
#include "handcad/gesture/ToolSelectionClassifier.hpp"
#include "handcad/gesture/ModeToggleStateMachine.hpp"
#include "handcad/gesture/ActionDispatcher.hpp"
#include "handcad/gesture/GestureRecognitionSystem.hpp"

// Two-cadence execution
#include "handcad/realtime/SnapshotExchange.hpp"
#include "handcad/realtime/EventQueue.hpp"
#include "handcad/realtime/FrameSource.hpp"
#include "handcad/realtime/RecordedFrameSource.hpp"
#include "handcad/realtime/GesturePipeline.hpp"

// Scene-side session
#include "handcad/session/CadSession.hpp"

/**
 * @brief Main HandCAD namespace
 */
namespace handcad {

/**
 * @brief Library version string
 */
inline const char* versionString() {
    return "1.0.0";
}

} // namespace handcad
