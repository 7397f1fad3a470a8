/**
 * @file landmark_replay.cpp
 * @brief Replays a recorded landmark stream through the gesture pipeline
 *
 * Prints mode toggles, tool changes, dispatched actions and CAD commands as
 * the scene thread produces them, followed by runtime statistics.
 *
 * @copyright 2025 HandCAD Project
 * @license MIT License
 */

#include <handcad/handcad.h>
#include <atomic>
#include <chrono>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <map>
#include <mutex>

using namespace handcad;

// Global flag for CTRL+C handling
static volatile std::sig_atomic_t interrupted = 0;

static std::map<session::SceneCommandType, int> command_histogram;
static std::mutex histogram_mutex;

void signal_handler(int signal) {
    if (signal == SIGINT) {
        interrupted = 1;
    }
}

void print_command(const session::SceneCommand& cmd) {
    std::cout << "  -> " << std::setw(18) << std::left << session::to_string(cmd.type);

    switch (cmd.type) {
        case session::SceneCommandType::MODE_CHANGED:
            std::cout << (cmd.cad_active ? "CAD mode" : "normal mode");
            break;
        case session::SceneCommandType::TOOL_CHANGED:
            std::cout << gesture::to_string(cmd.tool);
            break;
        case session::SceneCommandType::PLACE_PRIMITIVE:
            std::cout << session::to_string(cmd.primitive) << " ";
            [[fallthrough]];
        case session::SceneCommandType::CAMERA_FOLLOW:
        case session::SceneCommandType::SELECT_AT:
        case session::SceneCommandType::MOVE_SELECTION:
            std::cout << std::fixed << std::setprecision(2)
                      << "(" << cmd.position.x << ", " << cmd.position.y << ", " << cmd.position.z << ")";
            break;
        case session::SceneCommandType::SCALE_SELECTION:
        case session::SceneCommandType::ROTATE_SELECTION:
        case session::SceneCommandType::EXTRUDE_SELECTION:
            std::cout << std::fixed << std::setprecision(2) << cmd.value;
            break;
        case session::SceneCommandType::SPAWN_DRONE:
        case session::SceneCommandType::SHOOT_BULLET:
        case session::SceneCommandType::SPAWN_BOX:
        case session::SceneCommandType::ROTATE_ALL:
        case session::SceneCommandType::EXPLOSION:
            break;
    }
    std::cout << std::endl;
}

void print_statistics(const gesture::GestureRecognitionSystem& system,
                      const realtime::GesturePipeline& pipeline) {
    const gesture::GestureSystemStats stats = system.get_stats();
    const realtime::PipelineMetrics metrics = pipeline.getMetrics();

    std::cout << "\n";
    std::cout << "=======================================" << std::endl;
    std::cout << "           REPLAY STATISTICS           " << std::endl;
    std::cout << "=======================================" << std::endl;
    std::cout << "Frames acquired:      " << metrics.frames_acquired << std::endl;
    std::cout << "Frames rejected:      " << metrics.frames_rejected << std::endl;
    std::cout << "Mode toggles:         " << stats.toggles_fired << std::endl;
    std::cout << "Actions dispatched:   " << stats.actions_dispatched << std::endl;
    std::cout << "Scene ticks:          " << metrics.scene_ticks << std::endl;
    std::cout << "Events dropped:       " << metrics.events_dropped << std::endl;
    std::cout << "Warnings / errors:    "
              << core::Logger::getInstance().getMessageCount(core::LogLevel::WARNING) << " / "
              << core::Logger::getInstance().getMessageCount(core::LogLevel::ERROR) << std::endl;
    std::cout << "Avg processing time:  " << std::fixed << std::setprecision(3)
              << stats.avg_processing_time_ms << " ms" << std::endl;
    std::cout << "=======================================" << std::endl;

    std::lock_guard<std::mutex> lock(histogram_mutex);
    if (!command_histogram.empty()) {
        std::cout << "\nScene commands:" << std::endl;
        std::cout << "---------------------------------------" << std::endl;
        for (const auto& entry : command_histogram) {
            std::cout << "  " << std::setw(20) << std::left
                      << session::to_string(entry.first)
                      << ": " << entry.second << std::endl;
        }
        std::cout << "=======================================" << std::endl;
    }
}

int main(int argc, char** argv) {
    std::signal(SIGINT, signal_handler);

    std::string recording;
    std::string config_file;
    bool realtime_pacing = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--config" || arg == "-c") {
            if (i + 1 < argc) {
                config_file = argv[++i];
            }
        } else if (arg == "--realtime" || arg == "-r") {
            realtime_pacing = true;
        } else if (arg == "--help" || arg == "-h") {
            std::cout << "Usage: " << argv[0] << " [options] <recording.yaml>" << std::endl;
            std::cout << "Options:" << std::endl;
            std::cout << "  --config, -c <file>   YAML configuration (default: built-in values)" << std::endl;
            std::cout << "  --realtime, -r        Replay at recorded speed" << std::endl;
            std::cout << "  --help, -h            Show this help message" << std::endl;
            return 0;
        } else {
            recording = arg;
        }
    }

    if (recording.empty()) {
        std::cerr << "ERROR: no recording given (see --help)" << std::endl;
        return 1;
    }

    auto& configuration = core::Configuration::getInstance();
    if (!config_file.empty() && !configuration.load(config_file)) {
        std::cerr << "ERROR: failed to load configuration " << config_file << std::endl;
        return 1;
    }

    try {
        auto& logger = core::Logger::getInstance();
        if (!logger.configure(core::LoggingConfig::from_configuration(configuration))) {
            std::cerr << "WARNING: file logging disabled, console only" << std::endl;
        }

        auto system_config = gesture::GestureSystemConfig::from_configuration(configuration);
        auto session_config = session::SessionConfig::from_configuration(configuration);
        auto pipeline_config = realtime::PipelineConfig::from_configuration(configuration);

        system_config.start_in_precision_mode = session_config.start_in_cad_mode;

        auto source = std::make_shared<realtime::RecordedFrameSource>(realtime_pacing);
        if (!source->load(recording)) {
            std::cerr << "ERROR: failed to load recording " << recording << std::endl;
            return 1;
        }

        auto system = std::make_shared<gesture::GestureRecognitionSystem>(system_config);
        session::CadSession cad_session(session_config);

        std::cout << "=========================================" << std::endl;
        std::cout << "   HANDCAD LANDMARK REPLAY" << std::endl;
        std::cout << "=========================================" << std::endl;
        std::cout << "Recording:   " << recording << " (" << source->frameCount() << " frames)" << std::endl;
        std::cout << "Pacing:      " << (realtime_pacing ? "recorded speed" : "as fast as possible") << std::endl;
        std::cout << "Start mode:  " << (cad_session.cad_active() ? "CAD" : "normal") << std::endl;
        std::cout << "=========================================" << std::endl;

        realtime::GesturePipeline pipeline(source, system, pipeline_config);
        cad_session.set_mode_request_handler([&pipeline](bool precision_mode) {
            pipeline.requestPrecisionMode(precision_mode);
        });

        auto on_scene_tick = [&cad_session](const realtime::GesturePipeline::SnapshotPtr& snapshot,
                                             const std::vector<gesture::GestureEvent>& events) {
            auto commands = cad_session.apply(snapshot.get(), events, core::Clock::now());
            for (const auto& cmd : commands) {
                print_command(cmd);
                std::lock_guard<std::mutex> lock(histogram_mutex);
                command_histogram[cmd.type]++;
            }
        };

        if (!pipeline.start(on_scene_tick)) {
            std::cerr << "ERROR: pipeline failed to start" << std::endl;
            return 1;
        }

        while (!interrupted && !pipeline.waitForSourceEnd(std::chrono::milliseconds(100))) {
        }

        pipeline.stop();
        print_statistics(*system, pipeline);

    } catch (const core::Exception& e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
