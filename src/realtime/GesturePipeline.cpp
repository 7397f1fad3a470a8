/* SPDX-License-Identifier: MIT */

#include <handcad/realtime/GesturePipeline.hpp>
#include <handcad/core/Configuration.hpp>
#include <handcad/core/Logger.hpp>
#include <handcad/core/exception.h>
#include <pthread.h>
#include <system_error>

namespace handcad {
namespace realtime {

PipelineConfig PipelineConfig::from_configuration(const core::Configuration& configuration) {
    PipelineConfig config;
    config.scene_rate_hz = configuration.get<double>("pipeline.scene_rate_hz", 60.0);

    const int capacity = configuration.get<int>("pipeline.event_queue_capacity", 64);
    if (capacity <= 0) {
        HANDCAD_THROW(core::ConfigurationException,
                      "pipeline.event_queue_capacity must be positive, got " +
                      std::to_string(capacity));
    }
    config.event_queue_capacity = static_cast<size_t>(capacity);

    if (!config.is_valid()) {
        HANDCAD_THROW(core::ConfigurationException, "Invalid pipeline configuration");
    }
    return config;
}

GesturePipeline::GesturePipeline(std::shared_ptr<FrameSource> source,
                                 std::shared_ptr<gesture::GestureRecognitionSystem> system,
                                 const PipelineConfig& config)
    : config_(config.is_valid() ? config : PipelineConfig{})
    , source_(std::move(source))
    , system_(std::move(system))
    , events_(config_.event_queue_capacity)
    , running_(false) {
    if (!source_) {
        HANDCAD_THROW_CODE(core::PipelineException, core::ResultCode::ERROR_NOT_INITIALIZED,
                           "GesturePipeline requires a frame source");
    }
    if (!system_) {
        HANDCAD_THROW_CODE(core::PipelineException, core::ResultCode::ERROR_NOT_INITIALIZED,
                           "GesturePipeline requires a recognition system");
    }
}

GesturePipeline::~GesturePipeline() {
    stop();
}

bool GesturePipeline::start(SceneCallback callback) {
    if (running_) {
        LOG_WARNING("GesturePipeline: already running");
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        scene_callback_ = std::move(callback);
    }
    {
        std::lock_guard<std::mutex> lock(source_mutex_);
        source_finished_ = false;
    }

    running_ = true;

    try {
        acquisition_thread_ = std::thread(&GesturePipeline::acquisitionThread, this);
        scene_thread_ = std::thread(&GesturePipeline::sceneThread, this);
    } catch (const std::system_error& e) {
        running_ = false;
        source_->interrupt();
        if (acquisition_thread_.joinable()) {
            acquisition_thread_.join();
        }
        HANDCAD_THROW_CODE(core::PipelineException, core::ResultCode::ERROR_THREAD_FAILURE,
                           std::string("Failed to start pipeline threads: ") + e.what());
    }

    LOG_INFO("GesturePipeline: started (scene rate " + std::to_string(config_.scene_rate_hz) + " Hz)");
    return true;
}

void GesturePipeline::stop() {
    if (!running_) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        running_ = false;
    }
    source_->interrupt();
    wake_cv_.notify_all();

    if (acquisition_thread_.joinable()) {
        acquisition_thread_.join();
    }
    if (scene_thread_.joinable()) {
        scene_thread_.join();
    }

    // Deliver whatever the acquisition thread queued after the last tick
    sceneTick();

    PipelineMetrics metrics = getMetrics();
    HANDCAD_LOG_INFO("GesturePipeline") << "stopped, frames=" << metrics.frames_acquired
                                        << ", rejected=" << metrics.frames_rejected
                                        << ", ticks=" << metrics.scene_ticks
                                        << ", events=" << metrics.events_delivered
                                        << ", dropped=" << metrics.events_dropped;
}

bool GesturePipeline::waitForSourceEnd(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(source_mutex_);
    return source_cv_.wait_for(lock, timeout, [this] { return source_finished_; });
}

PipelineMetrics GesturePipeline::getMetrics() const {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    PipelineMetrics metrics = metrics_;
    metrics.events_dropped = events_.dropped();
    return metrics;
}

void GesturePipeline::acquisitionThread() {
    pthread_setname_np(pthread_self(), "HC_Acquisition");

    HandFrameBatch batch;
    while (running_) {
        if (!source_->next(batch)) {
            break;
        }

        {
            std::lock_guard<std::mutex> lock(metrics_mutex_);
            metrics_.frames_acquired++;
        }

        try {
            std::vector<gesture::HandLandmarks> hands;
            hands.reserve(batch.hands.size());
            for (const auto& raw : batch.hands) {
                hands.push_back(gesture::HandLandmarks::from_points(raw.points, raw.hand_index,
                                                                    batch.timestamp));
            }

            gesture::GestureSnapshot snapshot = system_->process_frame(hands, batch.timestamp);
            for (const auto& event : snapshot.events) {
                events_.tryPush(event);
            }
            snapshots_.publish(std::move(snapshot));

            std::lock_guard<std::mutex> lock(metrics_mutex_);
            metrics_.snapshots_published++;
        } catch (const core::Exception& e) {
            {
                std::lock_guard<std::mutex> lock(metrics_mutex_);
                metrics_.frames_rejected++;
            }
            source_->onRejected(e);
        }
    }

    {
        std::lock_guard<std::mutex> lock(source_mutex_);
        source_finished_ = true;
    }
    source_cv_.notify_all();
    LOG_DEBUG("GesturePipeline: acquisition thread exiting");
}

void GesturePipeline::sceneThread() {
    pthread_setname_np(pthread_self(), "HC_Scene");

    const auto period = std::chrono::duration_cast<core::Clock::duration>(
        std::chrono::duration<double>(1.0 / config_.scene_rate_hz));
    auto next_tick = core::Clock::now();

    while (running_) {
        next_tick += period;
        sceneTick();

        std::unique_lock<std::mutex> lock(wake_mutex_);
        wake_cv_.wait_until(lock, next_tick, [this] { return !running_; });
    }
}

void GesturePipeline::requestPrecisionMode(bool enabled) {
    system_->set_precision_mode(enabled);
}

void GesturePipeline::sceneTick() {
    std::vector<gesture::GestureEvent> events = events_.drain();
    SnapshotPtr snapshot = snapshots_.latest();

    {
        std::lock_guard<std::mutex> lock(metrics_mutex_);
        metrics_.scene_ticks++;
        metrics_.events_delivered += events.size();
    }

    // Invoked unlocked: the callback may call back into start()
    SceneCallback callback;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback = scene_callback_;
    }
    if (!callback) {
        return;
    }

    try {
        callback(snapshot, events);
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("GesturePipeline: scene callback failed: ") + e.what());
    }
}

} // namespace realtime
} // namespace handcad
