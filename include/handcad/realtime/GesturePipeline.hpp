/* SPDX-License-Identifier: MIT */
/*
 * Two-cadence gesture pipeline
 *
 * Acquisition thread: frame source -> recognition system -> snapshot/event handoff
 * Scene thread:       fixed-rate tick reading the latest snapshot and queued events
 *
 * Camera I/O blocks only the acquisition thread; the scene thread never
 * waits on it.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include <handcad/gesture/GestureRecognitionSystem.hpp>
#include <handcad/realtime/EventQueue.hpp>
#include <handcad/realtime/FrameSource.hpp>
#include <handcad/realtime/SnapshotExchange.hpp>

namespace handcad {
namespace core {
class Configuration;
}
}

namespace handcad {
namespace realtime {

struct PipelineConfig {
    double scene_rate_hz = 60.0;
    size_t event_queue_capacity = 64;

    bool is_valid() const {
        return scene_rate_hz > 0.0 && scene_rate_hz <= 1000.0 && event_queue_capacity > 0;
    }

    /**
     * Read the pipeline section
     * @throws core::ConfigurationException if the resulting values are invalid
     */
    static PipelineConfig from_configuration(const core::Configuration& configuration);
};

/**
 * Pipeline counters
 */
struct PipelineMetrics {
    size_t frames_acquired = 0;
    size_t frames_rejected = 0;
    size_t snapshots_published = 0;
    size_t scene_ticks = 0;
    size_t events_delivered = 0;
    size_t events_dropped = 0;
};

class GesturePipeline {
public:
    using SnapshotPtr = SnapshotExchange<gesture::GestureSnapshot>::Ptr;

    /**
     * Called on the scene thread once per tick
     *
     * @param snapshot Latest published snapshot (nullptr until the first frame)
     * @param events Discrete events queued since the previous tick, oldest first
     */
    using SceneCallback = std::function<void(const SnapshotPtr& snapshot,
                                             const std::vector<gesture::GestureEvent>& events)>;

    /**
     * @throws core::PipelineException if source or system is null
     */
    GesturePipeline(std::shared_ptr<FrameSource> source,
                    std::shared_ptr<gesture::GestureRecognitionSystem> system,
                    const PipelineConfig& config = {});
    ~GesturePipeline();

    GesturePipeline(const GesturePipeline&) = delete;
    GesturePipeline& operator=(const GesturePipeline&) = delete;

    /**
     * Start both threads
     * @return false if already running
     * @throws core::PipelineException if a thread cannot be created
     */
    bool start(SceneCallback callback);

    /**
     * Stop both threads and run one final scene tick so no queued event is lost
     */
    void stop();

    bool isRunning() const { return running_.load(); }

    /**
     * Block until the source reports end of stream
     * @return false on timeout
     */
    bool waitForSourceEnd(std::chrono::milliseconds timeout);

    SnapshotPtr latestSnapshot() const { return snapshots_.latest(); }

    /**
     * Switch the recognizer between normal and precision mode
     *
     * Safe from any thread, the scene callback included. Takes effect from
     * the next frame the acquisition thread processes.
     */
    void requestPrecisionMode(bool enabled);

    PipelineMetrics getMetrics() const;

private:
    void acquisitionThread();
    void sceneThread();
    void sceneTick();

    PipelineConfig config_;
    std::shared_ptr<FrameSource> source_;
    std::shared_ptr<gesture::GestureRecognitionSystem> system_;

    SnapshotExchange<gesture::GestureSnapshot> snapshots_;
    EventQueue<gesture::GestureEvent> events_;

    std::atomic<bool> running_;
    std::thread acquisition_thread_;
    std::thread scene_thread_;

    std::mutex wake_mutex_;
    std::condition_variable wake_cv_;

    std::mutex callback_mutex_;
    SceneCallback scene_callback_;

    std::mutex source_mutex_;
    std::condition_variable source_cv_;
    bool source_finished_ = false;

    mutable std::mutex metrics_mutex_;
    PipelineMetrics metrics_;
};

} // namespace realtime
} // namespace handcad
