/**
 * @file test_realtime_pipeline.cpp
 * @brief Tests for the acquisition/scene pipeline and its building blocks
 *
 * Validates:
 * - SnapshotExchange latest-value semantics
 * - EventQueue drop-oldest overflow
 * - RecordedFrameSource parsing, rejection of bad documents, interrupt
 * - GesturePipeline end to end on the bundled sample session
 * - Session mode overrides reach the recognizer running behind the pipeline
 * - Scene callbacks may re-enter the pipeline
 */

#include <gtest/gtest.h>
#include <handcad/realtime/EventQueue.hpp>
#include <handcad/realtime/GesturePipeline.hpp>
#include <handcad/realtime/RecordedFrameSource.hpp>
#include <handcad/realtime/SnapshotExchange.hpp>
#include <handcad/session/CadSession.hpp>
#include <handcad/core/Logger.hpp>
#include <handcad/core/exception.h>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace handcad;
using namespace handcad::realtime;

namespace {

const char* kTwoFrameRecording = R"(
frames:
  - t: 0.0
    hands:
      - index: 0
        points: [[0.5,0.8,0],[0.44,0.75,0],[0.38,0.7,0],[0.42,0.66,0],[0.46,0.72,0],
                 [0.44,0.6,0],[0.44,0.5,0],[0.44,0.45,0],[0.44,0.4,0],
                 [0.5,0.6,0],[0.5,0.55,0],[0.5,0.6,0],[0.5,0.65,0],
                 [0.56,0.6,0],[0.56,0.55,0],[0.56,0.6,0],[0.56,0.65,0],
                 [0.62,0.6,0],[0.62,0.55,0],[0.62,0.6,0],[0.62,0.65,0]]
  - t: 0.05
    hands: []
)";

const char* kFistRecording = R"(
frames:
  - t: 0.0
    hands:
      - index: 0
        points: [[0.5,0.8,0],[0.44,0.75,0],[0.38,0.7,0],[0.42,0.66,0],[0.46,0.72,0],
                 [0.44,0.6,0],[0.44,0.55,0],[0.44,0.6,0],[0.44,0.65,0],
                 [0.5,0.6,0],[0.5,0.55,0],[0.5,0.6,0],[0.5,0.65,0],
                 [0.56,0.6,0],[0.56,0.55,0],[0.56,0.6,0],[0.56,0.65,0],
                 [0.62,0.6,0],[0.62,0.55,0],[0.62,0.6,0],[0.62,0.65,0]]
  - t: 0.05
    hands: []
)";

} // namespace

class RealtimePipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        core::Logger::getInstance().setLevel(core::LogLevel::ERROR);
    }

    static std::string sample_session() {
        return std::string(HANDCAD_TEST_DATA_DIR) + "/sample_session.yaml";
    }
};

/**
 * Test 1: Readers always see the newest published snapshot
 */
TEST_F(RealtimePipelineTest, SnapshotExchangeLatestWins) {
    SnapshotExchange<int> exchange;
    EXPECT_EQ(exchange.latest(), nullptr);
    EXPECT_EQ(exchange.sequence(), 0u);

    EXPECT_EQ(exchange.publish(1), 1u);
    auto held = exchange.latest();
    EXPECT_EQ(exchange.publish(2), 2u);
    EXPECT_EQ(exchange.publish(3), 3u);

    // Earlier reader keeps its own copy alive
    EXPECT_EQ(*held, 1);
    EXPECT_EQ(*exchange.latest(), 3);

    exchange.clear();
    EXPECT_EQ(exchange.latest(), nullptr);
    EXPECT_EQ(exchange.sequence(), 3u);
}

/**
 * Test 2: Full queue drops its oldest item
 */
TEST_F(RealtimePipelineTest, EventQueueDropsOldest) {
    EventQueue<int> queue(3);
    EXPECT_TRUE(queue.tryPush(1));
    EXPECT_TRUE(queue.tryPush(2));
    EXPECT_TRUE(queue.tryPush(3));
    EXPECT_FALSE(queue.tryPush(4));
    EXPECT_EQ(queue.size(), 3u);
    EXPECT_EQ(queue.dropped(), 1u);

    std::vector<int> items = queue.drain();
    ASSERT_EQ(items.size(), 3u);
    EXPECT_EQ(items[0], 2);
    EXPECT_EQ(items[2], 4);
    EXPECT_EQ(queue.size(), 0u);
    EXPECT_TRUE(queue.drain().empty());

    EventQueue<int> tiny(0);
    EXPECT_EQ(tiny.capacity(), 1u);
}

/**
 * Test 3: Recording parsed from memory
 */
TEST_F(RealtimePipelineTest, RecordedSourceParsesFrames) {
    RecordedFrameSource source;
    ASSERT_TRUE(source.loadFromString(kTwoFrameRecording));
    EXPECT_EQ(source.frameCount(), 2u);

    HandFrameBatch first;
    ASSERT_TRUE(source.next(first));
    ASSERT_EQ(first.hands.size(), 1u);
    EXPECT_EQ(first.hands[0].hand_index, 0);
    ASSERT_EQ(first.hands[0].points.size(), 21u);
    EXPECT_FLOAT_EQ(first.hands[0].points[8].y, 0.4f);

    HandFrameBatch second;
    ASSERT_TRUE(source.next(second));
    EXPECT_TRUE(second.hands.empty());
    EXPECT_NEAR(core::seconds_between(first.timestamp, second.timestamp), 0.05, 1e-6);

    HandFrameBatch done;
    EXPECT_FALSE(source.next(done));
    EXPECT_EQ(source.position(), 2u);

    source.rewind();
    EXPECT_TRUE(source.next(done));
}

/**
 * Test 4: Malformed recordings are refused and keep the previous data
 */
TEST_F(RealtimePipelineTest, RecordedSourceRejectsBadDocuments) {
    RecordedFrameSource source;
    ASSERT_TRUE(source.loadFromString(kTwoFrameRecording));

    EXPECT_FALSE(source.loadFromString("not_frames: 1"));
    EXPECT_FALSE(source.loadFromString("frames: [ {t: 1.0}, {t: 0.5} ]"));
    EXPECT_FALSE(source.loadFromString("frames: [ {t: 0.0, hands: [ {index: 0, points: [[0.1, 0.2]]} ]} ]"));
    EXPECT_FALSE(source.loadFromString("frames: [ {t: 0.0, hands: [ {index: 0, points: [[0.1, 0.2, "));
    EXPECT_FALSE(source.load("/nonexistent/recording.yaml"));

    EXPECT_EQ(source.frameCount(), 2u);
}

/**
 * Test 5: Pacing waits can be interrupted
 */
TEST_F(RealtimePipelineTest, RecordedSourceInterrupt) {
    auto source = std::make_shared<RecordedFrameSource>(true);
    ASSERT_TRUE(source->loadFromString("frames: [ {t: 0.0, hands: []}, {t: 60.0, hands: []} ]"));

    HandFrameBatch batch;
    ASSERT_TRUE(source->next(batch));

    std::atomic<bool> returned{false};
    bool result = true;
    std::thread waiter([&] {
        result = source->next(batch);
        returned = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_FALSE(returned.load());
    source->interrupt();
    waiter.join();

    EXPECT_TRUE(returned.load());
    EXPECT_FALSE(result);
}

/**
 * Test 6: Missing collaborators are a construction error
 */
TEST_F(RealtimePipelineTest, PipelineRequiresSourceAndSystem) {
    auto system = std::make_shared<gesture::GestureRecognitionSystem>();
    auto source = std::make_shared<RecordedFrameSource>();

    EXPECT_THROW(GesturePipeline(nullptr, system), core::PipelineException);
    try {
        GesturePipeline pipeline(source, nullptr);
        FAIL() << "Expected PipelineException";
    } catch (const core::PipelineException& e) {
        EXPECT_EQ(e.getResultCode(), core::ResultCode::ERROR_NOT_INITIALIZED);
    }
}

/**
 * Test 7: Sample session replayed end to end
 */
TEST_F(RealtimePipelineTest, SampleSessionEndToEnd) {
    auto source = std::make_shared<RecordedFrameSource>();
    ASSERT_TRUE(source->load(sample_session()));
    ASSERT_EQ(source->frameCount(), 120u);

    auto system = std::make_shared<gesture::GestureRecognitionSystem>();
    PipelineConfig config;
    config.scene_rate_hz = 200.0;
    GesturePipeline pipeline(source, system, config);

    std::mutex mutex;
    size_t callbacks = 0;
    size_t events_seen = 0;
    size_t toggles_seen = 0;
    std::uint64_t last_frame_id = 0;
    bool frame_ids_monotonic = true;

    ASSERT_TRUE(pipeline.start([&](const GesturePipeline::SnapshotPtr& snapshot,
                                   const std::vector<gesture::GestureEvent>& events) {
        std::lock_guard<std::mutex> lock(mutex);
        callbacks++;
        events_seen += events.size();
        for (const auto& event : events) {
            if (event.type == gesture::GestureEventType::MODE_TOGGLED) {
                toggles_seen++;
            }
        }
        if (snapshot) {
            if (snapshot->frame_id < last_frame_id) {
                frame_ids_monotonic = false;
            }
            last_frame_id = snapshot->frame_id;
        }
    }));
    EXPECT_TRUE(pipeline.isRunning());
    EXPECT_FALSE(pipeline.start(nullptr));

    ASSERT_TRUE(pipeline.waitForSourceEnd(std::chrono::seconds(10)));
    pipeline.stop();
    EXPECT_FALSE(pipeline.isRunning());

    PipelineMetrics metrics = pipeline.getMetrics();
    EXPECT_EQ(metrics.frames_acquired, 120u);
    EXPECT_EQ(metrics.frames_rejected, 1u);
    EXPECT_EQ(metrics.snapshots_published, 119u);
    EXPECT_EQ(metrics.events_dropped, 0u);
    EXPECT_EQ(source->rejectedCount(), 1u);

    // The truncated frame never reached the recognition system
    gesture::GestureSystemStats stats = system->get_stats();
    EXPECT_EQ(stats.frames_processed, 119u);
    EXPECT_EQ(stats.frames_rejected, 0u);

    ASSERT_NE(pipeline.latestSnapshot(), nullptr);
    EXPECT_EQ(pipeline.latestSnapshot()->frame_id, 118u);

    std::lock_guard<std::mutex> lock(mutex);
    EXPECT_GE(callbacks, 1u);
    EXPECT_EQ(events_seen, metrics.events_delivered);
    EXPECT_EQ(toggles_seen, 1u);
    EXPECT_EQ(stats.toggles_fired, 1u);
    EXPECT_TRUE(frame_ids_monotonic);
    EXPECT_EQ(last_frame_id, 118u);
}

/**
 * Test 8: A throwing scene callback does not stop the pipeline
 */
TEST_F(RealtimePipelineTest, CallbackExceptionContained) {
    auto source = std::make_shared<RecordedFrameSource>();
    ASSERT_TRUE(source->loadFromString(kTwoFrameRecording));
    auto system = std::make_shared<gesture::GestureRecognitionSystem>();

    GesturePipeline pipeline(source, system);
    std::atomic<int> calls{0};
    ASSERT_TRUE(pipeline.start([&](const GesturePipeline::SnapshotPtr&,
                                   const std::vector<gesture::GestureEvent>&) {
        calls++;
        throw std::runtime_error("scene failure");
    }));

    ASSERT_TRUE(pipeline.waitForSourceEnd(std::chrono::seconds(5)));
    pipeline.stop();

    EXPECT_GE(calls.load(), 1);
    EXPECT_EQ(pipeline.getMetrics().snapshots_published, 2u);
}

/**
 * Test 9: Leaving CAD mode on the session lets actions through the pipeline
 */
TEST_F(RealtimePipelineTest, SessionModeOverrideDispatchesActions) {
    auto source = std::make_shared<RecordedFrameSource>();
    ASSERT_TRUE(source->loadFromString(kFistRecording));

    gesture::GestureSystemConfig system_config;
    system_config.start_in_precision_mode = true;
    auto system = std::make_shared<gesture::GestureRecognitionSystem>(system_config);
    GesturePipeline pipeline(source, system);

    session::CadSession cad_session;
    ASSERT_TRUE(cad_session.cad_active());
    cad_session.set_mode_request_handler([&pipeline](bool precision_mode) {
        pipeline.requestPrecisionMode(precision_mode);
    });

    cad_session.set_cad_active(false);
    EXPECT_FALSE(system->is_precision_mode());

    std::mutex mutex;
    std::vector<session::SceneCommand> commands;
    ASSERT_TRUE(pipeline.start([&](const GesturePipeline::SnapshotPtr& snapshot,
                                   const std::vector<gesture::GestureEvent>& events) {
        std::lock_guard<std::mutex> lock(mutex);
        auto tick = cad_session.apply(snapshot.get(), events, core::Clock::now());
        commands.insert(commands.end(), tick.begin(), tick.end());
    }));

    ASSERT_TRUE(pipeline.waitForSourceEnd(std::chrono::seconds(5)));
    pipeline.stop();

    EXPECT_EQ(system->get_stats().actions_dispatched, 1u);

    std::lock_guard<std::mutex> lock(mutex);
    ASSERT_EQ(commands.size(), 1u);
    EXPECT_EQ(commands[0].type, session::SceneCommandType::SPAWN_DRONE);
    EXPECT_FALSE(cad_session.cad_active());
}

/**
 * Test 10: The final tick of stop() may restart the pipeline
 */
TEST_F(RealtimePipelineTest, CallbackMayRestartPipeline) {
    auto source = std::make_shared<RecordedFrameSource>();
    ASSERT_TRUE(source->loadFromString(kTwoFrameRecording));
    auto system = std::make_shared<gesture::GestureRecognitionSystem>();
    GesturePipeline pipeline(source, system);

    std::atomic<bool> restarted{false};
    std::atomic<int> second_run_calls{0};
    GesturePipeline::SceneCallback second_run = [&](const GesturePipeline::SnapshotPtr&,
                                                    const std::vector<gesture::GestureEvent>&) {
        second_run_calls++;
    };

    // The final tick runs on the thread that calls stop()
    const std::thread::id test_thread = std::this_thread::get_id();
    ASSERT_TRUE(pipeline.start([&](const GesturePipeline::SnapshotPtr&,
                                   const std::vector<gesture::GestureEvent>&) {
        if (std::this_thread::get_id() == test_thread && !restarted.exchange(true)) {
            EXPECT_TRUE(pipeline.start(second_run));
        }
    }));

    ASSERT_TRUE(pipeline.waitForSourceEnd(std::chrono::seconds(5)));
    pipeline.stop();
    EXPECT_TRUE(restarted.load());
    EXPECT_TRUE(pipeline.isRunning());

    pipeline.stop();
    EXPECT_FALSE(pipeline.isRunning());
    EXPECT_GE(second_run_calls.load(), 1);
}
