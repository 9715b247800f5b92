/**
 * @file test_scheduler.cpp
 * @brief Unit tests for Scheduler startup, draining, errors and shutdown
 */

#include <catch2/catch_test_macros.hpp>
#include <automind/audio_source.h>
#include <automind/errors.h>
#include <automind/frame_ring_buffer.h>
#include <automind/render_loop.h>
#include <automind/scheduler.h>

#include <mutex>
#include <string>
#include <vector>

using namespace automind;

namespace {

class EventLog {
public:
    void add(const std::string& event) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_events.push_back(event);
    }

    std::vector<std::string> events() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_events;
    }

    size_t indexOf(const std::string& event) const {
        auto all = events();
        for (size_t i = 0; i < all.size(); i++) {
            if (all[i] == event) return i;
        }
        return all.size();
    }

private:
    mutable std::mutex m_mutex;
    std::vector<std::string> m_events;
};

// Delivers a fixed number of frames synchronously from start()
class ScriptedSource : public AudioSource {
public:
    ScriptedSource(EventLog& log, uint32_t frames) : m_log(log), m_frames(frames) {}

    void open(uint32_t sampleRate, uint32_t channels, uint32_t frameSize) override {
        prepareAssembly(sampleRate, channels, frameSize);
        m_block.assign(static_cast<size_t>(frameSize) * channels, 0.25f);
        m_open = true;
    }

    void start() override {
        m_running = true;
        for (uint32_t i = 0; i < m_frames; i++) {
            deliver(m_block.data(), frameSize());
        }
        if (failOnStart) {
            reportError(std::make_exception_ptr(StreamInterrupted("device unplugged")));
        }
    }

    void close() override {
        if (m_open.exchange(false)) m_log.add("source.close");
        m_running = false;
    }

    std::string name() const override { return "Scripted"; }

    bool failOnStart = false;

private:
    EventLog& m_log;
    uint32_t m_frames;
    std::vector<float> m_block;
};

class CountingProcessor : public FrameProcessor {
public:
    explicit CountingProcessor(EventLog& log) : m_log(log) {}

    void process(const PCMFrame& frame) override {
        if (throwOnFrame) throw std::runtime_error("analysis failed");
        sequences.push_back(frame.sequence);
    }

    void finish() override {
        ++finished;
        m_log.add("processor.finish");
    }

    std::vector<uint64_t> sequences;
    int finished = 0;
    bool throwOnFrame = false;

private:
    EventLog& m_log;
};

class NullPresenter : public Presenter {
public:
    void present(const VisualState&) override { ++presented; }
    int presented = 0;
};

} // namespace

TEST_CASE("Scheduler drains every queued frame", "[core][scheduler]") {
    EventLog log;
    ScriptedSource source(log, 5);
    FrameRingBuffer ring(8, 64, 1, 44100);
    CountingProcessor processor(log);
    ShutdownSignal signal;

    source.open(44100, 1, 64);
    Scheduler scheduler(source, ring, processor, signal);
    scheduler.start();
    scheduler.drain();

    REQUIRE(processor.sequences == std::vector<uint64_t>{0, 1, 2, 3, 4});
    REQUIRE(processor.finished == 1);
    REQUIRE(scheduler.framesAnalyzed() == 5);
    REQUIRE_FALSE(signal.raised());
    REQUIRE_FALSE(scheduler.hasFailed());
}

TEST_CASE("Scheduler shutdown order and idempotence", "[core][scheduler]") {
    EventLog log;
    ScriptedSource source(log, 0);
    FrameRingBuffer ring(4, 64, 1, 44100);
    CountingProcessor processor(log);
    ShutdownSignal signal;

    source.open(44100, 1, 64);
    Scheduler scheduler(source, ring, processor, signal);
    scheduler.start();
    REQUIRE(scheduler.isRunning());

    scheduler.shutdown();

    SECTION("signal raised, source closed before the analysis thread finished") {
        REQUIRE(signal.raised());
        REQUIRE(ring.isClosed());
        REQUIRE_FALSE(source.isOpen());
        REQUIRE(log.indexOf("source.close") < log.indexOf("processor.finish"));
        REQUIRE_FALSE(scheduler.isRunning());
    }

    SECTION("a second shutdown does nothing") {
        scheduler.shutdown();
        scheduler.shutdown();
        REQUIRE(processor.finished == 1);
        REQUIRE(log.events().size() == 2);
    }
}

TEST_CASE("Scheduler shutdown without start", "[core][scheduler]") {
    EventLog log;
    ScriptedSource source(log, 0);
    FrameRingBuffer ring(2);
    CountingProcessor processor(log);
    ShutdownSignal signal;

    Scheduler scheduler(source, ring, processor, signal);
    scheduler.shutdown();
    scheduler.shutdown();

    REQUIRE(signal.raised());
    REQUIRE(processor.finished == 0);
}

TEST_CASE("Scheduler surfaces stream errors from run", "[core][scheduler]") {
    EventLog log;
    ScriptedSource source(log, 2);
    source.failOnStart = true;
    FrameRingBuffer ring(4, 64, 1, 44100);
    CountingProcessor processor(log);
    ShutdownSignal signal;

    RenderConfig renderConfig;
    renderConfig.fps = 200.0f;
    renderConfig.maxTicks = 10000;
    FeatureBus bus;
    NullPresenter presenter;
    RenderLoop renderLoop(renderConfig, bus, presenter);

    source.open(44100, 1, 64);
    Scheduler scheduler(source, ring, processor, signal);

    REQUIRE_THROWS_AS(scheduler.run(renderLoop), StreamInterrupted);
    REQUIRE(signal.raised());
    REQUIRE(scheduler.hasFailed());
    REQUIRE_FALSE(source.isOpen());
    // The render loop stopped on the signal, not on its tick limit
    REQUIRE(renderLoop.ticks() < 10000);
    REQUIRE_FALSE(renderLoop.finishedByItself());
}

TEST_CASE("Scheduler records analysis failures", "[core][scheduler]") {
    EventLog log;
    ScriptedSource source(log, 3);
    FrameRingBuffer ring(4, 64, 1, 44100);
    CountingProcessor processor(log);
    processor.throwOnFrame = true;
    ShutdownSignal signal;

    source.open(44100, 1, 64);
    Scheduler scheduler(source, ring, processor, signal);
    scheduler.start();
    scheduler.drain();

    REQUIRE(scheduler.hasFailed());
    REQUIRE(signal.raised());
    REQUIRE_THROWS_AS(scheduler.rethrowIfFailed(), std::runtime_error);

    SECTION("only the first error is kept") {
        scheduler.fail(std::make_exception_ptr(StreamInterrupted("later")));
        REQUIRE_THROWS_WITH(scheduler.rethrowIfFailed(), "analysis failed");
    }
}
