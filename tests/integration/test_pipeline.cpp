/**
 * @file test_pipeline.cpp
 * @brief Integration tests for the full capture-analysis-render pipeline
 *
 * A synthetic source stands in for the capture device, so these run without
 * audio hardware or a window.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <automind/feature_bus.h>
#include <automind/frame_ring_buffer.h>
#include <automind/presenter.h>
#include <automind/render_loop.h>
#include <automind/scheduler.h>
#include <automind/shutdown_signal.h>
#include <automind/audio/signal_source.h>
#include <automind/audio/spectral_analyzer.h>

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <vector>

using namespace automind;
using namespace automind::audio;
using Catch::Matchers::WithinAbs;

namespace {

SourceConfig tone(float frequency, uint64_t frames, bool paced) {
    SourceConfig config;
    config.synthetic = true;
    config.frequency = frequency;
    config.amplitude = 0.5f;
    config.paced = paced;
    config.frameLimit = frames;
    return config;
}

class CapturingPresenter : public Presenter {
public:
    void present(const VisualState& state) override {
        ++presented;
        last = state;
    }

    uint64_t presented = 0;
    VisualState last;
};

} // namespace

TEST_CASE("Two frames produce exactly one feature vector", "[integration][pipeline]") {
    ShutdownSignal signal;
    FrameRingBuffer ring(8, 512, 1, 44100);
    FeatureBus bus;
    SpectralAnalyzer analyzer(AnalyzerConfig{}, 44100, bus);
    SignalSource source(tone(440.0f, 2, false));

    source.open(44100, 1, 512);
    Scheduler scheduler(source, ring, analyzer, signal);
    scheduler.start();
    source.waitUntilFinished();
    scheduler.drain();

    REQUIRE_FALSE(scheduler.hasFailed());
    REQUIRE(scheduler.framesAnalyzed() == 2);
    REQUIRE(bus.version() == 1);

    FeatureVectorPtr vector = bus.readLatest();
    REQUIRE(vector != nullptr);
    REQUIRE_THAT(vector->timestamp, WithinAbs(1024.0 / 44100.0, 1e-9));
    REQUIRE(vector->magnitudes.size() == 512);
}

TEST_CASE("Tone frequency survives the whole pipeline", "[integration][pipeline]") {
    ShutdownSignal signal;
    FrameRingBuffer ring(FrameRingBuffer::capacityFor(0.5, 44100, 512), 512, 1, 44100);
    FeatureBus bus;
    SpectralAnalyzer analyzer(AnalyzerConfig{}, 44100, bus);
    SignalSource source(tone(2000.0f, 40, false));

    source.open(44100, 1, 512);
    Scheduler scheduler(source, ring, analyzer, signal);
    scheduler.start();
    source.waitUntilFinished();
    scheduler.drain();

    REQUIRE(ring.droppedFrames() == 0);
    REQUIRE(scheduler.framesAnalyzed() == 40);
    REQUIRE(bus.version() == 39);

    FeatureVectorPtr vector = bus.readLatest();
    long expected = std::lround(2000.0 * 1024.0 / 44100.0);
    REQUIRE(std::labs(static_cast<long>(vector->peakBin()) - expected) <= 1);
    REQUIRE(vector->mid() > vector->bass());
    REQUIRE(vector->mid() > vector->treble());
    REQUIRE_THAT(vector->timestamp, WithinAbs(40.0 * 512.0 / 44100.0, 1e-9));
}

TEST_CASE("Render loop presents live analysis until its tick limit", "[integration][pipeline]") {
    ShutdownSignal signal;
    FrameRingBuffer ring(FrameRingBuffer::capacityFor(0.2, 44100, 512), 512, 1, 44100);
    FeatureBus bus;
    SpectralAnalyzer analyzer(AnalyzerConfig{}, 44100, bus);
    SignalSource source(tone(100.0f, 0, true));

    RenderConfig render;
    render.fps = 100.0f;
    render.maxTicks = 30;
    CapturingPresenter presenter;
    RenderLoop renderLoop(render, bus, presenter);

    source.open(44100, 1, 512);
    Scheduler scheduler(source, ring, analyzer, signal);
    scheduler.run(renderLoop);

    REQUIRE(renderLoop.finishedByItself());
    REQUIRE_FALSE(scheduler.isRunning());
    REQUIRE_FALSE(source.isRunning());
    REQUIRE(signal.raised());

    // 30 ticks plus the final frame
    REQUIRE(presenter.presented == 31);
    REQUIRE(presenter.last.hasData);
    REQUIRE(presenter.last.bass > presenter.last.treble);
    REQUIRE(presenter.last.audioTime > 0.0);
}

TEST_CASE("Raising the shutdown signal stops a running pipeline", "[integration][pipeline]") {
    ShutdownSignal signal;
    FrameRingBuffer ring(8, 512, 1, 44100);
    FeatureBus bus;
    SpectralAnalyzer analyzer(AnalyzerConfig{}, 44100, bus);
    SignalSource source(tone(440.0f, 0, true));

    source.open(44100, 1, 512);
    Scheduler scheduler(source, ring, analyzer, signal);
    scheduler.start();
    REQUIRE(scheduler.isRunning());

    signal.raise();
    scheduler.shutdown();

    REQUIRE_FALSE(scheduler.isRunning());
    REQUIRE_FALSE(source.isOpen());
    REQUIRE(ring.isClosed());
    REQUIRE_NOTHROW(scheduler.rethrowIfFailed());
}
