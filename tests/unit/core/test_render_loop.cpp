/**
 * @file test_render_loop.cpp
 * @brief Unit tests for RenderLoop blending, decay and exit conditions
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <automind/render_loop.h>
#include <automind/shutdown_signal.h>

#include <sstream>
#include <vector>

using namespace automind;
using Catch::Matchers::WithinAbs;

namespace {

class RecordingPresenter : public Presenter {
public:
    void present(const VisualState& state) override { frames.push_back(state); }
    bool closeRequested() const override { return closeAfter > 0 && frames.size() >= closeAfter; }

    std::vector<VisualState> frames;
    size_t closeAfter = 0;
};

// Issues a command on every poll, like a key held for one frame
class CommandPresenter : public Presenter {
public:
    void pollEvents() override { issue(PresenterCommand::SimulateFatigueEvent); }
    void present(const VisualState&) override {}
};

FeatureVectorPtr loudVector(uint64_t sequence, bool beat = false,
                            FatigueLevel fatigue = FatigueLevel::Normal) {
    auto v = std::make_shared<FeatureVector>();
    v->magnitudes.assign(512, 0.05f);
    v->set(Feature::Bass, 0.2f);
    v->set(Feature::Mid, 0.1f);
    v->set(Feature::Treble, 0.05f);
    v->set(Feature::Rms, 0.3f);
    v->set(Feature::Beat, beat ? 1.0f : 0.0f);
    v->sequence = sequence;
    v->timestamp = 0.1 * static_cast<double>(sequence + 1);
    v->sampleRate = 44100;
    v->windowSize = 1024;
    v->fatigue.level = fatigue;
    return v;
}

} // namespace

TEST_CASE("RenderLoop without any published vector", "[core][render]") {
    RenderConfig config;
    FeatureBus bus;
    RecordingPresenter presenter;
    RenderLoop loop(config, bus, presenter);

    for (int i = 0; i < 10; i++) {
        loop.tick();
    }

    REQUIRE(presenter.frames.size() == 10);
    REQUIRE(loop.ticks() == 10);
    REQUIRE_FALSE(loop.state().hasData);
    REQUIRE_THAT(loop.state().energy(), WithinAbs(0.0f, 1e-6f));
    REQUIRE(loop.state().bars.size() == config.bars);
}

TEST_CASE("RenderLoop blends toward a fresh vector", "[core][render]") {
    RenderConfig config;
    FeatureBus bus;
    RecordingPresenter presenter;
    RenderLoop loop(config, bus, presenter);

    bus.publish(loudVector(0));
    loop.tick();

    const VisualState& state = loop.state();
    REQUIRE(state.hasData);
    REQUIRE(state.staleTicks == 0);
    REQUIRE_THAT(state.audioTime, WithinAbs(0.1, 1e-9));

    SECTION("first tick moves by the attack coefficient") {
        // bass target = 0.2 * bandGain(4) = 0.8, attack 0.5
        REQUIRE_THAT(state.bass, WithinAbs(0.4f, 1e-4f));
    }

    SECTION("repeated ticks converge on the target") {
        for (uint32_t i = 0; i < config.holdTicks; i++) loop.tick();
        REQUIRE(loop.state().bass > 0.7f);
        REQUIRE(loop.state().bass <= 0.8f + 1e-4f);
    }
}

TEST_CASE("RenderLoop decays when no new vectors arrive", "[core][render]") {
    RenderConfig config;
    FeatureBus bus;
    RecordingPresenter presenter;
    RenderLoop loop(config, bus, presenter);

    bus.publish(loudVector(0));
    loop.tick();
    float peak = loop.state().energy();
    REQUIRE(peak > 0.0f);

    // Ten ticks at 60 ticks/s with nothing new on the bus
    for (int i = 0; i < 10; i++) {
        loop.tick();
    }

    const VisualState& state = loop.state();
    REQUIRE(state.staleTicks == 10);
    REQUIRE(state.energy() < peak);

    SECTION("energy falls monotonically once the hold expires") {
        const auto& frames = presenter.frames;
        for (size_t i = config.holdTicks + 2; i < frames.size(); i++) {
            REQUIRE(frames[i].energy() <= frames[i - 1].energy());
        }
    }

    SECTION("a fresh vector resets the staleness") {
        bus.publish(loudVector(1));
        loop.tick();
        REQUIRE(loop.state().staleTicks == 0);
    }
}

TEST_CASE("RenderLoop beat pulse and fatigue colour", "[core][render]") {
    RenderConfig config;
    FeatureBus bus;
    RecordingPresenter presenter;
    RenderLoop loop(config, bus, presenter);

    SECTION("beat sets the pulse which then decays") {
        bus.publish(loudVector(0, true));
        loop.tick();
        float pulse = loop.state().pulse;
        REQUIRE_THAT(pulse, WithinAbs(config.pulseDecay, 1e-5f));

        loop.tick();
        REQUIRE(loop.state().pulse < pulse);
    }

    SECTION("critical fatigue pulls the background toward red") {
        bus.publish(loudVector(0, false, FatigueLevel::Critical));
        for (int i = 0; i < 60; i++) loop.tick();

        glm::vec3 red = fatigueColor(FatigueLevel::Critical);
        REQUIRE(loop.state().fatigue == FatigueLevel::Critical);
        REQUIRE_THAT(loop.state().background.r, WithinAbs(red.r, 0.01f));
        REQUIRE_THAT(loop.state().background.g, WithinAbs(red.g, 0.01f));
    }
}

TEST_CASE("RenderLoop run exit conditions", "[core][render]") {
    RenderConfig config;
    config.fps = 200.0f;
    FeatureBus bus;
    RecordingPresenter presenter;
    ShutdownSignal signal;

    SECTION("stops after maxTicks") {
        config.maxTicks = 10;
        RenderLoop loop(config, bus, presenter);
        loop.run(signal);
        REQUIRE(loop.ticks() == 10);
        REQUIRE(loop.finishedByItself());
    }

    SECTION("stops when the presenter asks to close") {
        presenter.closeAfter = 3;
        RenderLoop loop(config, bus, presenter);
        loop.run(signal);
        REQUIRE(loop.ticks() == 3);
        REQUIRE(loop.finishedByItself());
    }

    SECTION("does not tick once the signal is raised") {
        signal.raise();
        RenderLoop loop(config, bus, presenter);
        loop.run(signal);
        REQUIRE(loop.ticks() == 0);
        REQUIRE_FALSE(loop.finishedByItself());
    }

    SECTION("presentFinal presents the last state once more") {
        config.maxTicks = 2;
        RenderLoop loop(config, bus, presenter);
        loop.run(signal);
        loop.presentFinal();
        REQUIRE(presenter.frames.size() == 3);
    }
}

TEST_CASE("LogPresenter prints a meter line", "[core][render]") {
    std::ostringstream out;
    LogPresenter presenter(out, 2);

    VisualState state;
    state.level = 0.5f;
    presenter.present(state);
    REQUIRE(out.str().empty());

    presenter.present(state);
    REQUIRE(out.str().find("[Render]") != std::string::npos);
    REQUIRE(out.str().find("NORMAL") != std::string::npos);
    REQUIRE(presenter.presented() == 2);
}

TEST_CASE("LogPresenter leaves the stream formatting alone", "[core][render]") {
    std::ostringstream out;
    LogPresenter presenter(out, 1);

    VisualState state;
    state.audioTime = 1.0;
    presenter.present(state);
    REQUIRE(out.str().find("1.00s") != std::string::npos);

    REQUIRE(out.precision() == 6);
    REQUIRE((out.flags() & std::ios::floatfield) == 0);

    out.str("");
    out << 0.123456;
    REQUIRE(out.str() == "0.123456");
}

TEST_CASE("Presenter commands reach the handler", "[core][render]") {
    RenderConfig config;
    config.fps = 200.0f;
    config.maxTicks = 2;
    FeatureBus bus;
    CommandPresenter presenter;
    ShutdownSignal signal;

    SECTION("without a handler commands are dropped") {
        RenderLoop loop(config, bus, presenter);
        loop.run(signal);
        REQUIRE(loop.ticks() == 2);
    }

    SECTION("each poll forwards one command") {
        std::vector<PresenterCommand> received;
        presenter.setCommandHandler([&received](PresenterCommand command) {
            received.push_back(command);
        });

        RenderLoop loop(config, bus, presenter);
        loop.run(signal);
        REQUIRE(received.size() == 2);
        REQUIRE(received[0] == PresenterCommand::SimulateFatigueEvent);
    }
}
