#pragma once

/**
 * @file render_loop.h
 * @brief Fixed-rate loop turning feature vectors into presented frames
 */

#include <automind/config.h>
#include <automind/feature_bus.h>
#include <automind/presenter.h>
#include <automind/tick_clock.h>
#include <automind/visual_state.h>
#include <cstdint>
#include <vector>

namespace automind {

class ShutdownSignal;

/**
 * @brief Main-thread loop that polls the FeatureBus and presents VisualStates
 *
 * Runs at RenderConfig::fps regardless of how often the analyzer publishes.
 * Every tick reads the newest vector, blends the VisualState toward the
 * targets it implies (fast attack, slower release), and presents once. When
 * no fresh vector arrived for more than holdTicks ticks, or none ever did,
 * the targets drop to the baseline so the display decays instead of
 * freezing.
 *
 * @par Example
 * @code
 * RenderLoop loop(config.render, bus, presenter);
 * loop.run(signal);        // returns on shutdown or window close
 * loop.presentFinal();
 * @endcode
 */
class RenderLoop {
public:
    RenderLoop(const RenderConfig& config, FeatureBus& bus, Presenter& presenter);

    /**
     * @brief Run paced ticks until shutdown
     *
     * Returns when the signal is raised, the presenter asks to close, or
     * RenderConfig::maxTicks ticks were presented.
     */
    void run(const ShutdownSignal& signal);

    /// @brief Read the bus, update the state, present. No pacing.
    void tick();

    /// @brief Present the current state once more if configured to
    void presentFinal();

    /// @brief True when the loop stopped for its own reasons (presenter, tick limit)
    bool finishedByItself() const { return m_finishedByItself; }

    const VisualState& state() const { return m_state; }
    uint64_t ticks() const { return m_state.tick; }
    const TickClock& clock() const { return m_clock; }

private:
    void updateTargets(const FeatureVector* source);
    void blend();

    RenderConfig m_config;
    FeatureBus& m_bus;
    Presenter& m_presenter;
    TickClock m_clock;

    VisualState m_state;
    FeatureVectorPtr m_lastSeen;

    // Targets the state is blending toward
    std::vector<float> m_targetBars;
    float m_targetBass = 0.0f;
    float m_targetMid = 0.0f;
    float m_targetTreble = 0.0f;
    float m_targetLevel = 0.0f;

    bool m_finishedByItself = false;
};

} // namespace automind
