#include <automind/render_loop.h>
#include <automind/shutdown_signal.h>

#include <algorithm>
#include <cmath>
#include <iostream>

namespace automind {

float VisualState::energy() const {
    float e = std::max({bass, mid, treble, level});
    for (float b : bars) e = std::max(e, b);
    return e;
}

glm::vec3 fatigueColor(FatigueLevel level) {
    switch (level) {
        case FatigueLevel::Warning:  return glm::vec3(255, 165, 0) / 255.0f;
        case FatigueLevel::Critical: return glm::vec3(255, 50, 50) / 255.0f;
        case FatigueLevel::Normal:   break;
    }
    return glm::vec3(20, 30, 50) / 255.0f;
}

RenderLoop::RenderLoop(const RenderConfig& config, FeatureBus& bus, Presenter& presenter)
    : m_config(config),
      m_bus(bus),
      m_presenter(presenter),
      m_clock(config.fps) {
    uint32_t bars = std::max<uint32_t>(m_config.bars, 1);
    m_state.bars.assign(bars, 0.0f);
    m_targetBars.assign(bars, 0.0f);
    m_state.background = fatigueColor(FatigueLevel::Normal);
}

void RenderLoop::run(const ShutdownSignal& signal) {
    m_finishedByItself = false;
    m_clock.reset();

    std::cout << "[Render] Running at " << m_clock.rate() << " ticks/s" << std::endl;

    while (!signal.raised()) {
        m_presenter.pollEvents();
        tick();

        if (m_presenter.closeRequested()) {
            std::cout << "[Render] Close requested" << std::endl;
            m_finishedByItself = true;
            break;
        }
        if (m_config.maxTicks > 0 && m_state.tick >= m_config.maxTicks) {
            std::cout << "[Render] Presented " << m_state.tick << " ticks, exiting" << std::endl;
            m_finishedByItself = true;
            break;
        }

        m_clock.waitForNextTick();
    }

    if (m_clock.skippedTicks() > 0) {
        std::cout << "[Render] Skipped " << m_clock.skippedTicks() << " late ticks" << std::endl;
    }
}

void RenderLoop::tick() {
    FeatureVectorPtr latest = m_bus.readLatest();

    if (latest && latest != m_lastSeen) {
        m_lastSeen = latest;
        m_state.staleTicks = 0;
        m_state.hasData = true;
        m_state.audioTime = latest->timestamp;
        m_state.fatigue = latest->fatigue.level;
        m_state.fatigueEvents = latest->fatigue.eventCount;
        if (latest->beat()) {
            m_state.pulse = 1.0f;
        }
    } else if (m_state.hasData) {
        ++m_state.staleTicks;
    }

    if (m_lastSeen && m_state.staleTicks <= m_config.holdTicks) {
        updateTargets(m_lastSeen.get());
    } else {
        updateTargets(nullptr);
    }

    blend();
    ++m_state.tick;
    m_presenter.present(m_state);
}

void RenderLoop::presentFinal() {
    if (!m_config.presentFinalFrame) return;
    m_presenter.present(m_state);
}

void RenderLoop::updateTargets(const FeatureVector* source) {
    if (!source) {
        std::fill(m_targetBars.begin(), m_targetBars.end(), 0.0f);
        m_targetBass = m_targetMid = m_targetTreble = m_targetLevel = 0.0f;
        return;
    }

    // Spread the bars logarithmically over bins 1..binCount
    const auto& mags = source->magnitudes;
    const size_t bins = mags.size();
    const size_t barCount = m_targetBars.size();

    for (size_t i = 0; i < barCount; i++) {
        if (bins < 2) {
            m_targetBars[i] = 0.0f;
            continue;
        }
        float t0 = static_cast<float>(i) / barCount;
        float t1 = static_cast<float>(i + 1) / barCount;
        size_t lo = static_cast<size_t>(std::pow(static_cast<float>(bins), t0));
        size_t hi = static_cast<size_t>(std::pow(static_cast<float>(bins), t1));
        lo = std::clamp<size_t>(lo, 1, bins - 1);
        hi = std::clamp<size_t>(hi, lo + 1, bins);

        float sum = 0.0f;
        for (size_t k = lo; k < hi; k++) sum += mags[k];
        float avg = sum / static_cast<float>(hi - lo);
        m_targetBars[i] = std::clamp(avg * m_config.barGain, 0.0f, 1.0f);
    }

    float gain = m_config.bandGain;
    m_targetBass = std::clamp(source->bass() * gain, 0.0f, 1.0f);
    m_targetMid = std::clamp(source->mid() * gain, 0.0f, 1.0f);
    m_targetTreble = std::clamp(source->treble() * gain, 0.0f, 1.0f);
    m_targetLevel = std::clamp(source->value(Feature::Rms) * gain * 0.5f, 0.0f, 1.0f);
}

void RenderLoop::blend() {
    auto approach = [this](float current, float target) {
        float rate = target > current ? m_config.attack : m_config.release;
        return current + (target - current) * rate;
    };

    for (size_t i = 0; i < m_state.bars.size(); i++) {
        m_state.bars[i] = approach(m_state.bars[i], m_targetBars[i]);
    }
    m_state.bass = approach(m_state.bass, m_targetBass);
    m_state.mid = approach(m_state.mid, m_targetMid);
    m_state.treble = approach(m_state.treble, m_targetTreble);
    m_state.level = approach(m_state.level, m_targetLevel);

    m_state.pulse *= m_config.pulseDecay;
    m_state.background = glm::mix(m_state.background, fatigueColor(m_state.fatigue), 0.1f);
}

} // namespace automind
