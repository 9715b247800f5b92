#include <automind/audio/fatigue_monitor.h>

#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>

namespace automind::audio {

namespace {
constexpr double NEVER = -std::numeric_limits<double>::infinity();
}

FatigueMonitor::FatigueMonitor(const FatigueConfig& config, uint32_t sampleRate)
    : m_config(config), m_lastManualEvent(NEVER), m_lastAlert(NEVER) {
    double period = std::max(0.0f, m_config.evaluationPeriod) * static_cast<double>(sampleRate);
    m_periodSamples = std::max<uint64_t>(1, static_cast<uint64_t>(std::llround(period)));
}

bool FatigueMonitor::process(const float* samples, size_t count, double streamTime) {
    if (!m_config.enabled || !samples || count == 0) return false;

    bool evaluated = false;
    for (size_t i = 0; i < count; i++) {
        m_sumSquares += static_cast<double>(samples[i]) * samples[i];
        if (++m_accumulated == m_periodSamples) {
            evaluate(streamTime);
            evaluated = true;
        }
    }
    return evaluated;
}

bool FatigueMonitor::recordEvent(double streamTime) {
    if (!m_config.enabled) return false;
    if (streamTime - m_lastManualEvent < m_config.manualEventSpacing) return false;

    m_lastManualEvent = streamTime;
    m_events.push_back(streamTime);
    std::cout << "[Fatigue] Simulated event at " << streamTime << "s, "
              << m_events.size() << " in window" << std::endl;

    updateLevel(streamTime);
    return true;
}

void FatigueMonitor::reset() {
    m_sumSquares = 0.0;
    m_accumulated = 0;
    m_events.clear();
    m_level = FatigueLevel::Normal;
    m_lastEnergy = 0.0f;
    m_lastManualEvent = NEVER;
    m_lastAlert = NEVER;
    m_alerts = 0;
}

void FatigueMonitor::evaluate(double streamTime) {
    m_lastEnergy = static_cast<float>(m_sumSquares / static_cast<double>(m_accumulated));
    m_sumSquares = 0.0;
    m_accumulated = 0;

    if (m_lastEnergy > m_config.energyThreshold) {
        m_events.push_back(streamTime);
        std::cout << "[Fatigue] Event at " << streamTime << "s (energy " << m_lastEnergy
                  << "), " << m_events.size() << " in window" << std::endl;
    }

    updateLevel(streamTime);
}

void FatigueMonitor::updateLevel(double streamTime) {
    // Rolling window instead of a hard periodic reset
    while (!m_events.empty() && streamTime - m_events.front() >= m_config.eventWindow) {
        m_events.pop_front();
    }

    FatigueLevel next = levelFor(eventCount());
    if (next == m_level) return;

    std::cout << "[Fatigue] Level " << fatigueLevelName(m_level) << " -> "
              << fatigueLevelName(next) << std::endl;
    bool escalated = next > m_level;
    m_level = next;

    if (escalated) {
        alert(next, streamTime);
    }
}

void FatigueMonitor::alert(FatigueLevel level, double streamTime) {
    if (streamTime - m_lastAlert < m_config.alertInterval) return;

    m_lastAlert = streamTime;
    ++m_alerts;
    if (level == FatigueLevel::Critical) {
        std::cerr << "[Fatigue] ALERT: severe fatigue, stop and rest now" << std::endl;
    } else {
        std::cerr << "[Fatigue] ALERT: signs of fatigue, take a break soon" << std::endl;
    }
}

FatigueLevel FatigueMonitor::levelFor(uint32_t events) const {
    if (m_config.warningCount == 0) return FatigueLevel::Normal;
    if (events >= m_config.warningCount + 1) return FatigueLevel::Critical;
    if (events >= m_config.warningCount) return FatigueLevel::Warning;
    return FatigueLevel::Normal;
}

} // namespace automind::audio
