#pragma once

/**
 * @file fatigue_monitor.h
 * @brief Sustained-energy event counting with warning levels
 *
 * FatigueMonitor listens to the stream in fixed evaluation periods. A period
 * whose mean squared amplitude exceeds the threshold counts as one event
 * (a yawn picked up by the microphone). The number of events inside a
 * rolling window gives the fatigue level. Escalations to Warning or Critical
 * log an alert, at most once per alertInterval.
 */

#include <automind/config.h>
#include <automind/feature_vector.h>
#include <cstddef>
#include <cstdint>
#include <deque>

namespace automind::audio {

/**
 * @brief Counts high-energy periods and derives a FatigueLevel
 *
 * Runs on the analysis thread. Time is stream time (seconds of audio
 * received), so results do not depend on how fast frames are processed.
 *
 * @par Example
 * @code
 * FatigueMonitor monitor(config.fatigue, 44100);
 * monitor.process(hop.data(), hop.size(), streamTime);
 * if (monitor.level() == FatigueLevel::Critical) { ... }
 * @endcode
 */
class FatigueMonitor {
public:
    FatigueMonitor(const FatigueConfig& config, uint32_t sampleRate);

    /**
     * @brief Feed mono samples
     * @param samples Mono samples
     * @param count Number of samples
     * @param streamTime Stream time just past the last sample (s)
     * @return true if an evaluation period completed during this call
     */
    bool process(const float* samples, size_t count, double streamTime);

    /**
     * @brief Count a simulated event at the given stream time
     *
     * Events closer than manualEventSpacing to the previous simulated event
     * are ignored.
     * @return true if the event was counted
     */
    bool recordEvent(double streamTime);

    /// @brief Forget all events and the partial period
    void reset();

    FatigueLevel level() const { return m_level; }
    uint32_t eventCount() const { return static_cast<uint32_t>(m_events.size()); }
    float lastEnergy() const { return m_lastEnergy; }
    FatigueStatus status() const { return {m_level, eventCount(), m_lastEnergy}; }

    /// @brief Escalation alerts logged since construction or reset()
    uint32_t alertCount() const { return m_alerts; }

    /// @brief Samples per evaluation period
    uint64_t periodSamples() const { return m_periodSamples; }

private:
    void evaluate(double streamTime);
    void updateLevel(double streamTime);
    void alert(FatigueLevel level, double streamTime);
    FatigueLevel levelFor(uint32_t events) const;

    FatigueConfig m_config;
    uint64_t m_periodSamples;

    double m_sumSquares = 0.0;
    uint64_t m_accumulated = 0;

    std::deque<double> m_events;   // Stream times of recorded events, oldest first
    FatigueLevel m_level = FatigueLevel::Normal;
    float m_lastEnergy = 0.0f;

    double m_lastManualEvent;
    double m_lastAlert;
    uint32_t m_alerts = 0;
};

} // namespace automind::audio
