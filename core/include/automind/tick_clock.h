#pragma once

/**
 * @file tick_clock.h
 * @brief Fixed-rate tick pacing for the render loop
 */

#include <chrono>
#include <cstdint>

namespace automind {

/**
 * @brief Maps wall-clock time onto evenly spaced tick deadlines
 *
 * Tick n is due at start + n * period. waitForNextTick() sleeps until the
 * next deadline. When the caller falls more than one period behind, missed
 * deadlines are skipped instead of being replayed in a burst.
 */
class TickClock {
public:
    using Clock = std::chrono::steady_clock;

    /// @param rate Ticks per second (clamped to at least 1)
    explicit TickClock(double rate = 60.0);

    /// @brief Restart the schedule from now
    void reset();

    /**
     * @brief Sleep until the next tick deadline
     * @return Number of deadlines skipped because the caller was late
     */
    uint64_t waitForNextTick();

    double rate() const { return m_rate; }
    Clock::duration period() const { return m_period; }

    /// @brief Deadlines passed so far
    uint64_t tickIndex() const { return m_tick; }

    /// @brief Seconds since reset()
    double elapsed() const;

    /// @brief Seconds between the previous two waits
    double dt() const { return m_dt; }

    /// @brief Total skipped deadlines since reset()
    uint64_t skippedTicks() const { return m_skipped; }

private:
    double m_rate;
    Clock::duration m_period;
    Clock::time_point m_start;
    Clock::time_point m_lastWake;
    uint64_t m_tick = 0;
    uint64_t m_skipped = 0;
    double m_dt = 0.0;
};

} // namespace automind
