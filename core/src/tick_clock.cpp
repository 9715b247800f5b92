#include <automind/tick_clock.h>

#include <algorithm>
#include <thread>

namespace automind {

TickClock::TickClock(double rate)
    : m_rate(std::max(rate, 1.0)),
      m_period(std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(1.0 / m_rate))) {
    reset();
}

void TickClock::reset() {
    m_start = Clock::now();
    m_lastWake = m_start;
    m_tick = 0;
    m_skipped = 0;
    m_dt = 0.0;
}

uint64_t TickClock::waitForNextTick() {
    ++m_tick;
    Clock::time_point deadline = m_start + m_period * static_cast<int64_t>(m_tick);
    Clock::time_point now = Clock::now();

    uint64_t skipped = 0;
    if (now > deadline + m_period) {
        // More than a full period late: jump to the next future deadline
        auto behind = (now - deadline) / m_period;
        skipped = static_cast<uint64_t>(behind);
        m_tick += skipped;
        m_skipped += skipped;
        deadline = m_start + m_period * static_cast<int64_t>(m_tick);
    }

    if (deadline > now) {
        std::this_thread::sleep_until(deadline);
    }

    Clock::time_point wake = Clock::now();
    m_dt = std::chrono::duration<double>(wake - m_lastWake).count();
    m_lastWake = wake;
    return skipped;
}

double TickClock::elapsed() const {
    return std::chrono::duration<double>(Clock::now() - m_start).count();
}

} // namespace automind
