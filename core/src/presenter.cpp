#include <automind/presenter.h>

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

namespace automind {

LogPresenter::LogPresenter(uint32_t every) : LogPresenter(std::cout, every) {}

LogPresenter::LogPresenter(std::ostream& out, uint32_t every) : m_out(out), m_every(every) {}

void LogPresenter::present(const VisualState& state) {
    ++m_presented;
    if (m_every == 0 || (m_presented % m_every) != 0) return;

    constexpr int METER_WIDTH = 20;
    int filled = static_cast<int>(std::clamp(state.level, 0.0f, 1.0f) * METER_WIDTH + 0.5f);

    // Formatted separately so the precision does not stick to m_out
    std::ostringstream line;
    line << std::fixed << std::setprecision(2)
         << "[Render] t=" << std::setw(7) << state.audioTime << "s"
         << "  bass " << state.bass
         << " |" << std::string(filled, '#') << std::string(METER_WIDTH - filled, ' ') << "|"
         << " mid " << state.mid
         << " treble " << state.treble
         << (state.pulse > 0.5f ? "  *" : "   ")
         << " " << fatigueLevelName(state.fatigue);
    if (!state.hasData) line << " (waiting for audio)";
    m_out << line.str() << "\n";
}

} // namespace automind
