#include <automind/audio/onset_detector.h>

#include <algorithm>
#include <cmath>

namespace automind::audio {

namespace {
// Floor for the adaptive threshold so silence with tiny noise never triggers
constexpr float MIN_THRESHOLD = 1e-4f;
}

OnsetDetector::OnsetDetector(float sensitivity, float holdMs, uint32_t historySize)
    : m_sensitivity(sensitivity),
      m_holdSeconds(std::max(0.0f, holdMs) / 1000.0),
      m_history(std::max<uint32_t>(historySize, 2), 0.0f) {}

bool OnsetDetector::process(const std::vector<float>& magnitudes, double time) {
    if (m_previous.size() != magnitudes.size()) {
        // First spectrum: nothing to compare against
        m_previous = magnitudes;
        m_flux = 0.0f;
        return false;
    }

    float flux = 0.0f;
    for (size_t i = 0; i < magnitudes.size(); i++) {
        float diff = magnitudes[i] - m_previous[i];
        if (diff > 0.0f) flux += diff;
    }
    std::copy(magnitudes.begin(), magnitudes.end(), m_previous.begin());
    m_flux = flux;

    // Adaptive threshold from the history before this value
    float mean = 0.0f;
    float stdDev = 0.0f;
    if (m_historyFill > 0) {
        for (size_t i = 0; i < m_historyFill; i++) mean += m_history[i];
        mean /= m_historyFill;

        float variance = 0.0f;
        for (size_t i = 0; i < m_historyFill; i++) {
            float d = m_history[i] - mean;
            variance += d * d;
        }
        stdDev = std::sqrt(variance / m_historyFill);
    }
    m_threshold = std::max(mean + m_sensitivity * stdDev, MIN_THRESHOLD);

    m_history[m_historyPos] = flux;
    m_historyPos = (m_historyPos + 1) % m_history.size();
    m_historyFill = std::min(m_historyFill + 1, m_history.size());

    bool held = m_lastOnset >= 0.0 && (time - m_lastOnset) < m_holdSeconds;
    if (flux > m_threshold && !held) {
        m_lastOnset = time;
        ++m_onsets;
        return true;
    }
    return false;
}

void OnsetDetector::reset() {
    m_previous.clear();
    std::fill(m_history.begin(), m_history.end(), 0.0f);
    m_historyPos = 0;
    m_historyFill = 0;
    m_flux = 0.0f;
    m_threshold = 0.0f;
    m_lastOnset = -1.0;
    m_onsets = 0;
}

} // namespace automind::audio
