#pragma once

/**
 * @file onset_detector.h
 * @brief Spectral-flux onset detection
 */

#include <cstddef>
#include <cstdint>
#include <vector>

namespace automind::audio {

/**
 * @brief Detects onsets from consecutive magnitude spectra
 *
 * Flux is the sum of positive magnitude increases since the previous
 * spectrum. An onset fires when the flux exceeds the mean of the recent flux
 * history plus sensitivity standard deviations, and at least holdMs have
 * passed since the last onset.
 *
 * @par Example
 * @code
 * OnsetDetector onsets(1.5f, 100.0f, 43);
 * bool beat = onsets.process(magnitudes, timestamp);
 * float flux = onsets.flux();
 * @endcode
 */
class OnsetDetector {
public:
    OnsetDetector(float sensitivity, float holdMs, uint32_t historySize);

    /**
     * @brief Analyze the next spectrum
     * @param magnitudes Magnitude spectrum, same size every call
     * @param time Stream time of the spectrum (s)
     * @return true on onset
     */
    bool process(const std::vector<float>& magnitudes, double time);

    void reset();

    float flux() const { return m_flux; }
    float threshold() const { return m_threshold; }
    uint64_t onsetCount() const { return m_onsets; }

private:
    float m_sensitivity;
    double m_holdSeconds;

    std::vector<float> m_previous;
    std::vector<float> m_history;
    size_t m_historyPos = 0;
    size_t m_historyFill = 0;

    float m_flux = 0.0f;
    float m_threshold = 0.0f;
    double m_lastOnset = -1.0;
    uint64_t m_onsets = 0;
};

} // namespace automind::audio
