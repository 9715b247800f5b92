#pragma once

/**
 * @file spectral_analyzer.h
 * @brief Sliding-window FFT analysis producing FeatureVectors
 *
 * SpectralAnalyzer provides:
 * - Mixdown of interleaved frames to mono
 * - Overlapping Hann-windowed FFT (KissFFT)
 * - Magnitude spectrum, bass/mid/treble band energies, RMS and peak
 * - Onset detection and fatigue monitoring
 */

#include <automind/config.h>
#include <automind/feature_bus.h>
#include <automind/scheduler.h>
#include <automind/audio/fatigue_monitor.h>
#include <automind/audio/onset_detector.h>
#include <atomic>
#include <cstdint>
#include <memory>
#include <vector>

namespace automind::audio {

/**
 * @brief Turns PCM frames into FeatureVectors on the analysis thread
 *
 * Samples are appended to a window of windowSize samples that starts out
 * zero-filled. Every hopSize new samples the window is transformed and a
 * FeatureVector is published to the bus. The first vector comes on the last
 * hop boundary at or before min(windowSize, 2 * hopSize) samples, so it never
 * waits for more than a full window. Until the window has filled, the older
 * part of it is zero padding.
 *
 * Magnitudes are |X[k]| / windowSize for k in [0, windowSize / 2). Band
 * energies are the sum of magnitudes over the bins nearest to the band
 * edges.
 *
 * @par Example
 * @code
 * FeatureBus bus;
 * SpectralAnalyzer analyzer(config.analyzer, 44100, bus);
 * analyzer.process(frame);                 // publishes when a hop completes
 * FeatureVectorPtr latest = bus.readLatest();
 * @endcode
 */
class SpectralAnalyzer : public FrameProcessor {
public:
    /**
     * @brief Create an analyzer
     * @throw TransformConfigurationMismatch window size not a power of two
     *        (>= 16), hop size not in (0, windowSize), or binCount not
     *        windowSize / 2
     */
    SpectralAnalyzer(const AnalyzerConfig& config, uint32_t sampleRate, FeatureBus& bus,
                     const FatigueConfig& fatigue = FatigueConfig{});
    ~SpectralAnalyzer() override;

    SpectralAnalyzer(const SpectralAnalyzer&) = delete;
    SpectralAnalyzer& operator=(const SpectralAnalyzer&) = delete;

    /**
     * @brief Check an analyzer configuration
     * @throw TransformConfigurationMismatch describing the first problem
     */
    static void validate(const AnalyzerConfig& config);

    void process(const PCMFrame& frame) override;
    void finish() override;

    /// @brief Return to the start-of-stream state (zeroed window, no history)
    void reset();

    // -------------------------------------------------------------------------
    /// @name Fatigue requests (any thread, applied at the next hop)
    /// @{

    /// @brief Clear the fatigue event count and level
    void requestFatigueReset() { m_fatigueResetRequested = true; }

    /// @brief Count one simulated fatigue event
    void requestFatigueEvent() { m_fatigueEventRequested = true; }

    /// @}

    // -------------------------------------------------------------------------
    /// @name Spectrum queries (analysis thread only)
    /// @{

    /// @brief Magnitude spectrum of the last analyzed window
    const std::vector<float>& spectrum() const { return m_spectrum; }

    /// @brief Center frequency of a bin in Hz
    float binFrequency(uint32_t bin) const;

    /// @brief Nearest bin for a frequency, clamped to [0, binCount)
    uint32_t frequencyToBin(float hz) const;

    /// @brief Summed magnitude between two frequencies of the last window
    float band(float lowHz, float highHz) const;

    /// @}
    // -------------------------------------------------------------------------

    uint32_t windowSize() const { return m_config.windowSize; }
    uint32_t hopSize() const { return m_config.hopSize; }
    uint32_t binCount() const { return m_config.windowSize / 2; }
    uint32_t sampleRate() const { return m_sampleRate; }

    /// @brief Vectors published since construction or reset()
    uint64_t windowsAnalyzed() const { return m_windows; }

    const FatigueMonitor& fatigue() const { return m_fatigue; }
    const OnsetDetector& onsets() const { return m_onsets; }

private:
    void completeHop(double streamTime);
    void analyzeWindow(double streamTime);

    struct Impl;
    std::unique_ptr<Impl> m_impl;

    AnalyzerConfig m_config;
    uint32_t m_sampleRate;
    FeatureBus& m_bus;

    std::vector<float> m_window;    // Oldest sample first
    std::vector<float> m_hop;       // Samples collected since the last hop
    uint32_t m_hopFill = 0;
    uint64_t m_received = 0;        // Mono samples received since start
    uint64_t m_firstPublishAt;      // min(windowSize, 2 * hopSize)

    std::vector<float> m_spectrum;
    uint64_t m_windows = 0;

    OnsetDetector m_onsets;
    FatigueMonitor m_fatigue;

    std::atomic<bool> m_fatigueResetRequested{false};
    std::atomic<bool> m_fatigueEventRequested{false};
};

} // namespace automind::audio
