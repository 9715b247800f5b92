#pragma once

/**
 * @file feature_vector.h
 * @brief Analysis results handed from the analyzer to the render loop
 */

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

namespace automind {

/**
 * @brief Scalar features computed for every analysis window
 *
 * The set is fixed at compile time; FeatureVector stores one float per kind.
 */
enum class Feature {
    Bass,    ///< Summed magnitude of the low band (default 20-250 Hz)
    Mid,     ///< Summed magnitude of the mid band (default 250-4000 Hz)
    Treble,  ///< Summed magnitude of the high band (default 4000-20000 Hz)
    Rms,     ///< RMS of the newest hop of samples
    Peak,    ///< Absolute peak of the newest hop of samples
    Flux,    ///< Positive spectral flux against the previous window
    Beat,    ///< 1 when an onset fired on this window, else 0
    Count
};

constexpr size_t FEATURE_COUNT = static_cast<size_t>(Feature::Count);

/// @brief Display name of a feature
const char* featureName(Feature feature);

/// @brief Fatigue level derived from sustained-energy events
enum class FatigueLevel {
    Normal,
    Warning,
    Critical
};

const char* fatigueLevelName(FatigueLevel level);

/// @brief Snapshot of the fatigue monitor at the time a vector was produced
struct FatigueStatus {
    FatigueLevel level = FatigueLevel::Normal;
    uint32_t eventCount = 0;   ///< Events inside the rolling window
    float lastEnergy = 0.0f;   ///< Mean squared amplitude of the last evaluated period
};

/**
 * @brief One analysis window's worth of features
 *
 * Built once by the analyzer, then shared read-only. A newer window replaces
 * the whole vector; nothing mutates a published vector.
 */
struct FeatureVector {
    std::vector<float> magnitudes;            ///< |X[k]| / N for k in [0, N/2)
    std::array<float, FEATURE_COUNT> values{};
    double timestamp = 0.0;                   ///< Stream time at the end of the window (s)
    uint64_t sequence = 0;                    ///< Index of this window since stream start
    uint32_t sampleRate = 0;
    uint32_t windowSize = 0;
    FatigueStatus fatigue;

    float value(Feature feature) const { return values[static_cast<size_t>(feature)]; }
    void set(Feature feature, float v) { values[static_cast<size_t>(feature)] = v; }

    float bass() const { return value(Feature::Bass); }
    float mid() const { return value(Feature::Mid); }
    float treble() const { return value(Feature::Treble); }
    bool beat() const { return value(Feature::Beat) > 0.5f; }

    /// @brief Frequency of a magnitude bin in Hz
    float binFrequency(size_t bin) const {
        return windowSize > 0 ? static_cast<float>(bin) * sampleRate / windowSize : 0.0f;
    }

    /// @brief Index of the largest magnitude bin, skipping DC
    size_t peakBin() const;
};

using FeatureVectorPtr = std::shared_ptr<const FeatureVector>;

} // namespace automind
