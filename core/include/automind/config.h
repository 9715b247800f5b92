#pragma once

/**
 * @file config.h
 * @brief Startup configuration for the capture, analysis and render stages
 *
 * Everything is fixed at startup; nothing here changes while the pipeline
 * runs. Values can come from defaults, a JSON file and command-line
 * overrides, in that order.
 *
 * @par JSON layout
 * @code
 * {
 *   "stream":   { "sampleRate": 44100, "channels": 1, "frameSize": 512 },
 *   "analyzer": { "windowSize": 1024, "hopSize": 512 },
 *   "render":   { "fps": 60, "bars": 32 },
 *   "source":   { "synthetic": true, "frequency": 440 }
 * }
 * @endcode
 */

#include <automind/pcm_frame.h>
#include <nlohmann/json.hpp>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace automind {

/// @brief Capture stream format and ring sizing
struct StreamConfig {
    uint32_t sampleRate = DEFAULT_SAMPLE_RATE;
    uint32_t channels = DEFAULT_CHANNELS;
    uint32_t frameSize = DEFAULT_FRAME_SIZE;
    int deviceIndex = -1;          ///< Capture device index, -1 = system default
    uint32_t ringCapacity = 0;     ///< Ring slots, 0 = derive from ringSeconds
    float ringSeconds = 0.2f;      ///< Audio held by a derived ring
};

/// @brief A named frequency range used for band energies
struct BandRange {
    float lowHz = 0.0f;
    float highHz = 0.0f;
};

/// @brief Transform and feature extraction settings
struct AnalyzerConfig {
    uint32_t windowSize = 1024;    ///< Transform length, power of two
    uint32_t hopSize = 512;        ///< Samples between windows, < windowSize
    uint32_t binCount = 0;         ///< Expected magnitude bins, 0 = windowSize / 2
    BandRange bass{20.0f, 250.0f};
    BandRange mid{250.0f, 4000.0f};
    BandRange treble{4000.0f, 20000.0f};
    float onsetSensitivity = 1.5f; ///< Standard deviations above mean flux
    float onsetHoldMs = 100.0f;    ///< Minimum time between onsets
    uint32_t onsetHistory = 43;    ///< Flux values kept for the adaptive threshold
};

/// @brief Sustained-energy event detection ("yawn" monitor)
struct FatigueConfig {
    bool enabled = true;
    float evaluationPeriod = 3.0f;   ///< Seconds of audio per evaluation
    float energyThreshold = 0.02f;   ///< Mean squared amplitude that counts as an event
    uint32_t warningCount = 3;       ///< Events for Warning; one more is Critical
    float eventWindow = 600.0f;      ///< Seconds an event stays counted
    float manualEventSpacing = 2.0f; ///< Minimum seconds between simulated events
    float alertInterval = 30.0f;     ///< Minimum seconds between escalation alerts
};

/// @brief Render pacing, smoothing and window settings
struct RenderConfig {
    float fps = 60.0f;
    uint32_t bars = 32;              ///< Display bars aggregated from the spectrum
    float attack = 0.5f;             ///< Blend toward rising targets per tick
    float release = 0.15f;           ///< Blend toward falling targets per tick
    uint32_t holdTicks = 3;          ///< Ticks a vector stays the target without a fresh one
    float pulseDecay = 0.85f;        ///< Beat pulse multiplier per tick
    float barGain = 40.0f;           ///< Magnitude to bar height scale
    float bandGain = 4.0f;           ///< Band energy to display level scale
    bool presentFinalFrame = true;
    bool headless = false;
    int width = 1000;
    int height = 700;
    uint64_t maxTicks = 0;           ///< Stop after this many ticks, 0 = unlimited
};

/// @brief Synthetic source settings (used instead of a capture device)
struct SourceConfig {
    bool synthetic = false;
    float frequency = 440.0f;
    float amplitude = 0.5f;
    float noise = 0.0f;
    bool paced = true;               ///< Generate at real-time speed
    uint64_t frameLimit = 0;         ///< Stop after this many frames, 0 = unlimited
};

/// @brief Complete startup configuration
struct PipelineConfig {
    StreamConfig stream;
    AnalyzerConfig analyzer;
    FatigueConfig fatigue;
    RenderConfig render;
    SourceConfig source;

    /// @brief Ring capacity after resolving ringCapacity == 0
    size_t resolvedRingCapacity() const;

    /**
     * @brief Check the configuration for values the pipeline cannot run with
     * @return Human-readable problems, empty when valid
     */
    std::vector<std::string> validate() const;
};

void to_json(nlohmann::json& j, const PipelineConfig& config);
void from_json(const nlohmann::json& j, PipelineConfig& config);

/**
 * @brief Load a configuration file over the given defaults
 * @param path JSON file
 * @param config Receives the values; keys missing from the file keep their value
 * @return true if the file was read and parsed
 */
bool loadConfigFile(const std::string& path, PipelineConfig& config);

/// @brief Write the configuration as pretty-printed JSON
bool saveConfigFile(const std::string& path, const PipelineConfig& config);

/// @brief True if n is a non-zero power of two
bool isPowerOfTwo(uint32_t n);

} // namespace automind
