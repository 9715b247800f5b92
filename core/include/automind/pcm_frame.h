#pragma once

/**
 * @file pcm_frame.h
 * @brief PCM frame type carried from the capture thread to the analyzer
 *
 * All audio in automind uses interleaved float samples in [-1.0, 1.0].
 */

#include <cstdint>
#include <cstddef>
#include <utility>
#include <vector>

namespace automind {

/// Default capture sample rate
constexpr uint32_t DEFAULT_SAMPLE_RATE = 44100;

/// Default capture channel count (mono)
constexpr uint32_t DEFAULT_CHANNELS = 1;

/// Default capture frame size (~11.6ms at 44.1kHz)
constexpr uint32_t DEFAULT_FRAME_SIZE = 512;

/**
 * @brief One fixed-size block of captured audio
 *
 * A PCMFrame owns its sample storage and is move-only: exactly one pipeline
 * stage holds it at a time. Storage is sized once by allocate() and then
 * recycled. FrameRingBuffer swaps storage with its slots on push and pop, so
 * frames circulate through a fixed pool without touching the allocator.
 *
 * Audio format:
 * - Interleaved float samples in range [-1.0, 1.0]
 * - Stereo: [L0, R0, L1, R1, ...]
 * - Mono: [S0, S1, S2, ...]
 */
class PCMFrame {
public:
    PCMFrame() = default;

    PCMFrame(const PCMFrame&) = delete;
    PCMFrame& operator=(const PCMFrame&) = delete;

    PCMFrame(PCMFrame&&) noexcept = default;
    PCMFrame& operator=(PCMFrame&&) noexcept = default;

    /**
     * @brief Size the sample storage
     * @param frames Samples per channel
     * @param ch Channel count
     * @param rate Sample rate in Hz
     */
    void allocate(uint32_t frames, uint32_t ch, uint32_t rate) {
        frameCount = frames;
        channels = ch;
        sampleRate = rate;
        m_samples.assign(static_cast<size_t>(frames) * ch, 0.0f);
    }

    /// @brief Swap storage and metadata with another frame (never allocates)
    void swap(PCMFrame& other) noexcept {
        m_samples.swap(other.m_samples);
        std::swap(frameCount, other.frameCount);
        std::swap(channels, other.channels);
        std::swap(sampleRate, other.sampleRate);
        std::swap(sequence, other.sequence);
        std::swap(startFrame, other.startFrame);
    }

    float* samples() { return m_samples.data(); }
    const float* samples() const { return m_samples.data(); }

    /// @brief Total sample count (frameCount * channels)
    uint32_t sampleCount() const { return frameCount * channels; }

    /// @brief Sample storage size, which may exceed sampleCount()
    size_t storageSize() const { return m_samples.size(); }

    bool isValid() const { return frameCount > 0 && m_samples.size() >= sampleCount(); }

    /// @brief Stream time of the first sample in seconds
    double startTime() const {
        return sampleRate > 0 ? static_cast<double>(startFrame) / sampleRate : 0.0;
    }

    /// @brief Stream time just past the last sample in seconds
    double endTime() const {
        return sampleRate > 0 ? static_cast<double>(startFrame + frameCount) / sampleRate : 0.0;
    }

    uint32_t frameCount = 0;    ///< Samples per channel
    uint32_t channels = 1;      ///< Channel count
    uint32_t sampleRate = DEFAULT_SAMPLE_RATE;
    uint64_t sequence = 0;      ///< Monotonic frame counter from the source
    uint64_t startFrame = 0;    ///< Stream position of the first sample

private:
    std::vector<float> m_samples;
};

} // namespace automind
