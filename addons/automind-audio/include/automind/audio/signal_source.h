#pragma once

/**
 * @file signal_source.h
 * @brief Synthetic AudioSource (sine plus noise) on its own thread
 */

#include <automind/audio_source.h>
#include <automind/config.h>
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <thread>
#include <vector>

namespace automind::audio {

/**
 * @brief Generates a test tone in place of a capture device
 *
 * A generator thread produces one frame at a time: a sine at
 * SourceConfig::frequency scaled by amplitude, plus white noise scaled by
 * noise, identical on every channel. When paced, frames are released at
 * real-time speed; otherwise as fast as the ring accepts them. With a frame
 * limit the thread stops by itself after that many frames.
 *
 * @par Example
 * @code
 * SourceConfig tone;
 * tone.frequency = 1000.0f;
 * tone.paced = false;
 * tone.frameLimit = 8;
 *
 * SignalSource source(tone);
 * source.open(44100, 1, 512);
 * source.setSink(&ring);
 * source.start();
 * source.waitUntilFinished();
 * @endcode
 */
class SignalSource : public AudioSource {
public:
    explicit SignalSource(const SourceConfig& config);
    ~SignalSource() override;

    /// @throw ConfigurationRejected zero rate, channels or frame size
    void open(uint32_t sampleRate, uint32_t channels, uint32_t frameSize) override;
    void start() override;
    void close() override;
    std::string name() const override { return "Signal"; }

    /// @brief True once the frame limit was reached
    bool finished() const { return m_finished.load(); }

    /**
     * @brief Block until the frame limit is reached or the source is closed
     *
     * Without a frame limit this only returns after close().
     */
    void waitUntilFinished();

    const SourceConfig& config() const { return m_config; }

private:
    void generatorLoop();
    void generate();
    void fill(float* out, uint32_t frames);
    float nextNoise();

    SourceConfig m_config;
    std::vector<float> m_block;
    double m_phase = 0.0;
    uint32_t m_seed = 12345;

    std::thread m_thread;
    std::mutex m_mutex;
    std::condition_variable m_wake;
    std::atomic<bool> m_stop{false};
    std::atomic<bool> m_finished{false};
};

} // namespace automind::audio
