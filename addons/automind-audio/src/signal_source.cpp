#include <automind/audio/signal_source.h>
#include <automind/errors.h>

#include <chrono>
#include <cmath>
#include <iostream>
#include <string>

namespace automind::audio {

SignalSource::SignalSource(const SourceConfig& config) : m_config(config) {}

SignalSource::~SignalSource() {
    close();
}

void SignalSource::open(uint32_t sampleRate, uint32_t channels, uint32_t frameSize) {
    close();

    if (sampleRate == 0 || channels == 0 || frameSize == 0) {
        throw ConfigurationRejected("Sample rate, channel count and frame size must be non-zero (got " +
                                    std::to_string(sampleRate) + "Hz, " + std::to_string(channels) +
                                    " ch, " + std::to_string(frameSize) + " frames)");
    }

    prepareAssembly(sampleRate, channels, frameSize);
    m_block.assign(static_cast<size_t>(frameSize) * channels, 0.0f);
    m_phase = 0.0;
    m_seed = 12345;
    m_stop = false;
    m_finished = false;
    m_open = true;

    std::cout << "[Signal] " << m_config.frequency << "Hz tone, amplitude " << m_config.amplitude
              << ", noise " << m_config.noise << (m_config.paced ? ", real-time" : ", unpaced") << std::endl;
}

void SignalSource::start() {
    if (!m_open.load()) {
        throw AudioError("Signal source started before open()");
    }
    if (m_running.exchange(true)) return;

    m_thread = std::thread(&SignalSource::generatorLoop, this);
}

void SignalSource::close() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stop = true;
    }
    m_wake.notify_all();

    if (m_thread.joinable()) {
        m_thread.join();
    }

    m_running = false;
    m_open = false;
}

void SignalSource::waitUntilFinished() {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_wake.wait(lock, [this] { return m_finished.load() || m_stop.load(); });
}

void SignalSource::generatorLoop() {
    try {
        generate();
    } catch (const std::exception&) {
        reportError(std::current_exception());
    }
}

void SignalSource::generate() {
    using clock = std::chrono::steady_clock;

    const uint32_t frameSize = this->frameSize();
    const auto framePeriod = std::chrono::duration_cast<clock::duration>(
        std::chrono::duration<double>(static_cast<double>(frameSize) / sampleRate()));
    const auto startTime = clock::now();

    uint64_t produced = 0;

    while (!m_stop.load()) {
        if (m_config.frameLimit > 0 && produced >= m_config.frameLimit) {
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_finished = true;
            }
            m_wake.notify_all();
            std::cout << "[Signal] Generated " << produced << " frames" << std::endl;
            return;
        }

        fill(m_block.data(), frameSize);
        deliver(m_block.data(), frameSize);
        ++produced;

        if (m_config.paced) {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_wake.wait_until(lock, startTime + framePeriod * produced,
                              [this] { return m_stop.load(); });
        }
    }
}

void SignalSource::fill(float* out, uint32_t frames) {
    const uint32_t ch = channels();
    const double phaseInc = 2.0 * 3.14159265358979323846 * m_config.frequency / sampleRate();

    for (uint32_t i = 0; i < frames; i++) {
        float sample = m_config.amplitude * static_cast<float>(std::sin(m_phase));
        if (m_config.noise > 0.0f) {
            sample += m_config.noise * nextNoise();
        }

        for (uint32_t c = 0; c < ch; c++) {
            out[static_cast<size_t>(i) * ch + c] = sample;
        }

        m_phase += phaseInc;
        if (m_phase >= 2.0 * 3.14159265358979323846) m_phase -= 2.0 * 3.14159265358979323846;
    }
}

float SignalSource::nextNoise() {
    // Fast PRNG (xorshift)
    m_seed ^= m_seed << 13;
    m_seed ^= m_seed >> 17;
    m_seed ^= m_seed << 5;

    // Convert to float in range [-1, 1]
    return (static_cast<float>(m_seed) / 2147483648.0f) - 1.0f;
}

} // namespace automind::audio
