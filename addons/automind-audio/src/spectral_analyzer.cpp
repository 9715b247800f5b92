#include <automind/audio/spectral_analyzer.h>
#include <automind/errors.h>
#include <kiss_fft.h>

#include <algorithm>
#include <cmath>
#include <iostream>
#include <new>
#include <string>

namespace automind::audio {

namespace {

constexpr uint32_t MIN_WINDOW_SIZE = 16;

AnalyzerConfig checkedConfig(const AnalyzerConfig& config, uint32_t sampleRate) {
    SpectralAnalyzer::validate(config);
    if (sampleRate == 0) {
        throw TransformConfigurationMismatch("sample rate must be non-zero");
    }
    AnalyzerConfig resolved = config;
    resolved.binCount = config.windowSize / 2;
    return resolved;
}

} // namespace

struct SpectralAnalyzer::Impl {
    kiss_fft_cfg cfg = nullptr;
    std::vector<kiss_fft_cpx> fftIn;
    std::vector<kiss_fft_cpx> fftOut;
    std::vector<float> window;  // Hann window

    explicit Impl(uint32_t size) : fftIn(size), fftOut(size), window(size) {
        cfg = kiss_fft_alloc(static_cast<int>(size), 0, nullptr, nullptr);
        if (!cfg) {
            throw std::bad_alloc();
        }
        for (uint32_t i = 0; i < size; i++) {
            window[i] = 0.5f * (1.0f - std::cos(2.0f * 3.14159265f * i / (size - 1)));
        }
    }

    ~Impl() {
        kiss_fft_free(cfg);
    }

    Impl(const Impl&) = delete;
    Impl& operator=(const Impl&) = delete;
};

void SpectralAnalyzer::validate(const AnalyzerConfig& config) {
    const uint32_t n = config.windowSize;
    if (!isPowerOfTwo(n) || n < MIN_WINDOW_SIZE) {
        throw TransformConfigurationMismatch(
            "window size " + std::to_string(n) + " is not a power of two >= " +
            std::to_string(MIN_WINDOW_SIZE));
    }
    if (config.hopSize == 0 || config.hopSize >= n) {
        throw TransformConfigurationMismatch(
            "hop size " + std::to_string(config.hopSize) +
            " must be in (0, " + std::to_string(n) + ")");
    }
    if (config.binCount != 0 && config.binCount != n / 2) {
        throw TransformConfigurationMismatch(
            "bin count " + std::to_string(config.binCount) +
            " does not match window size " + std::to_string(n) +
            " (expected " + std::to_string(n / 2) + ")");
    }
}

SpectralAnalyzer::SpectralAnalyzer(const AnalyzerConfig& config, uint32_t sampleRate,
                                   FeatureBus& bus, const FatigueConfig& fatigue)
    : m_config(checkedConfig(config, sampleRate)),
      m_sampleRate(sampleRate),
      m_bus(bus),
      m_window(m_config.windowSize, 0.0f),
      m_hop(m_config.hopSize, 0.0f),
      m_firstPublishAt(std::min<uint64_t>(m_config.windowSize, 2ull * m_config.hopSize)),
      m_spectrum(m_config.windowSize / 2, 0.0f),
      m_onsets(m_config.onsetSensitivity, m_config.onsetHoldMs, m_config.onsetHistory),
      m_fatigue(fatigue, sampleRate) {
    m_impl = std::make_unique<Impl>(m_config.windowSize);

    std::cout << "[Analyzer] Window " << m_config.windowSize << ", hop " << m_config.hopSize
              << ", " << binCount() << " bins at " << m_sampleRate << "Hz" << std::endl;
}

SpectralAnalyzer::~SpectralAnalyzer() = default;

void SpectralAnalyzer::process(const PCMFrame& frame) {
    if (!frame.isValid()) return;

    const uint32_t channels = frame.channels;
    const float* input = frame.samples();

    for (uint32_t i = 0; i < frame.frameCount; i++) {
        // Mix interleaved channels to mono
        float sample;
        if (channels == 1) {
            sample = input[i];
        } else {
            float sum = 0.0f;
            for (uint32_t c = 0; c < channels; c++) {
                sum += input[static_cast<size_t>(i) * channels + c];
            }
            sample = sum / static_cast<float>(channels);
        }

        m_hop[m_hopFill++] = sample;
        ++m_received;

        if (m_hopFill == m_config.hopSize) {
            double streamTime = static_cast<double>(frame.startFrame + i + 1) / frame.sampleRate;
            completeHop(streamTime);
        }
    }
}

void SpectralAnalyzer::finish() {
    std::cout << "[Analyzer] Published " << m_windows << " vectors, "
              << m_onsets.onsetCount() << " onsets, fatigue "
              << fatigueLevelName(m_fatigue.level()) << std::endl;
}

void SpectralAnalyzer::reset() {
    std::fill(m_window.begin(), m_window.end(), 0.0f);
    std::fill(m_hop.begin(), m_hop.end(), 0.0f);
    std::fill(m_spectrum.begin(), m_spectrum.end(), 0.0f);
    m_hopFill = 0;
    m_received = 0;
    m_windows = 0;
    m_onsets.reset();
    m_fatigue.reset();
    m_fatigueResetRequested = false;
    m_fatigueEventRequested = false;
}

void SpectralAnalyzer::completeHop(double streamTime) {
    const uint32_t hop = m_config.hopSize;

    // Slide the window by one hop, newest samples at the end
    std::copy(m_window.begin() + hop, m_window.end(), m_window.begin());
    std::copy(m_hop.begin(), m_hop.end(), m_window.end() - hop);
    m_hopFill = 0;

    if (m_fatigueResetRequested.exchange(false)) {
        m_fatigue.reset();
        std::cout << "[Analyzer] Fatigue reset at " << streamTime << "s" << std::endl;
    }
    if (m_fatigueEventRequested.exchange(false)) {
        m_fatigue.recordEvent(streamTime);
    }
    m_fatigue.process(m_hop.data(), hop, streamTime);

    // Publish on the last hop boundary at or before the first-publish point,
    // so a hop longer than half the window does not push it past a full window
    if (m_received + hop > m_firstPublishAt) {
        analyzeWindow(streamTime);
    }
}

void SpectralAnalyzer::analyzeWindow(double streamTime) {
    const uint32_t n = m_config.windowSize;
    const uint32_t hop = m_config.hopSize;

    for (uint32_t i = 0; i < n; i++) {
        m_impl->fftIn[i].r = m_window[i] * m_impl->window[i];
        m_impl->fftIn[i].i = 0.0f;
    }

    kiss_fft(m_impl->cfg, m_impl->fftIn.data(), m_impl->fftOut.data());

    const float scale = 1.0f / static_cast<float>(n);
    for (uint32_t k = 0; k < n / 2; k++) {
        float re = m_impl->fftOut[k].r;
        float im = m_impl->fftOut[k].i;
        m_spectrum[k] = std::sqrt(re * re + im * im) * scale;
    }

    // Level of the newest hop
    float sumSq = 0.0f;
    float peak = 0.0f;
    for (uint32_t i = 0; i < hop; i++) {
        float s = m_hop[i];
        sumSq += s * s;
        peak = std::max(peak, std::abs(s));
    }

    bool beat = m_onsets.process(m_spectrum, streamTime);

    auto vector = std::make_shared<FeatureVector>();
    vector->magnitudes = m_spectrum;
    vector->set(Feature::Bass, band(m_config.bass.lowHz, m_config.bass.highHz));
    vector->set(Feature::Mid, band(m_config.mid.lowHz, m_config.mid.highHz));
    vector->set(Feature::Treble, band(m_config.treble.lowHz, m_config.treble.highHz));
    vector->set(Feature::Rms, std::sqrt(sumSq / static_cast<float>(hop)));
    vector->set(Feature::Peak, peak);
    vector->set(Feature::Flux, m_onsets.flux());
    vector->set(Feature::Beat, beat ? 1.0f : 0.0f);
    vector->timestamp = streamTime;
    vector->sequence = m_windows++;
    vector->sampleRate = m_sampleRate;
    vector->windowSize = n;
    vector->fatigue = m_fatigue.status();

    m_bus.publish(std::move(vector));
}

float SpectralAnalyzer::binFrequency(uint32_t bin) const {
    return static_cast<float>(bin) * m_sampleRate / m_config.windowSize;
}

uint32_t SpectralAnalyzer::frequencyToBin(float hz) const {
    long bin = std::lround(static_cast<double>(hz) * m_config.windowSize / m_sampleRate);
    return static_cast<uint32_t>(std::clamp<long>(bin, 0, static_cast<long>(binCount()) - 1));
}

float SpectralAnalyzer::band(float lowHz, float highHz) const {
    uint32_t lowBin = frequencyToBin(lowHz);
    uint32_t highBin = frequencyToBin(highHz);
    if (lowBin > highBin) std::swap(lowBin, highBin);

    float sum = 0.0f;
    for (uint32_t i = lowBin; i <= highBin; i++) {
        sum += m_spectrum[i];
    }
    return sum;
}

} // namespace automind::audio
