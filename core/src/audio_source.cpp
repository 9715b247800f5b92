#include <automind/audio_source.h>
#include <automind/frame_ring_buffer.h>

#include <algorithm>
#include <cstring>
#include <iostream>

namespace automind {

void AudioSource::prepareAssembly(uint32_t sampleRate, uint32_t channels, uint32_t frameSize) {
    m_sampleRate = sampleRate;
    m_channels = channels;
    m_frameSize = frameSize;

    m_assembly.allocate(frameSize, channels, sampleRate);
    m_fill = 0;
    m_sequence = 0;
    m_streamPosition = 0;
    m_delivered.store(0, std::memory_order_relaxed);
}

void AudioSource::deliver(const float* interleaved, uint32_t frames) {
    if (!interleaved || frames == 0) return;

    const size_t frameSamples = static_cast<size_t>(m_frameSize) * m_channels;

    while (frames > 0) {
        // Storage comes back from the ring's preallocated slots; only an
        // unsized ring hands back an empty buffer
        if (m_assembly.storageSize() < frameSamples) {
            m_assembly.allocate(m_frameSize, m_channels, m_sampleRate);
        }

        uint32_t take = std::min(frames, m_frameSize - m_fill);
        std::memcpy(m_assembly.samples() + static_cast<size_t>(m_fill) * m_channels,
                    interleaved,
                    static_cast<size_t>(take) * m_channels * sizeof(float));

        m_fill += take;
        interleaved += static_cast<size_t>(take) * m_channels;
        frames -= take;

        if (m_fill == m_frameSize) {
            m_assembly.frameCount = m_frameSize;
            m_assembly.channels = m_channels;
            m_assembly.sampleRate = m_sampleRate;
            m_assembly.sequence = m_sequence++;
            m_assembly.startFrame = m_streamPosition;
            m_streamPosition += m_frameSize;

            if (m_sink) {
                m_sink->push(m_assembly);
            }
            m_delivered.fetch_add(1, std::memory_order_relaxed);
            m_fill = 0;
        }
    }
}

void AudioSource::reportError(std::exception_ptr error) {
    if (m_errorHandler) {
        m_errorHandler(error);
        return;
    }

    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        std::cerr << "[" << name() << "] Unhandled stream error: " << e.what() << std::endl;
    }
}

} // namespace automind
