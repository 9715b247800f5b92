#pragma once

/**
 * @file audio_source.h
 * @brief Base class for anything that produces PCM frames
 */

#include <automind/pcm_frame.h>
#include <atomic>
#include <cstdint>
#include <exception>
#include <functional>
#include <string>
#include <utility>

namespace automind {

class FrameRingBuffer;

/**
 * @brief Producer of fixed-size PCM frames
 *
 * A source owns its device (or generator thread) exclusively. open()
 * acquires it, start() begins delivery into the sink ring, close() stops and
 * releases everything. Backends deliver audio in whatever block size they
 * like; deliver() cuts it into frames of exactly frameSize samples per
 * channel and pushes them, without allocating or locking beyond the ring's
 * short critical section.
 *
 * Failures while running (the device disappearing) are passed to the error
 * handler instead of being thrown on the backend's thread.
 */
class AudioSource {
public:
    using ErrorHandler = std::function<void(std::exception_ptr)>;

    virtual ~AudioSource() = default;

    AudioSource(const AudioSource&) = delete;
    AudioSource& operator=(const AudioSource&) = delete;

    /**
     * @brief Acquire the stream
     * @param sampleRate Sample rate in Hz
     * @param channels Channel count
     * @param frameSize Samples per channel in every delivered frame
     * @throw DeviceUnavailable no matching input device
     * @throw ConfigurationRejected the format is not supported
     */
    virtual void open(uint32_t sampleRate, uint32_t channels, uint32_t frameSize) = 0;

    /// @brief Begin delivering frames to the sink
    virtual void start() = 0;

    /**
     * @brief Stop delivery and release the device
     *
     * Safe to call at any time, repeatedly, and after a failed open() or a
     * stream failure.
     */
    virtual void close() = 0;

    /// @brief Short backend name for log lines
    virtual std::string name() const = 0;

    /// @brief Ring that receives frames; must outlive the running stream
    void setSink(FrameRingBuffer* sink) { m_sink = sink; }

    /// @brief Handler for failures raised while the stream is running
    void setErrorHandler(ErrorHandler handler) { m_errorHandler = std::move(handler); }

    bool isOpen() const { return m_open.load(); }
    bool isRunning() const { return m_running.load(); }

    uint32_t sampleRate() const { return m_sampleRate; }
    uint32_t channels() const { return m_channels; }
    uint32_t frameSize() const { return m_frameSize; }

    /// @brief Frames pushed to the sink since open()
    uint64_t framesDelivered() const { return m_delivered.load(std::memory_order_relaxed); }

protected:
    AudioSource() = default;

    /// @brief Record the stream format and size the assembly frame
    void prepareAssembly(uint32_t sampleRate, uint32_t channels, uint32_t frameSize);

    /**
     * @brief Append interleaved samples, pushing every completed frame
     *
     * Called on the capture thread. Must stay real-time safe.
     */
    void deliver(const float* interleaved, uint32_t frames);

    /// @brief Forward a runtime failure to the error handler
    void reportError(std::exception_ptr error);

    std::atomic<bool> m_open{false};
    std::atomic<bool> m_running{false};

private:
    FrameRingBuffer* m_sink = nullptr;
    ErrorHandler m_errorHandler;

    uint32_t m_sampleRate = DEFAULT_SAMPLE_RATE;
    uint32_t m_channels = DEFAULT_CHANNELS;
    uint32_t m_frameSize = DEFAULT_FRAME_SIZE;

    PCMFrame m_assembly;
    uint32_t m_fill = 0;             // Frames written into m_assembly
    uint64_t m_sequence = 0;
    uint64_t m_streamPosition = 0;   // Sample frames delivered before m_assembly
    std::atomic<uint64_t> m_delivered{0};
};

} // namespace automind
