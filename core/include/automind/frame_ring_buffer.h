#pragma once

/**
 * @file frame_ring_buffer.h
 * @brief Bounded frame queue between the capture thread and the analyzer
 */

#include <automind/pcm_frame.h>
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <vector>

namespace automind {

/// @brief Outcome of FrameRingBuffer::push()
enum class PushResult {
    Queued,         ///< Frame appended
    DroppedOldest,  ///< Buffer was full: oldest frame discarded, frame appended
    Discarded       ///< Buffer is closed: frame ignored
};

/// @brief Outcome of FrameRingBuffer::pop()
enum class PopResult {
    Frame,   ///< A frame was moved into the output
    Closed   ///< Buffer closed and drained
};

/**
 * @brief Fixed-capacity FIFO of PCM frames with drop-oldest backpressure
 *
 * One producer (capture callback or generator thread) pushes, one consumer
 * (analysis thread) pops. push() never waits: when the buffer is full the
 * oldest queued frame is dropped and counted, since fresh audio matters more
 * than complete audio for a live visualization. pop() blocks until a frame
 * arrives or the buffer is closed.
 *
 * Frames are exchanged by swapping storage with preallocated slots. After
 * push() the caller's frame holds the storage of the slot it replaced, ready
 * to be refilled, so steady-state operation performs no allocation.
 *
 * @par Example
 * @code
 * FrameRingBuffer ring(16, 512, 1, 44100);
 *
 * // Capture thread
 * PCMFrame scratch;
 * scratch.allocate(512, 1, 44100);
 * fill(scratch);
 * ring.push(scratch);   // scratch now holds recycled storage
 *
 * // Analysis thread
 * PCMFrame frame;
 * frame.allocate(512, 1, 44100);
 * while (ring.pop(frame) == PopResult::Frame) {
 *     analyze(frame);
 * }
 * @endcode
 */
class FrameRingBuffer {
public:
    /**
     * @brief Create a ring with a fixed number of slots
     * @param capacity Maximum queued frames (at least 1)
     * @param frameSize Samples per channel to preallocate in every slot (0 = none)
     * @param channels Channel count for preallocated slots
     * @param sampleRate Sample rate for preallocated slots
     */
    explicit FrameRingBuffer(size_t capacity,
                             uint32_t frameSize = 0,
                             uint32_t channels = DEFAULT_CHANNELS,
                             uint32_t sampleRate = DEFAULT_SAMPLE_RATE);

    FrameRingBuffer(const FrameRingBuffer&) = delete;
    FrameRingBuffer& operator=(const FrameRingBuffer&) = delete;

    /**
     * @brief Slot count holding roughly @p seconds of audio
     *
     * Never less than 2 so the producer can run one frame ahead.
     */
    static size_t capacityFor(double seconds, uint32_t sampleRate, uint32_t frameSize);

    /**
     * @brief Enqueue a frame without blocking
     * @param frame Frame to hand over; receives recycled slot storage
     */
    PushResult push(PCMFrame& frame);

    /**
     * @brief Dequeue the oldest frame, waiting until one is available
     * @param out Receives the frame; its previous storage returns to the pool
     * @return PopResult::Closed once the buffer is closed and empty
     */
    PopResult pop(PCMFrame& out);

    /// @brief Non-blocking pop. Returns false when nothing is queued.
    bool tryPop(PCMFrame& out);

    /**
     * @brief Stop accepting frames and wake the consumer
     *
     * Frames already queued can still be popped. Calling close() more than
     * once has no further effect.
     */
    void close();

    bool isClosed() const;
    size_t size() const;
    size_t capacity() const { return m_slots.size(); }

    /// @brief Frames discarded by drop-oldest since construction
    uint64_t droppedFrames() const { return m_dropped.load(std::memory_order_relaxed); }

private:
    void takeHead(PCMFrame& out);

    std::vector<PCMFrame> m_slots;
    size_t m_head = 0;
    size_t m_count = 0;
    bool m_closed = false;

    mutable std::mutex m_mutex;
    std::condition_variable m_available;
    std::atomic<uint64_t> m_dropped{0};
};

} // namespace automind
