#pragma once

/**
 * @file scheduler.h
 * @brief Thread ownership, startup and ordered shutdown of the pipeline
 */

#include <automind/pcm_frame.h>
#include <automind/shutdown_signal.h>
#include <atomic>
#include <cstdint>
#include <exception>
#include <mutex>
#include <thread>

namespace automind {

class AudioSource;
class FrameRingBuffer;
class RenderLoop;

/**
 * @brief Consumer of frames on the analysis thread
 */
class FrameProcessor {
public:
    virtual ~FrameProcessor() = default;

    /// @brief Handle one frame, in the order the source produced them
    virtual void process(const PCMFrame& frame) = 0;

    /// @brief Called once after the last frame
    virtual void finish() {}
};

/**
 * @brief Runs the analysis thread and coordinates shutdown
 *
 * The source must already be open. run() starts the analysis thread and the
 * source, drives the render loop on the calling thread, and tears everything
 * down when the render loop returns.
 *
 * Shutdown order:
 * 1. raise the ShutdownSignal
 * 2. close the source (no more frames produced)
 * 3. close the ring (a waiting pop() returns Closed)
 * 4. join the analysis thread
 * 5. the render loop presents its final frame
 *
 * Errors from the capture callback context or the analysis thread are
 * recorded, raise the signal, and are rethrown from run() on the main thread.
 *
 * @par Example
 * @code
 * source.open(44100, 1, 512);
 * Scheduler scheduler(source, ring, analyzer, signal);
 * scheduler.run(renderLoop);   // throws StreamInterrupted if the device vanished
 * @endcode
 */
class Scheduler {
public:
    Scheduler(AudioSource& source, FrameRingBuffer& ring,
              FrameProcessor& processor, ShutdownSignal& signal);
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    /// @brief Start the analysis thread and the source
    void start();

    /**
     * @brief Start, run the render loop until shutdown, tear down
     * @throw AudioError the first error reported while running
     */
    void run(RenderLoop& renderLoop);

    /**
     * @brief Cancel and stop everything in order
     *
     * Idempotent: later calls do nothing.
     */
    void shutdown();

    /**
     * @brief End the stream without cancelling
     *
     * Closes the source and the ring, then waits until the analysis thread
     * has processed every queued frame.
     */
    void drain();

    /**
     * @brief Record a failure and raise the shutdown signal
     *
     * Only the first error is kept. Callable from any thread except a
     * POSIX signal handler.
     */
    void fail(std::exception_ptr error);

    /// @brief Rethrow the recorded error, if any
    void rethrowIfFailed() const;

    bool hasFailed() const;
    bool isRunning() const { return m_started.load() && !m_stopped.load(); }
    uint64_t framesAnalyzed() const { return m_framesAnalyzed.load(std::memory_order_relaxed); }

    ShutdownSignal& signal() { return m_signal; }

private:
    void analysisLoop();
    void stopStream();

    AudioSource& m_source;
    FrameRingBuffer& m_ring;
    FrameProcessor& m_processor;
    ShutdownSignal& m_signal;

    std::thread m_analysisThread;
    std::mutex m_lifecycleMutex;
    std::atomic<bool> m_started{false};
    std::atomic<bool> m_stopped{false};
    std::atomic<uint64_t> m_framesAnalyzed{0};

    mutable std::mutex m_errorMutex;
    std::exception_ptr m_error;
};

} // namespace automind
