#include <automind/scheduler.h>
#include <automind/audio_source.h>
#include <automind/frame_ring_buffer.h>
#include <automind/render_loop.h>

#include <iostream>

namespace automind {

Scheduler::Scheduler(AudioSource& source, FrameRingBuffer& ring,
                     FrameProcessor& processor, ShutdownSignal& signal)
    : m_source(source), m_ring(ring), m_processor(processor), m_signal(signal) {}

Scheduler::~Scheduler() {
    shutdown();
}

void Scheduler::start() {
    if (m_started.exchange(true)) return;

    m_source.setSink(&m_ring);
    m_source.setErrorHandler([this](std::exception_ptr error) { fail(error); });

    m_analysisThread = std::thread(&Scheduler::analysisLoop, this);

    try {
        m_source.start();
    } catch (...) {
        shutdown();
        throw;
    }

    std::cout << "[Scheduler] Pipeline started (" << m_source.name() << ", "
              << m_source.sampleRate() << "Hz, " << m_source.channels() << " ch, "
              << m_source.frameSize() << " frames, ring " << m_ring.capacity() << ")" << std::endl;
}

void Scheduler::run(RenderLoop& renderLoop) {
    start();
    renderLoop.run(m_signal);
    shutdown();
    renderLoop.presentFinal();
    rethrowIfFailed();
}

void Scheduler::shutdown() {
    m_signal.raise();
    stopStream();
}

void Scheduler::drain() {
    stopStream();
}

void Scheduler::stopStream() {
    std::lock_guard<std::mutex> lock(m_lifecycleMutex);
    if (m_stopped.load()) return;

    m_source.close();
    m_ring.close();
    if (m_analysisThread.joinable()) {
        m_analysisThread.join();
    }
    m_stopped = true;

    if (m_started.load()) {
        std::cout << "[Scheduler] Stopped: " << m_source.framesDelivered() << " frames captured, "
                  << framesAnalyzed() << " analyzed, " << m_ring.droppedFrames() << " dropped" << std::endl;
    }
}

void Scheduler::fail(std::exception_ptr error) {
    {
        std::lock_guard<std::mutex> lock(m_errorMutex);
        if (m_error) return;
        m_error = error;
    }

    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        std::cerr << "[Scheduler] Pipeline error: " << e.what() << std::endl;
    }

    m_signal.raise();
}

void Scheduler::rethrowIfFailed() const {
    std::exception_ptr error;
    {
        std::lock_guard<std::mutex> lock(m_errorMutex);
        error = m_error;
    }
    if (error) std::rethrow_exception(error);
}

bool Scheduler::hasFailed() const {
    std::lock_guard<std::mutex> lock(m_errorMutex);
    return static_cast<bool>(m_error);
}

void Scheduler::analysisLoop() {
    PCMFrame frame;
    frame.allocate(m_source.frameSize(), m_source.channels(), m_source.sampleRate());

    uint64_t reportedDrops = 0;

    try {
        while (!m_signal.raised()) {
            if (m_ring.pop(frame) == PopResult::Closed) break;

            m_processor.process(frame);
            m_framesAnalyzed.fetch_add(1, std::memory_order_relaxed);

            uint64_t drops = m_ring.droppedFrames();
            if (drops != reportedDrops) {
                std::cout << "[Scheduler] Dropped " << (drops - reportedDrops)
                          << " stale frame(s), " << drops << " total" << std::endl;
                reportedDrops = drops;
            }
        }
        m_processor.finish();
    } catch (const std::exception&) {
        fail(std::current_exception());
    }
}

} // namespace automind
