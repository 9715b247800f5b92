#include <automind/frame_ring_buffer.h>

#include <algorithm>
#include <cmath>

namespace automind {

FrameRingBuffer::FrameRingBuffer(size_t capacity, uint32_t frameSize,
                                 uint32_t channels, uint32_t sampleRate)
    : m_slots(std::max<size_t>(capacity, 1)) {
    if (frameSize > 0) {
        for (auto& slot : m_slots) {
            slot.allocate(frameSize, channels, sampleRate);
        }
    }
}

size_t FrameRingBuffer::capacityFor(double seconds, uint32_t sampleRate, uint32_t frameSize) {
    if (sampleRate == 0 || frameSize == 0 || seconds <= 0.0) return 2;
    double frames = std::ceil(seconds * sampleRate / frameSize);
    return std::max<size_t>(static_cast<size_t>(frames), 2);
}

PushResult FrameRingBuffer::push(PCMFrame& frame) {
    PushResult result = PushResult::Queued;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_closed) {
            return PushResult::Discarded;
        }

        if (m_count == m_slots.size()) {
            // Full: the oldest slot becomes the new tail
            m_head = (m_head + 1) % m_slots.size();
            --m_count;
            m_dropped.fetch_add(1, std::memory_order_relaxed);
            result = PushResult::DroppedOldest;
        }

        size_t tail = (m_head + m_count) % m_slots.size();
        m_slots[tail].swap(frame);
        ++m_count;
    }
    m_available.notify_one();
    return result;
}

PopResult FrameRingBuffer::pop(PCMFrame& out) {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_available.wait(lock, [this] { return m_count > 0 || m_closed; });

    if (m_count == 0) {
        return PopResult::Closed;
    }
    takeHead(out);
    return PopResult::Frame;
}

bool FrameRingBuffer::tryPop(PCMFrame& out) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_count == 0) return false;
    takeHead(out);
    return true;
}

void FrameRingBuffer::takeHead(PCMFrame& out) {
    out.swap(m_slots[m_head]);
    m_head = (m_head + 1) % m_slots.size();
    --m_count;
}

void FrameRingBuffer::close() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_closed = true;
    }
    m_available.notify_all();
}

bool FrameRingBuffer::isClosed() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_closed;
}

size_t FrameRingBuffer::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_count;
}

} // namespace automind
