/**
 * @file test_frame_ring_buffer.cpp
 * @brief Unit tests for FrameRingBuffer drop-oldest and close semantics
 */

#include <catch2/catch_test_macros.hpp>
#include <automind/frame_ring_buffer.h>

#include <chrono>
#include <thread>

using namespace automind;

namespace {

PCMFrame makeFrame(uint64_t sequence, uint32_t frameSize = 4) {
    PCMFrame frame;
    frame.allocate(frameSize, 1, 44100);
    frame.sequence = sequence;
    frame.startFrame = sequence * frameSize;
    for (uint32_t i = 0; i < frameSize; i++) {
        frame.samples()[i] = static_cast<float>(sequence);
    }
    return frame;
}

} // namespace

TEST_CASE("FrameRingBuffer keeps FIFO order", "[core][ring]") {
    FrameRingBuffer ring(4);

    for (uint64_t i = 0; i < 3; i++) {
        PCMFrame frame = makeFrame(i);
        REQUIRE(ring.push(frame) == PushResult::Queued);
    }
    REQUIRE(ring.size() == 3);

    PCMFrame out;
    for (uint64_t i = 0; i < 3; i++) {
        REQUIRE(ring.pop(out) == PopResult::Frame);
        REQUIRE(out.sequence == i);
        REQUIRE(out.samples()[0] == static_cast<float>(i));
    }
    REQUIRE(ring.size() == 0);
}

TEST_CASE("FrameRingBuffer drops the oldest frames when full", "[core][ring]") {
    const size_t capacity = 4;
    const uint64_t pushes = 10;
    FrameRingBuffer ring(capacity);

    for (uint64_t i = 0; i < pushes; i++) {
        PCMFrame frame = makeFrame(i);
        PushResult result = ring.push(frame);
        if (i < capacity) {
            REQUIRE(result == PushResult::Queued);
        } else {
            REQUIRE(result == PushResult::DroppedOldest);
        }
    }

    SECTION("holds exactly the newest frames in order") {
        REQUIRE(ring.size() == capacity);
        PCMFrame out;
        for (uint64_t expected = pushes - capacity; expected < pushes; expected++) {
            REQUIRE(ring.tryPop(out));
            REQUIRE(out.sequence == expected);
        }
        REQUIRE_FALSE(ring.tryPop(out));
    }

    SECTION("counts every drop") {
        REQUIRE(ring.droppedFrames() == pushes - capacity);
    }
}

TEST_CASE("FrameRingBuffer close semantics", "[core][ring]") {
    FrameRingBuffer ring(2);

    SECTION("queued frames drain before Closed") {
        PCMFrame frame = makeFrame(7);
        ring.push(frame);
        ring.close();

        PCMFrame out;
        REQUIRE(ring.pop(out) == PopResult::Frame);
        REQUIRE(out.sequence == 7);
        REQUIRE(ring.pop(out) == PopResult::Closed);
    }

    SECTION("push after close is discarded") {
        ring.close();
        PCMFrame frame = makeFrame(1);
        REQUIRE(ring.push(frame) == PushResult::Discarded);
        REQUIRE(ring.size() == 0);
        REQUIRE(ring.droppedFrames() == 0);
    }

    SECTION("close is idempotent") {
        ring.close();
        ring.close();
        REQUIRE(ring.isClosed());
        PCMFrame out;
        REQUIRE(ring.pop(out) == PopResult::Closed);
    }

    SECTION("close wakes a blocked consumer") {
        PopResult result = PopResult::Frame;
        std::thread consumer([&] {
            PCMFrame out;
            result = ring.pop(out);
        });
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        ring.close();
        consumer.join();
        REQUIRE(result == PopResult::Closed);
    }
}

TEST_CASE("FrameRingBuffer recycles preallocated storage", "[core][ring]") {
    FrameRingBuffer ring(2, 256, 2, 48000);

    PCMFrame frame = makeFrame(0, 256);
    ring.push(frame);

    // The producer gets a preallocated slot back in exchange
    REQUIRE(frame.storageSize() == 256 * 2);
}

TEST_CASE("FrameRingBuffer capacity helper", "[core][ring]") {
    SECTION("200ms at 44.1kHz with 512-sample frames") {
        REQUIRE(FrameRingBuffer::capacityFor(0.2, 44100, 512) == 18);
    }

    SECTION("never below two") {
        REQUIRE(FrameRingBuffer::capacityFor(0.001, 44100, 4096) == 2);
        REQUIRE(FrameRingBuffer::capacityFor(0.2, 0, 512) == 2);
    }
}
