#include <doctest/doctest.h>
#include "minir/core/FramePacer.hpp"

#include <chrono>
#include <thread>

using namespace minir::core;
using namespace std::chrono_literals;

TEST_CASE("FramePacer holds the loop to the target rate") {
    const auto start = FramePacer::Clock::now();
    FramePacer pacer;

    // 200 FPS: five frames cannot finish before 25ms of schedule have passed.
    for (int i = 0; i < 5; ++i) {
        pacer.paceFrame(200.0);
    }
    CHECK(FramePacer::Clock::now() - start >= 25ms);
}

TEST_CASE("FramePacer with no target does not wait") {
    FramePacer pacer;
    const auto start = FramePacer::Clock::now();
    for (int i = 0; i < 1000; ++i) {
        pacer.paceFrame(0.0);
    }
    CHECK(FramePacer::Clock::now() - start < 500ms);
}

TEST_CASE("FramePacer resyncs instead of bursting after a long stall") {
    FramePacer pacer;
    std::this_thread::sleep_for(150ms);

    // The missed deadlines are dropped, so the next frames are paced from now.
    const auto resumed = FramePacer::Clock::now();
    pacer.paceFrame(100.0);
    pacer.paceFrame(100.0);
    CHECK(FramePacer::Clock::now() - resumed >= 10ms);
}
