#pragma once

#include <chrono>
#include <thread>

namespace minir::core {

// Caps the main loop at a target rate. Sleeps until shortly before the next
// deadline and spins the remainder; a loop that falls far behind resyncs to
// now instead of bursting to catch up.
class FramePacer {
public:
    using Clock = std::chrono::steady_clock;

    static constexpr auto kSpinWindow = std::chrono::milliseconds(2);
    static constexpr auto kMaxLag = std::chrono::milliseconds(100);

    FramePacer() : m_deadline(Clock::now()) {}

    // targetFps <= 0 disables pacing and just resets the schedule.
    void paceFrame(double targetFps) {
        if (targetFps <= 0.0) {
            m_deadline = Clock::now();
            return;
        }

        m_deadline += std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(1.0 / targetFps));

        const auto now = Clock::now();
        if (now > m_deadline + kMaxLag) {
            m_deadline = now;
            return;
        }

        if (m_deadline - now > kSpinWindow) {
            std::this_thread::sleep_for(m_deadline - now - kSpinWindow);
        }
        while (Clock::now() < m_deadline) {
            std::this_thread::yield();
        }
    }

    void reset() { m_deadline = Clock::now(); }

private:
    Clock::time_point m_deadline;
};

} // namespace minir::core
