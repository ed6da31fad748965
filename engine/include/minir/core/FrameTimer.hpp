#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>

namespace minir::core {

    // Per-frame delta source for the render loop. Deltas are clamped so a stall
    // (debugger break, window drag) does not advance animations by seconds at once.
    class FrameTimer {
    public:
        explicit FrameTimer(float maxDelta = 0.1f)
            : m_maxDelta(maxDelta)
        {
            reset();
        }

        void reset() {
            m_lastFrame = std::chrono::steady_clock::now();
            m_frameCount = 0;
            m_smoothedDelta = 1.0f / 60.0f;
        }

        [[nodiscard]] float tick() {
            auto now = std::chrono::steady_clock::now();
            std::chrono::duration<float> delta = now - m_lastFrame;
            m_lastFrame = now;
            ++m_frameCount;

            const float dt = std::clamp(delta.count(), 0.0f, m_maxDelta);
            m_smoothedDelta = (m_smoothedDelta * 0.95f) + (dt * 0.05f);
            return dt;
        }

        [[nodiscard]] float elapsed() const {
            auto now = std::chrono::steady_clock::now();
            std::chrono::duration<float> delta = now - m_lastFrame;
            return delta.count();
        }

        [[nodiscard]] uint64_t frameCount() const noexcept { return m_frameCount; }

        [[nodiscard]] float averageFps() const noexcept {
            return m_smoothedDelta > 0.0f ? 1.0f / m_smoothedDelta : 0.0f;
        }

    private:
        std::chrono::steady_clock::time_point m_lastFrame;
        float m_maxDelta;
        float m_smoothedDelta = 1.0f / 60.0f;
        uint64_t m_frameCount = 0;
    };

}
