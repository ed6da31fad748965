#pragma once

#include <glm/vec3.hpp>

#include <cstdint>
#include <span>

namespace minir::renderer::scene
{
    struct BoundingBox
    {
        glm::vec3 m_min{0.0f};
        glm::vec3 m_max{0.0f};

        [[nodiscard]] glm::vec3 center() const { return (m_min + m_max) * 0.5f; }
        [[nodiscard]] glm::vec3 size() const { return m_max - m_min; }

        [[nodiscard]] float maxExtent() const;

        static BoundingBox unitCube(float size);

        // Bounds of the position component of an interleaved float stream.
        // An empty stream yields a degenerate box at the origin.
        static BoundingBox fromInterleaved(std::span<const float> vertices, uint32_t floatsPerVertex);
    };
}
