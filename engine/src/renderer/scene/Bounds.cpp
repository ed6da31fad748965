#include "minir/renderer/scene/Bounds.hpp"

#include <glm/common.hpp>

#include <algorithm>

namespace minir::renderer::scene
{
    float BoundingBox::maxExtent() const
    {
        const glm::vec3 s = size();
        return std::max({s.x, s.y, s.z});
    }

    BoundingBox BoundingBox::unitCube(float size)
    {
        BoundingBox out{};
        out.m_min = glm::vec3(-size * 0.5f);
        out.m_max = glm::vec3(size * 0.5f);
        return out;
    }

    BoundingBox BoundingBox::fromInterleaved(std::span<const float> vertices, uint32_t floatsPerVertex)
    {
        BoundingBox out{};
        if (floatsPerVertex < 3 || vertices.size() < 3)
        {
            return out;
        }

        out.m_min = glm::vec3(vertices[0], vertices[1], vertices[2]);
        out.m_max = out.m_min;

        for (size_t i = 0; i + 3 <= vertices.size(); i += floatsPerVertex)
        {
            const glm::vec3 p(vertices[i], vertices[i + 1], vertices[i + 2]);
            out.m_min = glm::min(out.m_min, p);
            out.m_max = glm::max(out.m_max, p);
        }
        return out;
    }
}
