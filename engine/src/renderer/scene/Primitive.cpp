#include "minir/renderer/scene/Primitive.hpp"

#include <glm/geometric.hpp>

#include <array>

namespace minir::renderer::scene::Primitive
{
    namespace
    {
        struct CubeFace
        {
            glm::vec3 normal;
            glm::vec3 u;
            glm::vec3 v;
        };

        // u x v == normal, so corners walked (-u,-v) (+u,-v) (+u,+v) (-u,+v)
        // wind counter-clockwise seen from outside.
        const std::array<CubeFace, 6> kFaces = {{
            {{0, 0, 1}, {1, 0, 0}, {0, 1, 0}},
            {{0, 0, -1}, {-1, 0, 0}, {0, 1, 0}},
            {{0, 1, 0}, {1, 0, 0}, {0, 0, -1}},
            {{0, -1, 0}, {1, 0, 0}, {0, 0, 1}},
            {{1, 0, 0}, {0, 0, -1}, {0, 1, 0}},
            {{-1, 0, 0}, {0, 0, 1}, {0, 1, 0}},
        }};

        const std::array<glm::vec2, 4> kCorners = {{
            {-1.0f, -1.0f}, {1.0f, -1.0f}, {1.0f, 1.0f}, {-1.0f, 1.0f}
        }};

        void push(std::vector<float>& out, const glm::vec3& v)
        {
            out.insert(out.end(), {v.x, v.y, v.z});
        }
    }

    MeshData createCube(float size)
    {
        const float h = size * 0.5f;

        MeshData data{};
        data.m_attributes = VertexAttribute_Position | VertexAttribute_TexCoord |
                            VertexAttribute_Normal | VertexAttribute_Color;
        data.m_vertices.reserve(kFaces.size() * 4 * 12);
        data.m_indices.reserve(kFaces.size() * 6);

        for (const CubeFace& face : kFaces)
        {
            const auto base = static_cast<uint32_t>(data.m_vertices.size() / 12);

            for (const glm::vec2& c : kCorners)
            {
                push(data.m_vertices, (face.normal + face.u * c.x + face.v * c.y) * h);
                data.m_vertices.insert(data.m_vertices.end(), {(c.x + 1.0f) * 0.5f, (c.y + 1.0f) * 0.5f});
                push(data.m_vertices, face.normal);
                data.m_vertices.insert(data.m_vertices.end(), {1.0f, 1.0f, 1.0f, 1.0f});
            }

            data.m_indices.insert(data.m_indices.end(), {base, base + 1, base + 2, base + 2, base + 3, base});
        }
        return data;
    }

    MeshData createWireframeCube(float size)
    {
        const float h = size * 0.5f;

        MeshData data{};
        data.m_attributes = VertexAttribute_Position | VertexAttribute_Color;

        // Front ring (z = +h) then back ring (z = -h), both counter-clockwise from bottom-left.
        for (float z : {h, -h})
        {
            for (const glm::vec2& c : kCorners)
            {
                data.m_vertices.insert(data.m_vertices.end(), {c.x * h, c.y * h, z, 1.0f, 1.0f, 1.0f, 1.0f});
            }
        }

        for (uint32_t ring = 0; ring < 2; ++ring)
        {
            const uint32_t base = ring * 4;
            for (uint32_t i = 0; i < 4; ++i)
            {
                data.m_indices.insert(data.m_indices.end(), {base + i, base + ((i + 1) % 4)});
            }
        }
        for (uint32_t i = 0; i < 4; ++i)
        {
            data.m_indices.insert(data.m_indices.end(), {i, i + 4});
        }
        return data;
    }

    MeshData createGrid(float width, float depth, uint32_t segments)
    {
        MeshData data{};
        data.m_attributes = VertexAttribute_Position | VertexAttribute_TexCoord | VertexAttribute_Normal;
        if (segments == 0)
        {
            return data;
        }

        const uint32_t verticesX = segments + 1;
        const uint32_t verticesZ = segments + 1;
        const float stepX = width / static_cast<float>(segments);
        const float stepZ = depth / static_cast<float>(segments);

        data.m_vertices.reserve(static_cast<size_t>(verticesX) * verticesZ * 8);
        for (uint32_t z = 0; z < verticesZ; ++z)
        {
            for (uint32_t x = 0; x < verticesX; ++x)
            {
                const float px = static_cast<float>(x) * stepX - width * 0.5f;
                const float pz = static_cast<float>(z) * stepZ - depth * 0.5f;
                const float u = static_cast<float>(x) / static_cast<float>(segments);
                const float v = static_cast<float>(z) / static_cast<float>(segments);
                data.m_vertices.insert(data.m_vertices.end(), {px, 0.0f, pz, u, v, 0.0f, 1.0f, 0.0f});
            }
        }

        data.m_indices.reserve(static_cast<size_t>(segments) * segments * 6);
        for (uint32_t z = 0; z < segments; ++z)
        {
            for (uint32_t x = 0; x < segments; ++x)
            {
                const uint32_t topLeft = z * verticesX + x;
                const uint32_t topRight = topLeft + 1;
                const uint32_t bottomLeft = (z + 1) * verticesX + x;
                const uint32_t bottomRight = bottomLeft + 1;

                data.m_indices.insert(data.m_indices.end(),
                                      {topLeft, bottomLeft, topRight, topRight, bottomLeft, bottomRight});
            }
        }
        return data;
    }
}
