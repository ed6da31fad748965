#pragma once

#include "minir/core/result.hpp"
#include "minir/renderer/RenderBackend.hpp"
#include "minir/renderer/scene/Drawable.hpp"

#include <glm/vec4.hpp>

#include <memory>

namespace minir::renderer::scene
{
    class Mesh final : public Drawable
    {
        struct CreateKey
        {
            explicit CreateKey() = default;
        };

    public:
        // Validates and uploads the geometry. Fails on empty data, an index
        // count that does not match the topology, or an out-of-range index.
        static core::Result<std::unique_ptr<Mesh>> create(RenderBackend& backend,
                                                          const MeshData& data,
                                                          PrimitiveTopology topology = PrimitiveTopology::TriangleList);

        static std::unique_ptr<Mesh> createCube(RenderBackend& backend, float size = 1.0f, bool wireframe = false);
        static std::unique_ptr<Mesh> createGrid(RenderBackend& backend, float width = 10.0f, float depth = 10.0f,
                                                uint32_t segments = 10);

        // Only reachable through the factories above.
        Mesh(CreateKey, RenderBackend& backend, GpuMeshHandle gpuMesh, uint32_t vertexCount, uint32_t indexCount,
             PrimitiveTopology topology, const BoundingBox& bounds);
        ~Mesh() override;

        [[nodiscard]] DrawableKind kind() const override { return DrawableKind::Mesh; }
        void render(ShaderHandle shader) override;
        [[nodiscard]] std::optional<BoundingBox> bounds() const override { return m_bounds; }

        [[nodiscard]] const glm::vec4& color() const { return m_color; }
        void setColor(const glm::vec4& color) { m_color = color; }

        [[nodiscard]] TextureHandle texture() const { return m_texture; }
        void setTexture(TextureHandle texture) { m_texture = texture; }

        [[nodiscard]] GpuMeshHandle gpuMesh() const { return m_gpuMesh; }
        [[nodiscard]] uint32_t vertexCount() const { return m_vertexCount; }
        [[nodiscard]] uint32_t indexCount() const { return m_indexCount; }
        [[nodiscard]] PrimitiveTopology topology() const { return m_topology; }

    private:
        RenderBackend& m_backend;
        GpuMeshHandle m_gpuMesh;
        uint32_t m_vertexCount = 0;
        uint32_t m_indexCount = 0;
        PrimitiveTopology m_topology = PrimitiveTopology::TriangleList;
        BoundingBox m_bounds{};
        glm::vec4 m_color{1.0f};
        TextureHandle m_texture = INVALID_TEXTURE_HANDLE;
    };
}
