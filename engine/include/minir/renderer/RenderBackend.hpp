#pragma once

#include "minir/core/Handle.h"

#include <glm/mat4x4.hpp>
#include <glm/vec3.hpp>
#include <glm/vec4.hpp>

#include <cstdint>
#include <string_view>
#include <variant>
#include <vector>

namespace minir::renderer
{
    enum class PrimitiveTopology : uint8_t
    {
        TriangleList,
        LineList
    };

    enum VertexAttribute : uint32_t
    {
        VertexAttribute_Position = 0x1,
        VertexAttribute_TexCoord = 0x2,
        VertexAttribute_Normal   = 0x4,
        VertexAttribute_Color    = 0x8,
    };

    // Interleaved float vertex stream. Position is always the first three floats.
    struct MeshData
    {
        std::vector<float> m_vertices;
        std::vector<uint32_t> m_indices;
        uint32_t m_attributes = VertexAttribute_Position;

        [[nodiscard]] uint32_t floatsPerVertex() const
        {
            uint32_t n = 0;
            if (m_attributes & VertexAttribute_Position) n += 3;
            if (m_attributes & VertexAttribute_TexCoord) n += 2;
            if (m_attributes & VertexAttribute_Normal) n += 3;
            if (m_attributes & VertexAttribute_Color) n += 4;
            return n;
        }

        [[nodiscard]] uint32_t vertexCount() const
        {
            const uint32_t stride = floatsPerVertex();
            return stride == 0 ? 0u : static_cast<uint32_t>(m_vertices.size() / stride);
        }
    };

    using UniformValue = std::variant<bool, int32_t, float, glm::vec3, glm::vec4, glm::mat4>;

    struct DrawCommand
    {
        ShaderHandle shader = INVALID_SHADER_HANDLE;
        GpuMeshHandle mesh = INVALID_GPU_MESH_HANDLE;
        PrimitiveTopology topology = PrimitiveTopology::TriangleList;
        uint32_t indexCount = 0;
        glm::mat4 model{1.0f};
        glm::vec4 color{1.0f};
        TextureHandle texture = INVALID_TEXTURE_HANDLE;
    };

    // GPU submission boundary. Everything below this interface (buffers,
    // vertex layouts, program objects) belongs to the backend.
    class RenderBackend
    {
    public:
        virtual ~RenderBackend() = default;

        [[nodiscard]] virtual const char* name() const = 0;

        virtual ShaderHandle createShaderProgram(std::string_view debugName) = 0;
        virtual void destroyShaderProgram(ShaderHandle shader) = 0;

        virtual GpuMeshHandle createMesh(const MeshData& data) = 0;
        virtual void destroyMesh(GpuMeshHandle mesh) = 0;

        virtual void setUniform(ShaderHandle shader, std::string_view uniformName, const UniformValue& value) = 0;
        virtual void drawIndexed(const DrawCommand& cmd) = 0;

        virtual void beginFrame() {}
        virtual void endFrame() {}
    };
}
