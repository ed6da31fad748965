#pragma once

#include "minir/core/Pool.hpp"
#include "minir/renderer/RenderBackend.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace minir::renderer
{
    // Backend that records submissions instead of talking to a GPU. Used by the
    // headless sample and by the test suite to observe what the scene drew.
    class NullRenderBackend final : public RenderBackend
    {
    public:
        NullRenderBackend();
        ~NullRenderBackend() override;

        [[nodiscard]] const char* name() const override { return "Null"; }

        ShaderHandle createShaderProgram(std::string_view debugName) override;
        void destroyShaderProgram(ShaderHandle shader) override;

        GpuMeshHandle createMesh(const MeshData& data) override;
        void destroyMesh(GpuMeshHandle mesh) override;

        void setUniform(ShaderHandle shader, std::string_view uniformName, const UniformValue& value) override;
        void drawIndexed(const DrawCommand& cmd) override;

        void beginFrame() override;
        void endFrame() override;

        // Draws submitted since the last beginFrame(); the log holds one frame at most.
        [[nodiscard]] const std::vector<DrawCommand>& drawCalls() const { return m_drawCalls; }

        // nullptr when the uniform was never written for this program.
        [[nodiscard]] const UniformValue* uniform(ShaderHandle shader, std::string_view uniformName) const;

        [[nodiscard]] size_t liveMeshCount() const { return m_meshes.size(); }
        [[nodiscard]] size_t liveShaderCount() const { return m_shaders.size(); }
        [[nodiscard]] uint64_t frameIndex() const { return m_frameIndex; }
        [[nodiscard]] uint32_t lastFrameDrawCount() const { return m_lastFrameDrawCount; }

    private:
        struct MeshRecord
        {
            uint32_t vertexCount = 0;
            uint32_t indexCount = 0;
        };

        struct ShaderRecord
        {
            std::string debugName;
            std::unordered_map<std::string, UniformValue> uniforms;
        };

        core::Pool<MeshRecord, core::GpuMeshTag> m_meshes;
        core::Pool<ShaderRecord, core::ShaderTag> m_shaders;
        std::vector<DrawCommand> m_drawCalls;
        uint64_t m_frameIndex = 0;
        uint32_t m_frameDrawCount = 0;
        uint32_t m_lastFrameDrawCount = 0;
    };
}
