#include "minir/renderer/NullRenderBackend.hpp"

#include "minir/core/logger.hpp"

#include <cpptrace/cpptrace.hpp>

namespace minir::renderer
{
    NullRenderBackend::NullRenderBackend()
    {
        core::Logger::Render.trace("NullRenderBackend created");
    }

    NullRenderBackend::~NullRenderBackend()
    {
        if (!m_meshes.empty())
        {
            core::Logger::Render.warn("NullRenderBackend destroyed with {} live mesh(es)", m_meshes.size());
        }
    }

    ShaderHandle NullRenderBackend::createShaderProgram(std::string_view debugName)
    {
        core::Logger::Render.trace("NullRenderBackend::createShaderProgram: {}", debugName);
        return m_shaders.emplace(ShaderRecord{std::string(debugName), {}});
    }

    void NullRenderBackend::destroyShaderProgram(ShaderHandle shader)
    {
        if (!m_shaders.erase(shader))
        {
            core::Logger::Render.warn("NullRenderBackend::destroyShaderProgram: stale handle {}", shader.packed());
        }
    }

    GpuMeshHandle NullRenderBackend::createMesh(const MeshData& data)
    {
        MeshRecord record{};
        record.vertexCount = data.vertexCount();
        record.indexCount = static_cast<uint32_t>(data.m_indices.size());

        core::Logger::Render.trace("NullRenderBackend::createMesh: {} vertices, {} indices",
                                   record.vertexCount, record.indexCount);
        return m_meshes.emplace(record);
    }

    void NullRenderBackend::destroyMesh(GpuMeshHandle mesh)
    {
        if (!m_meshes.erase(mesh))
        {
            core::Logger::Render.warn("NullRenderBackend::destroyMesh: stale handle {}", mesh.packed());
        }
    }

    void NullRenderBackend::setUniform(ShaderHandle shader, std::string_view uniformName, const UniformValue& value)
    {
        ShaderRecord* record = m_shaders.get(shader);
        if (record == nullptr)
        {
            throw cpptrace::runtime_error("setUniform on invalid shader program: " + std::string(uniformName));
        }
        record->uniforms.insert_or_assign(std::string(uniformName), value);
    }

    void NullRenderBackend::drawIndexed(const DrawCommand& cmd)
    {
        const MeshRecord* mesh = m_meshes.get(cmd.mesh);
        if (mesh == nullptr)
        {
            throw cpptrace::runtime_error("drawIndexed with a destroyed or invalid mesh handle");
        }
        if (!m_shaders.validate(cmd.shader))
        {
            throw cpptrace::runtime_error("drawIndexed with an invalid shader program");
        }
        if (cmd.indexCount > mesh->indexCount)
        {
            throw cpptrace::runtime_error("drawIndexed index count exceeds mesh index buffer");
        }

        m_drawCalls.push_back(cmd);
        ++m_frameDrawCount;
    }

    void NullRenderBackend::beginFrame()
    {
        m_drawCalls.clear();
        m_frameDrawCount = 0;
    }

    void NullRenderBackend::endFrame()
    {
        m_lastFrameDrawCount = m_frameDrawCount;
        ++m_frameIndex;
    }

    const UniformValue* NullRenderBackend::uniform(ShaderHandle shader, std::string_view uniformName) const
    {
        const ShaderRecord* record = m_shaders.get(shader);
        if (record == nullptr)
        {
            return nullptr;
        }
        auto it = record->uniforms.find(std::string(uniformName));
        return it != record->uniforms.end() ? &it->second : nullptr;
    }
}
