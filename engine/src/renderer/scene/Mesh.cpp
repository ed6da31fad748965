#include "minir/renderer/scene/Mesh.hpp"

#include "minir/core/logger.hpp"
#include "minir/renderer/scene/Primitive.hpp"

#include <cpptrace/cpptrace.hpp>

#include <algorithm>
#include <format>

namespace minir::renderer::scene
{
    namespace
    {
        std::unique_ptr<Mesh> unwrapBuiltin(core::Result<std::unique_ptr<Mesh>> result, const char* what)
        {
            if (!result)
            {
                throw cpptrace::logic_error(std::format("built-in {} geometry rejected: {}", what, result.error()));
            }
            return std::move(*result);
        }
    }

    core::Result<std::unique_ptr<Mesh>> Mesh::create(RenderBackend& backend,
                                                     const MeshData& data,
                                                     PrimitiveTopology topology)
    {
        const uint32_t stride = data.floatsPerVertex();
        if (!(data.m_attributes & VertexAttribute_Position))
        {
            return core::fail("vertex layout has no position attribute");
        }
        if (data.m_vertices.empty() || data.m_indices.empty())
        {
            return core::fail("mesh has no vertices or no indices");
        }
        if (data.m_vertices.size() % stride != 0)
        {
            return core::fail("vertex stream of {} floats is not a multiple of the {}-float stride",
                              data.m_vertices.size(), stride);
        }

        const size_t primitiveSize = topology == PrimitiveTopology::TriangleList ? 3 : 2;
        if (data.m_indices.size() % primitiveSize != 0)
        {
            return core::fail("{} indices do not form whole primitives", data.m_indices.size());
        }

        const uint32_t vertexCount = data.vertexCount();
        const uint32_t maxIndex = *std::ranges::max_element(data.m_indices);
        if (maxIndex >= vertexCount)
        {
            return core::fail("index {} out of range for {} vertices", maxIndex, vertexCount);
        }

        const GpuMeshHandle gpuMesh = backend.createMesh(data);
        const BoundingBox bounds = BoundingBox::fromInterleaved(data.m_vertices, stride);

        return std::make_unique<Mesh>(CreateKey{}, backend, gpuMesh, vertexCount,
                                      static_cast<uint32_t>(data.m_indices.size()), topology, bounds);
    }

    std::unique_ptr<Mesh> Mesh::createCube(RenderBackend& backend, float size, bool wireframe)
    {
        if (wireframe)
        {
            return unwrapBuiltin(create(backend, Primitive::createWireframeCube(size), PrimitiveTopology::LineList),
                                 "wireframe cube");
        }
        return unwrapBuiltin(create(backend, Primitive::createCube(size)), "cube");
    }

    std::unique_ptr<Mesh> Mesh::createGrid(RenderBackend& backend, float width, float depth, uint32_t segments)
    {
        return unwrapBuiltin(create(backend, Primitive::createGrid(width, depth, segments)), "grid");
    }

    Mesh::Mesh(CreateKey, RenderBackend& backend, GpuMeshHandle gpuMesh, uint32_t vertexCount, uint32_t indexCount,
               PrimitiveTopology topology, const BoundingBox& bounds)
        : m_backend(backend)
        , m_gpuMesh(gpuMesh)
        , m_vertexCount(vertexCount)
        , m_indexCount(indexCount)
        , m_topology(topology)
        , m_bounds(bounds)
    {
    }

    Mesh::~Mesh()
    {
        if (m_gpuMesh.isValid())
        {
            m_backend.destroyMesh(m_gpuMesh);
        }
    }

    void Mesh::render(ShaderHandle shader)
    {
        DrawCommand cmd{};
        cmd.shader = shader;
        cmd.mesh = m_gpuMesh;
        cmd.topology = m_topology;
        cmd.indexCount = m_indexCount;
        cmd.model = modelMatrix();
        cmd.color = m_color;
        cmd.texture = m_texture;

        m_backend.setUniform(shader, "uUseTexture", m_texture.isValid());
        m_backend.drawIndexed(cmd);
    }
}
