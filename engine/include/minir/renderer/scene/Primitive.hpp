#pragma once

#include "minir/renderer/RenderBackend.hpp"

namespace minir::renderer::scene::Primitive
{
    // Position, uv, normal, color (12 floats per vertex); 24 vertices, 36 indices.
    MeshData createCube(float size = 1.0f);

    // Position and color (7 floats per vertex); 8 vertices, 12 line segments.
    MeshData createWireframeCube(float size = 1.0f);

    // XZ plane centered on the origin; position, uv, normal (8 floats per vertex).
    MeshData createGrid(float width = 10.0f, float depth = 10.0f, uint32_t segments = 10);
}
