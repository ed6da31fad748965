#include "minir/renderer/scene/Model.hpp"

#include "minir/core/logger.hpp"

#include <cpptrace/cpptrace.hpp>

namespace minir::renderer::scene
{
    core::Result<std::unique_ptr<Model>> Model::create(std::unique_ptr<Mesh> mesh,
                                                       std::string name,
                                                       std::filesystem::path sourcePath)
    {
        if (!mesh)
        {
            return core::fail("model requires a mesh");
        }

        if (name.empty())
        {
            name = sourcePath.empty() ? std::string("Model") : sourcePath.stem().string();
        }

        auto model = std::make_unique<Model>(CreateKey{}, std::move(mesh), std::move(name), std::move(sourcePath));

        const BoundingBox& b = model->m_bounds;
        core::Logger::Scene.info("Model '{}' ready: {} vertices, {} indices", model->m_name,
                                 model->m_mesh->vertexCount(), model->m_mesh->indexCount());
        core::Logger::Scene.debug("  bounds ({:.2f}, {:.2f}, {:.2f}) to ({:.2f}, {:.2f}, {:.2f})",
                                  b.m_min.x, b.m_min.y, b.m_min.z, b.m_max.x, b.m_max.y, b.m_max.z);
        return model;
    }

    std::unique_ptr<Model> Model::createCube(RenderBackend& backend, float size, const glm::vec4& color)
    {
        auto mesh = Mesh::createCube(backend, size);
        mesh->setColor(color);

        auto model = create(std::move(mesh), "Cube");
        if (!model)
        {
            throw cpptrace::logic_error("cube model rejected: " + model.error());
        }
        (*model)->m_bounds = BoundingBox::unitCube(size);
        return std::move(*model);
    }

    Model::Model(CreateKey, std::unique_ptr<Mesh> mesh, std::string name, std::filesystem::path sourcePath)
        : m_mesh(std::move(mesh))
        , m_name(std::move(name))
        , m_sourcePath(std::move(sourcePath))
        , m_bounds(m_mesh->bounds().value_or(BoundingBox::unitCube(2.0f)))
    {
    }

    void Model::render(ShaderHandle shader)
    {
        m_mesh->transform() = m_transform;
        m_mesh->render(shader);
    }

    void Model::centerAtOrigin()
    {
        m_transform.m_position = -m_bounds.center();
    }

    void Model::scaleToFit(float targetSize)
    {
        const float maxDimension = m_bounds.maxExtent();
        if (maxDimension > 0.0f)
        {
            m_transform.m_scale = glm::vec3(targetSize / maxDimension);
        }
    }
}
