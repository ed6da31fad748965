#pragma once

#include "minir/core/result.hpp"
#include "minir/renderer/scene/Mesh.hpp"

#include <filesystem>
#include <memory>
#include <string>

namespace minir::renderer::scene
{
    // Composite drawable: a named mesh with a source path and object-space bounds.
    // The geometry arrives already decoded; file parsing happens upstream.
    class Model final : public Drawable
    {
        struct CreateKey
        {
            explicit CreateKey() = default;
        };

    public:
        static core::Result<std::unique_ptr<Model>> create(std::unique_ptr<Mesh> mesh,
                                                           std::string name,
                                                           std::filesystem::path sourcePath = {});

        // Unit-style cube model with bounds of +-size/2.
        static std::unique_ptr<Model> createCube(RenderBackend& backend, float size = 1.0f,
                                                 const glm::vec4& color = glm::vec4(1.0f));

        Model(CreateKey, std::unique_ptr<Mesh> mesh, std::string name, std::filesystem::path sourcePath);

        [[nodiscard]] DrawableKind kind() const override { return DrawableKind::Model; }
        void render(ShaderHandle shader) override;

        [[nodiscard]] std::string_view name() const override { return m_name; }
        void setName(std::string name) { m_name = std::move(name); }

        [[nodiscard]] std::optional<BoundingBox> bounds() const override { return m_bounds; }
        [[nodiscard]] glm::vec3 boundsCenter() const { return m_bounds.center(); }
        [[nodiscard]] glm::vec3 boundsSize() const { return m_bounds.size(); }

        [[nodiscard]] const std::filesystem::path& sourcePath() const { return m_sourcePath; }

        [[nodiscard]] Mesh& mesh() { return *m_mesh; }
        [[nodiscard]] const Mesh& mesh() const { return *m_mesh; }

        // Moves the model so its bounds are centered on the origin.
        void centerAtOrigin();
        // Uniformly scales the model so its largest extent equals targetSize.
        void scaleToFit(float targetSize);

    private:
        std::unique_ptr<Mesh> m_mesh;
        std::string m_name;
        std::filesystem::path m_sourcePath;
        BoundingBox m_bounds{};
    };
}
