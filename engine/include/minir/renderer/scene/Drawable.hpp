#pragma once

#include "minir/core/Handle.h"
#include "minir/renderer/scene/Bounds.hpp"
#include "minir/renderer/scene/transform.hpp"

#include <cstdint>
#include <optional>
#include <string_view>

namespace minir::renderer::scene
{
    enum class DrawableKind : uint8_t
    {
        Mesh,
        Model
    };

    // Anything the scene can draw. The transform held here is a write-through
    // cache: SceneObject overwrites it before every render call.
    class Drawable
    {
    public:
        virtual ~Drawable() = default;

        Drawable(const Drawable&) = delete;
        Drawable& operator=(const Drawable&) = delete;

        [[nodiscard]] virtual DrawableKind kind() const = 0;
        virtual void render(ShaderHandle shader) = 0;

        // Empty when the drawable carries no name of its own.
        [[nodiscard]] virtual std::string_view name() const { return {}; }
        [[nodiscard]] virtual std::optional<BoundingBox> bounds() const { return std::nullopt; }

        [[nodiscard]] Transform& transform() { return m_transform; }
        [[nodiscard]] const Transform& transform() const { return m_transform; }

        [[nodiscard]] glm::mat4 modelMatrix() const { return m_transform.mat4(); }

    protected:
        Drawable() = default;

        Transform m_transform;
    };

    inline const char* toString(DrawableKind kind)
    {
        switch (kind)
        {
        case DrawableKind::Mesh: return "Mesh";
        case DrawableKind::Model: return "Model";
        }
        return "Unknown";
    }
}
