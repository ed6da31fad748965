#pragma once

#include "minir/core/Handle.h"
#include "minir/renderer/scene/Drawable.hpp"
#include "minir/renderer/scene/transform.hpp"

#include <glm/vec3.hpp>

#include <memory>
#include <optional>
#include <string>

namespace minir::renderer::scene
{
    class ContentRegistry;

    /**
     * @brief Named, transformable, optionally self-animating wrapper around one Drawable.
     *
     * The SceneObject owns the authoritative transform. The referenced Drawable
     * lives in a ContentRegistry; this object holds a handle and counts as one of
     * its users until disposed. Two objects sharing a handle (see clone()) write
     * their transforms into the same Drawable in render order.
     */
    class SceneObject
    {
    public:
        static constexpr const char* kDefaultName = "SceneObject";

        // Name defaults to the drawable's own name, or kDefaultName when it has none.
        // The initial transform is copied from the drawable.
        SceneObject(ContentRegistry& content, DrawableHandle drawable,
                    std::optional<std::string> name = std::nullopt);
        ~SceneObject();

        SceneObject(const SceneObject&) = delete;
        SceneObject& operator=(const SceneObject&) = delete;

        // Advances auto-rotation; every axis is wrapped to [0, 360).
        void update(float deltaTime);

        // Pushes this object's transform into the drawable and draws it.
        // Does nothing while invisible. Drawable faults propagate.
        void render(ShaderHandle shader);

        [[nodiscard]] bool shouldRender(const glm::vec3& viewerPosition, float maxDistance) const;

        // New object over the same drawable (shared, not copied). Name gets "_Clone".
        [[nodiscard]] std::unique_ptr<SceneObject> clone() const;

        // Releases the registry reference. Idempotent; never frees the drawable.
        void dispose();
        [[nodiscard]] bool isDisposed() const { return m_disposed; }

        [[nodiscard]] std::string toString() const;

        [[nodiscard]] const std::string& name() const { return m_name; }
        void setName(std::string name) { m_name = std::move(name); }

        [[nodiscard]] bool isVisible() const { return m_visible; }
        void setVisible(bool visible) { m_visible = visible; }

        [[nodiscard]] const glm::vec3& position() const { return m_transform.m_position; }
        void setPosition(const glm::vec3& position) { m_transform.m_position = position; }

        [[nodiscard]] const glm::vec3& rotation() const { return m_transform.m_rotation; }
        void setRotation(const glm::vec3& rotationDegrees) { m_transform.m_rotation = rotationDegrees; }

        [[nodiscard]] const glm::vec3& scale() const { return m_transform.m_scale; }
        void setScale(const glm::vec3& scale) { m_transform.m_scale = scale; }

        [[nodiscard]] const Transform& transform() const { return m_transform; }
        [[nodiscard]] glm::mat4 modelMatrix() const { return m_transform.mat4(); }

        [[nodiscard]] bool autoRotate() const { return m_autoRotate; }
        void setAutoRotate(bool enabled) { m_autoRotate = enabled; }

        [[nodiscard]] const glm::vec3& rotationSpeed() const { return m_rotationSpeed; }
        void setRotationSpeed(const glm::vec3& degreesPerSecond) { m_rotationSpeed = degreesPerSecond; }

        [[nodiscard]] DrawableHandle drawable() const { return m_drawable; }
        // nullptr once the registry no longer holds the drawable.
        [[nodiscard]] const Drawable* resolveDrawable() const;

    private:
        ContentRegistry* m_content;
        DrawableHandle m_drawable;

        std::string m_name;
        bool m_visible = true;

        Transform m_transform;

        bool m_autoRotate = false;
        glm::vec3 m_rotationSpeed{0.0f, 30.0f, 0.0f};

        bool m_disposed = false;
    };

    // Wraps an angle in degrees into [0, 360), negative input included.
    float wrapDegrees(float degrees);
}
