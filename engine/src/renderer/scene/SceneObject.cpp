#include "minir/renderer/scene/SceneObject.hpp"

#include "minir/core/logger.hpp"
#include "minir/renderer/scene/ContentRegistry.hpp"

#include <glm/geometric.hpp>

#include <cmath>
#include <format>

namespace minir::renderer::scene
{
    float wrapDegrees(float degrees)
    {
        float wrapped = std::fmod(degrees, 360.0f);
        if (wrapped < 0.0f)
        {
            wrapped += 360.0f;
        }
        // -epsilon + 360 can round up to exactly 360
        if (wrapped >= 360.0f)
        {
            wrapped = 0.0f;
        }
        return wrapped;
    }

    SceneObject::SceneObject(ContentRegistry& content, DrawableHandle drawable, std::optional<std::string> name)
        : m_content(&content)
        , m_drawable(drawable)
    {
        const Drawable* target = content.get(drawable);

        if (name.has_value())
        {
            m_name = std::move(*name);
        }
        else if (target != nullptr && !target->name().empty())
        {
            m_name = std::string(target->name());
        }
        else
        {
            m_name = kDefaultName;
        }

        if (target != nullptr)
        {
            m_transform = target->transform();
        }

        if (!content.acquire(drawable))
        {
            core::Logger::Scene.warn("SceneObject '{}' created over an invalid drawable handle", m_name);
        }
    }

    SceneObject::~SceneObject()
    {
        dispose();
    }

    void SceneObject::update(float deltaTime)
    {
        if (!m_autoRotate)
        {
            return;
        }

        const glm::vec3 advanced = m_transform.m_rotation + m_rotationSpeed * deltaTime;
        m_transform.m_rotation = glm::vec3(wrapDegrees(advanced.x),
                                           wrapDegrees(advanced.y),
                                           wrapDegrees(advanced.z));
    }

    void SceneObject::render(ShaderHandle shader)
    {
        if (!m_visible)
        {
            return;
        }

        Drawable* target = m_content->get(m_drawable);
        if (target == nullptr)
        {
            core::Logger::Scene.warn("SceneObject '{}' skipped: drawable {} no longer exists",
                                     m_name, m_drawable.packed());
            return;
        }

        if (m_content->isShared(m_drawable))
        {
            core::Logger::Scene.trace("SceneObject '{}' overwrites the transform of shared drawable {}",
                                      m_name, m_drawable.packed());
        }

        target->transform() = m_transform;
        target->render(shader);
    }

    bool SceneObject::shouldRender(const glm::vec3& viewerPosition, float maxDistance) const
    {
        if (!m_visible)
        {
            return false;
        }

        const float distance = glm::distance(m_transform.m_position, viewerPosition);
        return distance <= maxDistance;
    }

    std::unique_ptr<SceneObject> SceneObject::clone() const
    {
        auto copy = std::make_unique<SceneObject>(*m_content, m_drawable, m_name + "_Clone");
        copy->m_transform = m_transform;
        copy->m_autoRotate = m_autoRotate;
        copy->m_rotationSpeed = m_rotationSpeed;
        copy->m_visible = m_visible;
        return copy;
    }

    void SceneObject::dispose()
    {
        if (m_disposed)
        {
            return;
        }

        // The drawable stays in the registry; only our claim on it goes away.
        m_content->release(m_drawable);
        m_disposed = true;
    }

    std::string SceneObject::toString() const
    {
        const glm::vec3& p = m_transform.m_position;
        return std::format("SceneObject: {} at ({}, {}, {})", m_name, p.x, p.y, p.z);
    }

    const Drawable* SceneObject::resolveDrawable() const
    {
        return m_content->get(m_drawable);
    }
}
