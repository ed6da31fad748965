#include "minir/renderer/scene/SceneManager.hpp"

#include "minir/core/common.hpp"
#include "minir/core/cvar.hpp"
#include "minir/core/logger.hpp"
#include "minir/core/profiler.hpp"

#include <algorithm>
#include <format>

AUTO_CVAR_BOOL(scene_distance_culling, "Skip objects farther from the viewer than scene_max_render_distance",
               true, minir::core::CVarFlags::save);
AUTO_CVAR_FLOAT(scene_max_render_distance, "Cull radius around the viewer, in world units",
                50.0f, minir::core::CVarFlags::save);

namespace minir::renderer::scene
{
    SceneSettings SceneSettings::fromCVars()
    {
        SceneSettings settings{};
        settings.enableDistanceCulling = scene_distance_culling.get();
        settings.maxRenderDistance = std::max(kMinRenderDistance, scene_max_render_distance.get());
        return settings;
    }

    void SceneSettings::storeToCVars() const
    {
        scene_distance_culling.set(enableDistanceCulling);
        scene_max_render_distance.set(maxRenderDistance);
    }

    SceneManager::SceneManager(SceneSettings settings)
        : m_settings(settings)
    {
        m_settings.maxRenderDistance = std::max(SceneSettings::kMinRenderDistance, m_settings.maxRenderDistance);
        core::Logger::Scene.info("Scene manager initialized (culling {}, max distance {:.1f})",
                                 m_settings.enableDistanceCulling ? "on" : "off", m_settings.maxRenderDistance);
    }

    SceneManager::~SceneManager()
    {
        dispose();
    }

    SceneObject* SceneManager::addObject(std::unique_ptr<SceneObject> obj)
    {
        if (!obj)
        {
            return nullptr;
        }

        // Caller re-wrapped a pointer we already own; drop the alias before
        // anything below can throw and delete an object still in m_objects.
        SceneObject* raw = obj.get();
        if (contains(raw))
        {
            (void)obj.release();
            return raw;
        }

        MINIR_ASSERT(!m_iterating, "SceneManager::addObject called during update/render");
        m_objects.push_back(std::move(obj));
        core::Logger::Scene.info("Added object: {} (Total: {})", raw->name(), m_objects.size());
        return raw;
    }

    std::unique_ptr<SceneObject> SceneManager::removeObject(const SceneObject* obj)
    {
        MINIR_ASSERT(!m_iterating, "SceneManager::removeObject called during update/render");
        if (obj == nullptr)
        {
            return nullptr;
        }

        auto it = std::ranges::find_if(m_objects, [obj](const std::unique_ptr<SceneObject>& o) {
            return o.get() == obj;
        });
        if (it == m_objects.end())
        {
            return nullptr;
        }

        std::unique_ptr<SceneObject> removed = std::move(*it);
        m_objects.erase(it);
        core::Logger::Scene.info("Removed object: {} (Total: {})", removed->name(), m_objects.size());
        return removed;
    }

    SceneObject* SceneManager::findObject(std::string_view name) const
    {
        auto it = std::ranges::find_if(m_objects, [name](const std::unique_ptr<SceneObject>& o) {
            return util::iequals(o->name(), name);
        });
        return it != m_objects.end() ? it->get() : nullptr;
    }

    bool SceneManager::contains(const SceneObject* obj) const
    {
        return std::ranges::any_of(m_objects, [obj](const std::unique_ptr<SceneObject>& o) {
            return o.get() == obj;
        });
    }

    void SceneManager::update(float deltaTime)
    {
        MINIR_PROFILE_FUNCTION();
        m_iterating = true;
        auto guard = util::makeScopeGuard([this] { m_iterating = false; });

        for (const auto& obj : m_objects)
        {
            obj->update(deltaTime);
        }
    }

    void SceneManager::render(ShaderHandle shader, const glm::vec3& viewerPosition)
    {
        MINIR_PROFILE_FUNCTION();
        m_renderedObjects = 0;
        m_culledObjects = 0;

        m_iterating = true;
        auto guard = util::makeScopeGuard([this] { m_iterating = false; });

        for (const auto& obj : m_objects)
        {
            if (m_settings.enableDistanceCulling &&
                !obj->shouldRender(viewerPosition, m_settings.maxRenderDistance))
            {
                ++m_culledObjects;
                continue;
            }

            // Counted as rendered even when the object is invisible and its
            // own render() draws nothing (only reachable with culling off).
            obj->render(shader);
            ++m_renderedObjects;
        }

        MINIR_PROFILE_PLOT("Scene rendered", static_cast<int64_t>(m_renderedObjects));
        MINIR_PROFILE_PLOT("Scene culled", static_cast<int64_t>(m_culledObjects));
    }

    void SceneManager::toggleDistanceCulling()
    {
        m_settings.enableDistanceCulling = !m_settings.enableDistanceCulling;
        core::Logger::Scene.info("Distance culling: {}", m_settings.enableDistanceCulling ? "on" : "off");
    }

    void SceneManager::adjustRenderDistance(float delta)
    {
        m_settings.maxRenderDistance =
            std::max(SceneSettings::kMinRenderDistance, m_settings.maxRenderDistance + delta);
        core::Logger::Scene.info("Max render distance: {:.1f}", m_settings.maxRenderDistance);
    }

    void SceneManager::clear()
    {
        MINIR_ASSERT(!m_iterating, "SceneManager::clear called during update/render");
        if (m_objects.empty())
        {
            return;
        }

        for (const auto& obj : m_objects)
        {
            obj->dispose();
        }
        m_objects.clear();
        m_renderedObjects = 0;
        m_culledObjects = 0;
        core::Logger::Scene.info("Scene cleared");
    }

    void SceneManager::dispose()
    {
        if (m_disposed)
        {
            return;
        }
        clear();
        m_disposed = true;
    }

    std::string SceneManager::getPerformanceInfo() const
    {
        return std::format("Objects: {} | Rendered: {} | Culled: {} | Distance Culling: {} | Max Distance: {:.0f}",
                           totalObjects(), m_renderedObjects, m_culledObjects,
                           m_settings.enableDistanceCulling ? "On" : "Off", m_settings.maxRenderDistance);
    }

    void SceneManager::printSceneInfo() const
    {
        core::Logger::Scene.info("=== Scene Info ===");
        core::Logger::Scene.info("Total Objects: {}", totalObjects());
        core::Logger::Scene.info("Distance Culling: {}", m_settings.enableDistanceCulling ? "On" : "Off");
        core::Logger::Scene.info("Max Render Distance: {:.1f}", m_settings.maxRenderDistance);

        if (!m_objects.empty())
        {
            core::Logger::Scene.info("Objects:");
            for (const auto& obj : m_objects)
            {
                const glm::vec3& p = obj->position();
                core::Logger::Scene.info("  - {} at ({:.2f}, {:.2f}, {:.2f})", obj->name(), p.x, p.y, p.z);
            }
        }
    }
}
