#pragma once

#include "minir/core/Handle.h"
#include "minir/renderer/scene/SceneObject.hpp"

#include <glm/vec3.hpp>

#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace minir::renderer::scene
{
    struct SceneSettings
    {
        static constexpr float kMinRenderDistance = 5.0f;

        bool enableDistanceCulling = true;
        float maxRenderDistance = 50.0f;

        // Current values of scene_distance_culling / scene_max_render_distance.
        static SceneSettings fromCVars();
        // Writes the values back so the next CVarSystem::saveToIni persists them.
        void storeToCVars() const;
    };

    struct SceneStats
    {
        uint32_t totalObjects = 0;
        uint32_t renderedObjects = 0;
        uint32_t culledObjects = 0;
    };

    /**
     * @brief Ordered owner of SceneObjects with per-frame update and render passes.
     *
     * Objects keep insertion order. Rendering culls by Euclidean distance from
     * the viewer, not by frustum. Counters describe the most recent render()
     * only, and after it rendered + culled == total.
     *
     * Not thread-safe. Adding, removing or clearing objects from inside an
     * update() or render() pass is not allowed.
     */
    class SceneManager
    {
    public:
        explicit SceneManager(SceneSettings settings = {});
        ~SceneManager();

        SceneManager(const SceneManager&) = delete;
        SceneManager& operator=(const SceneManager&) = delete;

        // Appends obj and returns it. A null object is ignored (nullptr is returned);
        // an object already in the scene is not added twice.
        SceneObject* addObject(std::unique_ptr<SceneObject> obj);

        // Removes by identity and hands ownership back; the caller decides
        // whether to dispose. Empty when obj is not in the scene.
        std::unique_ptr<SceneObject> removeObject(const SceneObject* obj);

        // First object whose name matches, ignoring ASCII case.
        [[nodiscard]] SceneObject* findObject(std::string_view name) const;

        [[nodiscard]] std::span<const std::unique_ptr<SceneObject>> getAllObjects() const { return m_objects; }
        [[nodiscard]] bool contains(const SceneObject* obj) const;

        void update(float deltaTime);
        void render(ShaderHandle shader, const glm::vec3& viewerPosition);

        void toggleDistanceCulling();
        void setDistanceCulling(bool enabled) { m_settings.enableDistanceCulling = enabled; }
        // Clamped so the distance never drops below SceneSettings::kMinRenderDistance.
        void adjustRenderDistance(float delta);

        // Disposes every object and empties the scene.
        void clear();
        void dispose();

        [[nodiscard]] std::string getPerformanceInfo() const;
        void printSceneInfo() const;

        [[nodiscard]] bool distanceCullingEnabled() const { return m_settings.enableDistanceCulling; }
        [[nodiscard]] float maxRenderDistance() const { return m_settings.maxRenderDistance; }
        [[nodiscard]] const SceneSettings& settings() const { return m_settings; }

        [[nodiscard]] uint32_t totalObjects() const { return static_cast<uint32_t>(m_objects.size()); }
        [[nodiscard]] uint32_t renderedObjects() const { return m_renderedObjects; }
        [[nodiscard]] uint32_t culledObjects() const { return m_culledObjects; }
        [[nodiscard]] SceneStats stats() const { return {totalObjects(), m_renderedObjects, m_culledObjects}; }

    private:
        std::vector<std::unique_ptr<SceneObject>> m_objects;
        SceneSettings m_settings;

        uint32_t m_renderedObjects = 0;
        uint32_t m_culledObjects = 0;

        bool m_iterating = false;
        bool m_disposed = false;
    };
}
