#include "minir/renderer/scene/DemoScene.hpp"

#include "minir/core/logger.hpp"
#include "minir/core/profiler.hpp"
#include "minir/renderer/scene/ContentRegistry.hpp"
#include "minir/renderer/scene/Mesh.hpp"
#include "minir/renderer/scene/SceneManager.hpp"

#include <glm/gtc/constants.hpp>

#include <cmath>
#include <format>
#include <memory>

namespace minir::renderer::scene
{
    namespace
    {
        DrawableHandle addColoredCube(ContentRegistry& content, RenderBackend& backend, float size,
                                      const glm::vec4& color)
        {
            auto cube = Mesh::createCube(backend, size);
            cube->setColor(color);
            return content.add(std::move(cube));
        }

        uint32_t createCubeGrid(SceneManager& scene, ContentRegistry& content, RenderBackend& backend)
        {
            using L = DemoSceneLayout;
            constexpr int half = L::kGridSize / 2;
            constexpr float last = static_cast<float>(L::kGridSize - 1);

            uint32_t added = 0;
            for (int x = 0; x < L::kGridSize; ++x)
            {
                for (int z = 0; z < L::kGridSize; ++z)
                {
                    const glm::vec4 color(static_cast<float>(x) / last, 0.5f, static_cast<float>(z) / last, 1.0f);
                    const DrawableHandle cube = addColoredCube(content, backend, L::kGridCubeSize, color);

                    auto obj = std::make_unique<SceneObject>(content, cube, std::format("GridCube_{}_{}", x, z));
                    obj->setPosition(glm::vec3(static_cast<float>(x - half) * L::kGridSpacing,
                                               1.0f,
                                               static_cast<float>(z - half) * L::kGridSpacing + L::kGridDepthOffset));
                    obj->setAutoRotate(true);
                    obj->setRotationSpeed(glm::vec3(30.0f + static_cast<float>(x) * 10.0f,
                                                    45.0f + static_cast<float>(z) * 15.0f,
                                                    0.0f));
                    scene.addObject(std::move(obj));
                    ++added;
                }
            }
            return added;
        }

        uint32_t createOrbiters(SceneManager& scene, ContentRegistry& content, RenderBackend& backend)
        {
            using L = DemoSceneLayout;
            constexpr float twoPi = glm::two_pi<float>();

            uint32_t added = 0;
            for (int i = 0; i < L::kOrbiterCount; ++i)
            {
                const float hue = static_cast<float>(i) / static_cast<float>(L::kOrbiterCount);
                const glm::vec4 color(std::sin(hue * twoPi) * 0.5f + 0.5f,
                                      std::sin(hue * twoPi + twoPi / 3.0f) * 0.5f + 0.5f,
                                      std::sin(hue * twoPi + 2.0f * twoPi / 3.0f) * 0.5f + 0.5f,
                                      1.0f);
                const DrawableHandle cube = addColoredCube(content, backend, L::kOrbiterSize, color);

                auto obj = std::make_unique<SceneObject>(content, cube, std::format("Orbiter_{}", i));
                const float angle = twoPi * static_cast<float>(i) / static_cast<float>(L::kOrbiterCount);
                obj->setPosition(glm::vec3(std::sin(angle) * L::kOrbitRadius,
                                           2.0f + std::sin(static_cast<float>(i)),
                                           std::cos(angle) * L::kOrbitRadius));
                obj->setAutoRotate(true);
                obj->setRotationSpeed(glm::vec3(90.0f + static_cast<float>(i) * 30.0f,
                                                180.0f + static_cast<float>(i) * 45.0f,
                                                45.0f));
                scene.addObject(std::move(obj));
                ++added;
            }
            return added;
        }
    }

    uint32_t createDemoScene(SceneManager& scene, ContentRegistry& content, RenderBackend& backend,
                             DrawableHandle centerModel)
    {
        MINIR_PROFILE_FUNCTION();
        core::Logger::Scene.info("Creating demo scene");

        uint32_t added = 0;
        if (content.contains(centerModel))
        {
            auto car = std::make_unique<SceneObject>(content, centerModel, std::string("Center Car"));
            car->setPosition(glm::vec3(0.0f));
            car->setAutoRotate(true);
            car->setRotationSpeed(glm::vec3(0.0f, 45.0f, 0.0f));
            scene.addObject(std::move(car));
            ++added;
        }
        else if (centerModel.isValid())
        {
            core::Logger::Scene.warn("Demo scene: center model handle {} is stale, skipping", centerModel.packed());
        }

        added += createCubeGrid(scene, content, backend);
        added += createOrbiters(scene, content, backend);

        core::Logger::Scene.info("Demo scene complete! Total objects: {}", scene.totalObjects());
        return added;
    }
}
