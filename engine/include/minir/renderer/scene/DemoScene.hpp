#pragma once

#include "minir/core/Handle.h"
#include "minir/renderer/RenderBackend.hpp"

#include <cstdint>

namespace minir::renderer::scene
{
    class ContentRegistry;
    class SceneManager;

    struct DemoSceneLayout
    {
        static constexpr int kGridSize = 5;
        static constexpr float kGridSpacing = 4.0f;
        static constexpr float kGridCubeSize = 0.8f;
        static constexpr float kGridDepthOffset = 10.0f;

        static constexpr int kOrbiterCount = 6;
        static constexpr float kOrbitRadius = 8.0f;
        static constexpr float kOrbiterSize = 0.5f;
    };

    // Populates the scene with the showcase content: an optional "Center Car"
    // over centerModel, a 5x5 grid of spinning cubes and six orbiters. Every cube
    // gets its own mesh in the registry. Returns the number of objects added.
    uint32_t createDemoScene(SceneManager& scene, ContentRegistry& content, RenderBackend& backend,
                             DrawableHandle centerModel = INVALID_DRAWABLE_HANDLE);
}
