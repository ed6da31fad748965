#pragma once

/**
 * @file engine.hpp
 * @brief Main minir engine header
 */

#define MINIR_VERSION_MAJOR 0
#define MINIR_VERSION_MINOR 1
#define MINIR_VERSION_PATCH 0

#include "minir/core/FrameTimer.hpp"
#include "minir/core/logger.hpp"
#include "minir/renderer/scene/SceneManager.hpp"

namespace minir
{
    using Log = core::Logger;
    using FrameTimer = core::FrameTimer;
    using SceneManager = renderer::scene::SceneManager;
    using SceneObject = renderer::scene::SceneObject;
}
