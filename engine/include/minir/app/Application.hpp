#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include <SDL3/SDL.h>
#include <minir/engine.hpp>
#include <minir/core/FramePacer.hpp>
#include <minir/core/profiler.hpp>

#include "minir/platform/window.hpp"
#include "minir/renderer/RenderBackend.hpp"

namespace minir::app
{
    struct ApplicationConfig
    {
        std::string title{"minir"};
        int width{1280};
        int height{720};
        SDL_WindowFlags windowFlags{SDL_WINDOW_RESIZABLE};
        // No window and no SDL; the loop is bounded by maxFrames instead.
        bool headless{false};
        // 0 runs until the window closes. Headless runs need a non-zero value.
        uint64_t maxFrames{0};
        std::filesystem::path configPath{"minir.ini"};
    };

    class Application
    {
    public:
        explicit Application(ApplicationConfig cfg);
        virtual ~Application();

        Application(const Application&) = delete;
        Application& operator=(const Application&) = delete;

        // Returns the process exit code. Exceptions escaping the hooks are
        // logged with a stack trace and turned into exit code 1.
        int run();

        void requestQuit() { m_quitRequested = true; }

    protected:
        virtual void onInit();
        virtual void onUpdate(float dt);
        virtual void onEvent(const SDL_Event& event);
        virtual void onRenderFrame(float dt);
        virtual void onShutdown();

        [[nodiscard]] renderer::RenderBackend& backend() { return *m_backend; }
        [[nodiscard]] const core::FrameTimer& timer() const { return m_timer; }
        [[nodiscard]] float aspectRatio() const;

        void loadConfig();
        void saveConfig() const;

        ApplicationConfig m_config;

    private:
        [[nodiscard]] bool shouldKeepRunning() const;

        std::optional<platform::Window> m_window;
        std::unique_ptr<renderer::RenderBackend> m_backend;
        core::FrameTimer m_timer;
        core::FramePacer m_framePacer;
        bool m_quitRequested = false;
    };

}
