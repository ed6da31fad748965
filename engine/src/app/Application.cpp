#include "minir/app/Application.hpp"
#include "minir/core/cvar.hpp"
#include "minir/core/logger.hpp"
#include "minir/renderer/NullRenderBackend.hpp"
#include <cpptrace/cpptrace.hpp>
#include <algorithm>
#include <chrono>

AUTO_CVAR_FLOAT(app_max_fps, "Frame rate cap for windowed runs (0 uncapped)", 60.0f,
                minir::core::CVarFlags::save);

namespace minir::app {

    Application::Application(ApplicationConfig cfg)
        : m_config(std::move(cfg)),
          m_backend(std::make_unique<renderer::NullRenderBackend>())
    {
    }

    Application::~Application()
    {
        m_backend.reset();
        m_window.reset();
        core::Logger::shutdown();
    }

    void Application::loadConfig()
    {
        if (!std::filesystem::exists(m_config.configPath)) {
            core::Logger::Core.info("Config: {} not found, using defaults", m_config.configPath.string());
            return;
        }
        const int loaded = core::CVarSystem::loadFromIni(m_config.configPath);
        core::Logger::Core.info("Config: loaded {} value(s) from {}", loaded, m_config.configPath.string());
    }

    void Application::saveConfig() const
    {
        core::CVarSystem::saveToIni(m_config.configPath);
        core::Logger::Core.debug("Config: saved {}", m_config.configPath.string());
    }

    float Application::aspectRatio() const
    {
        if (m_window) {
            return m_window->aspectRatio();
        }
        return static_cast<float>(m_config.width) / static_cast<float>(std::max(m_config.height, 1));
    }

    bool Application::shouldKeepRunning() const
    {
        if (m_quitRequested) {
            return false;
        }
        if (m_config.maxFrames != 0 && m_timer.frameCount() >= m_config.maxFrames) {
            return false;
        }
        return !m_window || m_window->isRunning();
    }

    int Application::run()
    {
        cpptrace::register_terminate_handler();

        try
        {
            Log::init("[%H:%M:%S] [%-8l] %v");
            Log::info("minir v{}.{}.{} ({} backend)", MINIR_VERSION_MAJOR,
                      MINIR_VERSION_MINOR, MINIR_VERSION_PATCH, m_backend->name());

            if (m_config.headless && m_config.maxFrames == 0) {
                throw cpptrace::logic_error("headless run needs a frame limit");
            }

            loadConfig();

            if (!m_config.headless) {
                m_window.emplace(m_config.title, m_config.width, m_config.height, m_config.windowFlags);
            }

            onInit();
            m_timer.reset();
            m_framePacer.reset();

            while (shouldKeepRunning())
            {
                MINIR_PROFILE_FRAME("Main Loop");

                if (m_window) {
                    m_window->processEvents([this](const SDL_Event& e) { onEvent(e); });
                    if (!m_window->isRunning()) {
                        break;
                    }
                }

                const float deltaTime = m_timer.tick();

                {
                    MINIR_PROFILE_SCOPE("Update");
                    onUpdate(deltaTime);
                }

                auto renderStart = std::chrono::steady_clock::now();
                {
                    MINIR_PROFILE_SCOPE("Render");
                    m_backend->beginFrame();
                    onRenderFrame(deltaTime);
                    m_backend->endFrame();
                }
                std::chrono::duration<float, std::milli> renderMs = std::chrono::steady_clock::now() - renderStart;
                if (renderMs.count() > 20.0F) {
                    Log::warn("Slow frame {}: render took {:.2f}ms", m_timer.frameCount(), renderMs.count());
                }

                // Headless runs are bounded by maxFrames and stay uncapped.
                m_framePacer.paceFrame(m_window ? app_max_fps.get() : 0.0);
            }

            onShutdown();
            saveConfig();
            Log::info("Exiting after {} frame(s), avg {:.1f} FPS", m_timer.frameCount(), m_timer.averageFps());
            return 0;
        }
        catch (const cpptrace::exception& e)
        {
            Log::critical("Unhandled cpptrace exception: {}", e.what());
            e.trace().print();
            return 1;
        }
        catch (const std::exception& e)
        {
            Log::critical("Unhandled exception: {}", e.what());
            cpptrace::generate_trace().print();
            return 1;
        }
    }

    void Application::onInit() {}
    void Application::onUpdate(float dt) { (void)dt; }
    void Application::onEvent(const SDL_Event& event) { (void)event; }
    void Application::onRenderFrame(float dt) { (void)dt; }
    void Application::onShutdown() {}
}
