#include "minir/platform/window.hpp"
#include "minir/core/logger.hpp"
#include <cpptrace/cpptrace.hpp>
#include <format>

namespace minir::platform
{
    Window::Window(const std::string& title, int width, int height, SDL_WindowFlags flags)
        : m_width(width), m_height(height)
    {
        if (!SDL_InitSubSystem(SDL_INIT_VIDEO))
        {
            throw cpptrace::runtime_error(std::format("SDL video init failed: {}", SDL_GetError()));
        }

        m_handle.reset(SDL_CreateWindow(title.c_str(), width, height, flags));
        if (!m_handle)
        {
            const std::string reason = SDL_GetError();
            SDL_QuitSubSystem(SDL_INIT_VIDEO);
            throw cpptrace::runtime_error(std::format("cannot open {}x{} window '{}': {}",
                                                      width, height, title, reason));
        }

        core::Logger::Platform.info("Opened '{}' ({}x{})", title, width, height);
    }

    Window::~Window()
    {
        m_handle.reset();
        SDL_QuitSubSystem(SDL_INIT_VIDEO);
        SDL_Quit();
    }

    void Window::processEvents(const EventCallback& callback)
    {
        SDL_Event event;
        while (SDL_PollEvent(&event))
        {
            if (event.type == SDL_EVENT_QUIT || event.type == SDL_EVENT_WINDOW_CLOSE_REQUESTED)
            {
                m_running = false;
            }
            else if (event.type == SDL_EVENT_WINDOW_RESIZED)
            {
                m_width = event.window.data1;
                m_height = event.window.data2;
                core::Logger::Platform.debug("Resized to {}x{}", m_width, m_height);
            }

            if (callback)
            {
                callback(event);
            }
        }
    }

    void Window::setTitle(const std::string& title) const
    {
        if (!SDL_SetWindowTitle(m_handle.get(), title.c_str()))
        {
            core::Logger::Platform.warn("SDL_SetWindowTitle failed: {}", SDL_GetError());
        }
    }

    float Window::aspectRatio() const noexcept
    {
        return m_height > 0 ? static_cast<float>(m_width) / static_cast<float>(m_height) : 1.0f;
    }
}
