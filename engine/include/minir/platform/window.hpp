#pragma once

#include <SDL3/SDL.h>
#include <functional>
#include <memory>
#include <string>

namespace minir::platform {

// SDL3 window for the interactive demo. Owns SDL video init for its lifetime.
class Window {
public:
  using EventCallback = std::function<void(const SDL_Event &)>;

  Window(const std::string &title, int width, int height, SDL_WindowFlags flags = 0);
  ~Window();

  Window(const Window &) = delete;
  Window &operator=(const Window &) = delete;

  // Forwards every pending event to the callback. Quit and close requests
  // clear isRunning(); resizes refresh the cached size.
  void processEvents(const EventCallback &callback);

  [[nodiscard]] bool isRunning() const noexcept { return m_running; }
  void requestClose() noexcept { m_running = false; }

  void setTitle(const std::string &title) const;

  [[nodiscard]] int width() const noexcept { return m_width; }
  [[nodiscard]] int height() const noexcept { return m_height; }
  [[nodiscard]] float aspectRatio() const noexcept;

private:
  struct Destroy {
    void operator()(SDL_Window *w) const noexcept { SDL_DestroyWindow(w); }
  };

  std::unique_ptr<SDL_Window, Destroy> m_handle;
  int m_width = 0;
  int m_height = 0;
  bool m_running = true;
};

}
