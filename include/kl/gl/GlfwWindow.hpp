#pragma once

#ifdef KL_HAS_GLFW

#include "kl/events/ChartEvent.hpp"

#include <functional>
#include <string>

struct GLFWwindow;

namespace kl {

class RasterSurface;

// Desktop window that shows a RasterSurface and forwards mouse input as
// ChartEvents. Uses a compatibility GL context and glDrawPixels, so no
// extension loader is needed.
class GlfwWindow {
public:
  using EventFn = std::function<void(const ChartEvent&)>;

  GlfwWindow() = default;
  ~GlfwWindow();

  GlfwWindow(const GlfwWindow&) = delete;
  GlfwWindow& operator=(const GlfwWindow&) = delete;

  bool init(int width, int height, const std::string& title = "KlineEngine");

  void setEventHandler(EventFn fn) { onEvent_ = std::move(fn); }

  // Blits the surface (top-down RGBA8) and swaps.
  void present(const RasterSurface& surface);

  void pollEvents();
  bool shouldClose() const;

  int width() const { return width_; }
  int height() const { return height_; }

private:
  void emit(const ChartEvent& ev);
  ChartEvent baseEvent(EventType type) const;

  GLFWwindow* window_{nullptr};
  int width_{0};
  int height_{0};

  double cursorX_{0};
  double cursorY_{0};
  int mods_{0};
  EventFn onEvent_;

  static void scrollCallback(GLFWwindow* w, double xoff, double yoff);
  static void cursorPosCallback(GLFWwindow* w, double x, double y);
  static void cursorEnterCallback(GLFWwindow* w, int entered);
  static void mouseButtonCallback(GLFWwindow* w, int button, int action, int mods);
};

} // namespace kl

#endif // KL_HAS_GLFW
