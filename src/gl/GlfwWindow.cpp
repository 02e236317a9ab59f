#ifdef KL_HAS_GLFW

#include "kl/gl/GlfwWindow.hpp"
#include "kl/render/RasterSurface.hpp"

#include <GLFW/glfw3.h>
#include <cstdio>

namespace kl {

GlfwWindow::~GlfwWindow() {
  if (window_) {
    glfwDestroyWindow(window_);
    glfwTerminate();
  }
}

bool GlfwWindow::init(int width, int height, const std::string& title) {
  if (!glfwInit()) {
    std::fprintf(stderr, "GlfwWindow: glfwInit failed\n");
    return false;
  }

  glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 2);
  glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 1);
  glfwWindowHint(GLFW_RESIZABLE, GLFW_FALSE);

  window_ = glfwCreateWindow(width, height, title.c_str(), nullptr, nullptr);
  if (!window_) {
    std::fprintf(stderr, "GlfwWindow: glfwCreateWindow failed\n");
    glfwTerminate();
    return false;
  }

  glfwMakeContextCurrent(window_);
  glfwSwapInterval(1);

  width_ = width;
  height_ = height;

  glfwSetWindowUserPointer(window_, this);
  glfwSetScrollCallback(window_, scrollCallback);
  glfwSetCursorPosCallback(window_, cursorPosCallback);
  glfwSetCursorEnterCallback(window_, cursorEnterCallback);
  glfwSetMouseButtonCallback(window_, mouseButtonCallback);

  glfwGetCursorPos(window_, &cursorX_, &cursorY_);
  return true;
}

void GlfwWindow::present(const RasterSurface& surface) {
  if (!window_) return;

  int fbW = 0, fbH = 0;
  glfwGetFramebufferSize(window_, &fbW, &fbH);
  glViewport(0, 0, fbW, fbH);
  glClearColor(0.0f, 0.0f, 0.0f, 1.0f);
  glClear(GL_COLOR_BUFFER_BIT);

  // Surface rows are top-down; GL raster origin is bottom-left.
  float scaleX = surface.width() > 0 ? static_cast<float>(fbW) / static_cast<float>(surface.width()) : 1.0f;
  float scaleY = surface.height() > 0 ? static_cast<float>(fbH) / static_cast<float>(surface.height()) : 1.0f;
  glMatrixMode(GL_PROJECTION);
  glLoadIdentity();
  glMatrixMode(GL_MODELVIEW);
  glLoadIdentity();
  glRasterPos2f(-1.0f, 1.0f);
  glPixelZoom(scaleX, -scaleY);
  glPixelStorei(GL_UNPACK_ALIGNMENT, 1);
  glDrawPixels(surface.width(), surface.height(), GL_RGBA, GL_UNSIGNED_BYTE,
               surface.pixels().data());

  glfwSwapBuffers(window_);
}

void GlfwWindow::pollEvents() {
  glfwPollEvents();
}

bool GlfwWindow::shouldClose() const {
  return !window_ || glfwWindowShouldClose(window_);
}

void GlfwWindow::emit(const ChartEvent& ev) {
  if (onEvent_) onEvent_(ev);
}

ChartEvent GlfwWindow::baseEvent(EventType type) const {
  ChartEvent ev;
  ev.type = type;
  ev.chartX = cursorX_;
  ev.chartY = cursorY_;
  ev.shiftKey = (mods_ & GLFW_MOD_SHIFT) != 0;
  ev.ctrlKey = (mods_ & GLFW_MOD_CONTROL) != 0;
  ev.altKey = (mods_ & GLFW_MOD_ALT) != 0;
  ev.metaKey = (mods_ & GLFW_MOD_SUPER) != 0;
  return ev;
}

void GlfwWindow::scrollCallback(GLFWwindow* w, double xoff, double yoff) {
  auto* self = static_cast<GlfwWindow*>(glfwGetWindowUserPointer(w));
  if (!self) return;
  ChartEvent ev = self->baseEvent(EventType::Wheel);
  // One notch is reported as 100 px of wheel delta, scrolling down positive.
  ev.deltaX = -xoff * 100.0;
  ev.deltaY = -yoff * 100.0;
  self->emit(ev);
}

void GlfwWindow::cursorPosCallback(GLFWwindow* w, double x, double y) {
  auto* self = static_cast<GlfwWindow*>(glfwGetWindowUserPointer(w));
  if (!self) return;
  self->cursorX_ = x;
  self->cursorY_ = y;
  self->emit(self->baseEvent(EventType::PointerMove));
}

void GlfwWindow::cursorEnterCallback(GLFWwindow* w, int entered) {
  auto* self = static_cast<GlfwWindow*>(glfwGetWindowUserPointer(w));
  if (!self || entered) return;
  self->emit(self->baseEvent(EventType::MouseLeave));
}

void GlfwWindow::mouseButtonCallback(GLFWwindow* w, int button, int action, int mods) {
  auto* self = static_cast<GlfwWindow*>(glfwGetWindowUserPointer(w));
  if (!self) return;

  self->mods_ = mods;
  ChartEvent ev = self->baseEvent(action == GLFW_PRESS ? EventType::PointerDown : EventType::PointerUp);
  switch (button) {
    case GLFW_MOUSE_BUTTON_LEFT:   ev.button = 0; break;
    case GLFW_MOUSE_BUTTON_MIDDLE: ev.button = 1; break;
    case GLFW_MOUSE_BUTTON_RIGHT:  ev.button = 2; break;
    default:                       ev.button = button; break;
  }
  self->emit(ev);
}

} // namespace kl

#endif // KL_HAS_GLFW
