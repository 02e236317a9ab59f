#pragma once
#include "kl/events/ChartEvent.hpp"
#include "kl/viewport/Viewport.hpp"

#include <functional>

namespace kl {

// Wheel scrolling along the time axis.
//   ZoomX:   never consumes the wheel (zoom handles it)
//   ScrollX: vertical wheel pans time
//   Blend:   horizontal wheel pans when it dominates, else falls through
class ScrollHandler {
public:
  using UpdateFn = std::function<void()>;

  // Fraction of the visible span per wheel unit.
  static constexpr double kScrollSpeed = 0.01;

  ScrollHandler(Viewport& viewport, WheelMode mode, UpdateFn onUpdate);

  void setWheelMode(WheelMode mode) { mode_ = mode; }
  WheelMode wheelMode() const { return mode_; }

  // True when the wheel was consumed as a scroll.
  bool onWheel(const ChartEvent& ev);

  // Pan by a fraction of the visible span.
  void scrollLeft(double amount = 0.1);
  void scrollRight(double amount = 0.1);

private:
  void scrollTime(double delta);

  Viewport& viewport_;
  WheelMode mode_;
  UpdateFn onUpdate_;
};

} // namespace kl
