#include "kl/interaction/ScrollHandler.hpp"

#include <cmath>
#include <utility>

namespace kl {

ScrollHandler::ScrollHandler(Viewport& viewport, WheelMode mode, UpdateFn onUpdate)
    : viewport_(viewport), mode_(mode), onUpdate_(std::move(onUpdate)) {}

bool ScrollHandler::onWheel(const ChartEvent& ev) {
  switch (mode_) {
    case WheelMode::ZoomX:
      return false;
    case WheelMode::ScrollX:
      scrollTime(ev.deltaY);
      return true;
    case WheelMode::Blend:
      if (std::fabs(ev.deltaX) > std::fabs(ev.deltaY)) {
        scrollTime(ev.deltaX);
        return true;
      }
      return false;
  }
  return false;
}

void ScrollHandler::scrollTime(double delta) {
  viewport_.pan(delta * kScrollSpeed * viewport_.timeSpan());
  if (onUpdate_) onUpdate_();
}

void ScrollHandler::scrollLeft(double amount) {
  viewport_.pan(-amount * viewport_.timeSpan());
  if (onUpdate_) onUpdate_();
}

void ScrollHandler::scrollRight(double amount) {
  viewport_.pan(amount * viewport_.timeSpan());
  if (onUpdate_) onUpdate_();
}

} // namespace kl
