#include "kl/events/ChartEvent.hpp"

namespace kl {

const char* eventTypeName(EventType type) {
  switch (type) {
    case EventType::PointerDown:   return "pointerdown";
    case EventType::PointerMove:   return "pointermove";
    case EventType::PointerUp:     return "pointerup";
    case EventType::PointerCancel: return "pointercancel";
    case EventType::Wheel:         return "wheel";
    case EventType::MouseLeave:    return "mouseleave";
    case EventType::Click:         return "click";
    case EventType::DblClick:      return "dblclick";
  }
  return "unknown";
}

const char* wheelModeName(WheelMode mode) {
  switch (mode) {
    case WheelMode::ZoomX:   return "zoomX";
    case WheelMode::ScrollX: return "scrollX";
    case WheelMode::Blend:   return "blend";
  }
  return "unknown";
}

std::optional<WheelMode> parseWheelMode(const std::string& text) {
  if (text == "zoomX") return WheelMode::ZoomX;
  if (text == "scrollX") return WheelMode::ScrollX;
  if (text == "blend") return WheelMode::Blend;
  return std::nullopt;
}

} // namespace kl
