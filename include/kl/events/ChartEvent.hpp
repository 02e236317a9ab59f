#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace kl {

enum class EventType : std::uint8_t {
  PointerDown,
  PointerMove,
  PointerUp,
  PointerCancel,
  Wheel,
  MouseLeave,
  Click,
  DblClick
};

// Normalized input event. chartX/chartY are canvas pixels, 0 = left/top.
// NOT window-system specific: hosts convert their own events into this.
struct ChartEvent {
  EventType type{EventType::PointerMove};
  double chartX{0}, chartY{0};
  double deltaX{0}, deltaY{0}; // wheel only
  int button{0};               // 0 = primary
  bool shiftKey{false};
  bool ctrlKey{false};
  bool altKey{false};
  bool metaKey{false};
};

enum class WheelMode : std::uint8_t {
  ZoomX,   // wheel zooms the time axis
  ScrollX, // wheel scrolls the time axis
  Blend    // horizontal wheel scrolls, vertical wheel zooms
};

struct InteractionOptions {
  bool enablePan{true};
  bool enableZoom{true};
  bool enableCrosshair{true};
  WheelMode wheelMode{WheelMode::ZoomX};
  double minVisibleBars{10};
  double maxVisibleBars{1000};
  double zoomSpeed{1.0};
};

const char* eventTypeName(EventType type);
const char* wheelModeName(WheelMode mode);

// "zoomX" / "scrollX" / "blend"
std::optional<WheelMode> parseWheelMode(const std::string& text);

} // namespace kl
