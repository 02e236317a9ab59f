#pragma once
#include "kl/data/Candle.hpp"
#include "kl/layout/LayoutManager.hpp"
#include "kl/plugins/Plugin.hpp"

#include <string>
#include <vector>

namespace kl {

struct TooltipStyle {
  double padding{8};
  double lineHeight{16};
  double offset{10}; // distance from the cursor
  double fontPx{0};  // 0: theme font size
  bool utc{true};
};

// OHLCV box next to the crosshair, drawn after everything else while the
// crosshair is snapped to a candle.
Plugin makeCrosshairTooltipPlugin(const TooltipStyle& style = {});

// 1234 -> "1.23K", 2500000 -> "2.50M"; below 1000 rounds to an integer.
std::string formatVolume(double volume);

// "2024-01-15 14:30", "O: 101.25", ... "V: 1.20M" (volume only when present).
std::vector<std::string> tooltipLines(const Candle& candle, bool utc = true);

// Box of size w x h placed right/below the cursor, flipped to the other
// side when it would cross the area edge, then clamped inside the area.
LayoutRect placeTooltip(double cursorX, double cursorY, double w, double h,
                        const LayoutRect& area, double offset);

} // namespace kl
