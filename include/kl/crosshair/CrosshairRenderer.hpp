#pragma once
#include "kl/crosshair/Crosshair.hpp"
#include "kl/layout/LayoutManager.hpp"
#include "kl/render/DrawingSurface.hpp"
#include "kl/style/Theme.hpp"

#include <vector>

namespace kl {

struct CrosshairStyle {
  float lineColor[4] = {0.533f, 0.533f, 0.533f, 1.0f}; // #888888
  double lineWidth{1.0};
  std::vector<double> lineDash{4.0, 4.0};
  float highlightColor[4] = {1.0f, 1.0f, 1.0f, 1.0f};
  double highlightOpacity{0.1};
};

CrosshairStyle crosshairStyleFromTheme(const Theme& theme);

// Dashed cross lines plus a translucent band over the snapped candle, drawn
// inside the plot area only.
class CrosshairRenderer {
public:
  CrosshairRenderer(const Crosshair& crosshair, const Viewport& viewport)
    : crosshair_(crosshair), viewport_(viewport) {}

  void setStyle(const CrosshairStyle& style) { style_ = style; }
  const CrosshairStyle& style() const { return style_; }

  void draw(DrawingSurface& surface, const LayoutRect& chartArea) const;

private:
  const Crosshair& crosshair_;
  const Viewport& viewport_;
  CrosshairStyle style_;
};

} // namespace kl
