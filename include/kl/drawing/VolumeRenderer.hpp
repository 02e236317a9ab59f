#pragma once
#include "kl/data/CandleSeries.hpp"
#include "kl/render/DrawingSurface.hpp"
#include "kl/style/Theme.hpp"
#include "kl/viewport/Viewport.hpp"

namespace kl {

struct VolumeStyle {
  float up[4] = {0.063f, 0.725f, 0.506f, 0.5f};
  float down[4] = {0.937f, 0.267f, 0.267f, 0.5f};
};

VolumeStyle volumeStyleFromTheme(const Theme& theme);

// Volume bars anchored to the bottom of a strip of height `areaHeight`,
// scaled to the largest volume in the view. x positions come from the plot
// viewport; the strip shares its horizontal extent. Candles without volume
// are skipped.
class VolumeRenderer {
public:
  VolumeRenderer() = default;
  explicit VolumeRenderer(const VolumeStyle& style) : style_(style) {}

  void setStyle(const VolumeStyle& style) { style_ = style; }
  const VolumeStyle& style() const { return style_; }

  // Returns the number of bars drawn.
  std::size_t draw(DrawingSurface& surface, const Viewport& vp, const DataView& view,
                   double areaHeight, double barWidth) const;

private:
  VolumeStyle style_;
};

} // namespace kl
