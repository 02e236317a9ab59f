#include "kl/drawing/VolumeRenderer.hpp"

#include <algorithm>
#include <cmath>

namespace kl {

VolumeStyle volumeStyleFromTheme(const Theme& theme) {
  VolumeStyle s;
  copyColor(s.up, theme.volumeUp);
  copyColor(s.down, theme.volumeDown);
  return s;
}

std::size_t VolumeRenderer::draw(DrawingSurface& surface, const Viewport& vp, const DataView& view,
                                 double areaHeight, double barWidth) const {
  if (view.empty() || !view.volume || areaHeight <= 0.0 || barWidth <= 0.0) return 0;

  double maxVol = 0.0;
  for (std::size_t i = 0; i < view.length; i++) {
    if (view.hasVolume(i)) maxVol = std::max(maxVol, view.volume[i]);
  }
  if (maxVol <= 0.0) return 0;

  std::size_t drawn = 0;
  for (std::size_t i = 0; i < view.length; i++) {
    if (!view.hasVolume(i)) continue;
    double h = view.volume[i] / maxVol * areaHeight;
    if (h <= 0.0) continue;
    double x = std::floor(vp.xScale(static_cast<double>(view.ts[i])) - barWidth / 2.0);
    const float* color = view.close[i] >= view.open[i] ? style_.up : style_.down;
    surface.fillRect(x, areaHeight - h, barWidth, h, color);
    drawn++;
  }
  return drawn;
}

} // namespace kl
