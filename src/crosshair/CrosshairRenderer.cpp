#include "kl/crosshair/CrosshairRenderer.hpp"

#include <algorithm>

namespace kl {

CrosshairStyle crosshairStyleFromTheme(const Theme& theme) {
  CrosshairStyle s;
  copyColor(s.lineColor, theme.crosshairColor);
  copyColor(s.highlightColor, theme.highlightColor);
  s.highlightOpacity = theme.highlightOpacity;
  return s;
}

void CrosshairRenderer::draw(DrawingSurface& surface, const LayoutRect& chartArea) const {
  if (!crosshair_.isVisible()) return;
  const CrosshairState& st = crosshair_.state();

  surface.save();
  surface.setClip(chartArea.x, chartArea.y, chartArea.width, chartArea.height);
  surface.translate(chartArea.x, chartArea.y);

  // Highlight band first so the lines stay on top.
  if (st.candle) {
    double span = viewport_.timeSpan();
    if (span > 0.0) {
      const CandleSeries* series = crosshair_.series();
      double count = series ? static_cast<double>(std::max<std::size_t>(1, series->length())) : 50.0;
      double avgDuration = span / count;
      double w = std::max(2.0, avgDuration / span * chartArea.width * 0.8);
      double cx = viewport_.xScale(static_cast<double>(st.candle->ts));

      surface.save();
      surface.setGlobalAlpha(style_.highlightOpacity);
      surface.fillRect(cx - w / 2.0, 0.0, w, chartArea.height, style_.highlightColor);
      surface.restore();
    }
  }

  surface.setLineDash(style_.lineDash);
  if (st.x >= 0.0 && st.x <= chartArea.width) {
    surface.beginPath();
    surface.moveTo(st.x, 0.0);
    surface.lineTo(st.x, chartArea.height);
    surface.stroke(style_.lineColor, style_.lineWidth);
  }
  if (st.y >= 0.0 && st.y <= chartArea.height) {
    surface.beginPath();
    surface.moveTo(0.0, st.y);
    surface.lineTo(chartArea.width, st.y);
    surface.stroke(style_.lineColor, style_.lineWidth);
  }
  surface.setLineDash({});

  surface.restore();
}

} // namespace kl
