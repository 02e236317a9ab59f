#include "kl/drawing/CandleRenderer.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

namespace kl {

CandleStyle candleStyleFromTheme(const Theme& theme) {
  CandleStyle s;
  copyColor(s.up, theme.candleUp);
  copyColor(s.down, theme.candleDown);
  return s;
}

double CandleRenderer::bodyWidth(const Viewport& vp, const DataView& view,
                                 double fallbackIntervalMs) const {
  double span = vp.timeSpan();
  if (view.empty() || span <= 0.0 || vp.width() <= 0.0) return 0.0;

  double interval;
  if (view.length >= 2) {
    interval = static_cast<double>(view.ts[view.length - 1] - view.ts[0]) /
               static_cast<double>(view.length - 1);
  } else {
    interval = fallbackIntervalMs > 0.0 ? fallbackIntervalMs : span;
  }
  double raw = interval / span * vp.width();
  return std::max(style_.minBodyWidth, std::min(style_.maxBodyWidth, raw * (1.0 - style_.spacing)));
}

double CandleRenderer::draw(DrawingSurface& surface, const Viewport& vp, const DataView& view,
                            double fallbackIntervalMs) const {
  double bw = bodyWidth(vp, view, fallbackIntervalMs);
  if (bw <= 0.0) return 0.0;

  const std::size_t n = view.length;
  std::vector<double> xs(n), yOpen(n), yClose(n), yHigh(n), yLow(n);
  std::vector<std::uint8_t> up(n);
  for (std::size_t i = 0; i < n; i++) {
    xs[i] = vp.xScale(static_cast<double>(view.ts[i]));
    yOpen[i] = vp.yScale(view.open[i]);
    yClose[i] = vp.yScale(view.close[i]);
    yHigh[i] = vp.yScale(view.high[i]);
    yLow[i] = vp.yScale(view.low[i]);
    up[i] = view.close[i] >= view.open[i] ? 1 : 0;
  }

  // Wicks: one path per color, centered on the pixel column.
  for (int pass = 0; pass < 2; pass++) {
    bool wantUp = pass == 0;
    surface.beginPath();
    bool any = false;
    for (std::size_t i = 0; i < n; i++) {
      if ((up[i] != 0) != wantUp) continue;
      double wx = std::floor(xs[i]) + 0.5;
      surface.moveTo(wx, yHigh[i]);
      surface.lineTo(wx, yLow[i]);
      any = true;
    }
    if (any) surface.stroke(wantUp ? style_.up : style_.down, style_.wickWidth);
  }

  // Bodies. Doji bodies still get one pixel of height.
  for (int pass = 0; pass < 2; pass++) {
    bool wantUp = pass == 0;
    const float* color = wantUp ? style_.up : style_.down;
    for (std::size_t i = 0; i < n; i++) {
      if ((up[i] != 0) != wantUp) continue;
      double bx = std::floor(xs[i] - bw / 2.0);
      double by = std::min(yOpen[i], yClose[i]);
      double bh = std::fabs(yClose[i] - yOpen[i]);
      surface.fillRect(bx, by, bw, std::max(bh, 1.0), color);
    }
  }

  if (onDrawCandle_) {
    for (std::size_t i = 0; i < n; i++) {
      CandleDrawInfo info;
      info.index = i;
      info.ts = view.ts[i];
      info.open = view.open[i];
      info.high = view.high[i];
      info.low = view.low[i];
      info.close = view.close[i];
      if (view.meta && view.meta[i]) info.meta = &*view.meta[i];
      info.x = xs[i];
      info.yOpen = yOpen[i];
      info.yClose = yClose[i];
      info.yHigh = yHigh[i];
      info.yLow = yLow[i];
      info.bodyWidth = bw;
      info.color = up[i] ? style_.up : style_.down;
      info.surface = &surface;
      onDrawCandle_(info);
    }
  }
  return bw;
}

} // namespace kl
