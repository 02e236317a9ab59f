#include "kl/plugins/MovingAveragePlugin.hpp"
#include "kl/chart/Chart.hpp"
#include "kl/math/Indicators.hpp"

#include <algorithm>
#include <cmath>
#include <memory>
#include <vector>

namespace kl {

namespace {

struct MovingAverageState {
  MovingAverageConfig config;
  Chart* chart{nullptr};
};

const double* fieldColumn(const DataView& view, PriceField f) {
  switch (f) {
    case PriceField::Open:  return view.open;
    case PriceField::High:  return view.high;
    case PriceField::Low:   return view.low;
    case PriceField::Close: return view.close;
  }
  return view.close;
}

void drawMovingAverage(const MovingAverageState& st, const PluginContext& ctx) {
  const CandleSeries* series = st.chart->primarySeries();
  if (!series || series->empty() || st.config.period < 1) return;

  const Viewport& vp = st.chart->viewport();
  const LayoutRect& area = ctx.layout->chartArea;
  DrawingSurface& s = *ctx.surface;

  // Visible candles plus the warm-up window and one point past each edge
  // so the line reaches the plot borders.
  auto first = static_cast<std::ptrdiff_t>(
      series->firstIndexAtOrAfter(static_cast<std::int64_t>(std::ceil(vp.timeRange().start))));
  std::ptrdiff_t last =
      series->lastIndexAtOrBefore(static_cast<std::int64_t>(std::floor(vp.timeRange().end)));
  if (last < first) return;
  std::ptrdiff_t lo = std::max<std::ptrdiff_t>(0, first - st.config.period);
  DataView view = series->rangeByIndex(lo, last + 2);
  if (view.empty()) return;

  std::vector<double> sma = computeSMA(fieldColumn(view, st.config.source), view.length, st.config.period);

  float color[4];
  if (st.config.color) {
    for (int i = 0; i < 4; i++) color[i] = (*st.config.color)[i];
  } else {
    int idx = ((st.config.colorIndex % 4) + 4) % 4;
    copyColor(color, st.chart->theme().overlayColors[idx]);
  }

  s.save();
  s.setClip(area.x, area.y, area.width, area.height);
  s.translate(area.x, area.y);
  s.beginPath();
  bool penDown = false;
  for (std::size_t i = 0; i < view.length; i++) {
    if (std::isnan(sma[i])) continue;
    double x = vp.xScale(static_cast<double>(view.ts[i]));
    double y = vp.yScale(sma[i]);
    if (!penDown) {
      s.moveTo(x, y);
      penDown = true;
    } else {
      s.lineTo(x, y);
    }
  }
  if (penDown) s.stroke(color, st.config.lineWidth);
  s.restore();
}

} // anonymous namespace

Plugin makeMovingAveragePlugin(const MovingAverageConfig& config) {
  auto state = std::make_shared<MovingAverageState>();
  state->config = config;

  Plugin p;
  p.name = config.name.empty() ? "ma-" + std::to_string(config.period) : config.name;
  p.onInstall = [state](Chart& chart) { state->chart = &chart; };
  p.onUninstall = [state](Chart&) { state->chart = nullptr; };
  p.onRender = [state](const PluginContext& ctx) {
    if (ctx.phase != RenderPhase::AfterCandles || !state->chart) return;
    drawMovingAverage(*state, ctx);
  };
  return p;
}

} // namespace kl
