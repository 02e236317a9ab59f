#pragma once
#include "kl/data/CandleSeries.hpp"
#include "kl/render/DrawingSurface.hpp"
#include "kl/style/Theme.hpp"
#include "kl/viewport/Viewport.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <utility>

namespace kl {

struct CandleStyle {
  float up[4] = {0.063f, 0.725f, 0.506f, 1.0f};   // #10b981
  float down[4] = {0.937f, 0.267f, 0.267f, 1.0f}; // #ef4444
  double wickWidth{1.0};
  double minBodyWidth{1.0};
  double maxBodyWidth{20.0};
  double spacing{0.2}; // gap between bodies, fraction of the bar interval
};

CandleStyle candleStyleFromTheme(const Theme& theme);

// Geometry of one drawn candle, in plot-area pixels.
struct CandleDrawInfo {
  std::size_t index{0}; // index within the view
  std::int64_t ts{0};
  double open{0}, high{0}, low{0}, close{0};
  const CandleMeta* meta{nullptr};
  double x{0};
  double yOpen{0}, yClose{0}, yHigh{0}, yLow{0};
  double bodyWidth{0};
  const float* color{nullptr};
  DrawingSurface* surface{nullptr};
};

using CandleDrawCallback = std::function<void(const CandleDrawInfo&)>;

// Draws wicks and bodies for a view. Coordinates are relative to the plot
// area; callers translate the surface first.
class CandleRenderer {
public:
  CandleRenderer() = default;
  explicit CandleRenderer(const CandleStyle& style) : style_(style) {}

  void setStyle(const CandleStyle& style) { style_ = style; }
  const CandleStyle& style() const { return style_; }

  // Called once per candle after the batches are drawn. Empty disables it.
  void setOnDrawCandle(CandleDrawCallback cb) { onDrawCandle_ = std::move(cb); }

  // Body width in pixels. The bar interval is the view's mean timestamp
  // step; a single-candle view uses fallbackIntervalMs when positive, else
  // the whole visible span.
  double bodyWidth(const Viewport& vp, const DataView& view, double fallbackIntervalMs = 0.0) const;

  // Returns the body width used, or 0 when nothing was drawn.
  double draw(DrawingSurface& surface, const Viewport& vp, const DataView& view,
              double fallbackIntervalMs = 0.0) const;

private:
  CandleStyle style_;
  CandleDrawCallback onDrawCandle_;
};

} // namespace kl
