#pragma once
#include "kl/data/CandleSeries.hpp"
#include "kl/events/ChartEvent.hpp"
#include "kl/viewport/Viewport.hpp"

#include <cstddef>
#include <optional>

namespace kl {

struct CrosshairState {
  double x{0}, y{0};       // plot-area pixels
  double time{0}, price{0}; // domain values under the pointer
  std::optional<Candle> candle;
  std::optional<std::size_t> candleIndex;
  bool visible{false};
};

// Pointer tracking with snapping to the nearest visible candle.
class Crosshair {
public:
  explicit Crosshair(const Viewport& viewport) : viewport_(viewport) {}

  // Series to snap to. Null disables snapping.
  void setSeries(const CandleSeries* series) { series_ = series; }
  const CandleSeries* series() const { return series_; }

  // Event coordinates are plot-area pixels.
  void onPointerMove(const ChartEvent& ev);
  void hide() { state_.visible = false; }

  const CrosshairState& state() const { return state_; }
  bool isVisible() const { return state_.visible; }

  // Index of the visible candle closest in time to `time`, if any.
  std::optional<std::size_t> snapIndex(double time) const;

private:
  const Viewport& viewport_;
  const CandleSeries* series_{nullptr};
  CrosshairState state_;
};

} // namespace kl
