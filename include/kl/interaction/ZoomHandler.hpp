#pragma once
#include "kl/events/ChartEvent.hpp"
#include "kl/viewport/Viewport.hpp"

#include <functional>
#include <optional>

namespace kl {

// Wheel and programmatic zoom on the time axis. After every zoom the span is
// clamped to [minVisibleBars, maxVisibleBars] average candle durations and
// the window to the data bounds.
class ZoomHandler {
public:
  using UpdateFn = std::function<void()>;

  static constexpr double kStepFactor = 1.2;
  static constexpr double kDefaultMaxTime = 9007199254740991.0; // 2^53 - 1

  ZoomHandler(Viewport& viewport, const InteractionOptions& options, UpdateFn onUpdate);

  void setOptions(const InteractionOptions& options) { options_ = options; }
  const InteractionOptions& options() const { return options_; }

  void setDataBounds(double minTime, double maxTime, double avgCandleDuration);
  double minTime() const { return minTime_; }
  double maxTime() const { return maxTime_; }
  double avgCandleDuration() const { return avgDuration_; }

  // Negative deltaY zooms in. Returns false when zooming is disabled.
  bool onWheel(const ChartEvent& ev);

  // Centered on the plot middle unless centerX is given.
  void zoomIn(std::optional<double> centerX = std::nullopt);
  void zoomOut(std::optional<double> centerX = std::nullopt);

  // Shows the whole data range.
  void resetZoom();

private:
  void clampZoom();

  Viewport& viewport_;
  InteractionOptions options_;
  UpdateFn onUpdate_;

  double minTime_{0};
  double maxTime_{kDefaultMaxTime};
  double avgDuration_{60000}; // one minute until data says otherwise
};

} // namespace kl
