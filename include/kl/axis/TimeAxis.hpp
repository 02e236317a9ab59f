#pragma once
#include "kl/axis/AxisTick.hpp"
#include "kl/viewport/Viewport.hpp"

#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace kl {

using TimeFormatter = std::function<std::string(double ts)>;

// Horizontal time scale. Sub-month intervals tick on multiples of the
// interval; month, quarter and year intervals tick on UTC calendar
// boundaries.
class TimeAxis {
public:
  TimeAxis(const ViewTimeRange& range, double widthPx, double minTickSpacingPx = 80.0,
           TimeFormatter formatter = {});

  void setTimeRange(const ViewTimeRange& range) { range_ = range; }
  void setWidth(double widthPx) { widthPx_ = widthPx; }
  void setMinTickSpacing(double px) { minTickSpacingPx_ = px; }
  // Empty formatter restores interval-based labels.
  void setFormatter(TimeFormatter formatter) { formatter_ = std::move(formatter); }

  double scale(double ts) const;
  double invert(double px) const;

  std::vector<AxisTick> generateTicks() const;

  // Chosen interval in ms for the current range and width (0 if degenerate).
  double currentInterval() const;

  // Smallest ladder entry covering span / maxTicks, or an integer multiple
  // of the largest entry.
  static double findNiceInterval(double span, int maxTicks);

  const ViewTimeRange& timeRange() const { return range_; }
  double width() const { return widthPx_; }

private:
  std::string label(double ts, double interval) const;
  void calendarTicks(double interval, std::vector<AxisTick>& out) const;

  ViewTimeRange range_;
  double widthPx_;
  double minTickSpacingPx_;
  TimeFormatter formatter_;
};

} // namespace kl
