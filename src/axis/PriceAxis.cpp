#include "kl/axis/PriceAxis.hpp"

#include <cmath>
#include <cstdio>
#include <utility>

namespace kl {

std::string defaultPriceFormatter(double price) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.2f", price);
  return buf;
}

PriceAxis::PriceAxis(const PriceRange& range, double heightPx, double paddingPx,
                     double minTickSpacingPx, PriceFormatter formatter)
    : range_(range), heightPx_(heightPx), paddingPx_(paddingPx),
      minTickSpacingPx_(minTickSpacingPx) {
  setFormatter(std::move(formatter));
}

void PriceAxis::setFormatter(PriceFormatter formatter) {
  formatter_ = formatter ? std::move(formatter) : PriceFormatter(defaultPriceFormatter);
}

double PriceAxis::scale(double price) const {
  double span = range_.max - range_.min;
  if (span == 0.0) return heightPx_ / 2.0;
  double avail = heightPx_ - 2.0 * paddingPx_;
  return paddingPx_ + avail * (1.0 - (price - range_.min) / span);
}

double PriceAxis::invert(double px) const {
  double avail = heightPx_ - 2.0 * paddingPx_;
  if (avail == 0.0) return (range_.min + range_.max) / 2.0;
  double normalized = 1.0 - (px - paddingPx_) / avail;
  return range_.min + normalized * (range_.max - range_.min);
}

double PriceAxis::findNiceInterval(double span, int maxTicks) {
  static const double kSteps[] = {1.0, 2.0, 2.5, 5.0};

  double minInterval = span / static_cast<double>(maxTicks);
  double mag = std::pow(10.0, std::floor(std::log10(minInterval)));
  for (double step : kSteps) {
    if (step * mag >= minInterval) return step * mag;
  }
  return 10.0 * mag;
}

std::vector<AxisTick> PriceAxis::generateTicks() const {
  std::vector<AxisTick> ticks;

  double avail = heightPx_ - 2.0 * paddingPx_;
  double span = range_.max - range_.min;
  if (avail <= 0.0 || span <= 0.0 || minTickSpacingPx_ <= 0.0) return ticks;

  int maxTicks = static_cast<int>(std::floor(avail / minTickSpacingPx_));
  if (maxTicks <= 0) return ticks;

  double interval = findNiceInterval(span, maxTicks);
  if (!(interval > 0.0) || !std::isfinite(interval)) return ticks;

  // Integer multiples avoid accumulated floating error.
  double k = std::ceil(range_.min / interval);
  for (; k * interval <= range_.max + interval * 1e-9; k += 1.0) {
    double value = k * interval;
    if (value == 0.0) value = 0.0; // drop negative zero
    ticks.push_back(AxisTick{value, scale(value), formatter_(value)});
  }
  return ticks;
}

} // namespace kl
