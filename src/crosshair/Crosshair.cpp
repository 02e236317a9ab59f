#include "kl/crosshair/Crosshair.hpp"

#include <cmath>
#include <limits>

namespace kl {

void Crosshair::onPointerMove(const ChartEvent& ev) {
  state_.x = ev.chartX;
  state_.y = ev.chartY;
  state_.visible = true;
  state_.time = viewport_.invX(ev.chartX);
  state_.price = viewport_.invY(ev.chartY);

  state_.candleIndex = snapIndex(state_.time);
  if (state_.candleIndex) {
    state_.candle = series_->candleAt(*state_.candleIndex);
  } else {
    state_.candle.reset();
  }
}

std::optional<std::size_t> Crosshair::snapIndex(double time) const {
  if (!series_ || series_->empty() || !std::isfinite(time)) return std::nullopt;

  const ViewTimeRange& range = viewport_.timeRange();
  auto t0 = static_cast<std::int64_t>(std::ceil(range.start));
  auto t1 = static_cast<std::int64_t>(std::floor(range.end));
  DataView visible = series_->rangeByTime(t0, t1);
  if (visible.empty()) return std::nullopt;

  auto target = static_cast<std::int64_t>(std::llround(time));
  std::size_t idx = series_->firstIndexAtOrAfter(target);

  std::optional<std::size_t> best;
  double bestDist = std::numeric_limits<double>::max();
  auto consider = [&](std::size_t i) {
    if (i < visible.startIndex || i >= visible.endIndex) return;
    double d = std::fabs(static_cast<double>(series_->timestampAt(i)) - time);
    if (d < bestDist) {
      bestDist = d;
      best = i;
    }
  };
  consider(idx);
  if (idx > 0) consider(idx - 1);
  consider(idx + 1);
  return best;
}

} // namespace kl
