#include "kl/viewport/Viewport.hpp"

#include <algorithm>
#include <cmath>

namespace kl {

Viewport::Viewport(const ViewportConfig& cfg) {
  setConfig(cfg);
}

void Viewport::setConfig(const ViewportConfig& cfg) {
  time_ = cfg.time;
  price_ = cfg.price;
  width_ = cfg.width;
  height_ = cfg.height;
}

void Viewport::setTimeRange(double start, double end) {
  time_.start = start;
  time_.end = end;
}

void Viewport::setDimensions(double width, double height) {
  width_ = width;
  height_ = height;
}

// ---- Coordinate mapping ----

double Viewport::xScale(double ts) const {
  double span = time_.end - time_.start;
  if (span == 0.0) return 0.0;
  return (ts - time_.start) / span * width_;
}

double Viewport::yScale(double price) const {
  double span = price_.max - price_.min;
  if (span == 0.0) return height_ / 2.0;
  double normalized = (price - price_.min) / span;
  // Higher prices map to smaller y.
  return price_.paddingPx + availableHeight() * (1.0 - normalized);
}

double Viewport::invX(double px) const {
  if (width_ == 0.0) return time_.start;
  return time_.start + px / width_ * (time_.end - time_.start);
}

double Viewport::invY(double py) const {
  double avail = availableHeight();
  if (avail == 0.0) return (price_.min + price_.max) / 2.0;
  double normalized = 1.0 - (py - price_.paddingPx) / avail;
  return price_.min + normalized * (price_.max - price_.min);
}

// ---- Navigation ----

void Viewport::pan(double timeDelta, double priceDelta) {
  time_.start += timeDelta;
  time_.end += timeDelta;
  if (priceDelta != 0.0) {
    price_.min += priceDelta;
    price_.max += priceDelta;
  }
}

void Viewport::zoom(double factor, double centerX) {
  if (!(factor > 0.0) || !std::isfinite(factor)) return;

  double centerTime = invX(centerX);
  double span = time_.end - time_.start;
  double newSpan = span / factor;

  // Keep the same before/after split around the pivot so that
  // invX(centerX) is unchanged.
  double ratio = span != 0.0 ? (centerTime - time_.start) / span
                             : (width_ != 0.0 ? centerX / width_ : 0.5);
  time_.start = centerTime - newSpan * ratio;
  time_.end = time_.start + newSpan;
}

void Viewport::clampTimeRange(double minTime, double maxTime, double minSpan, double maxSpan) {
  double span = time_.end - time_.start;
  double center = (time_.start + time_.end) / 2.0;

  double clamped = span;
  if (clamped < minSpan) clamped = minSpan;
  if (clamped > maxSpan) clamped = maxSpan;
  if (clamped != span) {
    time_.start = center - clamped / 2.0;
    time_.end = center + clamped / 2.0;
  }

  // Slide into bounds; span is preserved.
  if (time_.end > maxTime) {
    time_.start -= time_.end - maxTime;
    time_.end = maxTime;
  }
  if (time_.start < minTime) {
    time_.end += minTime - time_.start;
    time_.start = minTime;
  }
}

// ---- Metrics ----

double Viewport::visibleBars(double totalCandles, double avgCandleDuration) const {
  if (totalCandles == 0.0 || avgCandleDuration == 0.0) return 0.0;
  return timeSpan() / avgCandleDuration;
}

double Viewport::pixelsPerMs() const {
  double span = timeSpan();
  if (span <= 0.0) return 0.0;
  return width_ / span;
}

} // namespace kl
