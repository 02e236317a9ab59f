#pragma once
#include "kl/data/Candle.hpp"

namespace kl {

// Visible time window in (fractional) epoch milliseconds.
struct ViewTimeRange {
  double start{0}, end{1000};
};

struct ViewportConfig {
  ViewTimeRange time;
  ViewportPriceConfig price{0, 100, 0};
  double width{0};
  double height{0};
};

// Maps (time, price) to plot-area pixels and back. Knows nothing about series.
class Viewport {
public:
  Viewport() = default;
  explicit Viewport(const ViewportConfig& cfg);

  void setConfig(const ViewportConfig& cfg);
  void setTimeRange(double start, double end);
  void setTimeRange(const ViewTimeRange& range) { setTimeRange(range.start, range.end); }
  void setPriceConfig(const ViewportPriceConfig& price) { price_ = price; }
  void setDimensions(double width, double height);

  // Coordinate mapping
  double xScale(double ts) const;
  double yScale(double price) const;
  double invX(double px) const;
  double invY(double py) const;

  // Navigation
  void pan(double timeDelta, double priceDelta = 0.0);
  void zoom(double factor, double centerX);
  void clampTimeRange(double minTime, double maxTime, double minSpan, double maxSpan);

  // Queries
  bool isTimeVisible(double ts) const { return ts >= time_.start && ts <= time_.end; }
  bool isPriceVisible(double price) const { return price >= price_.min && price <= price_.max; }
  double timeSpan() const { return time_.end - time_.start; }
  double priceSpan() const { return price_.max - price_.min; }
  double visibleBars(double totalCandles, double avgCandleDuration) const;
  double pixelsPerMs() const;

  const ViewTimeRange& timeRange() const { return time_; }
  const ViewportPriceConfig& priceConfig() const { return price_; }
  double width() const { return width_; }
  double height() const { return height_; }
  double availableHeight() const { return height_ - 2.0 * price_.paddingPx; }

private:
  ViewTimeRange time_;
  ViewportPriceConfig price_{0, 100, 0};
  double width_{0};
  double height_{0};
};

} // namespace kl
