#pragma once
#include "kl/axis/AxisTick.hpp"
#include "kl/data/Candle.hpp"

#include <functional>
#include <string>
#include <vector>

namespace kl {

using PriceFormatter = std::function<std::string(double price)>;

// Two decimals.
std::string defaultPriceFormatter(double price);

// Vertical price scale with "nice" ticks. Position 0 is the top edge.
class PriceAxis {
public:
  PriceAxis(const PriceRange& range, double heightPx, double paddingPx = 0.0,
            double minTickSpacingPx = 40.0, PriceFormatter formatter = {});

  void setPriceRange(const PriceRange& range) { range_ = range; }
  void setHeight(double heightPx) { heightPx_ = heightPx; }
  void setPadding(double paddingPx) { paddingPx_ = paddingPx; }
  void setMinTickSpacing(double px) { minTickSpacingPx_ = px; }
  void setFormatter(PriceFormatter formatter);

  double scale(double price) const;
  double invert(double px) const;

  std::vector<AxisTick> generateTicks() const;

  // Smallest {1, 2, 2.5, 5} x 10^k step covering span / maxTicks.
  static double findNiceInterval(double span, int maxTicks);

  const PriceRange& priceRange() const { return range_; }
  double height() const { return heightPx_; }
  double padding() const { return paddingPx_; }

private:
  PriceRange range_;
  double heightPx_;
  double paddingPx_;
  double minTickSpacingPx_;
  PriceFormatter formatter_;
};

} // namespace kl
