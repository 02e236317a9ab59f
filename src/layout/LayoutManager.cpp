#include "kl/layout/LayoutManager.hpp"

#include <algorithm>

namespace kl {

void LayoutManager::setDimensions(double width, double height) {
  config_.width = width;
  config_.height = height;
}

ChartLayout LayoutManager::compute() const {
  const auto& c = config_;
  const auto& pad = c.padding;

  double availW = c.width - pad.left - pad.right;
  double availH = c.height - pad.top - pad.bottom;

  double chartW = std::max(0.0, availW - c.priceAxisWidth);
  double chartH = std::max(0.0, availH - c.timeAxisHeight - c.volumeHeight);
  double volumeH = std::max(0.0, c.volumeHeight);

  ChartLayout out;
  out.chartArea = {pad.left, pad.top, chartW, chartH};

  if (volumeH > 0.0) {
    out.volumeArea = LayoutRect{pad.left, pad.top + chartH, chartW, volumeH};
  }

  out.timeAxisArea = {pad.left, pad.top + chartH + volumeH, chartW, c.timeAxisHeight};
  out.priceAxisArea = {pad.left + chartW, pad.top, c.priceAxisWidth, chartH};
  out.total = {0.0, 0.0, c.width, c.height};
  return out;
}

} // namespace kl
