#include "kl/interaction/PanHandler.hpp"

#include <utility>

namespace kl {

PanHandler::PanHandler(Viewport& viewport, UpdateFn onUpdate)
    : viewport_(viewport), onUpdate_(std::move(onUpdate)) {}

bool PanHandler::onPointerDown(const ChartEvent& ev) {
  if (ev.button != 0) return false;

  mode_ = ev.altKey ? PanMode::PanningPrice : PanMode::PanningTime;
  lastX_ = ev.chartX;
  lastY_ = ev.chartY;
  startTime_ = viewport_.timeRange();
  startPriceMin_ = viewport_.priceConfig().min;
  startPriceMax_ = viewport_.priceConfig().max;
  return true;
}

bool PanHandler::onPointerMove(const ChartEvent& ev) {
  if (mode_ == PanMode::Idle) return false;

  double dx = ev.chartX - lastX_;
  double dy = ev.chartY - lastY_;
  lastX_ = ev.chartX;
  lastY_ = ev.chartY;

  if (mode_ == PanMode::PanningTime) {
    if (viewport_.width() > 0.0) {
      viewport_.pan(-(dx / viewport_.width()) * viewport_.timeSpan());
    }
  } else if (viewport_.height() > 0.0) {
    // Dragging down moves the window up in price.
    viewport_.pan(0.0, (dy / viewport_.height()) * viewport_.priceSpan());
  }

  if (onUpdate_) onUpdate_();
  return true;
}

bool PanHandler::onPointerUp(const ChartEvent&) {
  if (mode_ == PanMode::Idle) return false;
  mode_ = PanMode::Idle;
  return true;
}

bool PanHandler::onPointerCancel(const ChartEvent&) {
  if (mode_ == PanMode::Idle) return false;

  viewport_.setTimeRange(startTime_);
  ViewportPriceConfig price = viewport_.priceConfig();
  price.min = startPriceMin_;
  price.max = startPriceMax_;
  viewport_.setPriceConfig(price);

  mode_ = PanMode::Idle;
  if (onUpdate_) onUpdate_();
  return true;
}

} // namespace kl
