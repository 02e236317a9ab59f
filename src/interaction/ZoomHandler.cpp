#include "kl/interaction/ZoomHandler.hpp"

#include <cmath>
#include <utility>

namespace kl {

ZoomHandler::ZoomHandler(Viewport& viewport, const InteractionOptions& options, UpdateFn onUpdate)
    : viewport_(viewport), options_(options), onUpdate_(std::move(onUpdate)) {}

void ZoomHandler::setDataBounds(double minTime, double maxTime, double avgCandleDuration) {
  minTime_ = minTime;
  maxTime_ = maxTime;
  avgDuration_ = avgCandleDuration;
}

bool ZoomHandler::onWheel(const ChartEvent& ev) {
  if (!options_.enableZoom) return false;

  double dir = ev.deltaY < 0.0 ? 1.0 : (ev.deltaY > 0.0 ? -1.0 : 0.0);
  double intensity = std::fabs(ev.deltaY) / 100.0; // one notch ~ 100 units
  double base = 1.0 + intensity * 0.1 * options_.zoomSpeed;
  double factor = dir > 0.0 ? base : 1.0 / base;

  viewport_.zoom(factor, ev.chartX);
  clampZoom();
  if (onUpdate_) onUpdate_();
  return true;
}

void ZoomHandler::zoomIn(std::optional<double> centerX) {
  viewport_.zoom(kStepFactor, centerX.value_or(viewport_.width() / 2.0));
  clampZoom();
  if (onUpdate_) onUpdate_();
}

void ZoomHandler::zoomOut(std::optional<double> centerX) {
  viewport_.zoom(1.0 / kStepFactor, centerX.value_or(viewport_.width() / 2.0));
  clampZoom();
  if (onUpdate_) onUpdate_();
}

void ZoomHandler::resetZoom() {
  viewport_.setTimeRange(minTime_, maxTime_);
  if (onUpdate_) onUpdate_();
}

void ZoomHandler::clampZoom() {
  double minSpan = avgDuration_ * options_.minVisibleBars;
  double maxSpan = avgDuration_ * options_.maxVisibleBars;
  viewport_.clampTimeRange(minTime_, maxTime_, minSpan, maxSpan);
}

} // namespace kl
