#pragma once
#include "kl/events/ChartEvent.hpp"
#include "kl/viewport/Viewport.hpp"

#include <cstdint>
#include <functional>

namespace kl {

enum class PanMode : std::uint8_t { Idle, PanningTime, PanningPrice };

// Drag-to-pan state machine. Events are in plot-area pixels.
//   Idle --down(button 0)--> PanningTime (PanningPrice with Alt)
//   Panning --up--> Idle
//   Panning --cancel--> Idle, viewport restored to the drag-start ranges
class PanHandler {
public:
  using UpdateFn = std::function<void()>;

  PanHandler(Viewport& viewport, UpdateFn onUpdate);

  // Each returns true when the event was consumed.
  bool onPointerDown(const ChartEvent& ev);
  bool onPointerMove(const ChartEvent& ev);
  bool onPointerUp(const ChartEvent& ev);
  bool onPointerCancel(const ChartEvent& ev);

  PanMode mode() const { return mode_; }
  bool isPanning() const { return mode_ != PanMode::Idle; }

  // Drops an active drag without restoring.
  void reset() { mode_ = PanMode::Idle; }

private:
  Viewport& viewport_;
  UpdateFn onUpdate_;

  PanMode mode_{PanMode::Idle};
  double lastX_{0}, lastY_{0};
  ViewTimeRange startTime_;
  double startPriceMin_{0}, startPriceMax_{0};
};

} // namespace kl
