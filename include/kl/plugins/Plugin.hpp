#pragma once
#include "kl/events/ChartEvent.hpp"
#include "kl/layout/LayoutManager.hpp"
#include "kl/render/DrawingSurface.hpp"

#include <cstdint>
#include <functional>
#include <string>

namespace kl {

class Chart;

// Fixed points within one frame, in execution order.
enum class RenderPhase : std::uint8_t {
  BeforeRender,
  AfterGrid,
  AfterAxes,
  AfterCandles,
  AfterRender
};

inline constexpr int kRenderPhaseCount = 5;

const char* renderPhaseName(RenderPhase phase);

struct PluginContext {
  RenderPhase phase{RenderPhase::BeforeRender};
  DrawingSurface* surface{nullptr};
  const ChartLayout* layout{nullptr};
  Chart* chart{nullptr};
};

// A plugin is a name plus any subset of hooks. Empty hooks are skipped.
struct Plugin {
  std::string name;
  std::function<void(Chart&)> onInstall;
  std::function<void(Chart&)> onUninstall;
  std::function<void(const PluginContext&)> onRender;
  std::function<void(const ChartEvent&)> onEvent;
};

} // namespace kl
