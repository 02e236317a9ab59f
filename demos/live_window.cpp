// Live window demo
// Random-walk candles in a GLFW window. Drag to pan (Alt+drag pans price),
// wheel to zoom.
//
// Usage: kl_live_window [config.json]

#include "kl/chart/Chart.hpp"
#include "kl/config/ChartConfig.hpp"
#include "kl/core/Scheduler.hpp"
#include "kl/data/RandomWalkSource.hpp"
#include "kl/gl/GlfwWindow.hpp"
#include "kl/plugins/CrosshairTooltipPlugin.hpp"
#include "kl/plugins/MovingAveragePlugin.hpp"
#include "kl/render/RasterSurface.hpp"

#include <cstdint>
#include <cstdio>
#include <string>

int main(int argc, char** argv) {
  kl::ChartConfig cfg;
  cfg.volumeHeight = 80;
  cfg.randomWalk.intervalMs = 200;
  cfg.randomWalk.candleDurationMs = 2000;
  if (argc > 1) {
    std::string error;
    if (!kl::loadChartConfigFile(argv[1], cfg, error)) {
      std::fprintf(stderr, "config: %s\n", error.c_str());
      return 1;
    }
  }

  int w = static_cast<int>(cfg.width);
  int h = static_cast<int>(cfg.height);

  kl::GlfwWindow window;
  if (!window.init(w, h, "KlineEngine live")) return 1;

  kl::LoopScheduler scheduler(16);
  kl::RasterSurface surface(w, h);
  if (!cfg.fontPath.empty() && !surface.loadFontFile(cfg.fontPath)) {
    std::fprintf(stderr, "font: cannot load %s, labels skipped\n", cfg.fontPath.c_str());
  }

  kl::RandomWalkSource walk(scheduler, cfg.randomWalk);

  kl::Chart chart(kl::makeChartOptions(cfg, surface, scheduler));
  kl::SeriesId primary = chart.addSeries();
  chart.installPlugin(kl::makeMovingAveragePlugin({}));
  chart.installPlugin(kl::makeCrosshairTooltipPlugin());
  chart.connectDataSource(primary, walk);

  window.setEventHandler([&chart](const kl::ChartEvent& ev) { chart.handleEvent(ev); });

  std::uint64_t presented = 0;
  while (!window.shouldClose()) {
    window.pollEvents();
    scheduler.pump();
    if (chart.stats().framesRendered != presented) {
      presented = chart.stats().framesRendered;
      window.present(surface);
    }
    scheduler.sleepUntilNext();
  }

  chart.disconnectDataSource(primary);
  std::printf("frames=%llu\n", static_cast<unsigned long long>(chart.stats().framesRendered));
  return 0;
}
