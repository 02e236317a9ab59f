// Headless snapshot demo
// Builds a chart over a RasterSurface, seeds it with history, lets a random
// walk feed run on a virtual clock, then writes the frame to disk.
//
// Usage: kl_headless_snapshot [config.json] [out.png|out.ppm]

#include "kl/chart/Chart.hpp"
#include "kl/config/ChartConfig.hpp"
#include "kl/core/Scheduler.hpp"
#include "kl/data/ArrayPlaybackSource.hpp"
#include "kl/data/RandomWalkSource.hpp"
#include "kl/plugins/CrosshairTooltipPlugin.hpp"
#include "kl/plugins/MovingAveragePlugin.hpp"
#include "kl/plugins/ShapesOverlayPlugin.hpp"
#include "kl/render/RasterSurface.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdio>
#include <string>
#include <vector>

// ---- Synthetic history ----

static std::vector<kl::Candle> makeHistory(std::int64_t endTs, std::int64_t stepMs, int count) {
  std::vector<kl::Candle> out;
  out.reserve(static_cast<std::size_t>(count));
  double price = 100.0;
  for (int i = 0; i < count; i++) {
    kl::Candle c;
    c.ts = endTs - static_cast<std::int64_t>(count - i) * stepMs;
    c.open = price;
    price += std::sin(i * 0.3) * 1.5 + std::cos(i * 0.11) * 0.8;
    c.close = price;
    c.high = std::max(c.open, c.close) + 0.5 + std::fabs(std::sin(i * 1.7));
    c.low = std::min(c.open, c.close) - 0.5 - std::fabs(std::cos(i * 1.3));
    c.volume = 50000.0 + 30000.0 * std::fabs(std::sin(i * 0.7));
    out.push_back(c);
  }
  return out;
}

static bool endsWith(const std::string& s, const char* suffix) {
  std::string suf(suffix);
  return s.size() >= suf.size() && s.compare(s.size() - suf.size(), suf.size(), suf) == 0;
}

int main(int argc, char** argv) {
  kl::ChartConfig cfg;
  cfg.volumeHeight = 80;
  if (argc > 1) {
    std::string error;
    if (!kl::loadChartConfigFile(argv[1], cfg, error)) {
      std::fprintf(stderr, "config: %s\n", error.c_str());
      return 1;
    }
  }
  std::string outPath = argc > 2 ? argv[2] : "kline_snapshot.png";

  const std::int64_t step = cfg.randomWalk.candleDurationMs;
  const std::int64_t startMs = 1704067200000; // 2024-01-01 00:00 UTC
  kl::ManualScheduler scheduler(startMs);

  kl::RasterSurface surface(static_cast<int>(cfg.width), static_cast<int>(cfg.height));
  if (!cfg.fontPath.empty() && !surface.loadFontFile(cfg.fontPath)) {
    std::fprintf(stderr, "font: cannot load %s, labels skipped\n", cfg.fontPath.c_str());
  }

  // Sources are declared before the chart so they outlive its connections.
  kl::RandomWalkSource walk(scheduler, cfg.randomWalk);
  kl::ArrayPlaybackSource replay(scheduler, makeHistory(startMs, step, 40), cfg.playback);

  kl::Chart chart(kl::makeChartOptions(cfg, surface, scheduler));
  std::vector<kl::Candle> history = makeHistory(startMs, step, 120);
  kl::SeriesId primary = chart.addSeries(history);
  kl::SeriesId ghost = chart.addSeries();
  chart.setSeriesOpacity(ghost, 0.35);

  chart.installPlugin(kl::makeMovingAveragePlugin({}));
  kl::MovingAverageConfig slow;
  slow.period = 50;
  slow.colorIndex = 1;
  chart.installPlugin(kl::makeMovingAveragePlugin(slow));
  chart.installPlugin(kl::makeCrosshairTooltipPlugin());

  // Box a stretch of history and mark where it closed.
  kl::ShapesOverlay shapes;
  chart.installPlugin(shapes.plugin());
  double boxLow = history[60].low, boxHigh = history[60].high;
  for (std::size_t i = 60; i < 90; i++) {
    boxLow = std::min(boxLow, history[i].low);
    boxHigh = std::max(boxHigh, history[i].high);
  }
  shapes.addRect(history[60].ts, history[89].ts, boxLow, boxHigh);
  kl::ShapeStyle level;
  level.fillColor.reset();
  level.strokeColor = std::array<float, 4>{1.0f, 0.76f, 0.03f, 1.0f};
  shapes.addLine(history[89].ts, startMs + 60000, history[89].close, level);

  chart.connectDataSource(primary, walk);
  chart.connectDataSource(ghost, replay);

  // One minute of virtual time, one frame per 16 ms.
  for (int i = 0; i < 60000 / 16; i++) {
    scheduler.advanceBy(16);
    scheduler.runFrame();
  }

  // Park the cursor in the middle of the plot so the crosshair shows.
  const kl::LayoutRect& plot = chart.layout().chartArea;
  kl::ChartEvent move;
  move.type = kl::EventType::PointerMove;
  move.chartX = plot.x + plot.width * 0.6;
  move.chartY = plot.y + plot.height * 0.4;
  chart.handleEvent(move);
  chart.renderNow();

  bool ok = endsWith(outPath, ".ppm") ? surface.savePPM(outPath) : surface.savePNG(outPath);
  if (!ok) {
    std::fprintf(stderr, "cannot write %s\n", outPath.c_str());
    return 1;
  }

  const kl::FrameStats& st = chart.stats();
  std::printf("wrote %s (%dx%d)\n", outPath.c_str(), surface.width(), surface.height());
  std::printf("frames=%llu requests=%llu coalesced=%llu visible=%zu\n",
              static_cast<unsigned long long>(st.framesRendered),
              static_cast<unsigned long long>(st.renderRequests),
              static_cast<unsigned long long>(st.coalescedRequests),
              st.visibleCandles);
  return 0;
}
