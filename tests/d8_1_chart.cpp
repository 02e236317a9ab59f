// D8.1: Chart series management, live sources, event routing and navigation

#include "kl/chart/Chart.hpp"
#include "kl/core/Scheduler.hpp"
#include "kl/data/ArrayPlaybackSource.hpp"
#include "kl/data/RandomWalkSource.hpp"
#include "support/RecordingSurface.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <vector>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

static void requireNear(double a, double b, double eps, const char* msg) {
  if (std::fabs(a - b) > eps) {
    std::fprintf(stderr, "ASSERT FAIL [%s]: %.8f != %.8f (eps=%.8f)\n", msg, a, b, eps);
    std::exit(1);
  }
}

// 100 one-second candles around 50.
static std::vector<kl::Candle> history() {
  std::vector<kl::Candle> rows;
  for (int i = 0; i < 100; i++) {
    kl::Candle c;
    c.ts = static_cast<std::int64_t>(i) * 1000;
    c.open = 50 + std::sin(i * 0.2);
    c.close = 50 + std::sin(i * 0.2 + 0.1);
    c.high = std::max(c.open, c.close) + 0.5;
    c.low = std::min(c.open, c.close) - 0.5;
    rows.push_back(c);
  }
  return rows;
}

static kl::ChartEvent event(kl::EventType type, double x, double y) {
  kl::ChartEvent ev;
  ev.type = type;
  ev.chartX = x;
  ev.chartY = y;
  return ev;
}

static kl::ChartOptions optionsFor(kl::DrawingSurface& surface, kl::Scheduler& scheduler) {
  kl::ChartOptions o;
  o.surface = &surface;
  o.scheduler = &scheduler;
  return o;
}

int main() {
  // --- Construction requires a surface and a scheduler ---
  {
    kl::ManualScheduler scheduler;
    kltest::RecordingSurface surface;
    bool threw = false;
    try {
      kl::ChartOptions o;
      o.scheduler = &scheduler;
      kl::Chart chart(o);
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    requireTrue(threw, "missing surface");

    threw = false;
    try {
      kl::ChartOptions o;
      o.surface = &surface;
      kl::Chart chart(o);
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    requireTrue(threw, "missing scheduler");

    kltest::RecordingSurface small(0, 0);
    kl::ChartOptions o = optionsFor(small, scheduler);
    o.width = 640;
    o.height = 480;
    kl::Chart sized(o);
    requireTrue(small.width() == 640 && small.height() == 480, "surface resized to options");
    requireTrue(sized.layout().total.width == 640, "layout uses requested size");
    requireTrue(sized.renderPending(), "first frame scheduled");
    std::printf("  construction PASS\n");
  }

  // --- Series bookkeeping ---
  {
    kl::ManualScheduler scheduler;
    kltest::RecordingSurface surface;
    kl::Chart chart(optionsFor(surface, scheduler));
    requireTrue(chart.primarySeries() == nullptr, "no primary yet");
    kl::SeriesId a = chart.addSeries(history());
    kl::SeriesId b = chart.addSeries();
    requireTrue(a != b && a != kl::kInvalidId, "distinct ids");
    requireTrue(chart.seriesCount() == 2, "two series");
    requireTrue(chart.primarySeries() == chart.series(a), "first added is primary");
    requireTrue(chart.series(999) == nullptr, "unknown id");

    requireTrue(chart.removeSeries(a), "remove a");
    requireTrue(!chart.removeSeries(a), "remove twice fails");
    requireTrue(chart.primarySeries() == chart.series(b), "b becomes primary");
    chart.clearSeries();
    requireTrue(chart.seriesCount() == 0 && chart.seriesIds().empty(), "cleared");
    std::printf("  series PASS\n");
  }

  // --- Live sources feed their series through updateOrAppend ---
  {
    kl::ManualScheduler scheduler(0);
    kltest::RecordingSurface surface;
    kl::RandomWalkSource walk(scheduler);
    kl::Chart chart(optionsFor(surface, scheduler));
    kl::SeriesId id = chart.addSeries();

    requireTrue(chart.connectDataSource(id, walk), "connected");
    requireTrue(walk.isActive(), "source started by the chart");
    requireTrue(!chart.connectDataSource(999, walk), "unknown series");

    scheduler.advanceBy(12000);
    const kl::CandleSeries* s = chart.series(id);
    requireTrue(s->length() == 3, "ticks merged into 3 candles");
    requireTrue(s->timestampAt(2) == 10000, "latest candle");

    requireTrue(chart.disconnectDataSource(id), "disconnected");
    requireTrue(!walk.isActive(), "source stopped with its last subscriber");
    requireTrue(!chart.disconnectDataSource(id), "nothing to disconnect");
    std::printf("  live source PASS\n");
  }

  // --- Removing a series detaches its source ---
  {
    kl::ManualScheduler scheduler(0);
    kltest::RecordingSurface surface;
    std::vector<kl::Candle> rec = history();
    kl::ArrayPlaybackSource replay(scheduler, rec);
    kl::Chart chart(optionsFor(surface, scheduler));
    kl::SeriesId id = chart.addSeries();
    chart.connectDataSource(id, replay);
    scheduler.advanceBy(2500);
    requireTrue(chart.series(id)->length() == 3, "three replayed");
    chart.removeSeries(id);
    requireTrue(replay.subscriberCount() == 0 && !replay.isActive(), "source released");
    std::printf("  source detach PASS\n");
  }

  // --- Drag pans; Alt-drag pans price and turns off auto-scale ---
  {
    kl::ManualScheduler scheduler;
    kltest::RecordingSurface surface;
    kl::Chart chart(optionsFor(surface, scheduler));
    chart.addSeries(history());
    scheduler.runFrame();
    double span = chart.viewport().timeSpan();
    const kl::LayoutRect& plot = chart.layout().chartArea;

    chart.handleEvent(event(kl::EventType::PointerDown, plot.x + 400, plot.y + 100));
    requireTrue(chart.panMode() == kl::PanMode::PanningTime, "panning");
    chart.handleEvent(event(kl::EventType::PointerMove, plot.x + 400 - plot.width / 10, plot.y + 100));
    requireNear(chart.viewport().timeRange().start, span / 10, 1e-6, "dragged left 10%");
    requireTrue(!chart.crosshairState().visible, "no crosshair while dragging");
    chart.handleEvent(event(kl::EventType::PointerUp, plot.x + 300, plot.y + 100));
    requireTrue(chart.panMode() == kl::PanMode::Idle, "released");

    scheduler.runFrame();
    requireNear(chart.viewport().timeRange().start, span / 10, 1e-6, "frame keeps user window");

    kl::ChartEvent down = event(kl::EventType::PointerDown, plot.x + 100, plot.y + 100);
    down.altKey = true;
    chart.handleEvent(down);
    double minBefore = chart.viewport().priceConfig().min;
    chart.handleEvent(event(kl::EventType::PointerMove, plot.x + 100, plot.y + 150));
    requireTrue(!chart.priceAutoScale(), "auto-scale off after price drag");
    double moved = chart.viewport().priceConfig().min;
    requireTrue(moved > minBefore, "price window moved");
    chart.handleEvent(event(kl::EventType::PointerUp, plot.x + 100, plot.y + 150));
    scheduler.runFrame();
    requireNear(chart.viewport().priceConfig().min, moved, 1e-9, "frame keeps panned price");

    chart.resetViewport();
    scheduler.runFrame();
    requireTrue(chart.priceAutoScale(), "auto-scale restored");
    requireNear(chart.viewport().timeRange().start, 0.0, 1e-9, "data refit");
    std::printf("  pan routing PASS\n");
  }

  // --- Cancel restores the drag-start state ---
  {
    kl::ManualScheduler scheduler;
    kltest::RecordingSurface surface;
    kl::Chart chart(optionsFor(surface, scheduler));
    chart.addSeries(history());
    scheduler.runFrame();
    const kl::LayoutRect& plot = chart.layout().chartArea;
    double min0 = chart.viewport().priceConfig().min;

    kl::ChartEvent down = event(kl::EventType::PointerDown, plot.x + 10, plot.y + 10);
    down.altKey = true;
    chart.handleEvent(down);
    chart.handleEvent(event(kl::EventType::PointerMove, plot.x + 10, plot.y + 90));
    chart.handleEvent(event(kl::EventType::PointerCancel, 0, 0));
    requireTrue(chart.priceAutoScale(), "auto-scale back");
    requireNear(chart.viewport().priceConfig().min, min0, 1e-9, "price restored");
    std::printf("  cancel routing PASS\n");
  }

  // --- Wheel routing per mode ---
  {
    kl::ManualScheduler scheduler;
    kltest::RecordingSurface surface;
    kl::Chart chart(optionsFor(surface, scheduler));
    chart.addSeries(history());
    scheduler.runFrame();
    const kl::LayoutRect& plot = chart.layout().chartArea;
    double span = chart.viewport().timeSpan();

    kl::ChartEvent w = event(kl::EventType::Wheel, plot.x + plot.width / 2, plot.y + 50);
    w.deltaY = -100;
    chart.handleEvent(w);
    requireNear(chart.viewport().timeSpan(), span / 1.1, 1e-6, "zoomX: wheel zooms");

    chart.setWheelMode(kl::WheelMode::ScrollX);
    requireTrue(chart.wheelMode() == kl::WheelMode::ScrollX, "mode stored");
    double start = chart.viewport().timeRange().start;
    double s2 = chart.viewport().timeSpan();
    w.deltaY = -5;
    chart.handleEvent(w);
    requireNear(chart.viewport().timeSpan(), s2, 1e-6, "scrollX: span kept");
    requireNear(chart.viewport().timeRange().start, start - 0.05 * s2, 1e-6, "scrollX: scrolled");

    chart.setWheelMode(kl::WheelMode::Blend);
    w.deltaX = 0;
    w.deltaY = 100;
    chart.handleEvent(w);
    requireNear(chart.viewport().timeSpan(), s2 * 1.1, 1e-6, "blend: vertical zooms");
    std::printf("  wheel routing PASS\n");
  }

  // --- Programmatic navigation ---
  {
    kl::ManualScheduler scheduler;
    kltest::RecordingSurface surface;
    kl::Chart chart(optionsFor(surface, scheduler));
    chart.addSeries(history());
    scheduler.runFrame();
    double span = chart.viewport().timeSpan();

    chart.zoomIn();
    requireNear(chart.viewport().timeSpan(), span / 1.2, 1e-6, "zoomIn");
    double s0 = chart.viewport().timeRange().start;
    chart.scrollLeft(0.5);
    requireNear(chart.viewport().timeRange().start, s0 - 0.5 * span / 1.2, 1e-6, "scrolled left");
    chart.zoomOut();
    chart.resetZoom();
    requireNear(chart.viewport().timeRange().start, 0.0, 1e-9, "reset start");
    requireNear(chart.viewport().timeRange().end, 99000.0, 1e-9, "reset end");
    requireTrue(chart.renderPending(), "navigation schedules a frame");
    std::printf("  navigation PASS\n");
  }

  // --- Disabled interactions ---
  {
    kl::ManualScheduler scheduler;
    kltest::RecordingSurface surface;
    kl::Chart chart(optionsFor(surface, scheduler));
    chart.addSeries(history());
    scheduler.runFrame();
    kl::InteractionOptions io;
    io.enablePan = false;
    io.enableCrosshair = false;
    io.enableZoom = false;
    chart.setInteractionOptions(io);
    double start = chart.viewport().timeRange().start;
    double span = chart.viewport().timeSpan();

    chart.handleEvent(event(kl::EventType::PointerDown, 100, 100));
    chart.handleEvent(event(kl::EventType::PointerMove, 300, 100));
    requireNear(chart.viewport().timeRange().start, start, 1e-9, "pan disabled");
    requireTrue(!chart.crosshairState().visible, "crosshair disabled");
    kl::ChartEvent w = event(kl::EventType::Wheel, 100, 100);
    w.deltaY = -100;
    chart.handleEvent(w);
    requireNear(chart.viewport().timeSpan(), span, 1e-9, "zoom disabled");
    std::printf("  disabled PASS\n");
  }

  // --- Resize and theme ---
  {
    kl::ManualScheduler scheduler;
    kltest::RecordingSurface surface;
    kl::Chart chart(optionsFor(surface, scheduler));
    chart.resize(1024, 768);
    requireTrue(surface.width() == 1024 && surface.height() == 768, "surface resized");
    requireNear(chart.layout().chartArea.width, 1024 - 16 - 60, 1e-9, "layout recomputed");
    requireNear(chart.viewport().width(), chart.layout().chartArea.width, 1e-9, "viewport sized");
    chart.resize(0, 100);
    requireTrue(surface.width() == 1024, "invalid resize ignored");

    kl::Theme light = kl::lightTheme();
    light.paddingPx = 20;
    chart.setTheme(light);
    chart.renderNow();
    requireTrue(chart.theme().name == light.name, "theme stored");
    requireNear(chart.layout().chartArea.x, 20.0, 1e-9, "padding from theme");
    requireTrue(surface.fills[0].color[0] == light.backgroundColor[0], "background from theme");
    std::printf("  resize/theme PASS\n");
  }

  std::printf("\nD8.1 chart PASS\n");
  return 0;
}
