// D6.1: PanHandler time and price drags, cancel restore

#include "kl/interaction/PanHandler.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

static void requireNear(double a, double b, double eps, const char* msg) {
  if (std::fabs(a - b) > eps) {
    std::fprintf(stderr, "ASSERT FAIL [%s]: %.8f != %.8f (eps=%.8f)\n", msg, a, b, eps);
    std::exit(1);
  }
}

static kl::ChartEvent pointer(kl::EventType type, double x, double y, int button = 0, bool alt = false) {
  kl::ChartEvent ev;
  ev.type = type;
  ev.chartX = x;
  ev.chartY = y;
  ev.button = button;
  ev.altKey = alt;
  return ev;
}

static kl::Viewport makeViewport() {
  kl::ViewportConfig cfg;
  cfg.time = {0, 1000};
  cfg.price = {0, 100, 0};
  cfg.width = 500;
  cfg.height = 200;
  return kl::Viewport(cfg);
}

int main() {
  constexpr double EPS = 1e-9;
  using kl::EventType;

  // --- Horizontal drag pans time against the pointer ---
  {
    kl::Viewport vp = makeViewport();
    int updates = 0;
    kl::PanHandler pan(vp, [&]() { updates++; });
    requireTrue(!pan.isPanning(), "idle initially");
    requireTrue(pan.onPointerDown(pointer(EventType::PointerDown, 100, 50)), "down accepted");
    requireTrue(pan.mode() == kl::PanMode::PanningTime, "time mode");

    pan.onPointerMove(pointer(EventType::PointerMove, 150, 50));
    requireNear(vp.timeRange().start, -100.0, EPS, "dragging right shows earlier data");
    requireNear(vp.timeRange().end, 900.0, EPS, "span kept");
    requireTrue(updates == 1, "update per move");

    // Deltas are measured from the previous move, not the press.
    pan.onPointerMove(pointer(EventType::PointerMove, 100, 80));
    requireNear(vp.timeRange().start, 0.0, EPS, "back to start");
    requireNear(vp.priceConfig().min, 0.0, EPS, "vertical motion ignored in time mode");

    requireTrue(pan.onPointerUp(pointer(EventType::PointerUp, 100, 80)), "up ends drag");
    requireTrue(!pan.isPanning(), "idle after up");
    requireTrue(!pan.onPointerMove(pointer(EventType::PointerMove, 300, 80)), "move ignored when idle");
    requireTrue(!pan.onPointerUp(pointer(EventType::PointerUp, 0, 0)), "stray up ignored");
    std::printf("  time pan PASS\n");
  }

  // --- Only the primary button starts a drag ---
  {
    kl::Viewport vp = makeViewport();
    kl::PanHandler pan(vp, nullptr);
    requireTrue(!pan.onPointerDown(pointer(EventType::PointerDown, 10, 10, 2)), "right button ignored");
    requireTrue(!pan.isPanning(), "still idle");
    std::printf("  buttons PASS\n");
  }

  // --- Alt-drag pans price ---
  {
    kl::Viewport vp = makeViewport();
    kl::PanHandler pan(vp, nullptr);
    pan.onPointerDown(pointer(EventType::PointerDown, 100, 100, 0, true));
    requireTrue(pan.mode() == kl::PanMode::PanningPrice, "price mode");
    pan.onPointerMove(pointer(EventType::PointerMove, 140, 120));
    requireNear(vp.priceConfig().min, 10.0, EPS, "dragging down raises the window");
    requireNear(vp.priceConfig().max, 110.0, EPS, "price span kept");
    requireNear(vp.timeRange().start, 0.0, EPS, "time untouched in price mode");
    std::printf("  price pan PASS\n");
  }

  // --- Cancel restores the press-time window ---
  {
    kl::Viewport vp = makeViewport();
    int updates = 0;
    kl::PanHandler pan(vp, [&]() { updates++; });
    pan.onPointerDown(pointer(EventType::PointerDown, 0, 0, 0, true));
    pan.onPointerMove(pointer(EventType::PointerMove, 0, 50));
    pan.onPointerMove(pointer(EventType::PointerMove, 0, 90));
    requireTrue(pan.onPointerCancel(pointer(EventType::PointerCancel, 0, 0)), "cancel accepted");
    requireNear(vp.priceConfig().min, 0.0, EPS, "price restored");
    requireNear(vp.timeRange().end, 1000.0, EPS, "time restored");
    requireTrue(updates == 3, "cancel triggers an update");
    requireTrue(!pan.isPanning(), "idle after cancel");
    requireTrue(!pan.onPointerCancel(pointer(EventType::PointerCancel, 0, 0)), "cancel when idle");
    std::printf("  cancel PASS\n");
  }

  // --- Zero-sized plot never divides by zero ---
  {
    kl::ViewportConfig cfg;
    cfg.time = {0, 1000};
    kl::Viewport vp(cfg);
    kl::PanHandler pan(vp, nullptr);
    pan.onPointerDown(pointer(EventType::PointerDown, 0, 0));
    pan.onPointerMove(pointer(EventType::PointerMove, 50, 0));
    requireTrue(std::isfinite(vp.timeRange().start), "finite");
    requireNear(vp.timeRange().start, 0.0, EPS, "no pan without width");
    pan.reset();
    requireTrue(!pan.isPanning(), "reset to idle");
    std::printf("  zero size PASS\n");
  }

  std::printf("\nD6.1 pan PASS\n");
  return 0;
}
