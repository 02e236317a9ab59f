// D6.3: Crosshair snapping to the nearest visible candle

#include "kl/crosshair/Crosshair.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
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

static kl::ChartEvent moveTo(double x, double y) {
  kl::ChartEvent ev;
  ev.type = kl::EventType::PointerMove;
  ev.chartX = x;
  ev.chartY = y;
  return ev;
}

// Ten candles at 0, 1000, ..., 9000 ms.
static std::vector<kl::Candle> tenCandles() {
  std::vector<kl::Candle> rows;
  for (int i = 0; i < 10; i++) {
    kl::Candle c;
    c.ts = i * 1000;
    c.open = 10 + i;
    c.close = 11 + i;
    c.high = 12 + i;
    c.low = 9 + i;
    rows.push_back(c);
  }
  return rows;
}

static kl::Viewport makeViewport(double start, double end) {
  kl::ViewportConfig cfg;
  cfg.time = {start, end};
  cfg.price = {0, 100, 0};
  cfg.width = 900;
  cfg.height = 100;
  return kl::Viewport(cfg);
}

int main() {
  kl::CandleSeries series(tenCandles());

  // --- Pointer position maps to time and price ---
  {
    kl::Viewport vp = makeViewport(0, 9000);
    kl::Crosshair ch(vp);
    ch.onPointerMove(moveTo(450, 25));
    requireTrue(ch.isVisible(), "visible");
    requireNear(ch.state().time, 4500.0, 1e-9, "time under pointer");
    requireNear(ch.state().price, 75.0, 1e-9, "price under pointer");
    requireTrue(!ch.state().candle.has_value(), "no series, no candle");
    std::printf("  mapping PASS\n");
  }

  // --- Snaps to the nearest timestamp ---
  {
    kl::Viewport vp = makeViewport(0, 9000);
    kl::Crosshair ch(vp);
    ch.setSeries(&series);

    ch.onPointerMove(moveTo(420, 50)); // 4200 ms
    requireTrue(ch.state().candleIndex && *ch.state().candleIndex == 4, "4200 -> index 4");
    requireTrue(ch.state().candle->ts == 4000, "candle copy");
    requireNear(ch.state().candle->close, 15.0, 1e-12, "candle values");

    ch.onPointerMove(moveTo(460, 50)); // 4600 ms
    requireTrue(*ch.state().candleIndex == 5, "4600 -> index 5");

    ch.onPointerMove(moveTo(0, 50));
    requireTrue(*ch.state().candleIndex == 0, "left edge -> first");
    ch.onPointerMove(moveTo(900, 50));
    requireTrue(*ch.state().candleIndex == 9, "right edge -> last");
    std::printf("  snapping PASS\n");
  }

  // --- Only visible candles are candidates ---
  {
    kl::Viewport vp = makeViewport(2500, 5500);
    kl::Crosshair ch(vp);
    ch.setSeries(&series);

    ch.onPointerMove(moveTo(0, 50)); // 2500 ms, 2000 is off-screen
    requireTrue(*ch.state().candleIndex == 3, "nearest visible is 3000");

    ch.onPointerMove(moveTo(900, 50)); // 5500 ms, 6000 is off-screen
    requireTrue(*ch.state().candleIndex == 5, "nearest visible is 5000");

    kl::Viewport empty = makeViewport(9500, 9900);
    kl::Crosshair none(empty);
    none.setSeries(&series);
    none.onPointerMove(moveTo(100, 50));
    requireTrue(!none.state().candleIndex.has_value(), "no visible candles");
    requireTrue(none.isVisible(), "still visible without a candle");
    std::printf("  visibility PASS\n");
  }

  // --- Hide and empty series ---
  {
    kl::Viewport vp = makeViewport(0, 9000);
    kl::CandleSeries emptySeries;
    kl::Crosshair ch(vp);
    ch.setSeries(&emptySeries);
    ch.onPointerMove(moveTo(100, 50));
    requireTrue(!ch.state().candle.has_value(), "empty series");
    ch.hide();
    requireTrue(!ch.isVisible(), "hidden");
    std::printf("  hide PASS\n");
  }

  std::printf("\nD6.3 crosshair PASS\n");
  return 0;
}
