// D8.2: ChartConfig JSON loading, validation and theme overrides

#include "kl/config/ChartConfig.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <string>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

static void requireNear(double a, double b, double eps, const char* msg) {
  if (std::fabs(a - b) > eps) {
    std::fprintf(stderr, "ASSERT FAIL [%s]: %.8f != %.8f (eps=%.8f)\n", msg, a, b, eps);
    std::exit(1);
  }
}

static bool errorMentions(const std::string& error, const char* key) {
  return error.find(key) != std::string::npos;
}

int main() {
  // --- Hex colors ---
  {
    float c[4] = {9, 9, 9, 9};
    requireTrue(kl::parseHexColor("#ff8000", c), "rrggbb");
    requireNear(c[0], 1.0, 1e-6, "red");
    requireNear(c[1], 128.0 / 255.0, 1e-6, "green");
    requireNear(c[3], 1.0, 1e-6, "opaque by default");
    requireTrue(kl::parseHexColor("#00000080", c), "rrggbbaa");
    requireNear(c[3], 128.0 / 255.0, 1e-6, "alpha");
    float keep[4] = {0.5f, 0.5f, 0.5f, 0.5f};
    requireTrue(!kl::parseHexColor("ff8000", keep), "missing #");
    requireTrue(!kl::parseHexColor("#ff80zz", keep), "bad digit");
    requireTrue(!kl::parseHexColor("#fff", keep), "short form unsupported");
    requireTrue(keep[0] == 0.5f, "untouched on failure");
    std::printf("  colors PASS\n");
  }

  // --- Full document ---
  {
    const char* json = R"({
      "width": 1024, "height": 640, "volumeHeight": 80, "priceAxisWidth": 72,
      "theme": { "preset": "light", "background": "#101014", "fontSize": 14, "padding": 4 },
      "interaction": { "wheelMode": "blend", "zoomSpeed": 2, "minVisibleBars": 5,
                       "maxVisibleBars": 500, "enableCrosshair": false },
      "randomWalk": { "initialPrice": 250, "intervalMs": 500, "candleDurationMs": 60000, "seed": 7 },
      "playback": { "speed": 10, "loop": true, "fixedIntervalMs": 100 },
      "font": "fonts/Inter.ttf",
      "unknownKey": [1, 2, 3]
    })";
    kl::ChartConfig cfg;
    std::string error;
    requireTrue(kl::loadChartConfig(json, cfg, error), "document accepted");
    requireNear(cfg.width, 1024, 1e-9, "width");
    requireNear(cfg.volumeHeight, 80, 1e-9, "volume height");
    requireNear(cfg.priceAxisWidth, 72, 1e-9, "price axis width");
    requireNear(cfg.timeAxisHeight, 40, 1e-9, "absent key keeps default");
    requireTrue(cfg.theme.name == "Light", "preset applied");
    requireNear(cfg.theme.backgroundColor[0], 16.0 / 255.0, 1e-6, "override on top of preset");
    requireNear(cfg.theme.fontPx, 14, 1e-6, "font size");
    requireNear(cfg.theme.paddingPx, 4, 1e-6, "padding");
    requireTrue(cfg.interaction.wheelMode == kl::WheelMode::Blend, "wheel mode");
    requireTrue(!cfg.interaction.enableCrosshair, "crosshair flag");
    requireTrue(cfg.interaction.enablePan, "pan default kept");
    requireNear(cfg.interaction.zoomSpeed, 2, 1e-9, "zoom speed");
    requireNear(cfg.randomWalk.initialPrice, 250, 1e-9, "initial price");
    requireTrue(cfg.randomWalk.intervalMs == 500 && cfg.randomWalk.seed == 7, "walk ints");
    requireNear(cfg.playback.speed, 10, 1e-9, "playback speed");
    requireTrue(cfg.playback.loop && cfg.playback.fixedIntervalMs == 100, "playback flags");
    requireTrue(cfg.fontPath == "fonts/Inter.ttf", "font path");
    std::printf("  full document PASS\n");
  }

  // --- Theme as a preset name ---
  {
    kl::ChartConfig cfg;
    std::string error;
    requireTrue(kl::loadChartConfig(R"({"theme": "LIGHT"})", cfg, error), "case-insensitive preset");
    requireTrue(cfg.theme.name == "Light", "light preset");
    requireTrue(!kl::loadChartConfig(R"({"theme": "neon"})", cfg, error), "unknown preset");
    requireTrue(errorMentions(error, "theme"), "error names theme");
    std::printf("  presets PASS\n");
  }

  // --- Failures name the key and leave the config untouched ---
  {
    kl::ChartConfig cfg;
    cfg.width = 333;
    std::string error;

    requireTrue(!kl::loadChartConfig(R"({"width": 900, "height": "tall"})", cfg, error), "string height");
    requireTrue(errorMentions(error, "height"), "error names height");
    requireNear(cfg.width, 333, 1e-9, "width untouched after failure");

    requireTrue(!kl::loadChartConfig(R"({"width": -5})", cfg, error), "negative width");
    requireTrue(!kl::loadChartConfig(R"({"interaction": {"wheelMode": "spin"}})", cfg, error), "bad mode");
    requireTrue(errorMentions(error, "interaction.wheelMode"), "error names wheelMode");
    requireTrue(!kl::loadChartConfig(R"({"interaction": {"minVisibleBars": 50, "maxVisibleBars": 10}})",
                                     cfg, error), "min above max");
    requireTrue(!kl::loadChartConfig(R"({"randomWalk": {"intervalMs": 0}})", cfg, error), "zero interval");
    requireTrue(!kl::loadChartConfig(R"({"randomWalk": {"seed": -1}})", cfg, error), "negative seed");
    requireTrue(!kl::loadChartConfig(R"({"playback": {"speed": 0}})", cfg, error), "zero speed");
    requireTrue(!kl::loadChartConfig(R"({"playback": {"loop": 1}})", cfg, error), "non-bool loop");
    requireTrue(!kl::loadChartConfig(R"({"theme": {"grid": "green"}})", cfg, error), "bad color");
    requireTrue(errorMentions(error, "theme.grid"), "error names theme.grid");
    requireTrue(!kl::loadChartConfig(R"({"theme": {"highlightOpacity": 2}})", cfg, error), "opacity > 1");
    requireTrue(!kl::loadChartConfig(R"({"font": 12})", cfg, error), "non-string font");
    requireTrue(!kl::loadChartConfig("[1, 2]", cfg, error), "array document");
    requireTrue(!kl::loadChartConfig(R"({"width": 10,})", cfg, error), "syntax error");
    requireTrue(errorMentions(error, "offset"), "parse error has an offset");
    requireNear(cfg.width, 333, 1e-9, "still untouched");
    std::printf("  validation PASS\n");
  }

  // --- Missing file ---
  {
    kl::ChartConfig cfg;
    std::string error;
    requireTrue(!kl::loadChartConfigFile("/nonexistent/kline.json", cfg, error), "missing file");
    requireTrue(errorMentions(error, "cannot open"), "error explains");
    std::printf("  file PASS\n");
  }

  std::printf("\nD8.2 chart config PASS\n");
  return 0;
}
