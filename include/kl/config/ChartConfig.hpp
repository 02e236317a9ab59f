#pragma once
#include "kl/data/ArrayPlaybackSource.hpp"
#include "kl/data/RandomWalkSource.hpp"
#include "kl/events/ChartEvent.hpp"
#include "kl/style/Theme.hpp"

#include <string>

namespace kl {

// Everything a host needs to build a chart and its demo feeds.
struct ChartConfig {
  double width{800};
  double height{600};
  double priceAxisWidth{60};
  double timeAxisHeight{40};
  double volumeHeight{0};
  Theme theme = darkTheme();
  InteractionOptions interaction;
  RandomWalkConfig randomWalk;
  ArrayPlaybackConfig playback;
  std::string fontPath; // TTF for the raster surface; empty = no text
};

// "#rrggbb" or "#rrggbbaa" into RGBA floats. `out` is untouched on failure.
bool parseHexColor(const std::string& text, float out[4]);

// Overlays a JSON object onto `out`. Keys that are absent keep their
// current value and unknown keys are ignored. A known key with the wrong
// type or an out-of-range value fails with `error` naming the key.
//
//   {
//     "width": 1024, "height": 640, "volumeHeight": 80,
//     "theme": "light" | { "preset": "dark", "background": "#101014", ... },
//     "interaction": { "wheelMode": "blend", "zoomSpeed": 2, ... },
//     "randomWalk": { "initialPrice": 250, "intervalMs": 500, ... },
//     "playback": { "speed": 10, "loop": true, "fixedIntervalMs": 100 },
//     "font": "fonts/Inter.ttf"
//   }
bool loadChartConfig(const std::string& json, ChartConfig& out, std::string& error);
bool loadChartConfigFile(const std::string& path, ChartConfig& out, std::string& error);

} // namespace kl
