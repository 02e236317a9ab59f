#pragma once
#include <optional>
#include <string>

namespace kl {

// RGBA colors are float[4] in [0, 1].
inline void setColor(float dst[4], float r, float g, float b, float a = 1.0f) {
  dst[0] = r; dst[1] = g; dst[2] = b; dst[3] = a;
}

inline void copyColor(float dst[4], const float src[4]) {
  dst[0] = src[0]; dst[1] = src[1]; dst[2] = src[2]; dst[3] = src[3];
}

struct Theme {
  std::string name{"Dark"};

  // Background
  float backgroundColor[4] = {0.1f, 0.1f, 0.12f, 1.0f};

  // Candle colors
  float candleUp[4] = {0.063f, 0.725f, 0.506f, 1.0f};   // #10b981
  float candleDown[4] = {0.937f, 0.267f, 0.267f, 1.0f}; // #ef4444

  // Grid/axis
  float gridColor[4] = {0.2f, 0.2f, 0.25f, 1.0f};
  float axisLineColor[4] = {0.4f, 0.4f, 0.45f, 1.0f};
  float labelColor[4] = {0.7f, 0.7f, 0.75f, 1.0f};
  float gridLineWidth{1.0f};

  // Crosshair / interactive
  float crosshairColor[4] = {0.533f, 0.533f, 0.533f, 1.0f}; // #888888
  float highlightColor[4] = {1.0f, 1.0f, 1.0f, 1.0f};
  float highlightOpacity{0.1f};

  // Tooltip
  float tooltipBackground[4] = {0.0f, 0.0f, 0.0f, 0.8f};
  float tooltipBorder[4] = {0.4f, 0.4f, 0.4f, 1.0f};
  float tooltipText[4] = {1.0f, 1.0f, 1.0f, 1.0f};

  // Line overlays (SMA etc.)
  float overlayColors[4][4] = {
    {0.231f, 0.510f, 0.965f, 1.0f}, // blue   #3b82f6
    {0.961f, 0.620f, 0.043f, 1.0f}, // orange #f59e0b
    {0.545f, 0.361f, 0.965f, 1.0f}, // violet #8b5cf6
    {0.024f, 0.714f, 0.831f, 1.0f}  // cyan   #06b6d4
  };

  // Volume
  float volumeUp[4] = {0.063f, 0.725f, 0.506f, 0.5f};
  float volumeDown[4] = {0.937f, 0.267f, 0.267f, 0.5f};

  // Text
  float textColor[4] = {0.8f, 0.8f, 0.85f, 1.0f};
  float fontPx{12.0f};
  float smallFontPx{10.0f};

  // Spacing
  float paddingPx{8.0f};
  float strokeWidth{1.0f};
};

// Built-in presets
Theme darkTheme();
Theme lightTheme();

// "dark" / "light" (case-insensitive).
std::optional<Theme> themeByName(const std::string& name);

} // namespace kl
