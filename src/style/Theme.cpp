#include "kl/style/Theme.hpp"

#include <algorithm>
#include <cctype>

namespace kl {

// -------------------- Built-in presets --------------------

Theme darkTheme() {
  Theme t;
  t.name = "Dark";
  // All fields already carry the dark-theme defaults from the struct initializers.
  return t;
}

Theme lightTheme() {
  Theme t;
  t.name = "Light";

  setColor(t.backgroundColor, 1.0f, 1.0f, 1.0f);         // #ffffff
  setColor(t.gridColor, 0.898f, 0.898f, 0.898f);         // #e5e5e5
  setColor(t.axisLineColor, 0.4f, 0.4f, 0.4f);           // #666666
  setColor(t.labelColor, 0.4f, 0.4f, 0.4f);
  setColor(t.textColor, 0.102f, 0.102f, 0.102f);         // #1a1a1a

  setColor(t.crosshairColor, 0.533f, 0.533f, 0.533f);
  setColor(t.highlightColor, 0.0f, 0.0f, 0.0f);
  t.highlightOpacity = 0.08f;

  setColor(t.tooltipBackground, 1.0f, 1.0f, 1.0f, 0.92f);
  setColor(t.tooltipBorder, 0.4f, 0.4f, 0.4f);
  setColor(t.tooltipText, 0.102f, 0.102f, 0.102f);

  setColor(t.volumeUp, 0.063f, 0.725f, 0.506f, 0.4f);
  setColor(t.volumeDown, 0.937f, 0.267f, 0.267f, 0.4f);

  return t;
}

std::optional<Theme> themeByName(const std::string& name) {
  std::string key(name);
  std::transform(key.begin(), key.end(), key.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (key == "dark") return darkTheme();
  if (key == "light") return lightTheme();
  return std::nullopt;
}

} // namespace kl
