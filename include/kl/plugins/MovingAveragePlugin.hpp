#pragma once
#include "kl/plugins/Plugin.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <string>

namespace kl {

enum class PriceField : std::uint8_t { Open, High, Low, Close };

struct MovingAverageConfig {
  int period{20};
  PriceField source{PriceField::Close};
  int colorIndex{0};                 // theme overlay color when `color` is unset
  std::optional<std::array<float, 4>> color;
  double lineWidth{2.0};
  std::string name;                  // defaults to "ma-<period>"
};

// Simple moving average of the primary series, drawn as a polyline over the
// plot area after the candles.
Plugin makeMovingAveragePlugin(const MovingAverageConfig& config = {});

} // namespace kl
