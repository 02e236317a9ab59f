#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace kl {

// Opaque per-candle annotations carried through the store untouched.
using CandleMeta = std::map<std::string, std::string>;

struct Candle {
  std::int64_t ts{0}; // epoch milliseconds
  double open{0}, high{0}, low{0}, close{0};
  std::optional<double> volume;
  std::optional<CandleMeta> meta;
};

struct TimeRange {
  std::int64_t start{0}, end{0};
};

struct PriceRange {
  double min{0}, max{0};
};

struct ViewportPriceConfig {
  double min{0}, max{0};
  double paddingPx{0};
};

} // namespace kl
