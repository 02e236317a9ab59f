#include "kl/math/Indicators.hpp"
#include <limits>

namespace kl {

std::vector<double> computeSMA(const double* values, std::size_t count, int period) {
  std::vector<double> sma(count, std::numeric_limits<double>::quiet_NaN());
  if (period < 1 || count < static_cast<std::size_t>(period)) return sma;

  auto p = static_cast<std::size_t>(period);
  double sum = 0.0;
  for (std::size_t i = 0; i < p; i++) sum += values[i];
  sma[p - 1] = sum / static_cast<double>(period);

  // Sliding window
  for (std::size_t i = p; i < count; i++) {
    sum += values[i] - values[i - p];
    sma[i] = sum / static_cast<double>(period);
  }
  return sma;
}

} // namespace kl
