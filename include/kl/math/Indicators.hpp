#pragma once
#include <cstddef>
#include <vector>

namespace kl {

// Simple moving average over `count` values.
// The first `period - 1` outputs are NaN (not enough data). A period below 1
// or larger than count yields all-NaN output.
std::vector<double> computeSMA(const double* values, std::size_t count, int period);

} // namespace kl
