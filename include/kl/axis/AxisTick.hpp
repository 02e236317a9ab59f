#pragma once
#include <string>

namespace kl {

struct AxisTick {
  double value{0};    // domain value (ms or price)
  double position{0}; // pixel offset along the axis
  std::string label;
};

} // namespace kl
