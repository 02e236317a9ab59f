#pragma once
#include <optional>

namespace kl {

struct LayoutRect {
  double x{0}, y{0}, width{0}, height{0};

  bool contains(double px, double py) const {
    return px >= x && px <= x + width && py >= y && py <= y + height;
  }
};

struct LayoutPadding {
  double top{8}, right{8}, bottom{8}, left{8};
};

struct LayoutConfig {
  double width{800};
  double height{600};
  double priceAxisWidth{60};
  double timeAxisHeight{40};
  double volumeHeight{0};
  LayoutPadding padding;
};

// Pixel rectangles for one frame.
struct ChartLayout {
  LayoutRect chartArea;
  LayoutRect timeAxisArea;
  LayoutRect priceAxisArea;
  std::optional<LayoutRect> volumeArea; // present when volumeHeight > 0
  LayoutRect total;
};

// Splits the canvas into plot area, volume strip and axis strips:
//
//   +-----------------------+-------+
//   | chartArea             | price |
//   +-----------------------+-------+
//   | volumeArea (optional) |
//   +-----------------------+
//   | timeAxisArea          |
//   +-----------------------+
class LayoutManager {
public:
  LayoutManager() = default;
  explicit LayoutManager(const LayoutConfig& cfg) : config_(cfg) {}

  void setConfig(const LayoutConfig& cfg) { config_ = cfg; }
  void setDimensions(double width, double height);
  void setVolumeHeight(double h) { config_.volumeHeight = h; }

  ChartLayout compute() const;

  const LayoutConfig& config() const { return config_; }

private:
  LayoutConfig config_;
};

} // namespace kl
