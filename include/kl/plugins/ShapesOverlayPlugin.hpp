#pragma once
#include "kl/plugins/Plugin.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kl {

// Annotations placed in (time, price) space over the plot area.
enum class ShapeType : std::uint8_t {
  Rectangle = 1, // t0..t1 by p0..p1
  Line = 2,      // horizontal segment t0..t1 at p0
  Band = 3       // full-width price band p0..p1
};

struct ShapeStyle {
  std::optional<std::array<float, 4>> strokeColor{std::array<float, 4>{0.129f, 0.588f, 0.953f, 1.0f}};
  std::optional<std::array<float, 4>> fillColor{std::array<float, 4>{0.129f, 0.588f, 0.953f, 0.1f}};
  double lineWidth{1.0};
  double opacity{1.0};
};

struct Shape {
  std::uint32_t id{0};
  ShapeType type{ShapeType::Rectangle};
  std::int64_t t0{0}, t1{0}; // unused by Band
  double p0{0}, p1{0};       // Line uses p0 only
  ShapeStyle style;
};

// Shape store plus the plugin that draws it after the candles. Copies share
// the same shapes. Edits request a frame from the chart the plugin is
// installed on; uninstalling clears the shapes.
class ShapesOverlay {
public:
  explicit ShapesOverlay(std::string name = "shapes-overlay");

  // Ids start at 1. Non-finite prices are rejected with id 0.
  std::uint32_t addRect(std::int64_t t0, std::int64_t t1, double p0, double p1,
                        const ShapeStyle& style = {});
  std::uint32_t addLine(std::int64_t t0, std::int64_t t1, double price,
                        const ShapeStyle& style = {});
  std::uint32_t addBand(double p0, double p1, const ShapeStyle& style = {});

  bool removeShape(std::uint32_t id);
  bool setStyle(std::uint32_t id, const ShapeStyle& style);
  void clear();

  const Shape* get(std::uint32_t id) const;
  const std::vector<Shape>& shapes() const;
  std::size_t count() const;

  Plugin plugin() const;

private:
  struct State;

  std::uint32_t add(Shape shape);

  std::shared_ptr<State> state_;
};

} // namespace kl
