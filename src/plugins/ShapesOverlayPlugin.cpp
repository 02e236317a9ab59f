#include "kl/plugins/ShapesOverlayPlugin.hpp"
#include "kl/chart/Chart.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <utility>

namespace kl {

struct ShapesOverlay::State {
  std::string name;
  std::vector<Shape> shapes;
  std::uint32_t nextId{1};
  Chart* chart{nullptr};

  void requestRedraw() {
    if (chart) chart->scheduleRender();
  }
};

namespace {

void strokeHorizontal(DrawingSurface& s, double x0, double x1, double y, const ShapeStyle& style) {
  s.beginPath();
  s.moveTo(x0, y);
  s.lineTo(x1, y);
  s.stroke(style.strokeColor->data(), style.lineWidth);
}

void drawShape(DrawingSurface& s, const Viewport& vp, const Shape& shape) {
  const ShapeStyle& style = shape.style;
  s.save();
  s.setGlobalAlpha(std::clamp(style.opacity, 0.0, 1.0));

  switch (shape.type) {
    case ShapeType::Rectangle: {
      double x0 = vp.xScale(static_cast<double>(shape.t0));
      double x1 = vp.xScale(static_cast<double>(shape.t1));
      double y0 = vp.yScale(shape.p0);
      double y1 = vp.yScale(shape.p1);
      double x = std::min(x0, x1), y = std::min(y0, y1);
      double w = std::fabs(x1 - x0), h = std::fabs(y1 - y0);
      if (style.fillColor) s.fillRect(x, y, w, h, style.fillColor->data());
      if (style.strokeColor) s.strokeRect(x, y, w, h, style.strokeColor->data(), style.lineWidth);
      break;
    }
    case ShapeType::Line: {
      if (!style.strokeColor) break;
      strokeHorizontal(s, vp.xScale(static_cast<double>(shape.t0)),
                       vp.xScale(static_cast<double>(shape.t1)), vp.yScale(shape.p0), style);
      break;
    }
    case ShapeType::Band: {
      double y0 = vp.yScale(shape.p0);
      double y1 = vp.yScale(shape.p1);
      double y = std::min(y0, y1), h = std::fabs(y1 - y0);
      if (style.fillColor) s.fillRect(0, y, vp.width(), h, style.fillColor->data());
      if (style.strokeColor) {
        strokeHorizontal(s, 0, vp.width(), y, style);
        strokeHorizontal(s, 0, vp.width(), y + h, style);
      }
      break;
    }
  }

  s.restore();
}

} // anonymous namespace

ShapesOverlay::ShapesOverlay(std::string name) : state_(std::make_shared<State>()) {
  state_->name = std::move(name);
}

std::uint32_t ShapesOverlay::add(Shape shape) {
  if (!std::isfinite(shape.p0) || !std::isfinite(shape.p1)) {
    std::fprintf(stderr, "ShapesOverlay: shape rejected, non-finite price\n");
    return 0;
  }
  shape.id = state_->nextId++;
  state_->shapes.push_back(shape);
  state_->requestRedraw();
  return shape.id;
}

std::uint32_t ShapesOverlay::addRect(std::int64_t t0, std::int64_t t1, double p0, double p1,
                                     const ShapeStyle& style) {
  Shape s;
  s.type = ShapeType::Rectangle;
  s.t0 = t0;
  s.t1 = t1;
  s.p0 = p0;
  s.p1 = p1;
  s.style = style;
  return add(s);
}

std::uint32_t ShapesOverlay::addLine(std::int64_t t0, std::int64_t t1, double price,
                                     const ShapeStyle& style) {
  Shape s;
  s.type = ShapeType::Line;
  s.t0 = t0;
  s.t1 = t1;
  s.p0 = price;
  s.p1 = price;
  s.style = style;
  return add(s);
}

std::uint32_t ShapesOverlay::addBand(double p0, double p1, const ShapeStyle& style) {
  Shape s;
  s.type = ShapeType::Band;
  s.p0 = p0;
  s.p1 = p1;
  s.style = style;
  return add(s);
}

bool ShapesOverlay::removeShape(std::uint32_t id) {
  auto& v = state_->shapes;
  auto it = std::find_if(v.begin(), v.end(), [id](const Shape& s) { return s.id == id; });
  if (it == v.end()) return false;
  v.erase(it);
  state_->requestRedraw();
  return true;
}

bool ShapesOverlay::setStyle(std::uint32_t id, const ShapeStyle& style) {
  for (auto& s : state_->shapes) {
    if (s.id == id) {
      s.style = style;
      state_->requestRedraw();
      return true;
    }
  }
  return false;
}

void ShapesOverlay::clear() {
  state_->shapes.clear();
  state_->requestRedraw();
}

const Shape* ShapesOverlay::get(std::uint32_t id) const {
  for (const auto& s : state_->shapes) {
    if (s.id == id) return &s;
  }
  return nullptr;
}

const std::vector<Shape>& ShapesOverlay::shapes() const { return state_->shapes; }

std::size_t ShapesOverlay::count() const { return state_->shapes.size(); }

Plugin ShapesOverlay::plugin() const {
  std::shared_ptr<State> state = state_;

  Plugin p;
  p.name = state->name;
  p.onInstall = [state](Chart& chart) { state->chart = &chart; };
  p.onUninstall = [state](Chart&) {
    state->chart = nullptr;
    state->shapes.clear();
  };
  p.onRender = [state](const PluginContext& ctx) {
    if (ctx.phase != RenderPhase::AfterCandles || !state->chart || state->shapes.empty()) return;
    const Viewport& vp = state->chart->viewport();
    const LayoutRect& area = ctx.layout->chartArea;
    DrawingSurface& s = *ctx.surface;

    s.save();
    s.setClip(area.x, area.y, area.width, area.height);
    s.translate(area.x, area.y);
    for (const auto& shape : state->shapes) drawShape(s, vp, shape);
    s.restore();
  };
  return p;
}

} // namespace kl
