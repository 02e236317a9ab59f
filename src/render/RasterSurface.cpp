#include "kl/render/RasterSurface.hpp"
#include "kl/export/Snapshot.hpp"

#include <algorithm>
#include <cmath>

namespace kl {

// Width estimate per character when no font is loaded.
static constexpr double kFallbackCharWidth = 0.6;

static std::vector<std::uint32_t> decodeUtf8(const std::string& s) {
  std::vector<std::uint32_t> out;
  out.reserve(s.size());
  for (std::size_t i = 0; i < s.size();) {
    auto c = static_cast<unsigned char>(s[i]);
    std::uint32_t cp = c;
    int extra = 0;
    if (c >= 0xF0) { cp = c & 0x07u; extra = 3; }
    else if (c >= 0xE0) { cp = c & 0x0Fu; extra = 2; }
    else if (c >= 0xC0) { cp = c & 0x1Fu; extra = 1; }
    i++;
    for (int k = 0; k < extra && i < s.size(); k++, i++) {
      cp = (cp << 6) | (static_cast<unsigned char>(s[i]) & 0x3Fu);
    }
    out.push_back(cp);
  }
  return out;
}

static double clamp01(double v) { return v < 0.0 ? 0.0 : (v > 1.0 ? 1.0 : v); }

RasterSurface::RasterSurface(int width, int height)
    : width_(std::max(0, width)), height_(std::max(0, height)) {
  pixels_.assign(static_cast<std::size_t>(width_) * height_ * 4, 0);
  resetState();
}

void RasterSurface::resetState() {
  state_ = State{};
  state_.clipX1 = width_;
  state_.clipY1 = height_;
  stack_.clear();
  path_.clear();
}

void RasterSurface::resize(int width, int height) {
  width_ = std::max(0, width);
  height_ = std::max(0, height);
  pixels_.assign(static_cast<std::size_t>(width_) * height_ * 4, 0);
  resetState();
}

void RasterSurface::setClearColor(const float color[4]) {
  for (int i = 0; i < 4; i++) clearColor_[i] = color[i];
}

void RasterSurface::clear() {
  std::uint8_t c[4];
  for (int i = 0; i < 4; i++) {
    c[i] = static_cast<std::uint8_t>(std::lround(clamp01(clearColor_[i]) * 255.0));
  }
  for (std::size_t i = 0; i < pixels_.size(); i += 4) {
    pixels_[i + 0] = c[0];
    pixels_[i + 1] = c[1];
    pixels_[i + 2] = c[2];
    pixels_[i + 3] = c[3];
  }
}

// ---- State ----

void RasterSurface::setClip(double x, double y, double w, double h) {
  double x0 = x + state_.tx, y0 = y + state_.ty;
  state_.clipX0 = std::max(state_.clipX0, x0);
  state_.clipY0 = std::max(state_.clipY0, y0);
  state_.clipX1 = std::min(state_.clipX1, x0 + w);
  state_.clipY1 = std::min(state_.clipY1, y0 + h);
}

void RasterSurface::translate(double dx, double dy) {
  state_.tx += dx;
  state_.ty += dy;
}

void RasterSurface::save() {
  stack_.push_back(state_);
}

void RasterSurface::restore() {
  if (stack_.empty()) return;
  state_ = stack_.back();
  stack_.pop_back();
}

void RasterSurface::setLineDash(const std::vector<double>& pattern) {
  state_.dash.clear();
  bool anyPositive = false;
  for (double d : pattern) {
    if (d < 0.0 || !std::isfinite(d)) return; // invalid patterns are ignored
    if (d > 0.0) anyPositive = true;
  }
  if (!anyPositive) return;
  state_.dash = pattern;
  // Odd-length patterns repeat to even length.
  if (state_.dash.size() % 2 == 1) state_.dash.insert(state_.dash.end(), pattern.begin(), pattern.end());
}

void RasterSurface::setGlobalAlpha(double alpha) {
  state_.alpha = clamp01(alpha);
}

// ---- Pixels ----

std::array<std::uint8_t, 4> RasterSurface::pixel(int x, int y) const {
  std::array<std::uint8_t, 4> out{0, 0, 0, 0};
  if (x < 0 || y < 0 || x >= width_ || y >= height_) return out;
  std::size_t i = (static_cast<std::size_t>(y) * width_ + x) * 4;
  for (int k = 0; k < 4; k++) out[k] = pixels_[i + k];
  return out;
}

void RasterSurface::blend(int x, int y, const float color[4], double coverage) {
  if (x < 0 || y < 0 || x >= width_ || y >= height_) return;
  double a = clamp01(color[3]) * state_.alpha * clamp01(coverage);
  if (a <= 0.0) return;

  std::size_t i = (static_cast<std::size_t>(y) * width_ + x) * 4;
  double dstA = pixels_[i + 3] / 255.0;
  double outA = a + dstA * (1.0 - a);
  for (int k = 0; k < 3; k++) {
    double src = clamp01(color[k]);
    double dst = pixels_[i + k] / 255.0;
    double v = outA > 0.0 ? (src * a + dst * dstA * (1.0 - a)) / outA : 0.0;
    pixels_[i + k] = static_cast<std::uint8_t>(std::lround(clamp01(v) * 255.0));
  }
  pixels_[i + 3] = static_cast<std::uint8_t>(std::lround(clamp01(outA) * 255.0));
}

void RasterSurface::fillDeviceRect(double x0, double y0, double x1, double y1,
                                   const float color[4]) {
  if (x1 < x0) std::swap(x0, x1);
  if (y1 < y0) std::swap(y0, y1);
  x0 = std::max({x0, state_.clipX0, 0.0});
  y0 = std::max({y0, state_.clipY0, 0.0});
  x1 = std::min({x1, state_.clipX1, static_cast<double>(width_)});
  y1 = std::min({y1, state_.clipY1, static_cast<double>(height_)});
  if (x1 <= x0 || y1 <= y0) return;

  int px0 = static_cast<int>(std::floor(x0));
  int py0 = static_cast<int>(std::floor(y0));
  int px1 = static_cast<int>(std::ceil(x1));
  int py1 = static_cast<int>(std::ceil(y1));
  for (int py = py0; py < py1; py++) {
    double covY = std::min(py + 1.0, y1) - std::max(static_cast<double>(py), y0);
    for (int px = px0; px < px1; px++) {
      double covX = std::min(px + 1.0, x1) - std::max(static_cast<double>(px), x0);
      blend(px, py, color, covX * covY);
    }
  }
}

// ---- Paths ----

void RasterSurface::beginPath() {
  path_.clear();
}

void RasterSurface::moveTo(double x, double y) {
  path_.push_back({Point{x + state_.tx, y + state_.ty}});
}

void RasterSurface::lineTo(double x, double y) {
  if (path_.empty()) {
    moveTo(x, y);
    return;
  }
  path_.back().push_back(Point{x + state_.tx, y + state_.ty});
}

void RasterSurface::stroke(const float color[4], double lineWidth) {
  for (const auto& sub : path_) strokePolyline(sub, color, lineWidth);
}

void RasterSurface::strokePolyline(const std::vector<Point>& pts, const float color[4],
                                   double lineWidth) {
  if (pts.size() < 2 || lineWidth <= 0.0) return;
  double hw = lineWidth / 2.0;

  if (state_.dash.empty()) {
    for (std::size_t i = 1; i < pts.size(); i++) strokeDeviceSegment(pts[i - 1], pts[i], color, hw);
    return;
  }

  // Dash phase carries across the segments of one subpath.
  std::size_t dashIdx = 0;
  double remaining = state_.dash[0];
  for (std::size_t i = 1; i < pts.size(); i++) {
    Point a = pts[i - 1];
    Point b = pts[i];
    double len = std::hypot(b.x - a.x, b.y - a.y);
    if (len <= 0.0) continue;
    double ux = (b.x - a.x) / len, uy = (b.y - a.y) / len;
    double pos = 0.0;
    while (pos < len) {
      double step = std::min(remaining, len - pos);
      if (dashIdx % 2 == 0 && step > 0.0) {
        Point s{a.x + ux * pos, a.y + uy * pos};
        Point e{a.x + ux * (pos + step), a.y + uy * (pos + step)};
        strokeDeviceSegment(s, e, color, hw);
      }
      pos += step;
      remaining -= step;
      if (remaining <= 1e-9) {
        dashIdx = (dashIdx + 1) % state_.dash.size();
        remaining = state_.dash[dashIdx];
      }
    }
  }
}

void RasterSurface::strokeDeviceSegment(const Point& a, const Point& b, const float color[4],
                                        double hw) {
  // Axis-aligned segments are exact rectangles with butt caps.
  if (a.x == b.x) {
    fillDeviceRect(a.x - hw, std::min(a.y, b.y), a.x + hw, std::max(a.y, b.y), color);
    return;
  }
  if (a.y == b.y) {
    fillDeviceRect(std::min(a.x, b.x), a.y - hw, std::max(a.x, b.x), a.y + hw, color);
    return;
  }

  double minX = std::max({std::min(a.x, b.x) - hw - 1.0, state_.clipX0, 0.0});
  double maxX = std::min({std::max(a.x, b.x) + hw + 1.0, state_.clipX1, static_cast<double>(width_)});
  double minY = std::max({std::min(a.y, b.y) - hw - 1.0, state_.clipY0, 0.0});
  double maxY = std::min({std::max(a.y, b.y) + hw + 1.0, state_.clipY1, static_cast<double>(height_)});
  if (maxX <= minX || maxY <= minY) return;

  double dx = b.x - a.x, dy = b.y - a.y;
  double len2 = dx * dx + dy * dy;

  for (int py = static_cast<int>(std::floor(minY)); py < static_cast<int>(std::ceil(maxY)); py++) {
    double cy = py + 0.5;
    if (cy < state_.clipY0 || cy > state_.clipY1) continue;
    for (int px = static_cast<int>(std::floor(minX)); px < static_cast<int>(std::ceil(maxX)); px++) {
      double cx = px + 0.5;
      if (cx < state_.clipX0 || cx > state_.clipX1) continue;
      double t = ((cx - a.x) * dx + (cy - a.y) * dy) / len2;
      t = clamp01(t);
      double d = std::hypot(cx - (a.x + t * dx), cy - (a.y + t * dy));
      double cov = clamp01(hw + 0.5 - d);
      if (cov > 0.0) blend(px, py, color, cov);
    }
  }
}

// ---- Rectangles ----

void RasterSurface::fillRect(double x, double y, double w, double h, const float color[4]) {
  double x0 = x + state_.tx, y0 = y + state_.ty;
  fillDeviceRect(x0, y0, x0 + w, y0 + h, color);
}

void RasterSurface::strokeRect(double x, double y, double w, double h, const float color[4],
                               double lineWidth) {
  // Four edge bands centered on the rectangle outline.
  double hw = lineWidth / 2.0;
  double x0 = x + state_.tx, y0 = y + state_.ty;
  double x1 = x0 + w, y1 = y0 + h;
  fillDeviceRect(x0 - hw, y0 - hw, x1 + hw, y0 + hw, color); // top
  fillDeviceRect(x0 - hw, y1 - hw, x1 + hw, y1 + hw, color); // bottom
  fillDeviceRect(x0 - hw, y0 + hw, x0 + hw, y1 - hw, color); // left
  fillDeviceRect(x1 - hw, y0 + hw, x1 + hw, y1 - hw, color); // right
}

// ---- Text ----

double RasterSurface::measureText(const std::string& text, double fontPx) {
  auto cps = decodeUtf8(text);
  if (!atlas_.hasFont()) return kFallbackCharWidth * fontPx * static_cast<double>(cps.size());

  atlas_.ensureGlyphs(cps.data(), static_cast<std::uint32_t>(cps.size()));
  double scale = fontPx / static_cast<double>(atlas_.glyphPx());
  double w = 0.0;
  for (auto cp : cps) {
    if (const GlyphInfo* g = atlas_.getGlyph(cp)) w += g->advance * scale;
  }
  return w;
}

double RasterSurface::sampleAtlas(double u, double v) const {
  // Bilinear, texel centers at +0.5
  const std::uint8_t* data = atlas_.atlasData();
  int size = static_cast<int>(atlas_.atlasSize());
  double fx = u - 0.5, fy = v - 0.5;
  int x0 = static_cast<int>(std::floor(fx));
  int y0 = static_cast<int>(std::floor(fy));
  double tx = fx - x0, ty = fy - y0;
  auto texel = [&](int x, int y) -> double {
    if (x < 0 || y < 0 || x >= size || y >= size) return 0.0;
    return data[static_cast<std::size_t>(y) * size + x] / 255.0;
  };
  double top = texel(x0, y0) * (1.0 - tx) + texel(x0 + 1, y0) * tx;
  double bottom = texel(x0, y0 + 1) * (1.0 - tx) + texel(x0 + 1, y0 + 1) * tx;
  return top * (1.0 - ty) + bottom * ty;
}

void RasterSurface::drawText(const std::string& text, double x, double y, const float color[4],
                             double fontPx, TextAlign align, TextBaseline baseline) {
  if (!atlas_.hasFont() || text.empty() || fontPx <= 0.0) return;

  double width = measureText(text, fontPx); // also rasterizes missing glyphs
  double scale = fontPx / static_cast<double>(atlas_.glyphPx());

  double penX = x + state_.tx;
  if (align == TextAlign::Center) penX -= width / 2.0;
  else if (align == TextAlign::Right) penX -= width;

  double ascent = atlas_.ascent() * scale;
  double descent = atlas_.descent() * scale;
  double baseY = y + state_.ty;
  switch (baseline) {
    case TextBaseline::Top:    baseY += ascent; break;
    case TextBaseline::Middle: baseY += (ascent + descent) / 2.0; break;
    case TextBaseline::Bottom: baseY += descent; break;
  }

  for (auto cp : decodeUtf8(text)) {
    const GlyphInfo* g = atlas_.getGlyph(cp);
    if (!g) continue;
    if (g->w > 0 && g->h > 0) {
      double gx0 = penX + g->bearingX * scale;
      double gy0 = baseY - g->bearingY * scale;
      double gx1 = gx0 + g->w * scale;
      double gy1 = gy0 + g->h * scale;

      int px0 = std::max(static_cast<int>(std::floor(std::max(gx0, state_.clipX0))), 0);
      int py0 = std::max(static_cast<int>(std::floor(std::max(gy0, state_.clipY0))), 0);
      int px1 = std::min(static_cast<int>(std::ceil(std::min(gx1, state_.clipX1))), width_);
      int py1 = std::min(static_cast<int>(std::ceil(std::min(gy1, state_.clipY1))), height_);
      for (int py = py0; py < py1; py++) {
        double v = g->atlasY + (py + 0.5 - gy0) / scale;
        for (int px = px0; px < px1; px++) {
          double u = g->atlasX + (px + 0.5 - gx0) / scale;
          double cov = sampleAtlas(u, v);
          if (cov > 0.0) blend(px, py, color, cov);
        }
      }
    }
    penX += g->advance * scale;
  }
}

// ---- Export ----

bool RasterSurface::savePNG(const std::string& path) const {
  return writePNG(path, pixels_.data(), width_, height_);
}

bool RasterSurface::savePPM(const std::string& path) const {
  return writePPM(path, pixels_.data(), width_, height_);
}

} // namespace kl
