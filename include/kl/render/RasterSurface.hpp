#pragma once
#include "kl/render/DrawingSurface.hpp"
#include "kl/text/GlyphAtlas.hpp"

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace kl {

// Software DrawingSurface over a top-down RGBA8 framebuffer.
// Strokes and rectangle edges are anti-aliased by pixel coverage; text is
// drawn from a GlyphAtlas once a font is loaded.
class RasterSurface : public DrawingSurface {
public:
  RasterSurface(int width, int height);

  // Paths
  void beginPath() override;
  void moveTo(double x, double y) override;
  void lineTo(double x, double y) override;
  void stroke(const float color[4], double lineWidth = 1.0) override;

  // Rectangles
  void fillRect(double x, double y, double w, double h, const float color[4]) override;
  void strokeRect(double x, double y, double w, double h, const float color[4],
                  double lineWidth = 1.0) override;

  // Text
  void drawText(const std::string& text, double x, double y, const float color[4],
                double fontPx, TextAlign align = TextAlign::Left,
                TextBaseline baseline = TextBaseline::Middle) override;
  double measureText(const std::string& text, double fontPx) override;

  void clear() override;

  // State
  void setClip(double x, double y, double w, double h) override;
  void translate(double dx, double dy) override;
  void save() override;
  void restore() override;
  void setLineDash(const std::vector<double>& pattern) override;
  void setGlobalAlpha(double alpha) override;

  // Size
  void resize(int width, int height) override;
  int width() const override { return width_; }
  int height() const override { return height_; }

  void setClearColor(const float color[4]);

  bool loadFontFile(const std::string& path) { return atlas_.loadFontFile(path); }
  bool loadFont(const std::uint8_t* data, std::uint32_t len) { return atlas_.loadFont(data, len); }
  const GlyphAtlas& glyphs() const { return atlas_; }

  const std::vector<std::uint8_t>& pixels() const { return pixels_; }
  std::array<std::uint8_t, 4> pixel(int x, int y) const;

  bool savePNG(const std::string& path) const;
  bool savePPM(const std::string& path) const;

  std::size_t saveDepth() const { return stack_.size(); }

private:
  struct Point {
    double x, y;
  };

  struct State {
    double tx{0}, ty{0};
    // Device-space clip rectangle
    double clipX0{0}, clipY0{0}, clipX1{0}, clipY1{0};
    std::vector<double> dash;
    double alpha{1.0};
  };

  void resetState();
  void blend(int x, int y, const float color[4], double coverage);
  void fillDeviceRect(double x0, double y0, double x1, double y1, const float color[4]);
  void strokeDeviceSegment(const Point& a, const Point& b, const float color[4], double halfWidth);
  void strokePolyline(const std::vector<Point>& pts, const float color[4], double lineWidth);
  double sampleAtlas(double u, double v) const;

  int width_;
  int height_;
  std::vector<std::uint8_t> pixels_;
  float clearColor_[4] = {0.0f, 0.0f, 0.0f, 0.0f};

  State state_;
  std::vector<State> stack_;
  std::vector<std::vector<Point>> path_; // device-space subpaths

  GlyphAtlas atlas_;
};

} // namespace kl
