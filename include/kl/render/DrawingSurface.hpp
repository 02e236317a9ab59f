#pragma once
#include <string>
#include <vector>

namespace kl {

enum class TextAlign { Left, Center, Right };
enum class TextBaseline { Top, Middle, Bottom };

// Immediate-mode 2D drawing target consumed by the engine. Colors are RGBA
// float[4]. State (clip, translation, dash, alpha) is saved/restored as a
// stack like a canvas context.
class DrawingSurface {
public:
  virtual ~DrawingSurface() = default;

  // Paths
  virtual void beginPath() = 0;
  virtual void moveTo(double x, double y) = 0;
  virtual void lineTo(double x, double y) = 0;
  virtual void stroke(const float color[4], double lineWidth = 1.0) = 0;

  // Rectangles
  virtual void fillRect(double x, double y, double w, double h, const float color[4]) = 0;
  virtual void strokeRect(double x, double y, double w, double h, const float color[4],
                          double lineWidth = 1.0) = 0;

  // Text
  virtual void drawText(const std::string& text, double x, double y, const float color[4],
                        double fontPx, TextAlign align = TextAlign::Left,
                        TextBaseline baseline = TextBaseline::Middle) = 0;
  virtual double measureText(const std::string& text, double fontPx) = 0;

  // Whole-surface clear to the current clear color.
  virtual void clear() = 0;

  // State
  virtual void setClip(double x, double y, double w, double h) = 0;
  virtual void translate(double dx, double dy) = 0;
  virtual void save() = 0;
  virtual void restore() = 0;
  virtual void setLineDash(const std::vector<double>& pattern) = 0;
  virtual void setGlobalAlpha(double alpha) = 0;

  // Size
  virtual void resize(int width, int height) = 0;
  virtual int width() const = 0;
  virtual int height() const = 0;
};

} // namespace kl
