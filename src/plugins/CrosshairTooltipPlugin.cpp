#include "kl/plugins/CrosshairTooltipPlugin.hpp"
#include "kl/axis/TimeFormat.hpp"
#include "kl/chart/Chart.hpp"

#include <algorithm>
#include <cstdio>
#include <memory>

namespace kl {

std::string formatVolume(double volume) {
  char buf[32];
  if (volume >= 1e9) std::snprintf(buf, sizeof(buf), "%.2fB", volume / 1e9);
  else if (volume >= 1e6) std::snprintf(buf, sizeof(buf), "%.2fM", volume / 1e6);
  else if (volume >= 1e3) std::snprintf(buf, sizeof(buf), "%.2fK", volume / 1e3);
  else std::snprintf(buf, sizeof(buf), "%.0f", volume);
  return buf;
}

std::vector<std::string> tooltipLines(const Candle& candle, bool utc) {
  std::vector<std::string> lines;
  lines.push_back(formatTimestamp(candle.ts, "%Y-%m-%d %H:%M", utc));

  char buf[64];
  std::snprintf(buf, sizeof(buf), "O: %.2f", candle.open);
  lines.emplace_back(buf);
  std::snprintf(buf, sizeof(buf), "H: %.2f", candle.high);
  lines.emplace_back(buf);
  std::snprintf(buf, sizeof(buf), "L: %.2f", candle.low);
  lines.emplace_back(buf);
  std::snprintf(buf, sizeof(buf), "C: %.2f", candle.close);
  lines.emplace_back(buf);
  if (candle.volume) lines.push_back("V: " + formatVolume(*candle.volume));
  return lines;
}

LayoutRect placeTooltip(double cursorX, double cursorY, double w, double h,
                        const LayoutRect& area, double offset) {
  double x = cursorX + offset;
  double y = cursorY + offset;
  if (x + w > area.x + area.width) x = cursorX - w - offset;
  if (y + h > area.y + area.height) y = cursorY - h - offset;
  x = std::max(area.x, std::min(x, area.x + area.width - w));
  y = std::max(area.y, std::min(y, area.y + area.height - h));
  return LayoutRect{x, y, w, h};
}

namespace {

struct TooltipState {
  TooltipStyle style;
  Chart* chart{nullptr};
};

void drawTooltip(const TooltipState& st, const PluginContext& ctx) {
  const CrosshairState& cs = st.chart->crosshairState();
  if (!cs.visible || !cs.candle) return;

  DrawingSurface& s = *ctx.surface;
  const Theme& theme = st.chart->theme();
  const LayoutRect& area = ctx.layout->chartArea;
  double fontPx = st.style.fontPx > 0.0 ? st.style.fontPx : theme.fontPx;

  auto lines = tooltipLines(*cs.candle, st.style.utc);
  double textW = 0.0;
  for (const auto& l : lines) textW = std::max(textW, s.measureText(l, fontPx));

  double w = textW + st.style.padding * 2.0;
  double h = static_cast<double>(lines.size()) * st.style.lineHeight + st.style.padding * 2.0;
  // Crosshair coordinates are plot-relative.
  LayoutRect box = placeTooltip(area.x + cs.x, area.y + cs.y, w, h, area, st.style.offset);

  s.save();
  s.fillRect(box.x, box.y, box.width, box.height, theme.tooltipBackground);
  s.strokeRect(box.x, box.y, box.width, box.height, theme.tooltipBorder, 1.0);
  for (std::size_t i = 0; i < lines.size(); i++) {
    double ty = box.y + st.style.padding + static_cast<double>(i) * st.style.lineHeight +
                st.style.lineHeight / 2.0;
    s.drawText(lines[i], box.x + st.style.padding, ty, theme.tooltipText, fontPx,
               TextAlign::Left, TextBaseline::Middle);
  }
  s.restore();
}

} // anonymous namespace

Plugin makeCrosshairTooltipPlugin(const TooltipStyle& style) {
  auto state = std::make_shared<TooltipState>();
  state->style = style;

  Plugin p;
  p.name = "crosshair-tooltip";
  p.onInstall = [state](Chart& chart) { state->chart = &chart; };
  p.onUninstall = [state](Chart&) { state->chart = nullptr; };
  p.onRender = [state](const PluginContext& ctx) {
    if (ctx.phase != RenderPhase::AfterRender || !state->chart) return;
    drawTooltip(*state, ctx);
  };
  return p;
}

} // namespace kl
