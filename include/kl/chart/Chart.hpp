#pragma once
#include "kl/axis/PriceAxis.hpp"
#include "kl/axis/TimeAxis.hpp"
#include "kl/config/ChartConfig.hpp"
#include "kl/core/Scheduler.hpp"
#include "kl/crosshair/Crosshair.hpp"
#include "kl/crosshair/CrosshairRenderer.hpp"
#include "kl/data/CandleSeries.hpp"
#include "kl/data/LiveDataSource.hpp"
#include "kl/debug/Stats.hpp"
#include "kl/drawing/CandleRenderer.hpp"
#include "kl/drawing/VolumeRenderer.hpp"
#include "kl/interaction/PanHandler.hpp"
#include "kl/interaction/ScrollHandler.hpp"
#include "kl/interaction/ZoomHandler.hpp"
#include "kl/layout/LayoutManager.hpp"
#include "kl/plugins/PluginManager.hpp"
#include "kl/render/DrawingSurface.hpp"
#include "kl/style/Theme.hpp"
#include "kl/viewport/Viewport.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kl {

struct ChartOptions {
  DrawingSurface* surface{nullptr}; // required, not owned
  Scheduler* scheduler{nullptr};    // required, not owned
  double width{0};                  // 0: surface width, else 800
  double height{0};                 // 0: surface height, else 600
  Theme theme = darkTheme();
  InteractionOptions interaction;
  double priceAxisWidth{60};
  double timeAxisHeight{40};
  double volumeHeight{0};
};

ChartOptions makeChartOptions(const ChartConfig& cfg, DrawingSurface& surface, Scheduler& scheduler);

// Owns the series, the viewport and the interaction handlers of one chart
// and draws it onto a DrawingSurface one frame at a time.
//
// Frame: layout, BeforeRender, clear, domains, grid, AfterGrid, axes,
// AfterAxes, candles and volume, AfterCandles, crosshair, AfterRender.
//
// Any number of scheduleRender() calls between two frames produce one draw.
class Chart {
public:
  // Throws std::invalid_argument without a surface or scheduler.
  explicit Chart(const ChartOptions& options);
  ~Chart();

  Chart(const Chart&) = delete;
  Chart& operator=(const Chart&) = delete;

  // ---- Series ----
  SeriesId addSeries();
  SeriesId addSeries(const std::vector<Candle>& rows);
  CandleSeries* series(SeriesId id);
  const CandleSeries* series(SeriesId id) const;
  bool removeSeries(SeriesId id);
  void clearSeries();
  std::vector<SeriesId> seriesIds() const;
  std::size_t seriesCount() const { return series_.size(); }
  // First added series still present, or null.
  const CandleSeries* primarySeries() const;

  // Opacity in [0, 1] for one series' candles.
  bool setSeriesOpacity(SeriesId id, double opacity);
  double seriesOpacity(SeriesId id) const;

  // ---- Live data ----
  // The source must outlive the connection (or the chart).
  bool connectDataSource(SeriesId id, LiveDataSource& source);
  bool disconnectDataSource(SeriesId id);

  // ---- Rendering ----
  void scheduleRender();
  void renderNow();
  bool renderPending() const { return renderPending_; }

  // ---- Input ----
  // Canvas-pixel event. Handlers see plot-area coordinates; plugins get the
  // event as delivered.
  void handleEvent(const ChartEvent& ev);

  // ---- Plugins ----
  bool installPlugin(Plugin plugin);
  bool uninstallPlugin(const std::string& name);
  std::vector<std::string> installedPlugins() const { return plugins_.pluginNames(); }
  PluginManager& plugins() { return plugins_; }

  // ---- Navigation ----
  void zoomIn(std::optional<double> centerX = std::nullopt) { zoom_.zoomIn(centerX); }
  void zoomOut(std::optional<double> centerX = std::nullopt) { zoom_.zoomOut(centerX); }
  void resetZoom();
  void scrollLeft(double amount = 0.1) { scroll_.scrollLeft(amount); }
  void scrollRight(double amount = 0.1) { scroll_.scrollRight(amount); }

  // Drops the user's window; the next frame fits all data again.
  void resetViewport();

  // ---- Settings ----
  void setWheelMode(WheelMode mode);
  WheelMode wheelMode() const { return interaction_.wheelMode; }
  void setInteractionOptions(const InteractionOptions& options);
  const InteractionOptions& interactionOptions() const { return interaction_; }
  void setTheme(const Theme& theme);
  const Theme& theme() const { return theme_; }
  void resize(int width, int height);

  // ---- State ----
  const CrosshairState& crosshairState() const { return crosshair_.state(); }
  const Viewport& viewport() const { return viewport_; }
  const ChartLayout& layout() const { return layout_; }
  const FrameStats& stats() const { return stats_; }
  PanMode panMode() const { return pan_.mode(); }
  bool viewportInitialized() const { return initialized_; }
  bool priceAutoScale() const { return autoScalePrice_; }
  DrawingSurface& surface() { return surface_; }
  Scheduler& scheduler() { return scheduler_; }
  CandleRenderer& candleRenderer() { return candleRenderer_; }

private:
  struct SeriesSlot {
    SeriesId id{kInvalidId};
    std::unique_ptr<CandleSeries> series;
    ListenerId listener{kInvalidId};
    double opacity{1.0};
    LiveDataSource* source{nullptr};
    SubscriptionId subscription{kInvalidId};
  };

  SeriesSlot* findSlot(SeriesId id);
  const SeriesSlot* findSlot(SeriesId id) const;
  SeriesId attachSeries(std::unique_ptr<CandleSeries> s);
  void detachSlot(SeriesSlot& slot);
  void applyTheme();

  void computeDomains();
  void drawBackground();
  void drawGrid();
  void drawAxes();
  void drawCandles();
  void runHooks(RenderPhase phase);

  DrawingSurface& surface_;
  Scheduler& scheduler_;
  Theme theme_;
  InteractionOptions interaction_;

  LayoutManager layoutManager_;
  ChartLayout layout_;
  Viewport viewport_;
  TimeAxis timeAxis_;
  PriceAxis priceAxis_;
  CandleRenderer candleRenderer_;
  VolumeRenderer volumeRenderer_;

  PanHandler pan_;
  ZoomHandler zoom_;
  ScrollHandler scroll_;
  Crosshair crosshair_;
  CrosshairRenderer crosshairRenderer_;

  PluginManager plugins_;

  std::vector<SeriesSlot> series_;
  SeriesId nextSeriesId_{1};

  bool initialized_{false};     // user window established
  bool autoScalePrice_{true};   // price range follows the visible data
  bool autoScaleAtDragStart_{true};
  bool renderPending_{false};
  TimerId frameId_{kInvalidId};
  FrameStats stats_;
};

} // namespace kl
