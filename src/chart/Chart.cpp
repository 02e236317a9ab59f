#include "kl/chart/Chart.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <limits>
#include <stdexcept>
#include <utility>

namespace kl {

namespace {

constexpr double kDefaultWidth = 800.0;
constexpr double kDefaultHeight = 600.0;
constexpr double kPricePadding = 0.05; // fraction of the visible price range
constexpr double kDefaultBarMs = 60000.0;
constexpr double kTimeLabelOffset = 20.0;
constexpr double kPriceLabelOffset = 10.0;

DrawingSurface& requireSurface(const ChartOptions& o) {
  if (!o.surface) throw std::invalid_argument("Chart: a drawing surface is required");
  return *o.surface;
}

Scheduler& requireScheduler(const ChartOptions& o) {
  if (!o.scheduler) throw std::invalid_argument("Chart: a scheduler is required");
  return *o.scheduler;
}

LayoutConfig layoutConfigFor(const ChartOptions& o, double width, double height) {
  LayoutConfig lc;
  lc.width = width;
  lc.height = height;
  lc.priceAxisWidth = o.priceAxisWidth;
  lc.timeAxisHeight = o.timeAxisHeight;
  lc.volumeHeight = o.volumeHeight;
  double p = o.theme.paddingPx;
  lc.padding = LayoutPadding{p, p, p, p};
  return lc;
}

double resolveDimension(double requested, int surfaceSize, double fallback) {
  if (requested > 0.0) return requested;
  if (surfaceSize > 0) return static_cast<double>(surfaceSize);
  return fallback;
}

// Integer window covering only timestamps inside [start, end].
TimeRange innerRange(const ViewTimeRange& r) {
  return TimeRange{static_cast<std::int64_t>(std::ceil(r.start)),
                   static_cast<std::int64_t>(std::floor(r.end))};
}

} // anonymous namespace

ChartOptions makeChartOptions(const ChartConfig& cfg, DrawingSurface& surface, Scheduler& scheduler) {
  ChartOptions o;
  o.surface = &surface;
  o.scheduler = &scheduler;
  o.width = cfg.width;
  o.height = cfg.height;
  o.theme = cfg.theme;
  o.interaction = cfg.interaction;
  o.priceAxisWidth = cfg.priceAxisWidth;
  o.timeAxisHeight = cfg.timeAxisHeight;
  o.volumeHeight = cfg.volumeHeight;
  return o;
}

Chart::Chart(const ChartOptions& options)
    : surface_(requireSurface(options)),
      scheduler_(requireScheduler(options)),
      theme_(options.theme),
      interaction_(options.interaction),
      layoutManager_(layoutConfigFor(options,
                                     resolveDimension(options.width, options.surface->width(), kDefaultWidth),
                                     resolveDimension(options.height, options.surface->height(), kDefaultHeight))),
      timeAxis_(ViewTimeRange{}, 0.0),
      priceAxis_(PriceRange{0, 100}, 0.0),
      pan_(viewport_, [this] { scheduleRender(); }),
      zoom_(viewport_, interaction_, [this] { scheduleRender(); }),
      scroll_(viewport_, interaction_.wheelMode, [this] { scheduleRender(); }),
      crosshair_(viewport_),
      crosshairRenderer_(crosshair_, viewport_),
      plugins_(*this) {
  const LayoutConfig& lc = layoutManager_.config();
  int w = static_cast<int>(std::lround(lc.width));
  int h = static_cast<int>(std::lround(lc.height));
  if (surface_.width() != w || surface_.height() != h) surface_.resize(w, h);

  layout_ = layoutManager_.compute();
  viewport_.setDimensions(layout_.chartArea.width, layout_.chartArea.height);
  applyTheme();
  scheduleRender();
}

Chart::~Chart() {
  if (frameId_ != kInvalidId) scheduler_.cancel(frameId_);
  plugins_.uninstallAll();
  for (auto& slot : series_) detachSlot(slot);
}

// ---- Series ----

SeriesId Chart::attachSeries(std::unique_ptr<CandleSeries> s) {
  SeriesSlot slot;
  slot.id = nextSeriesId_++;
  slot.listener = s->onChange([this] { scheduleRender(); });
  slot.series = std::move(s);
  series_.push_back(std::move(slot));
  crosshair_.setSeries(primarySeries());
  scheduleRender();
  return series_.back().id;
}

SeriesId Chart::addSeries() {
  return attachSeries(std::make_unique<CandleSeries>());
}

SeriesId Chart::addSeries(const std::vector<Candle>& rows) {
  return attachSeries(std::make_unique<CandleSeries>(rows));
}

Chart::SeriesSlot* Chart::findSlot(SeriesId id) {
  for (auto& s : series_) {
    if (s.id == id) return &s;
  }
  return nullptr;
}

const Chart::SeriesSlot* Chart::findSlot(SeriesId id) const {
  for (const auto& s : series_) {
    if (s.id == id) return &s;
  }
  return nullptr;
}

CandleSeries* Chart::series(SeriesId id) {
  SeriesSlot* s = findSlot(id);
  return s ? s->series.get() : nullptr;
}

const CandleSeries* Chart::series(SeriesId id) const {
  const SeriesSlot* s = findSlot(id);
  return s ? s->series.get() : nullptr;
}

const CandleSeries* Chart::primarySeries() const {
  return series_.empty() ? nullptr : series_.front().series.get();
}

std::vector<SeriesId> Chart::seriesIds() const {
  std::vector<SeriesId> ids;
  ids.reserve(series_.size());
  for (const auto& s : series_) ids.push_back(s.id);
  return ids;
}

void Chart::detachSlot(SeriesSlot& slot) {
  if (slot.source) {
    slot.source->unsubscribe(slot.subscription);
    slot.source = nullptr;
    slot.subscription = kInvalidId;
  }
  if (slot.series && slot.listener != kInvalidId) {
    slot.series->removeListener(slot.listener);
    slot.listener = kInvalidId;
  }
}

bool Chart::removeSeries(SeriesId id) {
  auto it = std::find_if(series_.begin(), series_.end(),
                         [id](const SeriesSlot& s) { return s.id == id; });
  if (it == series_.end()) {
    std::fprintf(stderr, "Chart: removeSeries: unknown series %llu\n",
                 static_cast<unsigned long long>(id));
    return false;
  }
  detachSlot(*it);
  series_.erase(it);
  crosshair_.setSeries(primarySeries());
  crosshair_.hide();
  scheduleRender();
  return true;
}

void Chart::clearSeries() {
  for (auto& slot : series_) detachSlot(slot);
  series_.clear();
  crosshair_.setSeries(nullptr);
  crosshair_.hide();
  scheduleRender();
}

bool Chart::setSeriesOpacity(SeriesId id, double opacity) {
  SeriesSlot* s = findSlot(id);
  if (!s) {
    std::fprintf(stderr, "Chart: setSeriesOpacity: unknown series %llu\n",
                 static_cast<unsigned long long>(id));
    return false;
  }
  s->opacity = std::isfinite(opacity) ? std::clamp(opacity, 0.0, 1.0) : 1.0;
  scheduleRender();
  return true;
}

double Chart::seriesOpacity(SeriesId id) const {
  const SeriesSlot* s = findSlot(id);
  return s ? s->opacity : 1.0;
}

// ---- Live data ----

bool Chart::connectDataSource(SeriesId id, LiveDataSource& source) {
  SeriesSlot* s = findSlot(id);
  if (!s) {
    std::fprintf(stderr, "Chart: connectDataSource: unknown series %llu\n",
                 static_cast<unsigned long long>(id));
    return false;
  }
  if (s->source) disconnectDataSource(id);

  s->source = &source;
  s->subscription = source.subscribe([this, id](const Candle& c) {
    if (CandleSeries* target = series(id)) target->updateOrAppend(c);
  });
  return true;
}

bool Chart::disconnectDataSource(SeriesId id) {
  SeriesSlot* s = findSlot(id);
  if (!s || !s->source) {
    std::fprintf(stderr, "Chart: disconnectDataSource: series %llu has no source\n",
                 static_cast<unsigned long long>(id));
    return false;
  }
  LiveDataSource* src = s->source;
  SubscriptionId sub = s->subscription;
  s->source = nullptr;
  s->subscription = kInvalidId;
  src->unsubscribe(sub);
  return true;
}

// ---- Rendering ----

void Chart::scheduleRender() {
  stats_.renderRequests++;
  if (renderPending_) {
    stats_.coalescedRequests++;
    return;
  }
  renderPending_ = true;
  frameId_ = scheduler_.requestFrame([this] {
    frameId_ = kInvalidId;
    renderNow();
    renderPending_ = false;
  });
}

void Chart::runHooks(RenderPhase phase) {
  PluginContext ctx;
  ctx.phase = phase;
  ctx.surface = &surface_;
  ctx.layout = &layout_;
  ctx.chart = this;
  plugins_.executeHooks(ctx);
}

void Chart::renderNow() {
  auto t0 = std::chrono::steady_clock::now();

  layout_ = layoutManager_.compute();
  runHooks(RenderPhase::BeforeRender);

  surface_.clear();
  drawBackground();
  computeDomains();

  drawGrid();
  runHooks(RenderPhase::AfterGrid);

  drawAxes();
  runHooks(RenderPhase::AfterAxes);

  drawCandles();
  runHooks(RenderPhase::AfterCandles);

  if (interaction_.enableCrosshair) crosshairRenderer_.draw(surface_, layout_.chartArea);
  runHooks(RenderPhase::AfterRender);

  auto t1 = std::chrono::steady_clock::now();
  stats_.lastFrameMs = std::chrono::duration<double, std::milli>(t1 - t0).count();
  stats_.framesRendered++;
}

void Chart::computeDomains() {
  const LayoutRect& area = layout_.chartArea;
  viewport_.setDimensions(area.width, area.height);

  double minTime = std::numeric_limits<double>::infinity();
  double maxTime = -std::numeric_limits<double>::infinity();
  const CandleSeries* firstNonEmpty = nullptr;
  for (const auto& slot : series_) {
    auto dx = slot.series->domainX();
    if (!dx) continue;
    if (!firstNonEmpty) firstNonEmpty = slot.series.get();
    minTime = std::min(minTime, static_cast<double>(dx->start));
    maxTime = std::max(maxTime, static_cast<double>(dx->end));
  }

  if (!firstNonEmpty) {
    // Nothing to fit yet.
    if (!initialized_) viewport_.setTimeRange(0.0, 1000.0);
    if (autoScalePrice_) viewport_.setPriceConfig(ViewportPriceConfig{0.0, 100.0, 0.0});
  } else {
    if (!initialized_) {
      viewport_.setTimeRange(minTime, maxTime);
      initialized_ = true;
    }

    // Price over the visible window.
    TimeRange window = innerRange(viewport_.timeRange());
    double minPrice = std::numeric_limits<double>::infinity();
    double maxPrice = -std::numeric_limits<double>::infinity();
    for (const auto& slot : series_) {
      auto dy = slot.series->domainY(window);
      if (!dy) continue;
      minPrice = std::min(minPrice, dy->min);
      maxPrice = std::max(maxPrice, dy->max);
    }
    if (!std::isfinite(minPrice) || !std::isfinite(maxPrice)) {
      minPrice = 0.0;
      maxPrice = 100.0;
    }
    double pad = (maxPrice - minPrice) * kPricePadding;
    if (autoScalePrice_) {
      viewport_.setPriceConfig(ViewportPriceConfig{minPrice - pad, maxPrice + pad, 0.0});
    }

    // Zoom limits follow the data every frame.
    double avg = (maxTime - minTime) / static_cast<double>(firstNonEmpty->length());
    if (!(avg > 0.0)) avg = kDefaultBarMs;
    zoom_.setDataBounds(minTime, maxTime, avg);
  }

  crosshair_.setSeries(primarySeries());

  timeAxis_.setTimeRange(viewport_.timeRange());
  timeAxis_.setWidth(area.width);
  const ViewportPriceConfig& pc = viewport_.priceConfig();
  priceAxis_.setPriceRange(PriceRange{pc.min, pc.max});
  priceAxis_.setHeight(area.height);
  priceAxis_.setPadding(pc.paddingPx);
}

void Chart::drawBackground() {
  const LayoutRect& t = layout_.total;
  surface_.fillRect(t.x, t.y, t.width, t.height, theme_.backgroundColor);
}

void Chart::drawGrid() {
  const LayoutRect& area = layout_.chartArea;
  if (area.width <= 0.0 || area.height <= 0.0) return;

  surface_.save();
  surface_.setClip(area.x, area.y, area.width, area.height);

  for (const auto& tick : timeAxis_.generateTicks()) {
    double x = area.x + tick.position;
    surface_.beginPath();
    surface_.moveTo(x, area.y);
    surface_.lineTo(x, area.y + area.height);
    surface_.stroke(theme_.gridColor, theme_.gridLineWidth);
  }
  for (const auto& tick : priceAxis_.generateTicks()) {
    double y = area.y + tick.position;
    surface_.beginPath();
    surface_.moveTo(area.x, y);
    surface_.lineTo(area.x + area.width, y);
    surface_.stroke(theme_.gridColor, theme_.gridLineWidth);
  }

  surface_.restore();
}

void Chart::drawAxes() {
  const LayoutRect& area = layout_.chartArea;
  const LayoutRect& timeArea = layout_.timeAxisArea;
  const LayoutRect& priceArea = layout_.priceAxisArea;

  // Axis lines along the plot's right and bottom edges.
  surface_.beginPath();
  surface_.moveTo(priceArea.x, priceArea.y);
  surface_.lineTo(priceArea.x, priceArea.y + priceArea.height);
  surface_.moveTo(timeArea.x, timeArea.y);
  surface_.lineTo(timeArea.x + timeArea.width, timeArea.y);
  surface_.stroke(theme_.axisLineColor, theme_.strokeWidth);

  for (const auto& tick : timeAxis_.generateTicks()) {
    surface_.drawText(tick.label, timeArea.x + tick.position, timeArea.y + kTimeLabelOffset,
                      theme_.labelColor, theme_.fontPx, TextAlign::Center, TextBaseline::Middle);
  }
  for (const auto& tick : priceAxis_.generateTicks()) {
    surface_.drawText(tick.label, priceArea.x + kPriceLabelOffset, area.y + tick.position,
                      theme_.labelColor, theme_.fontPx, TextAlign::Left, TextBaseline::Middle);
  }
}

void Chart::drawCandles() {
  stats_.visibleCandles = 0;
  const LayoutRect& area = layout_.chartArea;
  if (area.width <= 0.0 || area.height <= 0.0) return;

  TimeRange window = innerRange(viewport_.timeRange());
  double fallbackInterval = zoom_.avgCandleDuration();

  for (const auto& slot : series_) {
    const CandleSeries& s = *slot.series;
    if (s.empty()) continue;
    DataView view = s.rangeByTime(window.start, window.end);
    if (view.empty()) continue;
    stats_.visibleCandles += view.length;

    surface_.save();
    surface_.setClip(area.x, area.y, area.width, area.height);
    surface_.translate(area.x, area.y);
    if (slot.opacity < 1.0) surface_.setGlobalAlpha(slot.opacity);
    double bodyWidth = candleRenderer_.draw(surface_, viewport_, view, fallbackInterval);
    surface_.restore();

    if (layout_.volumeArea && view.volume) {
      const LayoutRect& va = *layout_.volumeArea;
      surface_.save();
      surface_.setClip(va.x, va.y, va.width, va.height);
      surface_.translate(va.x, va.y);
      if (slot.opacity < 1.0) surface_.setGlobalAlpha(slot.opacity);
      volumeRenderer_.draw(surface_, viewport_, view, va.height, bodyWidth);
      surface_.restore();
    }
  }
}

// ---- Input ----

void Chart::handleEvent(const ChartEvent& ev) {
  ChartEvent local = ev;
  local.chartX -= layout_.chartArea.x;
  local.chartY -= layout_.chartArea.y;

  switch (ev.type) {
    case EventType::PointerDown:
      if (interaction_.enablePan && pan_.onPointerDown(local)) {
        autoScaleAtDragStart_ = autoScalePrice_;
      }
      break;
    case EventType::PointerMove:
      if (interaction_.enablePan && pan_.isPanning()) {
        // A price drag takes the price axis off auto-scale.
        if (pan_.mode() == PanMode::PanningPrice) autoScalePrice_ = false;
        pan_.onPointerMove(local);
      }
      if (interaction_.enableCrosshair && !pan_.isPanning()) {
        crosshair_.onPointerMove(local);
        scheduleRender();
      }
      break;
    case EventType::PointerUp:
      if (pan_.isPanning()) pan_.onPointerUp(local);
      break;
    case EventType::PointerCancel:
      if (pan_.isPanning()) {
        autoScalePrice_ = autoScaleAtDragStart_;
        pan_.onPointerCancel(local);
      }
      break;
    case EventType::MouseLeave:
      if (interaction_.enableCrosshair) {
        crosshair_.hide();
        scheduleRender();
      }
      break;
    case EventType::Wheel:
      if (interaction_.wheelMode == WheelMode::ZoomX) {
        zoom_.onWheel(local);
      } else if (!scroll_.onWheel(local)) {
        zoom_.onWheel(local);
      }
      break;
    case EventType::Click:
    case EventType::DblClick:
      break;
  }

  plugins_.dispatchEvent(ev);
}

// ---- Plugins ----

bool Chart::installPlugin(Plugin plugin) {
  bool ok = plugins_.install(std::move(plugin));
  if (ok) scheduleRender();
  return ok;
}

bool Chart::uninstallPlugin(const std::string& name) {
  bool ok = plugins_.uninstall(name);
  if (ok) scheduleRender();
  return ok;
}

// ---- Navigation ----

void Chart::resetZoom() {
  autoScalePrice_ = true;
  zoom_.resetZoom();
}

void Chart::resetViewport() {
  initialized_ = false;
  autoScalePrice_ = true;
  pan_.reset();
  scheduleRender();
}

// ---- Settings ----

void Chart::setWheelMode(WheelMode mode) {
  interaction_.wheelMode = mode;
  scroll_.setWheelMode(mode);
  zoom_.setOptions(interaction_);
}

void Chart::setInteractionOptions(const InteractionOptions& options) {
  interaction_ = options;
  zoom_.setOptions(options);
  scroll_.setWheelMode(options.wheelMode);
  if (!options.enablePan) pan_.reset();
  if (!options.enableCrosshair) crosshair_.hide();
  scheduleRender();
}

void Chart::applyTheme() {
  candleRenderer_.setStyle(candleStyleFromTheme(theme_));
  volumeRenderer_.setStyle(volumeStyleFromTheme(theme_));
  crosshairRenderer_.setStyle(crosshairStyleFromTheme(theme_));

  LayoutConfig lc = layoutManager_.config();
  double p = theme_.paddingPx;
  lc.padding = LayoutPadding{p, p, p, p};
  layoutManager_.setConfig(lc);
}

void Chart::setTheme(const Theme& theme) {
  theme_ = theme;
  applyTheme();
  scheduleRender();
}

void Chart::resize(int width, int height) {
  if (width <= 0 || height <= 0) {
    std::fprintf(stderr, "Chart: ignoring resize to %dx%d\n", width, height);
    return;
  }
  surface_.resize(width, height);
  layoutManager_.setDimensions(width, height);
  layout_ = layoutManager_.compute();
  viewport_.setDimensions(layout_.chartArea.width, layout_.chartArea.height);
  scheduleRender();
}

} // namespace kl
