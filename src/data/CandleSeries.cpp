#include "kl/data/CandleSeries.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <limits>

namespace kl {

static constexpr std::size_t kMinCapacity = 16;

static double absentVolume() { return std::numeric_limits<double>::quiet_NaN(); }

// ---- DataView ----

bool DataView::hasVolume(std::size_t i) const {
  return volume && i < length && !std::isnan(volume[i]);
}

Candle DataView::candleAt(std::size_t i) const {
  Candle c;
  c.ts = ts[i];
  c.open = open[i];
  c.high = high[i];
  c.low = low[i];
  c.close = close[i];
  if (hasVolume(i)) c.volume = volume[i];
  if (meta) c.meta = meta[i];
  return c;
}

// ---- CandleSeries ----

CandleSeries::CandleSeries(const std::vector<Candle>& rows) {
  setData(rows);
}

void CandleSeries::setData(const std::vector<Candle>& rows) {
  if (rows.empty()) {
    clear();
    return;
  }

  std::vector<Candle> sorted(rows);
  std::stable_sort(sorted.begin(), sorted.end(),
                   [](const Candle& a, const Candle& b) { return a.ts < b.ts; });

  hasVolume_ = std::any_of(sorted.begin(), sorted.end(),
                           [](const Candle& c) { return c.volume.has_value(); });
  hasMeta_ = std::any_of(sorted.begin(), sorted.end(),
                         [](const Candle& c) { return c.meta.has_value(); });

  volume_.clear();
  meta_.clear();
  reserveExact(sorted.size());

  for (std::size_t i = 0; i < sorted.size(); i++) writeRow(i, sorted[i]);
  length_ = sorted.size();

  notifyChange();
}

bool CandleSeries::appendCandle(const Candle& row) {
  if (length_ > 0 && row.ts < ts_[length_ - 1]) {
    std::fprintf(stderr, "CandleSeries: append rejected, ts %lld precedes last ts %lld\n",
                 static_cast<long long>(row.ts), static_cast<long long>(ts_[length_ - 1]));
    return false;
  }

  if (length_ == capacity_) grow();
  if (row.volume && !hasVolume_) ensureVolumeColumn();
  if (row.meta && !hasMeta_) ensureMetaColumn();

  writeRow(length_, row);
  length_++;

  notifyChange();
  return true;
}

bool CandleSeries::updateLastCandle(const Candle& row) {
  if (length_ == 0) {
    std::fprintf(stderr, "CandleSeries: updateLastCandle on empty series ignored\n");
    return false;
  }
  if (length_ >= 2 && row.ts < ts_[length_ - 2]) {
    std::fprintf(stderr, "CandleSeries: update rejected, ts %lld precedes previous ts %lld\n",
                 static_cast<long long>(row.ts), static_cast<long long>(ts_[length_ - 2]));
    return false;
  }

  if (row.volume && !hasVolume_) ensureVolumeColumn();
  if (row.meta && !hasMeta_) ensureMetaColumn();

  writeRow(length_ - 1, row);

  notifyChange();
  return true;
}

bool CandleSeries::updateOrAppend(const Candle& row) {
  if (length_ == 0) return appendCandle(row);

  std::int64_t lastTs = ts_[length_ - 1];
  if (row.ts == lastTs) return updateLastCandle(row);
  if (row.ts > lastTs) return appendCandle(row);

  std::fprintf(stderr, "CandleSeries: out-of-order candle ignored (ts %lld < last %lld)\n",
               static_cast<long long>(row.ts), static_cast<long long>(lastTs));
  return false;
}

void CandleSeries::clear() {
  ts_ = {};
  open_ = {};
  high_ = {};
  low_ = {};
  close_ = {};
  volume_ = {};
  meta_ = {};
  length_ = 0;
  capacity_ = 0;
  hasVolume_ = false;
  hasMeta_ = false;

  notifyChange();
}

// ---- Storage ----

void CandleSeries::reserveExact(std::size_t cap) {
  if (cap != capacity_) reallocations_++;
  ts_.resize(cap, 0);
  open_.resize(cap, 0.0);
  high_.resize(cap, 0.0);
  low_.resize(cap, 0.0);
  close_.resize(cap, 0.0);
  if (hasVolume_) volume_.resize(cap, absentVolume());
  if (hasMeta_) meta_.resize(cap);
  capacity_ = cap;
}

void CandleSeries::grow() {
  std::size_t next = static_cast<std::size_t>(std::ceil(static_cast<double>(capacity_) * 1.5));
  reserveExact(std::max(kMinCapacity, next));
}

void CandleSeries::ensureVolumeColumn() {
  hasVolume_ = true;
  volume_.assign(capacity_, absentVolume());
}

void CandleSeries::ensureMetaColumn() {
  hasMeta_ = true;
  meta_.assign(capacity_, std::nullopt);
}

void CandleSeries::writeRow(std::size_t i, const Candle& row) {
  ts_[i] = row.ts;
  open_[i] = row.open;
  high_[i] = row.high;
  low_[i] = row.low;
  close_[i] = row.close;
  if (hasVolume_) volume_[i] = row.volume ? *row.volume : absentVolume();
  if (hasMeta_) meta_[i] = row.meta;
}

// ---- Queries ----

std::size_t CandleSeries::firstIndexAtOrAfter(std::int64_t t) const {
  std::size_t lo = 0, hi = length_;
  while (lo < hi) {
    std::size_t mid = lo + (hi - lo) / 2;
    if (ts_[mid] < t) lo = mid + 1;
    else hi = mid;
  }
  return lo;
}

std::ptrdiff_t CandleSeries::lastIndexAtOrBefore(std::int64_t t) const {
  // Upper bound minus one.
  std::size_t lo = 0, hi = length_;
  while (lo < hi) {
    std::size_t mid = lo + (hi - lo) / 2;
    if (ts_[mid] <= t) lo = mid + 1;
    else hi = mid;
  }
  return static_cast<std::ptrdiff_t>(lo) - 1;
}

DataView CandleSeries::rangeByIndex(std::ptrdiff_t lo, std::ptrdiff_t hi) const {
  DataView view;
  auto len = static_cast<std::ptrdiff_t>(length_);
  std::ptrdiff_t start = std::max<std::ptrdiff_t>(0, std::min(lo, len));
  std::ptrdiff_t end = std::max<std::ptrdiff_t>(0, std::min(hi, len));
  if (end < start) end = start;

  view.startIndex = static_cast<std::size_t>(start);
  view.endIndex = static_cast<std::size_t>(end);
  view.length = view.endIndex - view.startIndex;
  if (length_ == 0) return view;

  view.ts = ts_.data() + start;
  view.open = open_.data() + start;
  view.high = high_.data() + start;
  view.low = low_.data() + start;
  view.close = close_.data() + start;
  if (hasVolume_) view.volume = volume_.data() + start;
  if (hasMeta_) view.meta = meta_.data() + start;
  return view;
}

DataView CandleSeries::rangeByTime(std::int64_t t0, std::int64_t t1) const {
  auto lo = static_cast<std::ptrdiff_t>(firstIndexAtOrAfter(t0));
  auto hi = lastIndexAtOrBefore(t1) + 1;
  return rangeByIndex(lo, hi);
}

std::optional<TimeRange> CandleSeries::domainX() const {
  if (length_ == 0) return std::nullopt;
  return TimeRange{ts_[0], ts_[length_ - 1]};
}

std::optional<PriceRange> CandleSeries::domainY(std::optional<TimeRange> range) const {
  if (length_ == 0) return std::nullopt;

  std::ptrdiff_t lo = 0;
  std::ptrdiff_t hi = static_cast<std::ptrdiff_t>(length_) - 1;
  if (range) {
    lo = static_cast<std::ptrdiff_t>(firstIndexAtOrAfter(range->start));
    hi = lastIndexAtOrBefore(range->end);
  }
  if (hi < lo) return std::nullopt;

  PriceRange out{low_[static_cast<std::size_t>(lo)], high_[static_cast<std::size_t>(lo)]};
  for (std::ptrdiff_t i = lo + 1; i <= hi; i++) {
    auto k = static_cast<std::size_t>(i);
    out.min = std::min(out.min, low_[k]);
    out.max = std::max(out.max, high_[k]);
  }
  return out;
}

std::optional<Candle> CandleSeries::candleAt(std::size_t i) const {
  if (i >= length_) return std::nullopt;
  return rangeByIndex(static_cast<std::ptrdiff_t>(i), static_cast<std::ptrdiff_t>(i) + 1).candleAt(0);
}

std::int64_t CandleSeries::timestampAt(std::size_t i) const {
  return i < length_ ? ts_[i] : -1;
}

std::vector<Candle> CandleSeries::toVector() const {
  std::vector<Candle> out;
  out.reserve(length_);
  DataView all = rangeByIndex(0, static_cast<std::ptrdiff_t>(length_));
  for (std::size_t i = 0; i < all.length; i++) out.push_back(all.candleAt(i));
  return out;
}

// ---- Listeners ----

ListenerId CandleSeries::onChange(ChangeCallback cb) {
  return listeners_.add(std::move(cb));
}

bool CandleSeries::removeListener(ListenerId id) {
  return listeners_.remove(id);
}

} // namespace kl
