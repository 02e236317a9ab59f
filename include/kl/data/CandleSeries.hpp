#pragma once
#include "kl/core/ListenerList.hpp"
#include "kl/data/Candle.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

namespace kl {

// Borrowed window over a series' columns. Pointers are already offset to
// startIndex, so ts[0] is the first candle in the view.
// Invalid after the next mutation of the owning series.
struct DataView {
  const std::int64_t* ts{nullptr};
  const double* open{nullptr};
  const double* high{nullptr};
  const double* low{nullptr};
  const double* close{nullptr};
  const double* volume{nullptr};            // null when the series has no volume column
  const std::optional<CandleMeta>* meta{nullptr}; // null when the series has no meta column
  std::size_t startIndex{0};
  std::size_t endIndex{0};                  // exclusive
  std::size_t length{0};

  bool empty() const { return length == 0; }
  bool hasVolume(std::size_t i) const;
  Candle candleAt(std::size_t i) const;
};

// Columnar OHLCV store ordered by timestamp.
class CandleSeries {
public:
  using ChangeCallback = std::function<void()>;

  CandleSeries() = default;
  explicit CandleSeries(const std::vector<Candle>& rows);

  CandleSeries(const CandleSeries&) = delete;
  CandleSeries& operator=(const CandleSeries&) = delete;

  // Mutation
  void setData(const std::vector<Candle>& rows);
  bool appendCandle(const Candle& row);
  bool updateLastCandle(const Candle& row);
  bool updateOrAppend(const Candle& row);
  void clear();

  // Queries
  std::size_t firstIndexAtOrAfter(std::int64_t t) const;
  std::ptrdiff_t lastIndexAtOrBefore(std::int64_t t) const;
  DataView rangeByIndex(std::ptrdiff_t lo, std::ptrdiff_t hi) const;
  DataView rangeByTime(std::int64_t t0, std::int64_t t1) const;
  std::optional<TimeRange> domainX() const;
  std::optional<PriceRange> domainY(std::optional<TimeRange> range = std::nullopt) const;

  std::size_t length() const { return length_; }
  bool empty() const { return length_ == 0; }
  std::size_t capacity() const { return capacity_; }
  std::size_t reallocationCount() const { return reallocations_; }
  bool hasVolume() const { return hasVolume_; }
  bool hasMeta() const { return hasMeta_; }

  std::optional<Candle> candleAt(std::size_t i) const;
  std::int64_t timestampAt(std::size_t i) const; // -1 when out of range
  std::vector<Candle> toVector() const;

  // Change notification
  ListenerId onChange(ChangeCallback cb);
  bool removeListener(ListenerId id);
  std::size_t listenerCount() const { return listeners_.size(); }

private:
  void reserveExact(std::size_t cap);
  void grow();
  void writeRow(std::size_t i, const Candle& row);
  void ensureVolumeColumn();
  void ensureMetaColumn();
  void notifyChange() { listeners_.notify(); }

  std::vector<std::int64_t> ts_;
  std::vector<double> open_, high_, low_, close_;
  std::vector<double> volume_; // NaN marks an absent value
  std::vector<std::optional<CandleMeta>> meta_;

  std::size_t length_{0};
  std::size_t capacity_{0};
  std::size_t reallocations_{0};
  bool hasVolume_{false};
  bool hasMeta_{false};

  ListenerList<> listeners_;
};

} // namespace kl
