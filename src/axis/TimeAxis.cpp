#include "kl/axis/TimeAxis.hpp"
#include "kl/axis/TimeFormat.hpp"

#include <cmath>
#include <cstdint>

namespace kl {

static constexpr double kSecond = 1000.0;
static constexpr double kMinute = 60.0 * kSecond;
static constexpr double kHour = 60.0 * kMinute;
static constexpr double kDay = 24.0 * kHour;
static constexpr double kMonth = 30.0 * kDay;
static constexpr double kYear = 365.0 * kDay;

// Interval ladder (ms)
static const double kTimeIntervals[] = {
  1 * kSecond, 5 * kSecond, 10 * kSecond, 30 * kSecond,       // seconds
  1 * kMinute, 5 * kMinute, 10 * kMinute, 30 * kMinute,       // minutes
  1 * kHour, 2 * kHour, 4 * kHour, 6 * kHour, 12 * kHour,     // hours
  1 * kDay, 2 * kDay, 7 * kDay,                               // days/weeks
  kMonth, 3 * kMonth, kYear                                   // months/quarters/years
};
static constexpr int kTimeIntervalCount = 19;

// Cap on emitted calendar ticks; guards against absurd spans.
static constexpr int kMaxCalendarTicks = 10000;

TimeAxis::TimeAxis(const ViewTimeRange& range, double widthPx, double minTickSpacingPx,
                   TimeFormatter formatter)
    : range_(range), widthPx_(widthPx), minTickSpacingPx_(minTickSpacingPx),
      formatter_(std::move(formatter)) {}

double TimeAxis::scale(double ts) const {
  double span = range_.end - range_.start;
  if (span == 0.0) return 0.0;
  return (ts - range_.start) / span * widthPx_;
}

double TimeAxis::invert(double px) const {
  if (widthPx_ == 0.0) return range_.start;
  return range_.start + px / widthPx_ * (range_.end - range_.start);
}

double TimeAxis::findNiceInterval(double span, int maxTicks) {
  double minInterval = span / static_cast<double>(maxTicks);
  for (int i = 0; i < kTimeIntervalCount; i++) {
    if (kTimeIntervals[i] >= minInterval) return kTimeIntervals[i];
  }
  double largest = kTimeIntervals[kTimeIntervalCount - 1];
  return largest * std::ceil(minInterval / largest);
}

double TimeAxis::currentInterval() const {
  double span = range_.end - range_.start;
  if (widthPx_ <= 0.0 || span <= 0.0 || minTickSpacingPx_ <= 0.0) return 0.0;
  int maxTicks = static_cast<int>(std::floor(widthPx_ / minTickSpacingPx_));
  if (maxTicks <= 0) return 0.0;
  return findNiceInterval(span, maxTicks);
}

std::string TimeAxis::label(double ts, double interval) const {
  if (formatter_) return formatter_(ts);
  return formatTimestamp(static_cast<std::int64_t>(std::llround(ts)), chooseTimeFormat(interval));
}

std::vector<AxisTick> TimeAxis::generateTicks() const {
  std::vector<AxisTick> ticks;
  double interval = currentInterval();
  if (interval <= 0.0) return ticks;

  if (interval >= kMonth) {
    calendarTicks(interval, ticks);
    return ticks;
  }

  double k = std::ceil(range_.start / interval);
  for (; k * interval <= range_.end; k += 1.0) {
    double ts = k * interval;
    ticks.push_back(AxisTick{ts, scale(ts), label(ts, interval)});
  }
  return ticks;
}

void TimeAxis::calendarTicks(double interval, std::vector<AxisTick>& out) const {
  int monthStep;
  if (interval >= kYear) {
    monthStep = 12 * static_cast<int>(std::llround(interval / kYear));
  } else {
    monthStep = static_cast<int>(std::llround(interval / kMonth));
  }
  if (monthStep < 1) monthStep = 1;

  auto monthStartMs = [](std::int64_t absMonth) {
    std::tm tm{};
    tm.tm_year = static_cast<int>(absMonth / 12) - 1900;
    tm.tm_mon = static_cast<int>(absMonth % 12);
    tm.tm_mday = 1;
    return static_cast<double>(portableTimegm(&tm)) * 1000.0;
  };

  std::tm start = toCalendar(static_cast<std::int64_t>(std::floor(range_.start)));
  std::int64_t month = static_cast<std::int64_t>(start.tm_year + 1900) * 12 + start.tm_mon;
  if (monthStartMs(month) < range_.start) month++;
  if (month % monthStep != 0) month += monthStep - month % monthStep;

  for (int i = 0; i < kMaxCalendarTicks; i++, month += monthStep) {
    double ts = monthStartMs(month);
    if (ts > range_.end) break;
    out.push_back(AxisTick{ts, scale(ts), label(ts, interval)});
  }
}

} // namespace kl
