#include "kl/data/ArrayPlaybackSource.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace kl {

ArrayPlaybackSource::ArrayPlaybackSource(Scheduler& scheduler, std::vector<Candle> data,
                                         const ArrayPlaybackConfig& config)
    : scheduler_(scheduler), data_(std::move(data)), config_(config) {
  if (data_.empty()) {
    throw std::invalid_argument("ArrayPlaybackSource: data must not be empty");
  }
  if (!(config_.speed > 0.0)) {
    throw std::invalid_argument("ArrayPlaybackSource: speed must be positive");
  }
  std::stable_sort(data_.begin(), data_.end(),
                   [](const Candle& a, const Candle& b) { return a.ts < b.ts; });
}

ArrayPlaybackSource::~ArrayPlaybackSource() {
  if (timer_ != kInvalidId) scheduler_.cancel(timer_);
}

void ArrayPlaybackSource::start() {
  if (isActive()) return;
  setActive(true);
  startTime_ = scheduler_.nowMs();
  // Resuming mid-recording: the next candle keeps its recorded gap.
  if (index_ > 0 && index_ < data_.size()) startTime_ -= offsetMs(index_ - 1);
  scheduleNext();
}

void ArrayPlaybackSource::stop() {
  if (!isActive()) return;
  setActive(false);
  if (timer_ != kInvalidId) {
    scheduler_.cancel(timer_);
    timer_ = kInvalidId;
  }
}

void ArrayPlaybackSource::reset() {
  bool wasActive = isActive();
  if (wasActive) stop();
  index_ = 0;
  startTime_ = scheduler_.nowMs();
  if (subscriberCount() > 0) start();
}

void ArrayPlaybackSource::setSpeed(double speed) {
  if (!(speed > 0.0)) {
    throw std::invalid_argument("ArrayPlaybackSource: speed must be positive");
  }
  bool wasActive = isActive();
  if (wasActive) stop();
  config_.speed = speed;
  if (wasActive && subscriberCount() > 0) start();
}

double ArrayPlaybackSource::progress() const {
  return static_cast<double>(index_) / static_cast<double>(data_.size());
}

std::int64_t ArrayPlaybackSource::offsetMs(std::size_t i) const {
  double offset = static_cast<double>(data_[i].ts - data_.front().ts) / config_.speed;
  return static_cast<std::int64_t>(std::llround(offset));
}

void ArrayPlaybackSource::scheduleNext() {
  timer_ = kInvalidId;
  if (!isActive()) return;

  bool wrapped = false;
  if (index_ >= data_.size()) {
    if (!config_.loop) {
      setActive(false); // ran dry; subscribers stay attached
      return;
    }
    // The next pass starts at least 1 ms later and after the last candle
    // emitted, so its timestamps keep increasing.
    index_ = 0;
    startTime_ = std::max(scheduler_.nowMs() + 1, lastEmittedTs_ + 1);
    wrapped = true;
  }

  std::int64_t delay;
  if (config_.fixedIntervalMs) {
    delay = std::max<std::int64_t>(wrapped ? 1 : 0, *config_.fixedIntervalMs);
  } else {
    // Fire when the rebased timestamp comes due.
    delay = std::max<std::int64_t>(0, startTime_ + offsetMs(index_) - scheduler_.nowMs());
  }

  timer_ = scheduler_.setTimeout(delay, [this] { emitCurrent(); });
}

void ArrayPlaybackSource::emitCurrent() {
  timer_ = kInvalidId;
  if (index_ >= data_.size()) return;

  const Candle& src = data_[index_];
  Candle out;
  out.ts = startTime_ + offsetMs(index_);
  out.open = src.open;
  out.high = src.high;
  out.low = src.low;
  out.close = src.close;
  out.volume = src.volume;

  index_++;
  lastEmittedTs_ = out.ts;
  emit(out);
  // A subscriber may have stopped or reset playback.
  if (timer_ == kInvalidId) scheduleNext();
}

} // namespace kl
