#include "kl/data/RandomWalkSource.hpp"

#include <algorithm>
#include <cmath>

namespace kl {

RandomWalkSource::RandomWalkSource(Scheduler& scheduler, const RandomWalkConfig& config)
    : scheduler_(scheduler), config_(config), seed_(config.seed), price_(config.initialPrice) {}

RandomWalkSource::~RandomWalkSource() {
  if (timer_ != kInvalidId) scheduler_.cancel(timer_);
}

void RandomWalkSource::setConfig(const RandomWalkConfig& config) {
  bool wasActive = isActive();
  if (wasActive) stop();
  config_ = config;
  if (wasActive && subscriberCount() > 0) start();
}

void RandomWalkSource::start() {
  if (isActive()) return;
  setActive(true);
  current_.reset();
  timer_ = scheduler_.setInterval(config_.intervalMs, [this] { tick(); });
}

void RandomWalkSource::stop() {
  if (!isActive()) return;
  setActive(false);
  if (timer_ != kInvalidId) {
    scheduler_.cancel(timer_);
    timer_ = kInvalidId;
  }
  current_.reset();
}

double RandomWalkSource::nextRandom() {
  // LCG
  seed_ = seed_ * 1103515245u + 12345u;
  return static_cast<double>((seed_ >> 16) & 0x7FFF) / 32767.0;
}

void RandomWalkSource::tick() {
  const std::int64_t now = scheduler_.nowMs();
  const std::int64_t d = std::max<std::int64_t>(1, config_.candleDurationMs);

  if (!current_ || now - current_->ts >= d) {
    std::int64_t start;
    if (current_) {
      start = current_->ts + d;
    } else {
      start = static_cast<std::int64_t>(std::floor(static_cast<double>(now) / static_cast<double>(d))) * d;
    }
    Candle c;
    c.ts = start;
    c.open = c.high = c.low = c.close = price_;
    c.volume = 0.0;
    current_ = c;
  }

  price_ = std::max(1.0, price_ + (nextRandom() - 0.5) * 2.0 * config_.volatility);

  Candle& c = *current_;
  c.high = std::max(c.high, price_);
  c.low = std::min(c.low, price_);
  c.close = price_;
  c.volume = c.volume.value_or(0.0) + nextRandom() * config_.baseVolume * 0.2;

  Candle copy = c; // subscribers may stop the source
  emit(copy);
}

} // namespace kl
