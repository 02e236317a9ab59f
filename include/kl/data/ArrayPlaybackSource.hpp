#pragma once
#include "kl/core/Scheduler.hpp"
#include "kl/data/LiveDataSource.hpp"

#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <vector>

namespace kl {

struct ArrayPlaybackConfig {
  double speed{1.0};                          // > 0; 2 plays twice as fast
  bool loop{false};
  std::optional<std::int64_t> fixedIntervalMs; // overrides recorded spacing
};

// Replays recorded candles in timestamp order. Emitted timestamps are
// rebased onto the activation time and compressed by the speed factor.
class ArrayPlaybackSource : public LiveDataSource {
public:
  // Throws std::invalid_argument for empty data or a non-positive speed.
  ArrayPlaybackSource(Scheduler& scheduler, std::vector<Candle> data,
                      const ArrayPlaybackConfig& config = {});
  ~ArrayPlaybackSource() override;

  const char* name() const override { return "ArrayPlaybackSource"; }

  // Rewinds to the first candle; playback restarts if anyone is subscribed.
  void reset();

  // Throws std::invalid_argument for a non-positive speed.
  void setSpeed(double speed);
  double speed() const { return config_.speed; }

  double progress() const;
  bool isComplete() const { return index_ >= data_.size(); }
  std::size_t currentIndex() const { return index_; }
  std::size_t totalCandles() const { return data_.size(); }

protected:
  void start() override;
  void stop() override;

private:
  // Rebased offset of candle i from the first, compressed by speed.
  std::int64_t offsetMs(std::size_t i) const;
  void scheduleNext();
  void emitCurrent();

  Scheduler& scheduler_;
  std::vector<Candle> data_; // sorted by ts
  ArrayPlaybackConfig config_;
  TimerId timer_{kInvalidId};
  std::size_t index_{0};
  std::int64_t startTime_{0};
  std::int64_t lastEmittedTs_{std::numeric_limits<std::int64_t>::min()};
};

} // namespace kl
