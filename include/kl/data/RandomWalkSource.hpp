#pragma once
#include "kl/core/Scheduler.hpp"
#include "kl/data/LiveDataSource.hpp"

#include <cstdint>
#include <optional>

namespace kl {

struct RandomWalkConfig {
  double initialPrice{100.0};
  double volatility{1.0};          // max step per tick
  std::int64_t intervalMs{1000};   // tick period
  std::int64_t candleDurationMs{5000};
  double baseVolume{100000.0};
  std::uint32_t seed{42};
};

// Synthetic live feed. Every tick moves the price by a bounded random step
// and emits the in-progress candle; a new candle opens once the current one
// has lasted candleDurationMs.
class RandomWalkSource : public LiveDataSource {
public:
  RandomWalkSource(Scheduler& scheduler, const RandomWalkConfig& config = {});
  ~RandomWalkSource() override;

  const char* name() const override { return "RandomWalkSource"; }

  // Restarts the timer when running.
  void setConfig(const RandomWalkConfig& config);
  const RandomWalkConfig& config() const { return config_; }

  std::optional<Candle> currentCandle() const { return current_; }
  double currentPrice() const { return price_; }

protected:
  void start() override;
  void stop() override;

private:
  void tick();
  double nextRandom(); // [0, 1]

  Scheduler& scheduler_;
  RandomWalkConfig config_;
  TimerId timer_{kInvalidId};
  std::uint32_t seed_;
  double price_;
  std::optional<Candle> current_;
};

} // namespace kl
