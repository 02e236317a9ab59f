#pragma once
#include "kl/core/ListenerList.hpp"
#include "kl/data/Candle.hpp"

#include <cstddef>
#include <functional>

namespace kl {

// Push-based candle source. Production is reference counted: the source
// starts when its first subscriber arrives and stops when the last leaves.
// A subscriber that throws is logged and the others still run.
class LiveDataSource {
public:
  using CandleCallback = std::function<void(const Candle&)>;

  virtual ~LiveDataSource() = default;

  SubscriptionId subscribe(CandleCallback cb);
  bool unsubscribe(SubscriptionId id);

  std::size_t subscriberCount() const { return subscribers_.size(); }
  bool isActive() const { return active_; }

  // Component name used in diagnostics.
  virtual const char* name() const = 0;

protected:
  virtual void start() = 0;
  virtual void stop() = 0;

  void emit(const Candle& candle) { subscribers_.notify(candle); }

  // Subclasses flip this from start()/stop() or when they run dry.
  void setActive(bool active) { active_ = active; }

private:
  ListenerList<const Candle&> subscribers_;
  bool active_{false};
};

} // namespace kl
