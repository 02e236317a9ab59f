#include "kl/data/LiveDataSource.hpp"

#include <cstdio>
#include <exception>
#include <utility>

namespace kl {

SubscriptionId LiveDataSource::subscribe(CandleCallback cb) {
  SubscriptionId id = subscribers_.add([this, cb = std::move(cb)](const Candle& c) {
    try {
      cb(c);
    } catch (const std::exception& ex) {
      std::fprintf(stderr, "%s: subscriber failed: %s\n", name(), ex.what());
    }
  });
  if (subscribers_.size() == 1 && !active_) start();
  return id;
}

bool LiveDataSource::unsubscribe(SubscriptionId id) {
  if (!subscribers_.remove(id)) return false;
  if (subscribers_.empty() && active_) stop();
  return true;
}

} // namespace kl
