#pragma once
#include "kl/ids/Id.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <utility>
#include <vector>

namespace kl {

// Host event loop seen by the engine: a clock, frame callbacks and timers.
// Everything runs on the thread that drives the scheduler.
class Scheduler {
public:
  using Task = std::function<void()>;

  virtual ~Scheduler() = default;

  // Wall-clock time in epoch milliseconds.
  virtual std::int64_t nowMs() const = 0;

  virtual TimerId requestFrame(Task cb) = 0;
  virtual TimerId setTimeout(std::int64_t delayMs, Task cb) = 0;
  virtual TimerId setInterval(std::int64_t intervalMs, Task cb) = 0;

  // Cancels a frame request or timer. Unknown ids are ignored.
  virtual void cancel(TimerId id) = 0;
};

// Shared timer/frame bookkeeping. Subclasses supply the clock.
class QueueScheduler : public Scheduler {
public:
  TimerId requestFrame(Task cb) override;
  TimerId setTimeout(std::int64_t delayMs, Task cb) override;
  TimerId setInterval(std::int64_t intervalMs, Task cb) override;
  void cancel(TimerId id) override;

  std::size_t pendingFrames() const { return frames_.size(); }
  std::size_t pendingTimers() const { return timers_.size(); }

protected:
  // Runs timers due at or before `now`, earliest first. Timers armed while
  // this runs are left for the next call. Returns count fired.
  std::size_t runTimersUntil(std::int64_t now);

  // Runs the frame callbacks queued before this call.
  std::size_t runQueuedFrames();

  // Earliest timer due time, or -1 when no timer is armed.
  std::int64_t nextDueMs() const;

private:
  struct Timer {
    std::int64_t dueMs;
    std::int64_t intervalMs; // 0 for one-shot
    Task cb;
  };

  TimerId armTimer(std::int64_t delayMs, std::int64_t intervalMs, Task cb);

  TimerId nextId_{1};
  std::vector<std::pair<TimerId, Task>> frames_;
  std::map<TimerId, Timer> timers_;
};

// Virtual clock. Time only moves through advanceBy()/advanceTo().
class ManualScheduler : public QueueScheduler {
public:
  explicit ManualScheduler(std::int64_t startMs = 0) : nowMs_(startMs) {}

  std::int64_t nowMs() const override { return nowMs_; }

  // Moves the clock forward, firing timers at their due times in order.
  void advanceBy(std::int64_t ms);
  void advanceTo(std::int64_t ms);

  // Runs one frame. Frames requested from inside a frame wait for the next.
  std::size_t runFrame() { return runQueuedFrames(); }

private:
  std::int64_t nowMs_;
};

// Real-time loop driven by the host: call pump() from the main loop.
class LoopScheduler : public QueueScheduler {
public:
  explicit LoopScheduler(int frameIntervalMs = 16);

  std::int64_t nowMs() const override;

  // Fires due timers, then queued frames if a frame interval has elapsed.
  void pump();

  // Sleeps until the next timer or frame boundary (capped at one frame).
  void sleepUntilNext() const;

  int frameIntervalMs() const { return frameIntervalMs_; }

private:
  using Clock = std::chrono::steady_clock;

  int frameIntervalMs_;
  Clock::time_point origin_;
  std::int64_t originWallMs_;
  Clock::time_point lastFrame_;
};

} // namespace kl
