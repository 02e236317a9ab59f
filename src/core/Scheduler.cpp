#include "kl/core/Scheduler.hpp"

#include <algorithm>
#include <thread>

namespace kl {

// ---- QueueScheduler ----

TimerId QueueScheduler::requestFrame(Task cb) {
  TimerId id = nextId_++;
  frames_.emplace_back(id, std::move(cb));
  return id;
}

TimerId QueueScheduler::setTimeout(std::int64_t delayMs, Task cb) {
  return armTimer(std::max<std::int64_t>(0, delayMs), 0, std::move(cb));
}

TimerId QueueScheduler::setInterval(std::int64_t intervalMs, Task cb) {
  // A zero interval would spin forever inside runTimersUntil().
  std::int64_t iv = std::max<std::int64_t>(1, intervalMs);
  return armTimer(iv, iv, std::move(cb));
}

TimerId QueueScheduler::armTimer(std::int64_t delayMs, std::int64_t intervalMs, Task cb) {
  TimerId id = nextId_++;
  timers_[id] = Timer{nowMs() + delayMs, intervalMs, std::move(cb)};
  return id;
}

void QueueScheduler::cancel(TimerId id) {
  if (timers_.erase(id) != 0) return;
  frames_.erase(std::remove_if(frames_.begin(), frames_.end(),
                               [id](const std::pair<TimerId, Task>& f) { return f.first == id; }),
                frames_.end());
}

std::int64_t QueueScheduler::nextDueMs() const {
  std::int64_t best = -1;
  for (const auto& [id, t] : timers_) {
    if (best < 0 || t.dueMs < best) best = t.dueMs;
  }
  return best;
}

std::size_t QueueScheduler::runTimersUntil(std::int64_t now) {
  // Timers armed by callbacks of this run wait for the next one, so a zero
  // delay yields instead of spinning.
  const TimerId firstArmedDuringRun = nextId_;
  std::size_t fired = 0;
  for (;;) {
    // Earliest due timer; ties resolve by id (arm order).
    auto due = timers_.end();
    for (auto it = timers_.begin(); it != timers_.end(); ++it) {
      if (it->first >= firstArmedDuringRun) continue;
      if (it->second.dueMs > now) continue;
      if (due == timers_.end() || it->second.dueMs < due->second.dueMs) due = it;
    }
    if (due == timers_.end()) break;

    Task cb = due->second.cb;
    if (due->second.intervalMs > 0) {
      due->second.dueMs += due->second.intervalMs;
    } else {
      timers_.erase(due);
    }
    cb();
    fired++;
  }
  return fired;
}

std::size_t QueueScheduler::runQueuedFrames() {
  std::vector<std::pair<TimerId, Task>> batch;
  batch.swap(frames_);
  for (auto& f : batch) f.second();
  return batch.size();
}

// ---- ManualScheduler ----

void ManualScheduler::advanceTo(std::int64_t ms) {
  if (ms < nowMs_) return;
  // Step through due times so callbacks observe the clock at their due time.
  for (;;) {
    std::int64_t next = nextDueMs();
    if (next < 0 || next > ms) break;
    if (next > nowMs_) nowMs_ = next;
    runTimersUntil(nowMs_);
  }
  nowMs_ = ms;
}

void ManualScheduler::advanceBy(std::int64_t ms) {
  advanceTo(nowMs_ + std::max<std::int64_t>(0, ms));
}

// ---- LoopScheduler ----

LoopScheduler::LoopScheduler(int frameIntervalMs)
    : frameIntervalMs_(frameIntervalMs > 0 ? frameIntervalMs : 16),
      origin_(Clock::now()),
      originWallMs_(std::chrono::duration_cast<std::chrono::milliseconds>(
                        std::chrono::system_clock::now().time_since_epoch())
                        .count()),
      lastFrame_(origin_) {}

std::int64_t LoopScheduler::nowMs() const {
  auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - origin_);
  return originWallMs_ + elapsed.count();
}

void LoopScheduler::pump() {
  runTimersUntil(nowMs());

  auto now = Clock::now();
  if (now - lastFrame_ >= std::chrono::milliseconds(frameIntervalMs_)) {
    lastFrame_ = now;
    runQueuedFrames();
  }
}

void LoopScheduler::sleepUntilNext() const {
  auto wake = lastFrame_ + std::chrono::milliseconds(frameIntervalMs_);
  std::int64_t due = nextDueMs();
  if (due >= 0) {
    auto dueAt = origin_ + std::chrono::milliseconds(due - originWallMs_);
    wake = std::min(wake, dueAt);
  }
  std::this_thread::sleep_until(wake);
}

} // namespace kl
