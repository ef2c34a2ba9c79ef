// Repository: Whipcast
// Component: Tick Loop
// Purpose: Drift-free periodic callback on the scheduler (frame ticks, audio
//          packet pulls).
// Copyright (c) 2025 Whipcast
//
// TickLoop anchors every deadline to the loop's start time instead of
// re-arming a relative delay after each tick, so scheduling jitter never
// accumulates:
//   deadline_ms(N) = start_ms + (N * 1000 * period_den) / period_num
// A tick that runs late is followed immediately by the next due tick; the
// loop never tries to "catch up" with a burst larger than one tick.

#ifndef WHIPCAST_RUNTIME_TICK_LOOP_HPP_
#define WHIPCAST_RUNTIME_TICK_LOOP_HPP_

#include <cstdint>
#include <functional>
#include <memory>

#include "whipcast/runtime/CancellationToken.hpp"
#include "whipcast/runtime/IScheduler.hpp"

namespace whipcast::runtime {

class TickLoop {
 public:
  // Ticks per second as a rational (e.g. 24/1, or 50/1 for 20 ms audio).
  TickLoop(IScheduler& scheduler, int64_t rate_num, int64_t rate_den = 1);
  ~TickLoop();

  TickLoop(const TickLoop&) = delete;
  TickLoop& operator=(const TickLoop&) = delete;

  // on_tick receives the 0-based tick index. Restarting resets the index.
  void Start(std::function<void(int64_t)> on_tick);

  // Idempotent. No tick runs after Stop() returns.
  void Stop();

  bool IsRunning() const { return running_; }

  // Offset of tick N from the start, in ms. Pure arithmetic.
  int64_t DeadlineOffsetMs(int64_t tick_index) const;

 private:
  void Arm();

  IScheduler& scheduler_;
  int64_t rate_num_;
  int64_t rate_den_;
  std::function<void(int64_t)> on_tick_;
  CancellationToken token_;
  TimerId timer_ = kInvalidTimer;
  int64_t start_ms_ = 0;
  int64_t next_index_ = 0;
  bool running_ = false;
};

}  // namespace whipcast::runtime

#endif  // WHIPCAST_RUNTIME_TICK_LOOP_HPP_
