// Repository: Whipcast
// Component: Tick Loop
// Purpose: Drift-free periodic callback on the scheduler.
// Copyright (c) 2025 Whipcast

#include "whipcast/runtime/TickLoop.hpp"

#include <algorithm>

namespace whipcast::runtime {

TickLoop::TickLoop(IScheduler& scheduler, int64_t rate_num, int64_t rate_den)
    : scheduler_(scheduler),
      rate_num_(rate_num > 0 ? rate_num : 1),
      rate_den_(rate_den > 0 ? rate_den : 1) {}

TickLoop::~TickLoop() {
  Stop();
}

void TickLoop::Start(std::function<void(int64_t)> on_tick) {
  Stop();
  on_tick_ = std::move(on_tick);
  token_ = CancellationToken();
  start_ms_ = scheduler_.NowMs();
  next_index_ = 0;
  running_ = true;
  Arm();
}

void TickLoop::Stop() {
  if (!running_) return;
  running_ = false;
  token_.Cancel();
  if (timer_ != kInvalidTimer) {
    scheduler_.Cancel(timer_);
    timer_ = kInvalidTimer;
  }
}

int64_t TickLoop::DeadlineOffsetMs(int64_t tick_index) const {
  return (tick_index * 1000 * rate_den_) / rate_num_;
}

void TickLoop::Arm() {
  const int64_t deadline = start_ms_ + DeadlineOffsetMs(next_index_);
  const int64_t delay = std::max<int64_t>(0, deadline - scheduler_.NowMs());
  CancellationToken token = token_;
  timer_ = scheduler_.ScheduleAfter(delay, [this, token]() {
    if (token.IsCancelled()) return;
    timer_ = kInvalidTimer;
    const int64_t index = next_index_++;
    // Skip deadlines that are already in the past after a long stall.
    const int64_t now = scheduler_.NowMs();
    while (start_ms_ + DeadlineOffsetMs(next_index_) < now) {
      ++next_index_;
    }
    on_tick_(index);
    if (!token.IsCancelled()) Arm();
  });
}

}  // namespace whipcast::runtime
