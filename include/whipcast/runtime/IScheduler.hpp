// Repository: Whipcast
// Component: Scheduler Interface
// Purpose: Decouple task/timer dispatch from the thread that runs it.
//          Production: EventLoop (one dedicated thread).
//          Tests: ManualScheduler (virtual milliseconds, no sleeping).
// Copyright (c) 2025 Whipcast

#ifndef WHIPCAST_RUNTIME_ISCHEDULER_HPP_
#define WHIPCAST_RUNTIME_ISCHEDULER_HPP_

#include <cstdint>
#include <functional>

namespace whipcast::runtime {

using Task = std::function<void()>;
using TimerId = uint64_t;

constexpr TimerId kInvalidTimer = 0;

// All session state is touched only from tasks dispatched by one scheduler.
// Tasks never run concurrently with each other.
class IScheduler {
 public:
  virtual ~IScheduler() = default;

  // Runs task after the currently executing task returns. Thread-safe.
  virtual void Post(Task task) = 0;

  // Runs task once delay_ms has elapsed. Thread-safe.
  virtual TimerId ScheduleAfter(int64_t delay_ms, Task task) = 0;

  // Cancels a timer that has not fired yet. Unknown ids are ignored.
  virtual void Cancel(TimerId id) = 0;

  // Monotonic milliseconds.
  virtual int64_t NowMs() const = 0;
};

}  // namespace whipcast::runtime

#endif  // WHIPCAST_RUNTIME_ISCHEDULER_HPP_
