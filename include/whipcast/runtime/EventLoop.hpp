// Repository: Whipcast
// Component: Event Loop
// Purpose: Single-thread task and timer dispatcher that owns all session state.
// Copyright (c) 2025 Whipcast

#ifndef WHIPCAST_RUNTIME_EVENT_LOOP_HPP_
#define WHIPCAST_RUNTIME_EVENT_LOOP_HPP_

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <thread>
#include <unordered_map>

#include "whipcast/runtime/IScheduler.hpp"

namespace whipcast::runtime {

// EventLoop runs posted tasks FIFO and timers in deadline order on one
// dedicated thread.
//
// Lifecycle:
//   1. Construct
//   2. Start() spawns the loop thread
//   3. Post()/ScheduleAfter() from any thread
//   4. Stop() (or destructor) drains nothing further and joins
//
// RunSync() lets foreign threads (gRPC handlers) execute a task on the loop
// and wait for it to finish.
class EventLoop : public IScheduler {
 public:
  EventLoop();
  ~EventLoop() override;

  EventLoop(const EventLoop&) = delete;
  EventLoop& operator=(const EventLoop&) = delete;

  void Start();
  void Stop();

  void Post(Task task) override;
  TimerId ScheduleAfter(int64_t delay_ms, Task task) override;
  void Cancel(TimerId id) override;
  int64_t NowMs() const override;

  // Posts task and blocks until it has run. Must not be called from the
  // loop thread. Returns false if the loop is not running.
  bool RunSync(const Task& task);

  bool IsLoopThread() const;

 private:
  using Clock = std::chrono::steady_clock;

  void Run();

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<Task> tasks_;
  // Ordered by deadline, then by id so equal deadlines fire in schedule order.
  std::map<std::pair<Clock::time_point, TimerId>, Task> timers_;
  std::unordered_map<TimerId, Clock::time_point> timer_deadlines_;
  TimerId next_timer_id_ = 1;

  const Clock::time_point epoch_;
  std::atomic<bool> running_{false};
  std::thread thread_;
  std::thread::id loop_thread_id_;
};

}  // namespace whipcast::runtime

#endif  // WHIPCAST_RUNTIME_EVENT_LOOP_HPP_
