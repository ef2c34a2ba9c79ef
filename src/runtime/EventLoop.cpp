// Repository: Whipcast
// Component: Event Loop
// Purpose: Single-thread task and timer dispatcher that owns all session state.
// Copyright (c) 2025 Whipcast

#include "whipcast/runtime/EventLoop.hpp"

#include <exception>
#include <future>

#include "whipcast/util/Logger.hpp"

namespace whipcast::runtime {

EventLoop::EventLoop() : epoch_(Clock::now()) {}

EventLoop::~EventLoop() {
  Stop();
}

void EventLoop::Start() {
  bool expected = false;
  if (!running_.compare_exchange_strong(expected, true)) return;
  thread_ = std::thread([this] { Run(); });
}

void EventLoop::Stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    running_.store(false, std::memory_order_release);
  }
  cv_.notify_all();
  if (thread_.joinable()) {
    if (std::this_thread::get_id() == thread_.get_id()) {
      thread_.detach();
    } else {
      thread_.join();
    }
  }
  std::deque<Task> dropped;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    dropped.swap(tasks_);
    timers_.clear();
    timer_deadlines_.clear();
  }
}

void EventLoop::Post(Task task) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    tasks_.push_back(std::move(task));
  }
  cv_.notify_one();
}

TimerId EventLoop::ScheduleAfter(int64_t delay_ms, Task task) {
  if (delay_ms < 0) delay_ms = 0;
  TimerId id;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    id = next_timer_id_++;
    auto deadline = Clock::now() + std::chrono::milliseconds(delay_ms);
    timers_.emplace(std::make_pair(deadline, id), std::move(task));
    timer_deadlines_.emplace(id, deadline);
  }
  cv_.notify_one();
  return id;
}

void EventLoop::Cancel(TimerId id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = timer_deadlines_.find(id);
  if (it == timer_deadlines_.end()) return;
  timers_.erase(std::make_pair(it->second, id));
  timer_deadlines_.erase(it);
}

int64_t EventLoop::NowMs() const {
  return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - epoch_)
      .count();
}

bool EventLoop::RunSync(const Task& task) {
  if (!running_.load(std::memory_order_acquire)) return false;
  if (IsLoopThread()) {
    task();
    return true;
  }
  auto done = std::make_shared<std::promise<void>>();
  auto future = done->get_future();
  Post([task, done] {
    task();
    done->set_value();
  });
  // Stop() drops queued tasks, which breaks the promise and wakes us.
  try {
    future.get();
  } catch (const std::future_error&) {
    return false;
  }
  return true;
}

bool EventLoop::IsLoopThread() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return loop_thread_id_ == std::this_thread::get_id();
}

void EventLoop::Run() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    loop_thread_id_ = std::this_thread::get_id();
  }
  util::Logger::Debug("[EventLoop] started");

  std::unique_lock<std::mutex> lock(mutex_);
  while (running_.load(std::memory_order_acquire)) {
    Task next;
    if (!tasks_.empty()) {
      next = std::move(tasks_.front());
      tasks_.pop_front();
    } else if (!timers_.empty() && timers_.begin()->first.first <= Clock::now()) {
      auto it = timers_.begin();
      next = std::move(it->second);
      timer_deadlines_.erase(it->first.second);
      timers_.erase(it);
    } else if (!timers_.empty()) {
      cv_.wait_until(lock, timers_.begin()->first.first);
      continue;
    } else {
      cv_.wait(lock);
      continue;
    }

    lock.unlock();
    try {
      next();
    } catch (const std::exception& e) {
      util::Logger::Error(std::string("[EventLoop] task threw: ") + e.what());
    }
    lock.lock();
  }

  util::Logger::Debug("[EventLoop] stopped");
}

}  // namespace whipcast::runtime
