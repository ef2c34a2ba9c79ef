// Repository: Whipcast
// Component: Blocking I/O Worker
// Purpose: Runs blocking HTTP exchanges off the event loop and hands the
//          result back to it.
// Copyright (c) 2025 Whipcast

#ifndef WHIPCAST_RUNTIME_IO_WORKER_HPP_
#define WHIPCAST_RUNTIME_IO_WORKER_HPP_

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "whipcast/runtime/IScheduler.hpp"

namespace whipcast::runtime {

// One worker thread draining a FIFO of blocking jobs. Jobs run in
// submission order, so two HTTP calls from the same component never race.
class IoWorker {
 public:
  explicit IoWorker(std::string name);
  ~IoWorker();

  IoWorker(const IoWorker&) = delete;
  IoWorker& operator=(const IoWorker&) = delete;

  void Start();

  // Jobs still queued at Stop() are dropped.
  void Stop();

  void Submit(std::function<void()> job);

  // Runs work on the worker thread, then posts done(result) to scheduler.
  template <typename T>
  void SubmitThen(IScheduler& scheduler,
                  std::function<T()> work,
                  std::function<void(T)> done) {
    Submit([&scheduler, work = std::move(work), done = std::move(done)]() {
      auto result = std::make_shared<T>(work());
      scheduler.Post([done, result]() { done(std::move(*result)); });
    });
  }

 private:
  void Run();

  std::string name_;
  std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<std::function<void()>> jobs_;
  std::atomic<bool> running_{false};
  std::thread thread_;
};

}  // namespace whipcast::runtime

#endif  // WHIPCAST_RUNTIME_IO_WORKER_HPP_
