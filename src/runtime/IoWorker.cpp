// Repository: Whipcast
// Component: Blocking I/O Worker
// Purpose: Runs blocking HTTP exchanges off the event loop and hands the
//          result back to it.
// Copyright (c) 2025 Whipcast

#include "whipcast/runtime/IoWorker.hpp"

#include <exception>

#include "whipcast/util/Logger.hpp"

namespace whipcast::runtime {

IoWorker::IoWorker(std::string name) : name_(std::move(name)) {}

IoWorker::~IoWorker() {
  Stop();
}

void IoWorker::Start() {
  bool expected = false;
  if (!running_.compare_exchange_strong(expected, true)) return;
  thread_ = std::thread([this] { Run(); });
}

void IoWorker::Stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    running_.store(false, std::memory_order_release);
    jobs_.clear();
  }
  cv_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
}

void IoWorker::Submit(std::function<void()> job) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    jobs_.push_back(std::move(job));
  }
  cv_.notify_one();
}

void IoWorker::Run() {
  util::Logger::Debug("[IoWorker:" + name_ + "] started");
  while (true) {
    std::function<void()> job;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      cv_.wait(lock, [this] {
        return !running_.load(std::memory_order_acquire) || !jobs_.empty();
      });
      if (!running_.load(std::memory_order_acquire)) break;
      job = std::move(jobs_.front());
      jobs_.pop_front();
    }
    try {
      job();
    } catch (const std::exception& e) {
      util::Logger::Error("[IoWorker:" + name_ + "] job threw: " + e.what());
    }
  }
  util::Logger::Debug("[IoWorker:" + name_ + "] stopped");
}

}  // namespace whipcast::runtime
