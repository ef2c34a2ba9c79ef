// Repository: Whipcast
// Component: Session Event Queue
// Purpose: Event fan-out to streaming subscribers.
// Copyright (c) 2025 Whipcast

#include "service/SessionEventQueue.hpp"

#include <algorithm>
#include <utility>

namespace whipcast::service {

SessionEventQueue::SessionEventQueue(size_t capacity) : capacity_(capacity > 0 ? capacity : 1) {}

void SessionEventQueue::Push(SessionEvent event) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) return;
    if (events_.size() >= capacity_) {
      events_.pop_front();
      ++dropped_;
    }
    events_.push_back(std::move(event));
  }
  cv_.notify_one();
}

bool SessionEventQueue::WaitPop(SessionEvent& out, std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait_for(lock, timeout, [this] { return closed_ || !events_.empty(); });
  if (events_.empty()) return false;
  out = std::move(events_.front());
  events_.pop_front();
  return true;
}

void SessionEventQueue::Close() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
  }
  cv_.notify_all();
}

bool SessionEventQueue::IsClosed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

size_t SessionEventQueue::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return events_.size();
}

uint64_t SessionEventQueue::Dropped() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return dropped_;
}

std::shared_ptr<SessionEventQueue> SessionEventHub::Subscribe() {
  auto queue = std::make_shared<SessionEventQueue>();
  std::lock_guard<std::mutex> lock(mutex_);
  subscribers_.push_back(queue);
  return queue;
}

void SessionEventHub::Unsubscribe(const std::shared_ptr<SessionEventQueue>& queue) {
  std::lock_guard<std::mutex> lock(mutex_);
  subscribers_.erase(std::remove(subscribers_.begin(), subscribers_.end(), queue),
                     subscribers_.end());
}

void SessionEventHub::Publish(const SessionEvent& event) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& queue : subscribers_) queue->Push(event);
}

void SessionEventHub::CloseAll() {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& queue : subscribers_) queue->Close();
  subscribers_.clear();
}

size_t SessionEventHub::SubscriberCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return subscribers_.size();
}

}  // namespace whipcast::service
