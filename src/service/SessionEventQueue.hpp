// Repository: Whipcast
// Component: Session Event Queue
// Purpose: Bounded per-subscriber queue carrying controller events from the
//          event loop to gRPC streaming handlers.
// Copyright (c) 2025 Whipcast

#ifndef WHIPCAST_SERVICE_SESSION_EVENT_QUEUE_HPP_
#define WHIPCAST_SERVICE_SESSION_EVENT_QUEUE_HPP_

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace whipcast::service {

enum class SessionEventKind {
  kReady,
  kControllerState,
  kConnectionState,
  kRetry,
  kRetryExhausted,
  kWarning,
  kError,
};

struct SessionEvent {
  SessionEventKind kind = SessionEventKind::kWarning;
  int64_t timestamp_ms = 0;
  std::string detail;
  std::string stream_id;
  std::string playback_id;
  int attempt = 0;
  int64_t delay_ms = 0;
};

// Single-consumer queue. When full, the oldest event is dropped.
class SessionEventQueue {
 public:
  explicit SessionEventQueue(size_t capacity = 256);

  void Push(SessionEvent event);

  // Blocks up to timeout. Returns false on timeout or once closed and empty.
  bool WaitPop(SessionEvent& out, std::chrono::milliseconds timeout);

  // Wakes the consumer; later pushes are ignored.
  void Close();
  bool IsClosed() const;

  size_t Size() const;
  uint64_t Dropped() const;

 private:
  const size_t capacity_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<SessionEvent> events_;
  uint64_t dropped_ = 0;
  bool closed_ = false;
};

// Fans every published event out to the queues of current subscribers.
class SessionEventHub {
 public:
  std::shared_ptr<SessionEventQueue> Subscribe();
  void Unsubscribe(const std::shared_ptr<SessionEventQueue>& queue);
  void Publish(const SessionEvent& event);
  // Closes every subscriber queue.
  void CloseAll();
  size_t SubscriberCount() const;

 private:
  mutable std::mutex mutex_;
  std::vector<std::shared_ptr<SessionEventQueue>> subscribers_;
};

}  // namespace whipcast::service

#endif  // WHIPCAST_SERVICE_SESSION_EVENT_QUEUE_HPP_
