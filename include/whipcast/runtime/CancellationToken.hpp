// Repository: Whipcast
// Component: Cancellation Token
// Purpose: Shared stop flag checked by timers and tick loops after teardown,
//          with hooks that cancel pending work when the flag is set.
// Copyright (c) 2025 Whipcast

#ifndef WHIPCAST_RUNTIME_CANCELLATION_TOKEN_HPP_
#define WHIPCAST_RUNTIME_CANCELLATION_TOKEN_HPP_

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace whipcast::runtime {

using CancelHookId = uint64_t;

// Copies share one flag. Cancel() is one-way; a new scope needs a new token.
class CancellationToken {
 public:
  CancellationToken() : state_(std::make_shared<State>()) {}

  // Sets the flag and runs every registered hook once, on the calling thread.
  void Cancel() {
    if (state_->cancelled.exchange(true, std::memory_order_acq_rel)) return;
    std::vector<std::pair<CancelHookId, std::function<void()>>> hooks;
    {
      std::lock_guard<std::mutex> lock(state_->mutex);
      hooks.swap(state_->hooks);
    }
    for (auto& hook : hooks) hook.second();
  }

  bool IsCancelled() const { return state_->cancelled.load(std::memory_order_acquire); }

  // Registers a hook for Cancel(). Runs it immediately and returns 0 if the
  // token is already cancelled.
  CancelHookId OnCancel(std::function<void()> hook) {
    {
      std::lock_guard<std::mutex> lock(state_->mutex);
      if (!state_->cancelled.load(std::memory_order_acquire)) {
        const CancelHookId id = state_->next_id++;
        state_->hooks.emplace_back(id, std::move(hook));
        return id;
      }
    }
    hook();
    return 0;
  }

  void RemoveOnCancel(CancelHookId id) {
    if (id == 0) return;
    std::lock_guard<std::mutex> lock(state_->mutex);
    auto& hooks = state_->hooks;
    for (auto it = hooks.begin(); it != hooks.end(); ++it) {
      if (it->first == id) {
        hooks.erase(it);
        return;
      }
    }
  }

 private:
  struct State {
    std::atomic<bool> cancelled{false};
    std::mutex mutex;
    CancelHookId next_id = 1;
    std::vector<std::pair<CancelHookId, std::function<void()>>> hooks;
  };

  std::shared_ptr<State> state_;
};

}  // namespace whipcast::runtime

#endif  // WHIPCAST_RUNTIME_CANCELLATION_TOKEN_HPP_
