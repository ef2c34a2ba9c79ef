// Repository: Whipcast
// Component: Retry-With-Backoff Combinator
// Purpose: Drives one asynchronous operation through a RetryPolicy.
// Copyright (c) 2025 Whipcast

#include "whipcast/runtime/RetryWithBackoff.hpp"

#include <memory>
#include <sstream>

#include "whipcast/util/Logger.hpp"

namespace whipcast::runtime {

namespace {

// Keeps itself alive through the completion and timer closures it hands out.
class RetryRunner : public std::enable_shared_from_this<RetryRunner> {
 public:
  RetryRunner(IScheduler& scheduler, RetryPolicy policy, std::string label,
              AsyncOperation op, Completion done, CancellationToken token,
              RetryObserver on_retry)
      : scheduler_(scheduler),
        policy_(std::move(policy)),
        label_(std::move(label)),
        op_(std::move(op)),
        done_(std::move(done)),
        token_(std::move(token)),
        on_retry_(std::move(on_retry)) {}

  void Start() {
    std::weak_ptr<RetryRunner> weak = weak_from_this();
    hook_id_ = token_.OnCancel([weak]() {
      if (auto self = weak.lock()) self->CancelTimer();
    });
    Attempt();
  }

 private:
  void Attempt() {
    timer_ = kInvalidTimer;
    if (token_.IsCancelled()) return;
    auto self = shared_from_this();
    auto completed = std::make_shared<bool>(false);
    op_([self, completed](const CallResult& result) {
      if (*completed) return;
      *completed = true;
      self->OnAttemptDone(result);
    });
  }

  void CancelTimer() {
    if (timer_ == kInvalidTimer) return;
    scheduler_.Cancel(timer_);
    timer_ = kInvalidTimer;
  }

  void Finish(const CallResult& result) {
    token_.RemoveOnCancel(hook_id_);
    hook_id_ = 0;
    done_(result);
  }

  void OnAttemptDone(const CallResult& result) {
    if (token_.IsCancelled()) return;

    if (result.success) {
      if (retries_used_ > 0) {
        util::Logger::Info("[Retry] " + label_ + " succeeded after " +
                           std::to_string(retries_used_) + " retries");
      }
      Finish(result);
      return;
    }

    if (!policy_.IsRetryable(result)) {
      util::Logger::Warn("[Retry] " + label_ + " not retryable: " + Describe(result));
      Finish(result);
      return;
    }

    if (retries_used_ >= policy_.max_retries) {
      std::ostringstream msg;
      msg << label_ << " gave up after " << retries_used_ << " retries: " << result.message;
      util::Logger::Error("[Retry] " + msg.str());
      Finish(CallResult::Failure(ErrorKind::kRetryExhausted, msg.str(), result.http_status));
      return;
    }

    ++retries_used_;
    const int64_t delay = BackoffDelayMs(policy_, retries_used_);
    util::Logger::Warn("[Retry] " + label_ + " attempt failed (" + Describe(result) +
                       "), retry " + std::to_string(retries_used_) + "/" +
                       std::to_string(policy_.max_retries) + " in " +
                       std::to_string(delay) + "ms");
    if (on_retry_) on_retry_(retries_used_, delay, result);

    auto self = shared_from_this();
    timer_ = scheduler_.ScheduleAfter(delay, [self]() { self->Attempt(); });
  }

  IScheduler& scheduler_;
  RetryPolicy policy_;
  std::string label_;
  AsyncOperation op_;
  Completion done_;
  CancellationToken token_;
  RetryObserver on_retry_;
  int retries_used_ = 0;
  TimerId timer_ = kInvalidTimer;
  CancelHookId hook_id_ = 0;
};

}  // namespace

void RetryWithBackoff(IScheduler& scheduler,
                      const RetryPolicy& policy,
                      const std::string& label,
                      AsyncOperation op,
                      Completion done,
                      CancellationToken token,
                      RetryObserver on_retry) {
  auto runner = std::make_shared<RetryRunner>(scheduler, policy, label, std::move(op),
                                              std::move(done), std::move(token),
                                              std::move(on_retry));
  runner->Start();
}

}  // namespace whipcast::runtime
