#include "internal/upload/stall_watchdog.hpp"

#include <stdexcept>
#include <utility>

#include "internal/observability/logging.hpp"

namespace mediaflow::upload {

void WatchdogPolicy::Validate() const {
  if (sample_interval.count() <= 0) {
    throw std::invalid_argument("watchdog sample interval must be positive");
  }
  if (initial_grace.count() < 0) {
    throw std::invalid_argument("watchdog initial grace must not be negative");
  }
  const auto& t = threshold;
  if (t.fast.count() <= 0 || t.fast > t.moderate || t.moderate > t.unknown || t.unknown > t.slow || t.slow > t.offline) {
    throw std::invalid_argument("stall thresholds must satisfy 0 < fast <= moderate <= unknown <= slow <= offline");
  }
}

std::unique_ptr<StallWatchdog::Handle> StallWatchdog::Attach(std::shared_ptr<TransferSession> session, util::Millis threshold,
                                                             const WatchdogPolicy& policy, std::function<void()> on_stall) {
  if (!session) {
    throw std::invalid_argument("watchdog requires a session");
  }
  if (threshold.count() <= 0) {
    throw std::invalid_argument("stall threshold must be positive");
  }

  std::unique_ptr<Handle> handle(new Handle(std::move(session), threshold, policy, std::move(on_stall)));
  handle->thread_ = std::thread([raw = handle.get()] { raw->Run(); });
  return handle;
}

StallWatchdog::Handle::Handle(std::shared_ptr<TransferSession> session, util::Millis threshold, WatchdogPolicy policy,
                              std::function<void()> on_stall)
    : session_(std::move(session)), threshold_(threshold), policy_(std::move(policy)), on_stall_(std::move(on_stall)) {
}

StallWatchdog::Handle::~Handle() {
  Cancel();
}

void StallWatchdog::Handle::Cancel() {
  {
    std::lock_guard lock(mutex_);
    stop_ = true;
  }
  cv_.notify_all();

  if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
    thread_.join();
  }
}

util::Millis StallWatchdog::Handle::fired_threshold() const {
  const auto fired = fired_threshold_ms_.load();
  return fired > 0 ? util::Millis{fired} : threshold_;
}

void StallWatchdog::Handle::Run() {
  std::uint64_t previous_bytes = session_->ProgressSnapshot().bytes;

  std::unique_lock lock(mutex_);
  while (true) {
    if (cv_.wait_for(lock, policy_.sample_interval, [this] { return stop_; })) {
      return;
    }
    if (session_->IsSettled()) {
      return;
    }

    const auto now      = util::SteadyNow();
    const auto progress = session_->ProgressSnapshot();

    if (progress.bytes < previous_bytes) {
      MEDIAFLOW_LOG_WARN("transfer reported fewer bytes than the previous sample",
                         {observability::StringField("session_id", session_->id()), observability::IntField("previous", static_cast<std::int64_t>(previous_bytes)),
                          observability::IntField("current", static_cast<std::int64_t>(progress.bytes))});
    }
    previous_bytes = progress.bytes;

    // Silence is measured from the session's own timestamp, so a stall is
    // seen at most one sample interval after it crosses the threshold.
    const auto age       = now - session_->started_at();
    const auto effective = age < policy_.initial_grace ? threshold_ * 2 : threshold_;
    if (now - progress.last_progress_at <= effective) {
      continue;
    }

    // Flag first: the controller may wake as soon as the session settles.
    fired_threshold_ms_.store(effective.count());
    triggered_.store(true);
    lock.unlock();
    const bool cancelled = session_->Cancel(CancelReason::kStalled);
    if (!cancelled) {
      triggered_.store(false);
      fired_threshold_ms_.store(0);
      return;
    }

    MEDIAFLOW_LOG_WARN("transfer stalled",
                       {observability::StringField("session_id", session_->id()),
                        observability::IntField("stalled_ms", std::chrono::duration_cast<util::Millis>(now - progress.last_progress_at).count()),
                        observability::IntField("threshold_ms", effective.count())});
    if (on_stall_) {
      on_stall_();
    }
    return;
  }
}

} // namespace mediaflow::upload
