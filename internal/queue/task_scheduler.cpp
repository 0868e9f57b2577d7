#include "task_scheduler.hpp"

namespace mediaflow::queue {

void TaskScheduler::Enqueue(const QueueJob& job) {
  EnqueueAt(job, util::SteadyNow());
}

void TaskScheduler::EnqueueAt(const QueueJob& job, util::SteadyTimePoint not_before) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) return;
    queue_.push(Scheduled{not_before, next_sequence_++, job});
  }
  // A new earliest job must wake a sleeper waiting on a later one.
  cv_.notify_all();
}

std::optional<QueueJob> TaskScheduler::Dequeue() {
  std::unique_lock lock(mutex_);

  while (true) {
    if (shutdown_) return std::nullopt;

    if (queue_.empty()) {
      cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });
      continue;
    }

    const auto due = queue_.top().not_before;
    if (due <= util::SteadyNow()) {
      QueueJob job = queue_.top().job;
      queue_.pop();
      return job;
    }
    cv_.wait_until(lock, due);
  }
}

void TaskScheduler::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

std::size_t TaskScheduler::Pending() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

} // namespace mediaflow::queue
