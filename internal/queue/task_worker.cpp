#include "task_worker.hpp"

#include "internal/observability/logging.hpp"

namespace mediaflow::queue {

TaskWorker::TaskWorker(std::shared_ptr<TaskScheduler> scheduler, Handler handler, std::string name)
    : scheduler_(std::move(scheduler)), handler_(std::move(handler)), name_(std::move(name)) {
}

TaskWorker::~TaskWorker() {
  Stop();
}

void TaskWorker::Start() {
  if (running_.exchange(true)) return;
  thread_ = std::thread(&TaskWorker::Run, this);
}

// The owner shuts the scheduler down first; this only joins.
void TaskWorker::Stop() {
  running_ = false;
  if (thread_.joinable()) thread_.join();
}

void TaskWorker::Run() {
  while (running_) {
    auto job = scheduler_->Dequeue();
    if (!job) break;

    try {
      handler_(*job);
    } catch (const std::exception& e) {
      MEDIAFLOW_LOG_ERROR("queue job failed", {observability::StringField("worker", name_), observability::StringField("task_id", job->task_id),
                                               observability::StringField("error", e.what())});
    }
  }
}

} // namespace mediaflow::queue
