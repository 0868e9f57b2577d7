#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <thread>

#include "task_scheduler.hpp"

namespace mediaflow::queue {

/*
  Background worker that drains one scheduler.

  Executes:
      transfer jobs → UploadQueue::ProcessTransfer
      remove jobs   → UploadQueue::ProcessRemoval
*/
class TaskWorker {
 public:
  using Handler = std::function<void(const QueueJob&)>;

  TaskWorker(std::shared_ptr<TaskScheduler> scheduler, Handler handler, std::string name);
  ~TaskWorker();

  void Start();
  void Stop();

 private:
  void Run();

  std::shared_ptr<TaskScheduler> scheduler_;
  Handler                        handler_;
  std::string                    name_;

  std::thread       thread_;
  std::atomic<bool> running_{false};
};

} // namespace mediaflow::queue
