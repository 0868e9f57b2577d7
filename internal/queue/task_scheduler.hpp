#pragma once

#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <vector>

#include "internal/util/time.hpp"

namespace mediaflow::queue {

struct QueueJob {
  enum class Kind {
    kTransfer,
    kRemove,
  };

  Kind          kind{Kind::kTransfer};
  std::string   task_id;
  std::uint32_t attempt{0};
};

/*
  Thread-safe blocking queue for queue workers.

  Jobs may carry a not-before time; Dequeue() hands out the earliest due
  job and sleeps until one is due. Jobs with equal times keep FIFO order.
*/
class TaskScheduler {
 public:
  void Enqueue(const QueueJob& job);
  void EnqueueAt(const QueueJob& job, util::SteadyTimePoint not_before);

  // blocking wait; nullopt after Shutdown()
  std::optional<QueueJob> Dequeue();

  void Shutdown();

  std::size_t Pending() const;

 private:
  struct Scheduled {
    util::SteadyTimePoint not_before;
    std::uint64_t         sequence;
    QueueJob              job;
  };

  struct Later {
    bool operator()(const Scheduled& a, const Scheduled& b) const {
      if (a.not_before != b.not_before) return a.not_before > b.not_before;
      return a.sequence > b.sequence;
    }
  };

  mutable std::mutex                                            mutex_;
  std::condition_variable                                       cv_;
  std::priority_queue<Scheduled, std::vector<Scheduled>, Later> queue_;
  std::uint64_t                                                 next_sequence_ = 0;
  bool                                                          shutdown_      = false;
};

} // namespace mediaflow::queue
