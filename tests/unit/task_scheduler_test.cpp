#include <atomic>
#include <cassert>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/queue/task_scheduler.hpp"
#include "internal/queue/task_worker.hpp"
#include "tests/unit/fakes/scripted_blob_store.hpp"

namespace {

using namespace mediaflow;
using queue::QueueJob;
using queue::TaskScheduler;

QueueJob Job(const std::string& id, std::uint32_t attempt = 1) {
  return QueueJob{QueueJob::Kind::kTransfer, id, attempt};
}

void TestFifoForDueJobs() {
  TaskScheduler scheduler;
  scheduler.Enqueue(Job("a"));
  scheduler.Enqueue(Job("b"));
  scheduler.Enqueue(Job("c"));
  assert(scheduler.Pending() == 3);

  assert(scheduler.Dequeue()->task_id == "a");
  assert(scheduler.Dequeue()->task_id == "b");
  assert(scheduler.Dequeue()->task_id == "c");
  assert(scheduler.Pending() == 0);
}

void TestDelayedJobWaitsForItsTime() {
  TaskScheduler scheduler;
  const auto    start = util::SteadyNow();
  scheduler.EnqueueAt(Job("later"), start + util::Millis{60});
  scheduler.Enqueue(Job("now"));

  assert(scheduler.Dequeue()->task_id == "now");
  auto later = scheduler.Dequeue();
  assert(later->task_id == "later");
  assert(util::SteadyNow() - start >= util::Millis{60});
}

void TestEarlierJobWakesSleeper() {
  TaskScheduler scheduler;
  scheduler.EnqueueAt(Job("far"), util::SteadyNow() + util::Millis{10'000});

  std::string first;
  std::thread consumer([&] { first = scheduler.Dequeue()->task_id; });

  std::this_thread::sleep_for(util::Millis{20});
  scheduler.Enqueue(Job("near"));
  consumer.join();
  assert(first == "near");
}

void TestShutdownReleasesWaitersAndDropsJobs() {
  TaskScheduler    scheduler;
  std::atomic<int> released{0};

  std::vector<std::thread> waiters;
  for (int i = 0; i < 3; ++i) {
    waiters.emplace_back([&] {
      if (!scheduler.Dequeue()) ++released;
    });
  }
  std::this_thread::sleep_for(util::Millis{20});
  scheduler.Shutdown();
  for (auto& waiter : waiters) waiter.join();
  assert(released == 3);

  scheduler.Enqueue(Job("ignored"));
  assert(scheduler.Pending() == 0);
  assert(!scheduler.Dequeue());
}

void TestWorkerSurvivesThrowingHandler() {
  auto             scheduler = std::make_shared<TaskScheduler>();
  std::mutex       mutex;
  std::vector<std::string> handled;

  queue::TaskWorker worker(
      scheduler,
      [&](const QueueJob& job) {
        if (job.task_id == "bad") throw std::runtime_error("handler failure");
        std::lock_guard lock(mutex);
        handled.push_back(job.task_id);
      },
      "test-worker");
  worker.Start();
  worker.Start();

  scheduler->Enqueue(Job("one"));
  scheduler->Enqueue(Job("bad"));
  scheduler->Enqueue(Job("two"));

  assert(testing::WaitUntil([&] {
    std::lock_guard lock(mutex);
    return handled.size() == 2;
  }));

  scheduler->Shutdown();
  worker.Stop();

  std::lock_guard lock(mutex);
  assert(handled[0] == "one");
  assert(handled[1] == "two");
}

} // namespace

int main() {
  TestFifoForDueJobs();
  TestDelayedJobWaitsForItsTime();
  TestEarlierJobWakesSleeper();
  TestShutdownReleasesWaitersAndDropsJobs();
  TestWorkerSurvivesThrowingHandler();

  std::cout << "mediaflow_unit_task_scheduler: pass\n";
  return 0;
}
