#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/api/document_store.hpp"
#include "internal/media/preview_generator.hpp"
#include "internal/queue/destination_path.hpp"
#include "internal/queue/task_scheduler.hpp"
#include "internal/queue/task_worker.hpp"
#include "internal/queue/upload_task.hpp"
#include "internal/upload/upload_controller.hpp"

namespace mediaflow::queue {

struct QueueOptions {
  std::uint32_t               workers{2};
  util::Millis                completed_grace{2'000};
  std::string                 placeholder_collection{"posts"};
  std::string                 destination_template{kDefaultDestinationTemplate};
  std::size_t                 max_tasks{0}; // 0 = unbounded
  std::optional<util::Millis> timeout_hint;
};

/*
  UploadQueue

  Accepts media submissions, writes a placeholder document up front and
  moves the bytes in the background through the UploadController.

  FLOW:

    Submit → preview → placeholder record → pending task → transfer job
    worker → uploading → controller Upload → completed | failed
    completed → placeholder patched → removed after completed_grace
    failed    → stays listed until Retry or Cancel

  Every transition publishes a full task snapshot to all subscribers.
  One thread delivers at a time. Changes made meanwhile, including by a
  subscriber calling back into the queue, are coalesced into another
  round with a fresh snapshot, so every subscriber's last delivery
  matches Tasks().
*/
class UploadQueue {
 public:
  using Listener    = std::function<void(const TaskSnapshot&)>;
  using Unsubscribe = std::function<void()>;

  UploadQueue(std::shared_ptr<upload::UploadController> controller, db::DocumentStorePtr documents, media::PreviewGeneratorPtr previews,
              QueueOptions options = {});
  ~UploadQueue();

  UploadQueue(const UploadQueue&)            = delete;
  UploadQueue& operator=(const UploadQueue&) = delete;

  void Start();
  void Stop();

  // ---------------------------------------------------------------------
  // Caller API
  // ---------------------------------------------------------------------

  std::string Submit(const std::string& owner_id, const model::MediaPayload& payload, const std::string& caption,
                     model::MediaKind media_kind);

  // NotFound for unknown ids, InvalidState unless the task has failed.
  void Retry(const std::string& task_id);

  // Removes the task and cancels its session. False for unknown ids.
  bool Cancel(const std::string& task_id);

  // The listener receives the current snapshot before Subscribe returns.
  // Called from inside a listener, it joins the next delivery round.
  Unsubscribe Subscribe(Listener listener);

  QueueStatus  Status() const;
  TaskSnapshot Tasks() const;

  const QueueOptions& options() const {
    return options_;
  }

 private:
  struct Entry {
    UploadTask                 task;
    std::optional<std::string> session_id;
  };

  struct ListenerRegistry {
    std::mutex                                    mutex;
    std::uint64_t                                 next_id{0};
    std::vector<std::pair<std::uint64_t, Listener>> listeners;
  };

  // ---------------------------------------------------------------------
  // Worker side
  // ---------------------------------------------------------------------

  void ProcessTransfer(const QueueJob& job);
  void ProcessRemoval(const QueueJob& job);

  void OnSession(const std::string& task_id, std::uint32_t attempt, const std::string& session_id);
  void OnProgress(const std::string& task_id, std::uint32_t attempt, double percent);

  void FinishSuccess(const UploadTask& task, const std::string& url);
  void MarkFailed(const std::string& task_id, std::uint32_t attempt, upload::UploadError error);

  // ---------------------------------------------------------------------
  // Helpers
  // ---------------------------------------------------------------------

  Entry*       FindLocked(const std::string& task_id);
  TaskSnapshot SnapshotLocked() const;
  void         Notify();

  // Delivery rounds. The caller holds delivery_mutex_ and has set delivering_.
  void DrainLocked(std::unique_lock<std::mutex>& state, const Listener* first = nullptr);
  void Deliver(const std::vector<Listener>& listeners);
  std::vector<Listener> Listeners() const;

  std::shared_ptr<upload::UploadController> controller_;
  db::DocumentStorePtr                      documents_;
  media::PreviewGeneratorPtr                previews_;
  const QueueOptions                        options_;

  std::shared_ptr<TaskScheduler>           transfers_;
  std::shared_ptr<TaskScheduler>           housekeeping_;
  std::vector<std::unique_ptr<TaskWorker>> workers_;

  mutable std::mutex mutex_;
  std::vector<Entry> entries_;        // submission order
  std::size_t        reserved_{0};    // Submit calls past the capacity check

  std::mutex                        delivery_mutex_;
  std::condition_variable           delivery_idle_;
  bool                              delivering_{false};
  bool                              dirty_{false};
  std::thread::id                   delivery_thread_;
  std::shared_ptr<ListenerRegistry> registry_;

  std::atomic<bool> started_{false};
  std::atomic<bool> stopping_{false};
};

} // namespace mediaflow::queue
