#include "upload_queue.hpp"

#include <algorithm>
#include <stdexcept>
#include <thread>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace mediaflow::queue {

namespace {

using observability::IntField;
using observability::StringField;

void SetString(google::protobuf::Struct& fields, const std::string& key, const std::string& value) {
  (*fields.mutable_fields())[key].set_string_value(value);
}

void SetBool(google::protobuf::Struct& fields, const std::string& key, bool value) {
  (*fields.mutable_fields())[key].set_bool_value(value);
}

void SetNumber(google::protobuf::Struct& fields, const std::string& key, double value) {
  (*fields.mutable_fields())[key].set_number_value(value);
}

constexpr const char* kCancelledMessage = "Upload cancelled before it finished. Please try again.";

} // namespace

UploadQueue::UploadQueue(std::shared_ptr<upload::UploadController> controller, db::DocumentStorePtr documents,
                         media::PreviewGeneratorPtr previews, QueueOptions options)
    : controller_(std::move(controller)),
      documents_(std::move(documents)),
      previews_(std::move(previews)),
      options_(std::move(options)),
      transfers_(std::make_shared<TaskScheduler>()),
      housekeeping_(std::make_shared<TaskScheduler>()),
      registry_(std::make_shared<ListenerRegistry>()) {
  if (!controller_) throw std::invalid_argument("UploadQueue requires an upload controller");
  if (!documents_) throw std::invalid_argument("UploadQueue requires a document store");
  if (!previews_) throw std::invalid_argument("UploadQueue requires a preview generator");
  if (options_.placeholder_collection.empty()) throw std::invalid_argument("placeholder collection must not be empty");

  // Fail at construction on a bad template rather than on the first transfer.
  (void)ExpandDestination(options_.destination_template, "c", "r", "f");
}

UploadQueue::~UploadQueue() {
  Stop();
}

void UploadQueue::Start() {
  if (stopping_) throw util::InvalidState("upload queue was stopped");
  if (started_.exchange(true)) return;

  const auto workers = std::max<std::uint32_t>(1, options_.workers);
  for (std::uint32_t i = 0; i < workers; ++i) {
    workers_.push_back(std::make_unique<TaskWorker>(
        transfers_, [this](const QueueJob& job) { ProcessTransfer(job); }, "transfer-" + std::to_string(i)));
  }
  workers_.push_back(
      std::make_unique<TaskWorker>(housekeeping_, [this](const QueueJob& job) { ProcessRemoval(job); }, "housekeeping"));

  for (auto& worker : workers_) worker->Start();

  MEDIAFLOW_LOG_INFO("upload queue started", {IntField("workers", workers), StringField("collection", options_.placeholder_collection)});
}

void UploadQueue::Stop() {
  if (stopping_.exchange(true)) return;

  transfers_->Shutdown();
  housekeeping_->Shutdown();

  std::vector<std::string> sessions;
  {
    std::lock_guard lock(mutex_);
    for (const auto& entry : entries_) {
      if (entry.session_id) sessions.push_back(*entry.session_id);
    }
  }
  for (const auto& id : sessions) {
    controller_->Cancel(id);
  }

  for (auto& worker : workers_) worker->Stop();
  workers_.clear();

  if (started_) {
    MEDIAFLOW_LOG_INFO("upload queue stopped", {IntField("cancelled_sessions", static_cast<std::int64_t>(sessions.size()))});
  }
}

// -----------------------------------------------------------------------------
// Caller API
// -----------------------------------------------------------------------------

std::string UploadQueue::Submit(const std::string& owner_id, const model::MediaPayload& payload, const std::string& caption,
                                model::MediaKind media_kind) {
  if (owner_id.empty()) throw std::invalid_argument("owner id must not be empty");
  if (!payload.bytes || payload.size() == 0) throw std::invalid_argument("payload must not be empty");
  if (stopping_) throw util::InvalidState("upload queue is stopped");

  // The slot is held from here until the entry is pushed, so concurrent
  // submits cannot overrun max_tasks and a rejected one writes no placeholder.
  {
    std::lock_guard lock(mutex_);
    if (options_.max_tasks > 0 && entries_.size() + reserved_ >= options_.max_tasks) {
      throw util::ResourceExhausted("upload queue is full (" + std::to_string(options_.max_tasks) + " tasks)");
    }
    ++reserved_;
  }
  struct Reservation {
    UploadQueue* queue;
    bool         held{true};
    ~Reservation() {
      if (!held) return;
      std::lock_guard lock(queue->mutex_);
      --queue->reserved_;
    }
  } reservation{this};

  observability::SpanScope span("upload.queue.submit");
  span.SetAttribute("owner_id", owner_id);
  span.SetAttribute("media_kind", model::ToString(media_kind));

  std::string preview;
  try {
    preview = previews_->Generate(payload, media_kind);
  } catch (const std::exception& e) {
    MEDIAFLOW_LOG_WARN("preview generation failed; continuing without preview", {StringField("owner_id", owner_id), StringField("error", e.what())});
  }

  const auto task_id = util::GenerateId("task");
  const auto now     = util::Now();

  db::model::DocumentRecord record;
  record.collection = options_.placeholder_collection;
  SetString(record.fields, "owner_id", owner_id);
  SetString(record.fields, "caption", caption);
  SetString(record.fields, "media_kind", std::string(model::ToString(media_kind)));
  SetString(record.fields, "media_url", preview);
  SetString(record.fields, "preview", preview);
  SetBool(record.fields, "uploading", true);
  SetNumber(record.fields, "created_at_ms", static_cast<double>(util::ToUnixMillis(now)));
  SetString(record.fields, "task_id", task_id);

  if (auto result = documents_->CreateRecord(record); !result) {
    span.MarkFailed(db::ToString(result.code), result.message);
    MEDIAFLOW_LOG_ERROR("placeholder creation failed", {StringField("owner_id", owner_id), StringField("code", db::ToString(result.code)),
                                                        StringField("error", result.message)});
    throw util::Unavailable("could not create placeholder record: " + result.message);
  }

  UploadTask task;
  task.id                    = task_id;
  task.owner_id              = owner_id;
  task.caption               = caption;
  task.media_kind            = media_kind;
  task.payload               = payload;
  task.placeholder_record_id = record.id;
  task.preview               = std::move(preview);
  task.submitted_at          = now;

  {
    std::lock_guard lock(mutex_);
    entries_.push_back(Entry{std::move(task), std::nullopt});
    --reserved_;
    reservation.held = false;
  }
  transfers_->Enqueue(QueueJob{QueueJob::Kind::kTransfer, task_id, 1});

  MEDIAFLOW_LOG_INFO("task submitted", {StringField("task_id", task_id), StringField("record_id", record.id),
                                        StringField("media_kind", model::ToString(media_kind)),
                                        IntField("size_bytes", static_cast<std::int64_t>(payload.size()))});
  span.SetAttribute("task_id", task_id);

  Notify();
  return task_id;
}

void UploadQueue::Retry(const std::string& task_id) {
  std::uint32_t attempt = 0;
  {
    std::lock_guard lock(mutex_);
    auto*           entry = FindLocked(task_id);
    if (!entry) throw util::NotFound("task not found: " + task_id);

    auto& task = entry->task;
    if (!model::CanTransition(task.status, model::TaskStatus::kPending)) {
      throw util::InvalidState("task " + task_id + " is " + std::string(model::ToString(task.status)) + "; only failed tasks can be retried");
    }

    task.status   = model::TaskStatus::kPending;
    task.progress = 0.0;
    task.last_error.reset();
    task.final_url.reset();
    entry->session_id.reset();
    attempt = ++task.attempt;
  }

  transfers_->Enqueue(QueueJob{QueueJob::Kind::kTransfer, task_id, attempt});
  MEDIAFLOW_LOG_INFO("task retried", {StringField("task_id", task_id), IntField("attempt", attempt)});
  Notify();
}

bool UploadQueue::Cancel(const std::string& task_id) {
  std::optional<std::string> session_id;
  {
    std::lock_guard lock(mutex_);
    auto            it = std::find_if(entries_.begin(), entries_.end(), [&](const Entry& e) { return e.task.id == task_id; });
    if (it == entries_.end()) return false;
    session_id = it->session_id;
    entries_.erase(it);
  }

  if (session_id) {
    controller_->Cancel(*session_id);
  }
  MEDIAFLOW_LOG_INFO("task cancelled", {StringField("task_id", task_id), StringField("session_id", session_id.value_or(""))});
  Notify();
  return true;
}

UploadQueue::Unsubscribe UploadQueue::Subscribe(Listener listener) {
  if (!listener) throw std::invalid_argument("listener must not be empty");

  std::uint64_t id                = 0;
  const auto    register_listener = [&] {
    std::lock_guard lock(registry_->mutex);
    id = registry_->next_id++;
    registry_->listeners.emplace_back(id, listener);
  };

  std::unique_lock state(delivery_mutex_);
  if (delivering_ && delivery_thread_ == std::this_thread::get_id()) {
    register_listener();
    dirty_ = true;
  } else {
    delivery_idle_.wait(state, [this] { return !delivering_; });
    delivering_      = true;
    delivery_thread_ = std::this_thread::get_id();
    register_listener();
    DrainLocked(state, &listener);
  }
  state.unlock();

  std::weak_ptr<ListenerRegistry> weak = registry_;
  return [weak, id] {
    auto registry = weak.lock();
    if (!registry) return;
    std::lock_guard lock(registry->mutex);
    auto&           listeners = registry->listeners;
    listeners.erase(std::remove_if(listeners.begin(), listeners.end(), [id](const auto& l) { return l.first == id; }), listeners.end());
  };
}

QueueStatus UploadQueue::Status() const {
  std::lock_guard lock(mutex_);
  QueueStatus     status;
  status.total = entries_.size();
  for (const auto& entry : entries_) {
    switch (entry.task.status) {
      case model::TaskStatus::kPending:
        ++status.pending;
        break;
      case model::TaskStatus::kUploading:
        ++status.uploading;
        break;
      case model::TaskStatus::kCompleted:
        ++status.completed;
        break;
      case model::TaskStatus::kFailed:
        ++status.failed;
        break;
    }
  }
  return status;
}

TaskSnapshot UploadQueue::Tasks() const {
  std::lock_guard lock(mutex_);
  return SnapshotLocked();
}

// -----------------------------------------------------------------------------
// Worker side
// -----------------------------------------------------------------------------

void UploadQueue::ProcessTransfer(const QueueJob& job) {
  UploadTask task;
  {
    std::lock_guard lock(mutex_);
    auto*           entry = FindLocked(job.task_id);
    // Cancelled, or superseded by a newer attempt.
    if (!entry || entry->task.attempt != job.attempt) return;
    if (!model::CanTransition(entry->task.status, model::TaskStatus::kUploading)) return;

    entry->task.status   = model::TaskStatus::kUploading;
    entry->task.progress = 0.0;
    entry->session_id.reset();
    task = entry->task;
  }

  MEDIAFLOW_LOG_INFO("task uploading", {StringField("task_id", task.id), IntField("attempt", task.attempt)});
  Notify();

  const auto filename = PlaceholderFilename(task.placeholder_record_id, task.payload);
  const auto path     = ExpandDestination(options_.destination_template, options_.placeholder_collection, task.placeholder_record_id, filename);

  upload::UploadOptions upload_options;
  upload_options.media_kind   = task.media_kind;
  upload_options.timeout_hint = options_.timeout_hint;
  upload_options.on_session   = [this, id = task.id, attempt = task.attempt](const std::string& session_id) {
    OnSession(id, attempt, session_id);
  };
  upload_options.on_progress = [this, id = task.id, attempt = task.attempt](double percent) { OnProgress(id, attempt, percent); };

  upload::UploadResult result;
  try {
    result = controller_->Upload(task.payload, path, std::move(upload_options));
  } catch (const std::exception& e) {
    MEDIAFLOW_LOG_ERROR("upload controller threw", {StringField("task_id", task.id), StringField("error", e.what())});
    result.error = upload::UploadError{upload::UploadErrorKind::kUnknown, e.what()};
  }

  if (result.success && result.url) {
    FinishSuccess(task, *result.url);
    return;
  }

  if (result.cancelled) {
    MarkFailed(task.id, task.attempt, upload::UploadError{upload::UploadErrorKind::kUnknown, kCancelledMessage});
    return;
  }

  MarkFailed(task.id, task.attempt,
             result.error.value_or(upload::UploadError{upload::UploadErrorKind::kUnknown, "Upload failed. Please try again."}));
}

void UploadQueue::ProcessRemoval(const QueueJob& job) {
  bool removed = false;
  {
    std::lock_guard lock(mutex_);
    auto            it = std::find_if(entries_.begin(), entries_.end(), [&](const Entry& e) { return e.task.id == job.task_id; });
    if (it != entries_.end() && it->task.attempt == job.attempt && it->task.status == model::TaskStatus::kCompleted) {
      entries_.erase(it);
      removed = true;
    }
  }

  if (removed) {
    MEDIAFLOW_LOG_DEBUG("completed task removed", {StringField("task_id", job.task_id)});
    Notify();
  }
}

void UploadQueue::OnSession(const std::string& task_id, std::uint32_t attempt, const std::string& session_id) {
  bool orphaned = false;
  {
    std::lock_guard lock(mutex_);
    auto*           entry = FindLocked(task_id);
    if (!entry || entry->task.attempt != attempt || stopping_) {
      orphaned = true;
    } else {
      entry->session_id = session_id;
    }
  }

  // Cancel() or Stop() ran before the session existed.
  if (orphaned) {
    controller_->Cancel(session_id);
  }
}

void UploadQueue::OnProgress(const std::string& task_id, std::uint32_t attempt, double percent) {
  bool changed = false;
  {
    std::lock_guard lock(mutex_);
    auto*           entry = FindLocked(task_id);
    if (entry && entry->task.attempt == attempt && entry->task.status == model::TaskStatus::kUploading) {
      const auto clamped = std::clamp(percent, 0.0, 100.0);
      if (clamped > entry->task.progress) {
        entry->task.progress = clamped;
        changed              = true;
      }
    }
  }
  if (changed) Notify();
}

void UploadQueue::FinishSuccess(const UploadTask& task, const std::string& url) {
  {
    std::lock_guard lock(mutex_);
    auto*           entry = FindLocked(task.id);
    if (!entry || entry->task.attempt != task.attempt) {
      MEDIAFLOW_LOG_INFO("upload finished after task was cancelled; placeholder left untouched",
                         {StringField("task_id", task.id), StringField("record_id", task.placeholder_record_id)});
      return;
    }
  }

  google::protobuf::Struct patch;
  SetString(patch, "media_url", url);
  SetBool(patch, "uploading", false);
  SetNumber(patch, "completed_at_ms", static_cast<double>(util::ToUnixMillis(util::Now())));

  if (auto result = documents_->PatchRecord(options_.placeholder_collection, task.placeholder_record_id, patch); !result) {
    MEDIAFLOW_LOG_ERROR("placeholder finalize failed", {StringField("task_id", task.id), StringField("record_id", task.placeholder_record_id),
                                                        StringField("code", db::ToString(result.code)), StringField("error", result.message)});
    MarkFailed(task.id, task.attempt,
               upload::UploadError{upload::UploadErrorKind::kUnknown,
                                   "Upload finished but the post could not be updated. Please try again."});
    return;
  }

  bool completed = false;
  {
    std::lock_guard lock(mutex_);
    auto*           entry = FindLocked(task.id);
    if (entry && entry->task.attempt == task.attempt && model::CanTransition(entry->task.status, model::TaskStatus::kCompleted)) {
      entry->task.status    = model::TaskStatus::kCompleted;
      entry->task.progress  = 100.0;
      entry->task.final_url = url;
      entry->task.last_error.reset();
      entry->session_id.reset();
      completed = true;
    }
  }

  MEDIAFLOW_LOG_INFO("placeholder finalized", {StringField("task_id", task.id), StringField("record_id", task.placeholder_record_id)});
  if (!completed) return;

  MEDIAFLOW_LOG_INFO("task completed", {StringField("task_id", task.id), StringField("url", url)});
  housekeeping_->EnqueueAt(QueueJob{QueueJob::Kind::kRemove, task.id, task.attempt}, util::SteadyNow() + options_.completed_grace);
  Notify();
}

void UploadQueue::MarkFailed(const std::string& task_id, std::uint32_t attempt, upload::UploadError error) {
  bool failed = false;
  {
    std::lock_guard lock(mutex_);
    auto*           entry = FindLocked(task_id);
    if (entry && entry->task.attempt == attempt && model::CanTransition(entry->task.status, model::TaskStatus::kFailed)) {
      entry->task.status     = model::TaskStatus::kFailed;
      entry->task.last_error = error;
      entry->session_id.reset();
      failed = true;
    }
  }

  if (!failed) return;
  MEDIAFLOW_LOG_WARN("task failed", {StringField("task_id", task_id), IntField("attempt", attempt),
                                     StringField("kind", upload::ToString(error.kind)), StringField("message", error.message)});
  Notify();
}

// -----------------------------------------------------------------------------
// Helpers
// -----------------------------------------------------------------------------

UploadQueue::Entry* UploadQueue::FindLocked(const std::string& task_id) {
  auto it = std::find_if(entries_.begin(), entries_.end(), [&](const Entry& e) { return e.task.id == task_id; });
  return it == entries_.end() ? nullptr : &*it;
}

TaskSnapshot UploadQueue::SnapshotLocked() const {
  TaskSnapshot snapshot;
  snapshot.reserve(entries_.size());
  for (const auto& entry : entries_) snapshot.push_back(entry.task);
  return snapshot;
}

void UploadQueue::Notify() {
  std::unique_lock state(delivery_mutex_);
  dirty_ = true;
  // The delivering thread, this one included, picks the change up next round.
  if (delivering_) return;

  delivering_      = true;
  delivery_thread_ = std::this_thread::get_id();
  DrainLocked(state);
}

void UploadQueue::DrainLocked(std::unique_lock<std::mutex>& state, const Listener* first) {
  const auto release = [&] {
    delivering_      = false;
    delivery_thread_ = {};
    delivery_idle_.notify_all();
  };

  try {
    if (first) {
      state.unlock();
      Deliver({*first});
      state.lock();
    }
    while (dirty_) {
      dirty_ = false;
      state.unlock();
      Deliver(Listeners());
      state.lock();
    }
  } catch (...) {
    if (!state.owns_lock()) state.lock();
    release();
    throw;
  }
  release();
}

std::vector<UploadQueue::Listener> UploadQueue::Listeners() const {
  std::lock_guard       lock(registry_->mutex);
  std::vector<Listener> listeners;
  listeners.reserve(registry_->listeners.size());
  for (const auto& [id, listener] : registry_->listeners) listeners.push_back(listener);
  return listeners;
}

void UploadQueue::Deliver(const std::vector<Listener>& listeners) {
  TaskSnapshot snapshot;
  {
    std::lock_guard lock(mutex_);
    snapshot = SnapshotLocked();
  }

  for (const auto& listener : listeners) {
    try {
      listener(snapshot);
    } catch (const std::exception& e) {
      MEDIAFLOW_LOG_ERROR("task listener threw", {StringField("error", e.what())});
    }
  }
}

} // namespace mediaflow::queue
