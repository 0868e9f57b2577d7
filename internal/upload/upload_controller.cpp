#include "internal/upload/upload_controller.hpp"

#include <stdexcept>
#include <utility>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/uuid.hpp"

namespace mediaflow::upload {

namespace {

using observability::BoolField;
using observability::IntField;
using observability::StringField;

/*
  Caller progress hook that can be closed. Backend threads may deliver
  events after Upload() has returned; once closed they are dropped.
*/
class ProgressGate {
 public:
  explicit ProgressGate(std::function<void(double)> hook) : hook_(std::move(hook)) {
  }

  void Deliver(double percent) {
    std::lock_guard lock(mutex_);
    if (open_ && hook_) {
      hook_(percent);
    }
  }

  void Close() {
    std::lock_guard lock(mutex_);
    open_ = false;
  }

 private:
  std::mutex                  mutex_;
  bool                        open_{true};
  std::function<void(double)> hook_;
};

std::string OutcomeLabel(const UploadResult& result) {
  if (result.success) return "success";
  if (result.cancelled) return "cancelled";
  if (result.error) return std::string(ToString(result.error->kind));
  return "unknown";
}

} // namespace

UploadController::UploadController(storage::BlobStorePtr store, std::shared_ptr<network::ConnectivityMonitor> connectivity,
                                   ControllerPolicy policy)
    : store_(std::move(store)), connectivity_(std::move(connectivity)), policy_(std::move(policy)) {
  if (!store_) {
    throw std::invalid_argument("UploadController requires a blob store");
  }
  if (!connectivity_) {
    throw std::invalid_argument("UploadController requires a connectivity monitor");
  }
  policy_.Validate();
}

UploadResult UploadController::Upload(const model::MediaPayload& payload, const std::string& destination_path, UploadOptions options) {
  if (!payload.bytes) {
    throw std::invalid_argument("upload payload must not be null");
  }
  if (destination_path.empty()) {
    throw std::invalid_argument("upload destination path must not be empty");
  }

  observability::SpanScope span("upload.controller.upload");
  span.SetAttribute("destination", destination_path);
  span.SetAttribute("size_bytes", static_cast<std::int64_t>(payload.size()));

  const auto media_kind = model::ToString(options.media_kind);
  const auto network    = connectivity_->Sample();

  if (!network.online) {
    MEDIAFLOW_LOG_WARN("upload rejected: offline", {StringField("destination", destination_path)});
    observability::Metrics::Instance().RecordUploadOutcome(media_kind, ToString(UploadErrorKind::kOffline));
    span.MarkFailed(ToString(UploadErrorKind::kOffline), "link offline at pre-flight");
    return UploadResult{.error = OfflineError()};
  }

  const auto timeout   = ComputeTimeout(payload.size(), network.quality, options.timeout_hint, options.media_kind, policy_.timeout);
  const auto threshold = policy_.watchdog.ThresholdFor(network.quality);

  auto session = std::make_shared<TransferSession>(util::GenerateId("upl"), destination_path, payload.size());
  Register(session);

  // Every exit below this point unregisters.
  struct Registration {
    UploadController* controller;
    SessionPtr        session;
    ~Registration() {
      controller->Unregister(session);
    }
  } registration{this, session};

  MEDIAFLOW_LOG_INFO("upload started", {StringField("session_id", session->id()), StringField("destination", destination_path),
                                        IntField("size_bytes", static_cast<std::int64_t>(payload.size())),
                                        StringField("quality", network::ToString(network.quality)), IntField("timeout_ms", timeout.count()),
                                        IntField("stall_threshold_ms", threshold.count())});
  span.SetAttribute("session_id", session->id());
  span.SetAttribute("timeout_ms", static_cast<std::int64_t>(timeout.count()));

  if (options.on_session) {
    options.on_session(session->id());
  }

  auto watchdog = StallWatchdog::Attach(session, threshold, policy_.watchdog, [quality = network.quality] {
    observability::Metrics::Instance().RecordStall(network::ToString(quality));
  });

  auto gate = std::make_shared<ProgressGate>(std::move(options.on_progress));

  storage::TransferEvents events;
  events.on_progress = [session, gate](std::uint64_t transferred, std::uint64_t total) {
    if (session->RecordProgress(transferred) == TransferSession::ProgressUpdate::kRegressed) {
      MEDIAFLOW_LOG_DEBUG("backend reported a byte count below the previous report",
                          {StringField("session_id", session->id()), IntField("bytes", static_cast<std::int64_t>(transferred))});
    }
    if (total > 0 && !session->IsSettled()) {
      gate->Deliver(static_cast<double>(transferred) * 100.0 / static_cast<double>(total));
    }
  };
  events.on_error    = [session](const storage::BlobError& error) { session->Fail(error); };
  events.on_complete = [session](const std::string& url) { session->Complete(url); };

  try {
    session->AttachTransfer(store_->Put(destination_path, payload.bytes, payload.content_type, std::move(events)));
  } catch (const std::invalid_argument&) {
    watchdog->Cancel();
    gate->Close();
    throw;
  } catch (const std::exception& e) {
    MEDIAFLOW_LOG_ERROR("blob store rejected transfer", {StringField("session_id", session->id()), StringField("error", e.what())});
    session->Fail(storage::BlobError{storage::BlobErrorCode::kUnknown, e.what()});
  }

  const auto outcome = session->Await(session->started_at() + timeout);
  watchdog->Cancel();
  gate->Close();

  auto result = Settle(outcome, *session, *watchdog, timeout);

  const auto elapsed = std::chrono::duration_cast<util::Millis>(util::SteadyNow() - session->started_at());
  const auto label   = OutcomeLabel(result);

  observability::Metrics::Instance().RecordUploadOutcome(media_kind, label);
  observability::Metrics::Instance().ObserveUploadDurationMs(media_kind, static_cast<double>(elapsed.count()));
  span.SetAttribute("outcome", label);
  if (result.error) {
    span.MarkFailed(label, result.error->message);
    MEDIAFLOW_LOG_WARN("upload failed", {StringField("session_id", session->id()), StringField("kind", label),
                                         StringField("message", result.error->message), IntField("elapsed_ms", elapsed.count())});
  } else {
    MEDIAFLOW_LOG_INFO("upload finished", {StringField("session_id", session->id()), StringField("outcome", label),
                                           BoolField("cancelled", result.cancelled), IntField("elapsed_ms", elapsed.count())});
  }
  return result;
}

UploadResult UploadController::Settle(const TransferSession::Outcome& outcome, const TransferSession& session,
                                      const StallWatchdog::Handle& watchdog, util::Millis timeout) const {
  using Kind = TransferSession::Outcome::Kind;

  if (outcome.kind == Kind::kCompleted) {
    return UploadResult{.success = true, .url = outcome.url};
  }

  if (outcome.kind == Kind::kCancelled && session.token().Reason() != CancelReason::kStalled) {
    return UploadResult{.cancelled = true};
  }

  FailureContext context;
  context.network         = connectivity_->Sample();
  context.backend_error   = outcome.error;
  context.timeout         = timeout;
  context.stall_threshold = watchdog.fired_threshold();
  context.deadline_expired = outcome.kind == Kind::kDeadline;
  context.watchdog_triggered = outcome.kind == Kind::kCancelled && watchdog.Triggered();

  return UploadResult{.error = ClassifyFailure(context)};
}

bool UploadController::Cancel(const std::string& session_id) {
  SessionPtr session;
  {
    std::lock_guard lock(mutex_);
    auto            it = active_.find(session_id);
    if (it == active_.end()) {
      return false;
    }
    session = it->second;
    active_.erase(it);
    PublishActiveCountLocked();
  }

  session->Cancel(CancelReason::kCaller);
  MEDIAFLOW_LOG_INFO("upload cancelled", {StringField("session_id", session_id)});
  return true;
}

std::size_t UploadController::CancelAll() {
  std::unordered_map<std::string, SessionPtr> sessions;
  {
    std::lock_guard lock(mutex_);
    sessions.swap(active_);
    PublishActiveCountLocked();
  }

  for (const auto& [id, session] : sessions) {
    session->Cancel(CancelReason::kCaller);
    MEDIAFLOW_LOG_INFO("upload cancelled", {StringField("session_id", id)});
  }
  return sessions.size();
}

std::size_t UploadController::ActiveCount() const {
  std::lock_guard lock(mutex_);
  return active_.size();
}

void UploadController::Register(const SessionPtr& session) {
  std::lock_guard lock(mutex_);
  active_.emplace(session->id(), session);
  PublishActiveCountLocked();
}

void UploadController::Unregister(const SessionPtr& session) {
  std::lock_guard lock(mutex_);
  auto            it = active_.find(session->id());
  if (it != active_.end() && it->second == session) {
    active_.erase(it);
  }
  PublishActiveCountLocked();
}

void UploadController::PublishActiveCountLocked() const {
  observability::Metrics::Instance().SetActiveTransfers(active_.size());
}

} // namespace mediaflow::upload
