#include "internal/upload/transfer_session.hpp"

#include <utility>

namespace mediaflow::upload {

TransferSession::TransferSession(std::string id, std::string destination_path, std::uint64_t payload_size)
    : id_(std::move(id)),
      destination_path_(std::move(destination_path)),
      payload_size_(payload_size),
      started_at_(util::SteadyNow()),
      last_progress_at_(started_at_) {
}

TransferSession::ProgressUpdate TransferSession::RecordProgress(std::uint64_t bytes) {
  std::lock_guard lock(mutex_);

  ProgressUpdate update = ProgressUpdate::kUnchanged;
  if (bytes > last_reported_bytes_) {
    update            = ProgressUpdate::kAdvanced;
    last_progress_at_ = util::SteadyNow();
  } else if (bytes < last_reported_bytes_) {
    update = ProgressUpdate::kRegressed;
  }
  last_reported_bytes_ = bytes;
  return update;
}

TransferSession::Progress TransferSession::ProgressSnapshot() const {
  std::lock_guard lock(mutex_);
  return Progress{last_reported_bytes_, last_progress_at_};
}

void TransferSession::AttachTransfer(storage::TransferHandlePtr handle) {
  bool cancel_now = false;
  {
    std::lock_guard lock(mutex_);
    handle_    = handle;
    cancel_now = token_.IsCancelled();
  }
  if (cancel_now && handle) {
    handle->Cancel();
  }
}

bool TransferSession::Cancel(CancelReason reason) {
  storage::TransferHandlePtr handle;
  {
    std::lock_guard lock(mutex_);
    if (outcome_) {
      return false;
    }
    if (!token_.Cancel(reason)) {
      return false;
    }
    outcome_ = Outcome{.kind = Outcome::Kind::kCancelled};
    handle   = handle_;
  }
  cv_.notify_all();

  // Backend cancel may call back into this session; never under the lock.
  if (handle) {
    handle->Cancel();
  }
  return true;
}

void TransferSession::Complete(std::string url) {
  {
    std::lock_guard lock(mutex_);
    if (outcome_) {
      return;
    }
    outcome_ = Outcome{.kind = Outcome::Kind::kCompleted, .url = std::move(url)};
  }
  cv_.notify_all();
}

void TransferSession::Fail(storage::BlobError error) {
  {
    std::lock_guard lock(mutex_);
    if (outcome_) {
      return;
    }
    outcome_ = Outcome{.kind = Outcome::Kind::kFailed, .error = std::move(error)};
  }
  cv_.notify_all();
}

bool TransferSession::IsSettled() const {
  std::lock_guard lock(mutex_);
  return outcome_.has_value();
}

TransferSession::Outcome TransferSession::Await(util::SteadyTimePoint deadline) {
  storage::TransferHandlePtr handle;
  {
    std::unique_lock lock(mutex_);
    if (cv_.wait_until(lock, deadline, [this] { return outcome_.has_value(); })) {
      return *outcome_;
    }

    // Deadline won the race.
    token_.Cancel(CancelReason::kTimeout);
    outcome_ = Outcome{.kind = Outcome::Kind::kDeadline};
    handle   = handle_;
  }
  cv_.notify_all();

  if (handle) {
    handle->Cancel();
  }
  return Outcome{.kind = Outcome::Kind::kDeadline};
}

} // namespace mediaflow::upload
