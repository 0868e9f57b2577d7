#pragma once

#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

#include "internal/storage/blob_store.hpp"
#include "internal/upload/cancellation_token.hpp"
#include "internal/util/time.hpp"

namespace mediaflow::upload {

/*
  TransferSession

  One attempt to move one payload. Created by the controller under a fresh
  id, fed by backend events, read by the watchdog, settled exactly once.

  Thread model:
    backend thread   → RecordProgress / Complete / Fail
    watchdog thread  → ProgressSnapshot / Cancel(kStalled)
    controller       → AttachTransfer / Await / Cancel(kTimeout)
    external callers → Cancel(kCaller)
*/
class TransferSession {
 public:
  enum class ProgressUpdate {
    kAdvanced,
    kUnchanged,
    kRegressed,
  };

  struct Progress {
    std::uint64_t         bytes{0};
    util::SteadyTimePoint last_progress_at;
  };

  struct Outcome {
    enum class Kind {
      kCompleted,
      kFailed,
      kCancelled,
      kDeadline,
    };

    Kind                              kind{Kind::kDeadline};
    std::optional<std::string>        url;
    std::optional<storage::BlobError> error;
  };

  TransferSession(std::string id, std::string destination_path, std::uint64_t payload_size);

  TransferSession(const TransferSession&)            = delete;
  TransferSession& operator=(const TransferSession&) = delete;

  const std::string& id() const {
    return id_;
  }
  const std::string& destination_path() const {
    return destination_path_;
  }
  std::uint64_t payload_size() const {
    return payload_size_;
  }
  util::SteadyTimePoint started_at() const {
    return started_at_;
  }

  /*
    Store the latest byte count. Only an increase moves last_progress_at;
    a decrease is kept as the latest value but never counts as progress.
  */
  ProgressUpdate RecordProgress(std::uint64_t bytes);
  Progress       ProgressSnapshot() const;

  // Backend handle; if the session is already cancelled it is cancelled now.
  void AttachTransfer(storage::TransferHandlePtr handle);

  // Returns true if this call cancelled the session.
  bool Cancel(CancelReason reason);

  void Complete(std::string url);
  void Fail(storage::BlobError error);

  bool IsSettled() const;

  const CancellationToken& token() const {
    return token_;
  }

  /*
    Block until the session settles or `deadline` passes. Cancellation
    settles the session immediately even if the backend is still writing.
    On deadline the session cancels itself with reason kTimeout.
  */
  Outcome Await(util::SteadyTimePoint deadline);

 private:
  const std::string           id_;
  const std::string           destination_path_;
  const std::uint64_t         payload_size_;
  const util::SteadyTimePoint started_at_;

  CancellationToken token_;

  mutable std::mutex         mutex_;
  std::condition_variable    cv_;
  std::uint64_t              last_reported_bytes_{0};
  util::SteadyTimePoint      last_progress_at_;
  storage::TransferHandlePtr handle_;
  std::optional<Outcome>     outcome_;
};

} // namespace mediaflow::upload
