#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "internal/model/media.hpp"
#include "internal/network/connectivity.hpp"
#include "internal/storage/blob_store.hpp"
#include "internal/upload/stall_watchdog.hpp"
#include "internal/upload/timeout_calculator.hpp"
#include "internal/upload/transfer_session.hpp"
#include "internal/upload/upload_error.hpp"

namespace mediaflow::upload {

struct UploadOptions {
  model::MediaKind            media_kind{model::MediaKind::kImage};
  std::optional<util::Millis> timeout_hint;

  // Percentage 0-100. Never invoked after Upload() returns.
  std::function<void(double percent)> on_progress;

  // Invoked once the session is registered and cancellable by id.
  std::function<void(const std::string& session_id)> on_session;
};

struct UploadResult {
  bool                       success{false};
  std::optional<std::string> url;
  std::optional<UploadError> error;
  bool                       cancelled{false};
};

struct ControllerPolicy {
  TimeoutPolicy  timeout;
  WatchdogPolicy watchdog;

  void Validate() const {
    timeout.Validate();
    watchdog.Validate();
  }
};

/*
  UploadController

  Runs one upload end to end per Upload() call: pre-flight connectivity,
  adaptive deadline, backend transfer, stall supervision and failure
  classification. Keeps the id → session map so any thread can cancel.

  Upload() blocks its caller; backend I/O runs on the store's threads.
  Expected failures come back as UploadResult, never as exceptions.
  No retries and no document-store access happen here.
*/
class UploadController {
 public:
  UploadController(storage::BlobStorePtr store, std::shared_ptr<network::ConnectivityMonitor> connectivity, ControllerPolicy policy = {});

  UploadController(const UploadController&)            = delete;
  UploadController& operator=(const UploadController&) = delete;

  UploadResult Upload(const model::MediaPayload& payload, const std::string& destination_path, UploadOptions options = {});

  // Unknown ids are a no-op; returns whether a session was cancelled.
  bool        Cancel(const std::string& session_id);
  std::size_t CancelAll();
  std::size_t ActiveCount() const;

  const ControllerPolicy& policy() const {
    return policy_;
  }

 private:
  using SessionPtr = std::shared_ptr<TransferSession>;

  void Register(const SessionPtr& session);
  void Unregister(const SessionPtr& session);
  void PublishActiveCountLocked() const;

  UploadResult Settle(const TransferSession::Outcome& outcome, const TransferSession& session, const StallWatchdog::Handle& watchdog,
                      util::Millis timeout) const;

  storage::BlobStorePtr                          store_;
  std::shared_ptr<network::ConnectivityMonitor> connectivity_;
  const ControllerPolicy                         policy_;

  mutable std::mutex                          mutex_;
  std::unordered_map<std::string, SessionPtr> active_;
};

} // namespace mediaflow::upload
