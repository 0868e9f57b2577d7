#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "internal/network/network_quality.hpp"
#include "internal/storage/blob_store.hpp"
#include "internal/util/time.hpp"

namespace mediaflow::upload {

/*
  Failure classes reported to users. Cancellation is not an error; it is a
  flag on UploadResult.
*/
enum class UploadErrorKind : std::uint8_t {
  kOffline,
  kTimeout,
  kStalled,
  kUnauthorized,
  kForbidden,
  kQuotaExceeded,
  kNetwork,
  kUnknown,
};

std::string_view ToString(UploadErrorKind kind);

struct UploadError {
  UploadErrorKind kind{UploadErrorKind::kUnknown};
  std::string     message;
};

/*
  Everything the classifier needs to pick a message. `backend_error` is
  empty when the controller itself ended the transfer (deadline, stall).
*/
struct FailureContext {
  network::NetworkStatus          network;
  std::optional<storage::BlobError> backend_error;
  bool                            watchdog_triggered{false};
  bool                            deadline_expired{false};
  util::Millis                    timeout{0};
  util::Millis                    stall_threshold{0};
};

/*
  Fixed precedence:
    offline → unauthorized/forbidden → quota → stalled (watchdog flag only)
    → network → timeout → fallback with the connection class appended
*/
UploadError ClassifyFailure(const FailureContext& context);

UploadError OfflineError();
UploadError TimeoutError(util::Millis timeout, const network::NetworkStatus& network);
UploadError StalledError(util::Millis threshold);

} // namespace mediaflow::upload
