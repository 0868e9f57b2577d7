#include "internal/upload/upload_error.hpp"

#include <spdlog/fmt/fmt.h>

namespace mediaflow::upload {

std::string_view ToString(UploadErrorKind kind) {
  switch (kind) {
    case UploadErrorKind::kOffline:
      return "offline";
    case UploadErrorKind::kTimeout:
      return "timeout";
    case UploadErrorKind::kStalled:
      return "stalled";
    case UploadErrorKind::kUnauthorized:
      return "unauthorized";
    case UploadErrorKind::kForbidden:
      return "forbidden";
    case UploadErrorKind::kQuotaExceeded:
      return "quota_exceeded";
    case UploadErrorKind::kNetwork:
      return "network";
    case UploadErrorKind::kUnknown:
      return "unknown";
  }
  return "unknown";
}

UploadError OfflineError() {
  return {UploadErrorKind::kOffline, "No internet connection. Please check your network and try again."};
}

UploadError TimeoutError(util::Millis timeout, const network::NetworkStatus& network) {
  if (network::IsSlowConnection(network)) {
    return {UploadErrorKind::kTimeout,
            fmt::format("Upload timeout after {}s due to slow connection. Please try again with a smaller file or faster network.",
                        util::CeilSeconds(timeout))};
  }
  return {UploadErrorKind::kTimeout,
          fmt::format("Upload timeout after {}s. Please check your connection and try again.", util::CeilSeconds(timeout))};
}

UploadError StalledError(util::Millis threshold) {
  return {UploadErrorKind::kStalled,
          fmt::format("Upload stalled: no progress for {}s. Your session may have expired, storage rules may have rejected the upload, "
                      "or the network connection dropped. Please sign in again or retry on a stable connection.",
                      util::CeilSeconds(threshold))};
}

UploadError ClassifyFailure(const FailureContext& context) {
  if (!context.network.online) {
    return OfflineError();
  }

  const auto code = context.backend_error ? std::optional<storage::BlobErrorCode>(context.backend_error->code) : std::nullopt;

  if (code == storage::BlobErrorCode::kUnauthorized) {
    return {UploadErrorKind::kUnauthorized, "Permission denied. Please try logging out and back in."};
  }
  if (code == storage::BlobErrorCode::kForbidden) {
    return {UploadErrorKind::kForbidden, "Permission denied. You are not allowed to upload to this location."};
  }
  if (code == storage::BlobErrorCode::kQuotaExceeded) {
    return {UploadErrorKind::kQuotaExceeded, "Storage quota exceeded. Please contact support."};
  }

  // A backend "canceled" looks identical for user and watchdog cancels;
  // only the watchdog's own flag makes it a stall.
  if (context.watchdog_triggered) {
    return StalledError(context.stall_threshold);
  }

  if (code == storage::BlobErrorCode::kNetwork) {
    if (network::IsSlowConnection(context.network)) {
      return {UploadErrorKind::kNetwork, "Upload failed due to slow connection. Please try again or use a faster network."};
    }
    return {UploadErrorKind::kNetwork, "Upload failed due to network issues. Please try again."};
  }

  if (context.deadline_expired || code == storage::BlobErrorCode::kTimeout) {
    return TimeoutError(context.timeout, context.network);
  }

  return {UploadErrorKind::kUnknown, fmt::format("Upload failed (Connection: {}). Please try again.", network::DescribeConnection(context.network))};
}

} // namespace mediaflow::upload
