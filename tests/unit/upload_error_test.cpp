#include <cassert>
#include <iostream>
#include <optional>
#include <string>

#include "internal/upload/upload_error.hpp"

namespace {

using namespace mediaflow;
using upload::ClassifyFailure;
using upload::FailureContext;
using upload::UploadErrorKind;

network::NetworkStatus Online(network::NetworkQuality quality, std::string effective_type = "") {
  network::NetworkStatus status;
  status.online  = true;
  status.quality = quality;
  if (!effective_type.empty()) {
    status.hint = network::LinkHint{.effective_type = std::move(effective_type)};
  }
  return status;
}

FailureContext Context(network::NetworkStatus network, std::optional<storage::BlobErrorCode> code = std::nullopt) {
  FailureContext context;
  context.network = std::move(network);
  if (code) context.backend_error = storage::BlobError{*code, "backend"};
  context.timeout         = util::Millis{45'500};
  context.stall_threshold = util::Millis{30'000};
  return context;
}

bool StartsWith(const std::string& text, const std::string& prefix) {
  return text.rfind(prefix, 0) == 0;
}

void TestOfflineWinsOverEverything() {
  auto context               = Context(network::NetworkStatus{.online = false, .quality = network::NetworkQuality::kOffline},
                                       storage::BlobErrorCode::kUnauthorized);
  context.watchdog_triggered = true;
  context.deadline_expired   = true;

  const auto error = ClassifyFailure(context);
  assert(error.kind == UploadErrorKind::kOffline);
  assert(error.message == upload::OfflineError().message);
}

void TestPermissionAndQuota() {
  auto unauthorized               = Context(Online(network::NetworkQuality::kFast), storage::BlobErrorCode::kUnauthorized);
  unauthorized.watchdog_triggered = true;
  assert(ClassifyFailure(unauthorized).kind == UploadErrorKind::kUnauthorized);
  assert(StartsWith(ClassifyFailure(unauthorized).message, "Permission denied"));

  const auto forbidden = ClassifyFailure(Context(Online(network::NetworkQuality::kFast), storage::BlobErrorCode::kForbidden));
  assert(forbidden.kind == UploadErrorKind::kForbidden);

  const auto quota = ClassifyFailure(Context(Online(network::NetworkQuality::kFast), storage::BlobErrorCode::kQuotaExceeded));
  assert(quota.kind == UploadErrorKind::kQuotaExceeded);
  assert(quota.message == "Storage quota exceeded. Please contact support.");
}

void TestStallOnlyFromWatchdogFlag() {
  // A plain backend cancel is not a stall.
  const auto plain = ClassifyFailure(Context(Online(network::NetworkQuality::kFast), storage::BlobErrorCode::kCanceled));
  assert(plain.kind == UploadErrorKind::kUnknown);

  auto stalled               = Context(Online(network::NetworkQuality::kFast), storage::BlobErrorCode::kCanceled);
  stalled.watchdog_triggered = true;
  const auto error           = ClassifyFailure(stalled);
  assert(error.kind == UploadErrorKind::kStalled);
  assert(StartsWith(error.message, "Upload stalled: no progress for 30s"));
}

void TestStallBeatsNetworkAndTimeout() {
  auto context               = Context(Online(network::NetworkQuality::kSlow), storage::BlobErrorCode::kNetwork);
  context.watchdog_triggered = true;
  context.deadline_expired   = true;
  assert(ClassifyFailure(context).kind == UploadErrorKind::kStalled);
}

void TestNetworkVariants() {
  const auto slow = ClassifyFailure(Context(Online(network::NetworkQuality::kSlow, "2g"), storage::BlobErrorCode::kNetwork));
  assert(slow.kind == UploadErrorKind::kNetwork);
  assert(slow.message.find("slow connection") != std::string::npos);

  const auto fast = ClassifyFailure(Context(Online(network::NetworkQuality::kFast), storage::BlobErrorCode::kNetwork));
  assert(fast.kind == UploadErrorKind::kNetwork);
  assert(fast.message == "Upload failed due to network issues. Please try again.");
}

void TestTimeoutRoundsSecondsUp() {
  auto context             = Context(Online(network::NetworkQuality::kModerate));
  context.deadline_expired = true;
  const auto error         = ClassifyFailure(context);
  assert(error.kind == UploadErrorKind::kTimeout);
  assert(StartsWith(error.message, "Upload timeout after 46s."));

  auto slow             = Context(Online(network::NetworkQuality::kSlow));
  slow.deadline_expired = true;
  assert(ClassifyFailure(slow).message.find("due to slow connection") != std::string::npos);

  // A backend-reported timeout is classified the same way.
  const auto backend = ClassifyFailure(Context(Online(network::NetworkQuality::kFast), storage::BlobErrorCode::kTimeout));
  assert(backend.kind == UploadErrorKind::kTimeout);
}

void TestFallbackNamesConnection() {
  const auto typed = ClassifyFailure(Context(Online(network::NetworkQuality::kModerate, "3g"), storage::BlobErrorCode::kUnknown));
  assert(typed.kind == UploadErrorKind::kUnknown);
  assert(typed.message == "Upload failed (Connection: 3g). Please try again.");

  const auto untyped = ClassifyFailure(Context(Online(network::NetworkQuality::kUnknown)));
  assert(untyped.message == "Upload failed (Connection: unknown). Please try again.");
}

} // namespace

int main() {
  TestOfflineWinsOverEverything();
  TestPermissionAndQuota();
  TestStallOnlyFromWatchdogFlag();
  TestStallBeatsNetworkAndTimeout();
  TestNetworkVariants();
  TestTimeoutRoundsSecondsUp();
  TestFallbackNamesConnection();

  std::cout << "mediaflow_unit_upload_error: pass\n";
  return 0;
}
