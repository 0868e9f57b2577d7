#include "internal/network/network_quality.hpp"

#include <cmath>

#include <spdlog/fmt/fmt.h>

namespace mediaflow::network {
namespace {

constexpr double kBytesPerMegabyte = 1024.0 * 1024.0;

// Upload throughput is assumed to be 60% of the advertised downlink.
constexpr double kUploadShare = 0.6;

constexpr double kSlowRecommendLimitMb  = 5.0;
constexpr double kMeteredWarningMb      = 10.0;
constexpr double kLargeUploadSeconds    = 300.0;
constexpr double kSlowDownlinkMbps      = 1.0;
constexpr double kModerateDownlinkLimit = 5.0;

double FallbackDownlinkMbps(std::string_view effective_type) {
  if (effective_type == "slow-2g") return 0.05;
  if (effective_type == "2g") return 0.1;
  if (effective_type == "3g") return 1.0;
  if (effective_type == "4g") return 10.0;
  return 2.0;
}

} // namespace

std::string_view ToString(NetworkQuality quality) {
  switch (quality) {
    case NetworkQuality::kOffline:
      return "offline";
    case NetworkQuality::kSlow:
      return "slow";
    case NetworkQuality::kModerate:
      return "moderate";
    case NetworkQuality::kFast:
      return "fast";
    case NetworkQuality::kUnknown:
      return "unknown";
  }
  return "unknown";
}

int QualityRank(NetworkQuality quality) {
  switch (quality) {
    case NetworkQuality::kFast:
      return 0;
    case NetworkQuality::kModerate:
      return 1;
    case NetworkQuality::kUnknown:
      return 2;
    case NetworkQuality::kSlow:
      return 3;
    case NetworkQuality::kOffline:
      return 4;
  }
  return 2;
}

NetworkQuality ClassifyLink(bool online, const std::optional<LinkHint>& hint) {
  if (!online) {
    return NetworkQuality::kOffline;
  }
  if (!hint) {
    return NetworkQuality::kUnknown;
  }

  const auto& type     = hint->effective_type;
  const auto  downlink = hint->downlink_mbps;

  if (type == "slow-2g" || type == "2g") {
    return NetworkQuality::kSlow;
  }
  if (downlink > 0.0 && downlink < kSlowDownlinkMbps) {
    return NetworkQuality::kSlow;
  }
  if (type == "3g") {
    return NetworkQuality::kModerate;
  }
  if (type == "4g") {
    return NetworkQuality::kFast;
  }
  if (downlink <= 0.0) {
    return NetworkQuality::kUnknown;
  }
  return downlink < kModerateDownlinkLimit ? NetworkQuality::kModerate : NetworkQuality::kFast;
}

bool IsSlowConnection(const NetworkStatus& status) {
  return status.quality == NetworkQuality::kSlow;
}

std::string DescribeConnection(const NetworkStatus& status) {
  if (status.hint && !status.hint->effective_type.empty()) {
    return status.hint->effective_type;
  }
  return std::string(ToString(status.quality));
}

UploadEstimate EstimateUpload(std::uint64_t size_bytes, const NetworkStatus& status) {
  const double size_mb = static_cast<double>(size_bytes) / kBytesPerMegabyte;

  double speed_mbps = status.hint ? status.hint->downlink_mbps : 0.0;
  if (speed_mbps <= 0.0) {
    speed_mbps = FallbackDownlinkMbps(status.hint ? std::string_view(status.hint->effective_type) : std::string_view{});
  }

  // Mbps -> MB/s
  const double upload_mb_per_second = speed_mbps * 0.125 * kUploadShare;

  UploadEstimate estimate;
  estimate.estimated_seconds = size_mb / upload_mb_per_second;
  estimate.data_usage_mb     = size_mb;

  const auto minutes = static_cast<long long>(std::ceil(estimate.estimated_seconds / 60.0));
  const bool metered = status.hint && status.hint->metered;

  if (!status.online) {
    estimate.warning_message   = "No internet connection. Please check your network and try again.";
    estimate.recommend_proceed = false;
  } else if (IsSlowConnection(status)) {
    estimate.warning_message   = fmt::format("Slow connection detected. Upload may take {} minutes.", minutes);
    estimate.recommend_proceed = size_mb < kSlowRecommendLimitMb;
  } else if (metered && size_mb > kMeteredWarningMb) {
    estimate.warning_message = fmt::format("You're on a metered connection. This upload will use {:.1f}MB of data.", size_mb);
  } else if (estimate.estimated_seconds > kLargeUploadSeconds) {
    estimate.warning_message = fmt::format("Large file upload. Estimated time: {} minutes.", minutes);
  }

  return estimate;
}

} // namespace mediaflow::network
