#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace mediaflow::network {

/*
  Coarse link classes. Ordered from best to worst by QualityRank so budgets
  and thresholds can be checked for monotonicity.
*/
enum class NetworkQuality : std::uint8_t {
  kOffline  = 0,
  kSlow     = 1,
  kModerate = 2,
  kFast     = 3,
  kUnknown  = 4,
};

std::string_view ToString(NetworkQuality quality);

// 0 = fast ... 4 = offline. Unknown sits between moderate and slow.
int QualityRank(NetworkQuality quality);

/*
  Optional link description reported by the platform. Used only to bias
  timeouts and stall thresholds; never required for correctness.
*/
struct LinkHint {
  std::string   effective_type; // "slow-2g", "2g", "3g", "4g" or empty
  double        downlink_mbps{0.0};
  std::uint32_t rtt_ms{0};
  bool          metered{false};
};

struct NetworkStatus {
  bool                    online{true};
  NetworkQuality          quality{NetworkQuality::kUnknown};
  std::optional<LinkHint> hint;
};

NetworkQuality ClassifyLink(bool online, const std::optional<LinkHint>& hint);

bool IsSlowConnection(const NetworkStatus& status);

// Short label for messages: the effective type when known, else the class.
std::string DescribeConnection(const NetworkStatus& status);

struct UploadEstimate {
  double                     estimated_seconds{0.0};
  bool                       recommend_proceed{true};
  std::optional<std::string> warning_message;
  double                     data_usage_mb{0.0};
};

// Pure function of (size, status); recomputed per call.
UploadEstimate EstimateUpload(std::uint64_t size_bytes, const NetworkStatus& status);

} // namespace mediaflow::network
