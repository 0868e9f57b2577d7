#include "internal/upload/timeout_calculator.hpp"

#include <algorithm>
#include <stdexcept>

namespace mediaflow::upload {

namespace {
constexpr std::uint64_t kBytesPerMiB = 1024 * 1024;
}

util::Millis QualityDurations::For(network::NetworkQuality quality) const {
  switch (quality) {
    case network::NetworkQuality::kFast:
      return fast;
    case network::NetworkQuality::kModerate:
      return moderate;
    case network::NetworkQuality::kSlow:
      return slow;
    case network::NetworkQuality::kUnknown:
      return unknown;
    case network::NetworkQuality::kOffline:
      return offline;
  }
  return unknown;
}

util::Millis TimeoutPolicy::CeilingFor(model::MediaKind kind) const {
  return kind == model::MediaKind::kVideo ? video_ceiling : image_ceiling;
}

void TimeoutPolicy::Validate() const {
  if (floor.count() <= 0) {
    throw std::invalid_argument("timeout floor must be positive");
  }
  if (floor > image_ceiling || floor > video_ceiling) {
    throw std::invalid_argument("timeout floor exceeds a media ceiling");
  }
  const auto& b = per_megabyte;
  if (b.fast.count() < 0 || b.fast > b.moderate || b.moderate > b.unknown || b.unknown > b.slow || b.slow > b.offline) {
    throw std::invalid_argument("per-megabyte budgets must satisfy fast <= moderate <= unknown <= slow <= offline");
  }
}

util::Millis SizeBasedEstimate(std::uint64_t size_bytes, network::NetworkQuality quality, const TimeoutPolicy& policy) {
  const auto budget_ms = static_cast<std::uint64_t>(policy.per_megabyte.For(quality).count());

  // ceil(budget_ms * size / MiB) without overflowing for realistic sizes
  const std::uint64_t whole = size_bytes / kBytesPerMiB;
  const std::uint64_t rest  = size_bytes % kBytesPerMiB;
  const std::uint64_t ms    = whole * budget_ms + (rest * budget_ms + kBytesPerMiB - 1) / kBytesPerMiB;
  return util::Millis{static_cast<util::Millis::rep>(ms)};
}

util::Millis ComputeTimeout(std::uint64_t size_bytes, network::NetworkQuality quality, std::optional<util::Millis> caller_hint,
                            model::MediaKind kind, const TimeoutPolicy& policy) {
  auto timeout = std::max(SizeBasedEstimate(size_bytes, quality, policy), policy.floor);
  if (caller_hint) {
    timeout = std::max(timeout, *caller_hint);
  }
  return std::min(timeout, policy.CeilingFor(kind));
}

} // namespace mediaflow::upload
