#pragma once

#include <cstdint>
#include <optional>

#include "internal/model/media.hpp"
#include "internal/network/network_quality.hpp"
#include "internal/util/time.hpp"

namespace mediaflow::upload {

// One duration per quality class.
struct QualityDurations {
  util::Millis fast;
  util::Millis moderate;
  util::Millis slow;
  util::Millis unknown;
  util::Millis offline;

  util::Millis For(network::NetworkQuality quality) const;
};

struct TimeoutPolicy {
  static constexpr util::Millis kDefaultFloor{30'000};
  static constexpr util::Millis kDefaultImageCeiling{5 * 60'000};
  static constexpr util::Millis kDefaultVideoCeiling{15 * 60'000};

  util::Millis     floor{kDefaultFloor};
  util::Millis     image_ceiling{kDefaultImageCeiling};
  util::Millis     video_ceiling{kDefaultVideoCeiling};
  QualityDurations per_megabyte{
      .fast     = util::Millis{2'000},
      .moderate = util::Millis{5'000},
      .slow     = util::Millis{8'000},
      .unknown  = util::Millis{5'000},
      .offline  = util::Millis{8'000},
  };

  util::Millis CeilingFor(model::MediaKind kind) const;

  // Throws std::invalid_argument when the policy could produce a timeout
  // outside [floor, ceiling] or one that grows as the link improves.
  void Validate() const;
};

// budget(quality) × size in MiB, rounded up to the millisecond.
util::Millis SizeBasedEstimate(std::uint64_t size_bytes, network::NetworkQuality quality, const TimeoutPolicy& policy);

/*
  max(hint, size estimate, floor) clamped to the media kind's ceiling.
  Pure and deterministic.
*/
util::Millis ComputeTimeout(std::uint64_t size_bytes, network::NetworkQuality quality, std::optional<util::Millis> caller_hint,
                            model::MediaKind kind, const TimeoutPolicy& policy = {});

} // namespace mediaflow::upload
