#include "internal/upload/timeout_calculator.hpp"

#include <cassert>
#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <vector>

namespace {

using mediaflow::model::MediaKind;
using mediaflow::network::NetworkQuality;
using mediaflow::upload::ComputeTimeout;
using mediaflow::upload::SizeBasedEstimate;
using mediaflow::upload::TimeoutPolicy;
using mediaflow::util::Millis;

constexpr std::uint64_t kMiB = 1024 * 1024;

// Best link first.
const std::vector<NetworkQuality> kByQuality = {NetworkQuality::kFast, NetworkQuality::kModerate, NetworkQuality::kUnknown,
                                                NetworkQuality::kSlow, NetworkQuality::kOffline};

void TestSmallPayloadGetsFloor() {
  assert(ComputeTimeout(2 * kMiB, NetworkQuality::kFast, std::nullopt, MediaKind::kImage) == Millis{30'000});
  assert(ComputeTimeout(0, NetworkQuality::kOffline, std::nullopt, MediaKind::kVideo) == Millis{30'000});
}

void TestSizeEstimateUsesQualityBudget() {
  assert(SizeBasedEstimate(40 * kMiB, NetworkQuality::kSlow, TimeoutPolicy{}) == Millis{320'000});
  assert(SizeBasedEstimate(40 * kMiB, NetworkQuality::kFast, TimeoutPolicy{}) == Millis{80'000});
  assert(ComputeTimeout(40 * kMiB, NetworkQuality::kSlow, std::nullopt, MediaKind::kVideo) == Millis{320'000});
  assert(ComputeTimeout(40 * kMiB, NetworkQuality::kUnknown, std::nullopt, MediaKind::kVideo) == Millis{200'000});
}

void TestSizeEstimateRoundsUpToTheMillisecond() {
  // 1 byte at 2000 ms/MiB is a fraction of a millisecond.
  assert(SizeBasedEstimate(1, NetworkQuality::kFast, TimeoutPolicy{}) == Millis{1});
  assert(SizeBasedEstimate(kMiB + 1, NetworkQuality::kFast, TimeoutPolicy{}) == Millis{2'001});
}

void TestCeilingDependsOnMediaKind() {
  assert(ComputeTimeout(200 * kMiB, NetworkQuality::kSlow, std::nullopt, MediaKind::kImage) == Millis{300'000});
  assert(ComputeTimeout(200 * kMiB, NetworkQuality::kSlow, std::nullopt, MediaKind::kVideo) == Millis{900'000});
}

void TestCallerHintRaisesButIsClamped() {
  assert(ComputeTimeout(kMiB, NetworkQuality::kFast, Millis{120'000}, MediaKind::kImage) == Millis{120'000});
  assert(ComputeTimeout(kMiB, NetworkQuality::kFast, Millis{10'000}, MediaKind::kImage) == Millis{30'000});
  assert(ComputeTimeout(kMiB, NetworkQuality::kFast, Millis{3'600'000}, MediaKind::kImage) == Millis{300'000});
}

void TestBoundedAndMonotonic() {
  const TimeoutPolicy policy;
  for (auto kind : {MediaKind::kImage, MediaKind::kVideo}) {
    for (std::size_t q = 0; q < kByQuality.size(); ++q) {
      Millis previous{0};
      for (std::uint64_t mib = 0; mib <= 512; mib += 7) {
        const auto timeout = ComputeTimeout(mib * kMiB, kByQuality[q], std::nullopt, kind, policy);
        assert(timeout >= policy.floor);
        assert(timeout <= policy.CeilingFor(kind));
        assert(timeout >= previous);
        previous = timeout;

        if (q > 0) {
          // A better link never gets a longer deadline.
          assert(ComputeTimeout(mib * kMiB, kByQuality[q - 1], std::nullopt, kind, policy) <= timeout);
        }
      }
    }
  }
}

void TestValidateRejectsInconsistentPolicies() {
  TimeoutPolicy{}.Validate();

  TimeoutPolicy floor_above_ceiling;
  floor_above_ceiling.floor = Millis{400'000};
  bool threw = false;
  try {
    floor_above_ceiling.Validate();
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);

  TimeoutPolicy unordered;
  unordered.per_megabyte.fast = Millis{9'000};
  threw                       = false;
  try {
    unordered.Validate();
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestSmallPayloadGetsFloor();
  TestSizeEstimateUsesQualityBudget();
  TestSizeEstimateRoundsUpToTheMillisecond();
  TestCeilingDependsOnMediaKind();
  TestCallerHintRaisesButIsClamped();
  TestBoundedAndMonotonic();
  TestValidateRejectsInconsistentPolicies();

  std::cout << "mediaflow_unit_timeout_calculator: pass\n";
  return 0;
}
