#include <cassert>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>

#include "config/config.pb.h"
#include "internal/network/connectivity.hpp"
#include "internal/network/network_quality.hpp"

namespace {

using namespace mediaflow::network;

constexpr std::uint64_t kMiB = 1024 * 1024;

LinkHint Hint(std::string type, double downlink = 0.0, bool metered = false) {
  return LinkHint{.effective_type = std::move(type), .downlink_mbps = downlink, .rtt_ms = 0, .metered = metered};
}

NetworkStatus Status(std::optional<LinkHint> hint, bool online = true) {
  NetworkStatus status;
  status.online  = online;
  status.hint    = std::move(hint);
  status.quality = ClassifyLink(online, status.hint);
  return status;
}

void TestClassification() {
  assert(ClassifyLink(false, Hint("4g", 50)) == NetworkQuality::kOffline);
  assert(ClassifyLink(true, std::nullopt) == NetworkQuality::kUnknown);
  assert(ClassifyLink(true, Hint("slow-2g")) == NetworkQuality::kSlow);
  assert(ClassifyLink(true, Hint("2g")) == NetworkQuality::kSlow);
  assert(ClassifyLink(true, Hint("3g")) == NetworkQuality::kModerate);
  assert(ClassifyLink(true, Hint("4g")) == NetworkQuality::kFast);

  // A measured sub-1Mbps downlink wins over the advertised type.
  assert(ClassifyLink(true, Hint("4g", 0.5)) == NetworkQuality::kSlow);

  assert(ClassifyLink(true, Hint("", 2.0)) == NetworkQuality::kModerate);
  assert(ClassifyLink(true, Hint("", 12.0)) == NetworkQuality::kFast);
  assert(ClassifyLink(true, Hint("")) == NetworkQuality::kUnknown);
}

void TestRankOrdersBestToWorst() {
  assert(QualityRank(NetworkQuality::kFast) < QualityRank(NetworkQuality::kModerate));
  assert(QualityRank(NetworkQuality::kModerate) < QualityRank(NetworkQuality::kUnknown));
  assert(QualityRank(NetworkQuality::kUnknown) < QualityRank(NetworkQuality::kSlow));
  assert(QualityRank(NetworkQuality::kSlow) < QualityRank(NetworkQuality::kOffline));
}

void TestDescribeConnection() {
  assert(DescribeConnection(Status(Hint("3g"))) == "3g");
  assert(DescribeConnection(Status(std::nullopt)) == "unknown");
  assert(DescribeConnection(Status(std::nullopt, false)) == "offline");
}

void TestEstimateOnFastLink() {
  // 10 Mbps * 0.125 * 0.6 = 0.75 MB/s
  const auto estimate = EstimateUpload(3 * kMiB, Status(Hint("4g", 10.0)));
  assert(estimate.estimated_seconds > 3.99 && estimate.estimated_seconds < 4.01);
  assert(estimate.recommend_proceed);
  assert(!estimate.warning_message);
  assert(estimate.data_usage_mb == 3.0);
}

void TestEstimateOnSlowLinkDiscouragesLargeFiles() {
  const auto small = EstimateUpload(2 * kMiB, Status(Hint("2g")));
  assert(small.recommend_proceed);
  assert(small.warning_message && small.warning_message->find("Slow connection detected") == 0);

  const auto large = EstimateUpload(20 * kMiB, Status(Hint("2g")));
  assert(!large.recommend_proceed);
}

void TestEstimateWarnsOnMeteredAndLongUploads() {
  const auto metered = EstimateUpload(12 * kMiB, Status(Hint("4g", 10.0, true)));
  assert(metered.recommend_proceed);
  assert(metered.warning_message && metered.warning_message->find("metered") != std::string::npos);
  assert(metered.warning_message->find("12.0MB") != std::string::npos);

  // Fallback 2 Mbps for an unknown link: 0.15 MB/s, 100 MB takes > 5 minutes.
  const auto large = EstimateUpload(100 * kMiB, Status(std::nullopt));
  assert(large.warning_message && large.warning_message->find("Large file upload") == 0);
}

void TestEstimateWhenOffline() {
  const auto estimate = EstimateUpload(kMiB, Status(std::nullopt, false));
  assert(!estimate.recommend_proceed);
  assert(estimate.warning_message);
}

void TestStaticConnectivityFromConfig() {
  mediaflow::runtime::config::NetworkConfig config;
  auto                                      none = StaticConnectivity::FromConfig(config);
  assert(none->IsOnline());
  assert(!none->LinkQuality());
  assert(none->Sample().quality == NetworkQuality::kUnknown);

  config.set_effective_type("3g");
  config.set_metered(true);
  auto moderate = StaticConnectivity::FromConfig(config);
  assert(moderate->Sample().quality == NetworkQuality::kModerate);
  assert(moderate->Sample().hint->metered);

  config.set_force_offline(true);
  auto offline = StaticConnectivity::FromConfig(config);
  assert(offline->Sample().quality == NetworkQuality::kOffline);

  offline->SetOnline(true);
  offline->SetLinkHint(Hint("4g"));
  assert(offline->Sample().quality == NetworkQuality::kFast);
}

} // namespace

int main() {
  TestClassification();
  TestRankOrdersBestToWorst();
  TestDescribeConnection();
  TestEstimateOnFastLink();
  TestEstimateOnSlowLinkDiscouragesLargeFiles();
  TestEstimateWarnsOnMeteredAndLongUploads();
  TestEstimateWhenOffline();
  TestStaticConnectivityFromConfig();

  std::cout << "mediaflow_unit_network_quality: pass\n";
  return 0;
}
