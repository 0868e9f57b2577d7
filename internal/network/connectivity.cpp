#include "internal/network/connectivity.hpp"

#include <memory>

#include "config/config.pb.h"

namespace mediaflow::network {

NetworkStatus ConnectivityMonitor::Sample() const {
  NetworkStatus status;
  status.online  = IsOnline();
  status.hint    = LinkQuality();
  status.quality = ClassifyLink(status.online, status.hint);
  return status;
}

StaticConnectivity::StaticConnectivity(bool online, std::optional<LinkHint> hint) : online_(online), hint_(std::move(hint)) {
}

std::shared_ptr<StaticConnectivity> StaticConnectivity::FromConfig(const mediaflow::runtime::config::NetworkConfig& config) {
  std::optional<LinkHint> hint;
  if (!config.effective_type().empty() || config.downlink_mbps() > 0.0 || config.rtt_ms() > 0 || config.metered()) {
    hint = LinkHint{
        .effective_type = config.effective_type(),
        .downlink_mbps  = config.downlink_mbps(),
        .rtt_ms         = config.rtt_ms(),
        .metered        = config.metered(),
    };
  }
  return std::make_shared<StaticConnectivity>(!config.force_offline(), std::move(hint));
}

bool StaticConnectivity::IsOnline() const {
  std::lock_guard lock(mutex_);
  return online_;
}

std::optional<LinkHint> StaticConnectivity::LinkQuality() const {
  std::lock_guard lock(mutex_);
  return hint_;
}

void StaticConnectivity::SetOnline(bool online) {
  std::lock_guard lock(mutex_);
  online_ = online;
}

void StaticConnectivity::SetLinkHint(std::optional<LinkHint> hint) {
  std::lock_guard lock(mutex_);
  hint_ = std::move(hint);
}

} // namespace mediaflow::network
