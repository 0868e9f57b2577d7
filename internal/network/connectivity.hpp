#pragma once

#include <memory>
#include <mutex>
#include <optional>

#include "internal/network/network_quality.hpp"

namespace mediaflow::runtime::config {
class NetworkConfig;
}

namespace mediaflow::network {

/*
  ConnectivityMonitor

  Source of truth for "can we reach the network at all" plus an optional
  link-quality hint. Sampled on demand; implementations must be thread-safe.
*/
class ConnectivityMonitor {
 public:
  virtual ~ConnectivityMonitor() = default;

  virtual bool IsOnline() const = 0;

  virtual std::optional<LinkHint> LinkQuality() const {
    return std::nullopt;
  }

  NetworkStatus Sample() const;
};

/*
  StaticConnectivity

  Config-driven monitor for hosts without a platform connectivity API.
  State can be flipped at runtime (admin tooling, tests).
*/
class StaticConnectivity final : public ConnectivityMonitor {
 public:
  explicit StaticConnectivity(bool online = true, std::optional<LinkHint> hint = std::nullopt);

  static std::shared_ptr<StaticConnectivity> FromConfig(const mediaflow::runtime::config::NetworkConfig& config);

  bool                    IsOnline() const override;
  std::optional<LinkHint> LinkQuality() const override;

  void SetOnline(bool online);
  void SetLinkHint(std::optional<LinkHint> hint);

 private:
  mutable std::mutex      mutex_;
  bool                    online_;
  std::optional<LinkHint> hint_;
};

} // namespace mediaflow::network
