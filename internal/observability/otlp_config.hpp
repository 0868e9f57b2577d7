#pragma once

#include <cstdint>
#include <string>

namespace mediaflow::runtime::config {
class RuntimeConfig;
}

namespace mediaflow::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

enum class OtlpSignal {
  kTraces,
  kMetrics,
};

struct OtlpConfig {
  std::string   service_name{"mediaflow-uploader"};
  std::string   service_version{"0.1.0"};
  std::string   environment{};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
  double        trace_sample_ratio{1.0};
  std::uint32_t export_interval_ms{1000};
};

/*
  Exporter settings for one signal.

  Endpoint order: observability.otlp_endpoint, then
  OTEL_EXPORTER_OTLP_{TRACES,METRICS}_ENDPOINT, then OTEL_EXPORTER_OTLP_ENDPOINT,
  then the local collector default for the transport.
*/
OtlpConfig ResolveOtlpConfig(const mediaflow::runtime::config::RuntimeConfig& config, OtlpSignal signal);

} // namespace mediaflow::observability
