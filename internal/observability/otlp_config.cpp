#include "internal/observability/otlp_config.hpp"

#include <cstdlib>

#include "config/config.pb.h"

namespace mediaflow::observability {

namespace {

const char* SignalEndpointVariable(OtlpSignal signal) {
  return signal == OtlpSignal::kTraces ? "OTEL_EXPORTER_OTLP_TRACES_ENDPOINT" : "OTEL_EXPORTER_OTLP_METRICS_ENDPOINT";
}

std::string DefaultEndpoint(OtlpTransport transport, OtlpSignal signal) {
  if (transport == OtlpTransport::kGrpc) {
    return "localhost:4317";
  }
  return signal == OtlpSignal::kTraces ? "http://localhost:4318/v1/traces" : "http://localhost:4318/v1/metrics";
}

} // namespace

OtlpConfig ResolveOtlpConfig(const mediaflow::runtime::config::RuntimeConfig& config, OtlpSignal signal) {
  const auto& observability = config.observability();

  OtlpConfig resolved;
  if (!observability.service_name().empty()) {
    resolved.service_name = observability.service_name();
  }
  resolved.environment = observability.environment();
  resolved.transport   = observability.transport() == mediaflow::runtime::config::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf
                                                                                                     : OtlpTransport::kGrpc;
  resolved.insecure    = !observability.otlp_use_tls();

  const double ratio = observability.trace_sample_ratio();
  if (ratio > 0.0 && ratio < 1.0) {
    resolved.trace_sample_ratio = ratio;
  }
  if (observability.metrics_interval_ms() > 0) {
    resolved.export_interval_ms = observability.metrics_interval_ms();
  }

  if (!observability.otlp_endpoint().empty()) {
    resolved.endpoint = observability.otlp_endpoint();
  } else if (const char* endpoint = std::getenv(SignalEndpointVariable(signal))) {
    resolved.endpoint = endpoint;
  } else if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    resolved.endpoint = endpoint;
  } else {
    resolved.endpoint = DefaultEndpoint(resolved.transport, signal);
  }

  return resolved;
}

} // namespace mediaflow::observability
