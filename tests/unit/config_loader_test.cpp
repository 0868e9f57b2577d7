#include <cassert>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/config/upload_tuning.hpp"
#include "internal/observability/otlp_config.hpp"

namespace {

using mediaflow::config::BuildControllerPolicy;
using mediaflow::config::BuildQueueOptions;
using mediaflow::config::ConfigLoader;
using mediaflow::util::Millis;

constexpr const char* kConfig = R"(
server:
  bind_address: "127.0.0.1:6000"
storage:
  root_uri: /tmp/blobs
  public_base_url: "https://cdn.example.com"
  chunk_size_bytes: 1024
database:
  memory: {}
upload:
  timeout:
    floor_ms: 10000
    per_megabyte:
      slow_ms: 12000
  watchdog:
    initial_grace_ms: 0
  queue:
    workers: 4
    placeholder_collection: stories
    max_tasks: 8
    timeout_hint_ms: 45000
network:
  effective_type: 3g
  metered: true
)";

template <typename Exception, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Exception&) {
    return true;
  }
  return false;
}

void TestParsesSections() {
  const auto config = ConfigLoader::LoadFromYamlString(kConfig);
  assert(config.server().bind_address() == "127.0.0.1:6000");
  assert(config.storage().root_uri() == "/tmp/blobs");
  assert(config.storage().chunk_size_bytes() == 1024);
  assert(config.database().has_memory());
  assert(config.upload().timeout().floor_ms() == 10000);
  assert(config.upload().queue().placeholder_collection() == "stories");
  assert(config.network().effective_type() == "3g");
  assert(config.network().metered());
}

void TestEmptyDocumentMeansDefaults() {
  const auto config = ConfigLoader::LoadFromYamlString("");
  assert(config.server().bind_address().empty());
  assert(!config.has_upload());

  const auto policy = BuildControllerPolicy(config.upload());
  assert(policy.timeout.floor == Millis{30'000});
  assert(policy.watchdog.initial_grace == Millis{30'000});

  const auto options = BuildQueueOptions(config.upload().queue());
  assert(options.workers == 2);
  assert(options.placeholder_collection == "posts");
  assert(options.max_tasks == 0);
  assert(!options.timeout_hint);
}

void TestRejectsUnknownKeys() {
  assert(Throws<std::runtime_error>([] { ConfigLoader::LoadFromYamlString("upload:\n  timout:\n    floor_ms: 1\n"); }));
  assert(Throws<std::runtime_error>([] { ConfigLoader::LoadFromYamlString("server: [unterminated"); }));
  assert(Throws<std::runtime_error>([] { ConfigLoader::LoadFromYaml("/nonexistent/mediaflow.yaml"); }));
  assert(Throws<std::runtime_error>([] { ConfigLoader::LoadFromYamlString("- server\n- logging\n"); }));
}

void TestQuotedScalarsStayStrings() {
  const auto config = ConfigLoader::LoadFromYamlString("network:\n  effective_type: \"4\"\nlogging:\n  level: \"true\"\n");
  assert(config.network().effective_type() == "4");
  assert(config.logging().level() == "true");
}

void TestTuningOverridesOnlySetFields() {
  const auto config = ConfigLoader::LoadFromYamlString(kConfig);

  const auto policy = BuildControllerPolicy(config.upload());
  assert(policy.timeout.floor == Millis{10'000});
  assert(policy.timeout.per_megabyte.slow == Millis{12'000});
  assert(policy.timeout.per_megabyte.fast == Millis{2'000});
  assert(policy.watchdog.initial_grace == Millis{30'000}); // zero keeps the default
  assert(policy.watchdog.threshold.slow == Millis{90'000});

  const auto options = BuildQueueOptions(config.upload().queue());
  assert(options.workers == 4);
  assert(options.placeholder_collection == "stories");
  assert(options.destination_template == "{collection}/{record_id}/{filename}");
  assert(options.max_tasks == 8);
  assert(options.timeout_hint == Millis{45'000});
}

void TestInconsistentTuningThrows() {
  // offline budget below slow breaks the ordering
  const auto config = ConfigLoader::LoadFromYamlString(R"(
upload:
  timeout:
    per_megabyte:
      offline_ms: 100
)");
  assert(Throws<std::invalid_argument>([&] { BuildControllerPolicy(config.upload()); }));

  const auto ceilings = ConfigLoader::LoadFromYamlString(R"(
upload:
  timeout:
    floor_ms: 600000
)");
  assert(Throws<std::invalid_argument>([&] { BuildControllerPolicy(ceilings.upload()); }));
}

void TestShippedConfigLoads() {
  const auto config = ConfigLoader::LoadFromYaml(std::string(MEDIAFLOW_SOURCE_DIR) + "/config/mediaflow.yaml");
  assert(config.server().bind_address() == "0.0.0.0:50061");
  assert(config.database().has_sqlite());
  assert(config.observability().transport() == mediaflow::runtime::config::OTLP_TRANSPORT_GRPC);

  const auto policy = BuildControllerPolicy(config.upload());
  assert(policy.timeout.video_ceiling == Millis{900'000});
  assert(BuildQueueOptions(config.upload().queue()).max_tasks == 256);
}

void TestOtlpSettingsResolution() {
  using mediaflow::observability::OtlpSignal;
  using mediaflow::observability::OtlpTransport;
  using mediaflow::observability::ResolveOtlpConfig;

  ::unsetenv("OTEL_EXPORTER_OTLP_ENDPOINT");
  ::unsetenv("OTEL_EXPORTER_OTLP_TRACES_ENDPOINT");
  ::unsetenv("OTEL_EXPORTER_OTLP_METRICS_ENDPOINT");

  const auto http = ConfigLoader::LoadFromYamlString(R"(
observability:
  transport: OTLP_TRANSPORT_HTTP
  environment: staging
  trace_sample_ratio: 0.25
)");
  const auto traces = ResolveOtlpConfig(http, OtlpSignal::kTraces);
  assert(traces.transport == OtlpTransport::kHttpProtobuf);
  assert(traces.endpoint == "http://localhost:4318/v1/traces");
  assert(traces.service_name == "mediaflow-uploader");
  assert(traces.environment == "staging");
  assert(traces.trace_sample_ratio == 0.25);
  assert(traces.insecure);
  assert(ResolveOtlpConfig(http, OtlpSignal::kMetrics).endpoint == "http://localhost:4318/v1/metrics");

  ::setenv("OTEL_EXPORTER_OTLP_ENDPOINT", "collector:4317", 1);
  ::setenv("OTEL_EXPORTER_OTLP_METRICS_ENDPOINT", "metrics-collector:4317", 1);
  const mediaflow::runtime::config::RuntimeConfig empty;
  assert(ResolveOtlpConfig(empty, OtlpSignal::kTraces).endpoint == "collector:4317");
  assert(ResolveOtlpConfig(empty, OtlpSignal::kMetrics).endpoint == "metrics-collector:4317");
  assert(ResolveOtlpConfig(empty, OtlpSignal::kMetrics).export_interval_ms == 1000);

  const auto pinned = ConfigLoader::LoadFromYamlString(R"(
observability:
  otlp_endpoint: "otel.internal:4317"
  otlp_use_tls: true
  service_name: uploader-eu
  metrics_interval_ms: 5000
)");
  const auto metrics = ResolveOtlpConfig(pinned, OtlpSignal::kMetrics);
  assert(metrics.endpoint == "otel.internal:4317");
  assert(!metrics.insecure);
  assert(metrics.service_name == "uploader-eu");
  assert(metrics.export_interval_ms == 5000);
  assert(metrics.trace_sample_ratio == 1.0);

  ::unsetenv("OTEL_EXPORTER_OTLP_ENDPOINT");
  ::unsetenv("OTEL_EXPORTER_OTLP_METRICS_ENDPOINT");
}

} // namespace

int main() {
  TestParsesSections();
  TestEmptyDocumentMeansDefaults();
  TestRejectsUnknownKeys();
  TestQuotedScalarsStayStrings();
  TestTuningOverridesOnlySetFields();
  TestInconsistentTuningThrows();
  TestShippedConfigLoads();
  TestOtlpSettingsResolution();

  std::cout << "mediaflow_unit_config_loader: pass\n";
  return 0;
}
