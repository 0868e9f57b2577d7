#include <chrono>
#include <csignal>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/config/upload_tuning.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"

using mediaflow::observability::IntField;
using mediaflow::observability::StringField;

namespace {

volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

struct Options {
  std::string config_path;
  bool        check_only = false;
};

std::optional<Options> ParseArgs(int argc, char** argv) {
  Options options;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--check-config") {
      options.check_only = true;
    } else if (arg == "--config" && i + 1 < argc) {
      options.config_path = argv[++i];
    } else if (options.config_path.empty() && !arg.starts_with("--")) {
      options.config_path = arg;
    } else {
      return std::nullopt;
    }
  }
  if (options.config_path.empty()) {
    return std::nullopt;
  }
  return options;
}

void ShutdownObservability() {
  mediaflow::observability::ShutdownMetrics();
  mediaflow::observability::ShutdownTracing();
  mediaflow::observability::ShutdownLogging();
}

// Validates the upload tuning without opening storage or binding a port.
int CheckConfig(const mediaflow::runtime::config::RuntimeConfig& config) {
  const auto policy = mediaflow::config::BuildControllerPolicy(config.upload());
  const auto queue  = mediaflow::config::BuildQueueOptions(config.upload().queue());

  std::cout << "config ok\n"
            << "  bind_address:       " << config.server().bind_address() << "\n"
            << "  timeout floor:      " << policy.timeout.floor.count() << " ms\n"
            << "  image/video ceiling: " << policy.timeout.image_ceiling.count() << "/" << policy.timeout.video_ceiling.count() << " ms\n"
            << "  watchdog interval:  " << policy.watchdog.sample_interval.count() << " ms\n"
            << "  queue workers:      " << queue.workers << "\n"
            << "  placeholder target: " << queue.placeholder_collection << "\n";
  return 0;
}

} // namespace

int main(int argc, char** argv) {
  const auto options = ParseArgs(argc, argv);
  if (!options) {
    std::cerr << "Usage: mediaflow-uploader [--check-config] <config.yaml> | --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    const auto config = mediaflow::config::ConfigLoader::LoadFromYaml(options->config_path);
    if (options->check_only) {
      return CheckConfig(config);
    }

    mediaflow::observability::InitializeLogging(config);
    mediaflow::observability::InitializeTracing(config);
    mediaflow::observability::InitializeMetrics(config);

    auto app = mediaflow::factory::Build(config);

    mediaflow::runtime::Server server(config.server().bind_address(), std::move(app.grpc_services));

    // Handlers go in before Start() so an early SIGTERM still stops cleanly.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    MEDIAFLOW_LOG_INFO("mediaflow uploader started", {StringField("bind_address", config.server().bind_address()),
                                                      StringField("config", options->config_path)});

    while (g_running) std::this_thread::sleep_for(std::chrono::milliseconds(250));

    const auto in_flight = app.controller->ActiveCount();
    MEDIAFLOW_LOG_INFO("shutting down mediaflow uploader", {IntField("active_transfers", static_cast<std::int64_t>(in_flight))});

    server.Stop();
    app.Shutdown();
    ShutdownObservability();
  } catch (const std::exception& e) {
    if (options->check_only) {
      std::cerr << "config invalid: " << e.what() << std::endl;
      return 2;
    }
    MEDIAFLOW_LOG_ERROR("fatal error", {StringField("error", e.what())});
    ShutdownObservability();
    return 2;
  }

  return 0;
}
