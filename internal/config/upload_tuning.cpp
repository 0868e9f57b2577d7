#include "upload_tuning.hpp"

namespace mediaflow::config {

namespace {

using mediaflow::runtime::config::QualityDurations;

void Override(util::Millis& target, std::uint32_t value_ms) {
  if (value_ms > 0) target = util::Millis{value_ms};
}

void Override(upload::QualityDurations& target, const QualityDurations& config) {
  Override(target.fast, config.fast_ms());
  Override(target.moderate, config.moderate_ms());
  Override(target.slow, config.slow_ms());
  Override(target.unknown, config.unknown_ms());
  Override(target.offline, config.offline_ms());
}

} // namespace

upload::ControllerPolicy BuildControllerPolicy(const mediaflow::runtime::config::UploadConfig& config) {
  upload::ControllerPolicy policy;

  const auto& timeout = config.timeout();
  Override(policy.timeout.floor, timeout.floor_ms());
  Override(policy.timeout.image_ceiling, timeout.image_ceiling_ms());
  Override(policy.timeout.video_ceiling, timeout.video_ceiling_ms());
  Override(policy.timeout.per_megabyte, timeout.per_megabyte());

  const auto& watchdog = config.watchdog();
  Override(policy.watchdog.sample_interval, watchdog.sample_interval_ms());
  Override(policy.watchdog.initial_grace, watchdog.initial_grace_ms());
  Override(policy.watchdog.threshold, watchdog.threshold());

  policy.Validate();
  return policy;
}

queue::QueueOptions BuildQueueOptions(const mediaflow::runtime::config::QueueConfig& config) {
  queue::QueueOptions options;

  if (config.workers() > 0) options.workers = config.workers();
  Override(options.completed_grace, config.completed_grace_ms());
  if (!config.placeholder_collection().empty()) options.placeholder_collection = config.placeholder_collection();
  if (!config.destination_template().empty()) options.destination_template = config.destination_template();
  options.max_tasks = config.max_tasks();
  if (config.timeout_hint_ms() > 0) options.timeout_hint = util::Millis{config.timeout_hint_ms()};

  return options;
}

} // namespace mediaflow::config
