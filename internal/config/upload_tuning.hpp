#pragma once

#include "config/config.pb.h"
#include "internal/queue/upload_queue.hpp"
#include "internal/upload/upload_controller.hpp"

namespace mediaflow::config {

/*
  Maps the upload section of RuntimeConfig onto the controller and queue
  policies. A zero or empty field keeps the built-in default for that knob.
  The resulting policies are validated; a bad combination throws
  std::invalid_argument.
*/
upload::ControllerPolicy BuildControllerPolicy(const mediaflow::runtime::config::UploadConfig& config);

queue::QueueOptions BuildQueueOptions(const mediaflow::runtime::config::QueueConfig& config);

} // namespace mediaflow::config
