#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/media.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/upload/upload_error.hpp"
#include "internal/util/time.hpp"

namespace mediaflow::queue {

/*
  One submitted media item as seen by subscribers. Copies share the
  payload buffer.
*/
struct UploadTask {
  std::string         id;
  std::string         owner_id;
  std::string         caption;
  model::MediaKind    media_kind{model::MediaKind::kImage};
  model::MediaPayload payload;

  model::TaskStatus status{model::TaskStatus::kPending};
  double            progress{0.0}; // 0-100, non-decreasing within one attempt

  std::string                        placeholder_record_id;
  std::string                        preview;
  std::optional<std::string>         final_url;
  std::optional<upload::UploadError> last_error;

  std::uint32_t   attempt{1};
  util::TimePoint submitted_at;
};

// Full task list in submission order.
using TaskSnapshot = std::vector<UploadTask>;

struct QueueStatus {
  std::size_t total{0};
  std::size_t pending{0};
  std::size_t uploading{0};
  std::size_t completed{0};
  std::size_t failed{0};
};

} // namespace mediaflow::queue
