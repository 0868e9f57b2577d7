#pragma once

#include <cstdint>
#include <string_view>

namespace mediaflow::model {

enum class TaskStatus : std::uint8_t {
  kPending   = 0,
  kUploading = 1,
  kCompleted = 2,
  kFailed    = 3,
};

constexpr bool IsTerminal(TaskStatus status) {
  return status == TaskStatus::kCompleted;
}

/*
  pending -> uploading -> {completed | failed}
  failed  -> pending      (explicit retry only)
*/
constexpr bool CanTransition(TaskStatus from, TaskStatus to) {
  switch (from) {
    case TaskStatus::kPending:
      return to == TaskStatus::kUploading;
    case TaskStatus::kUploading:
      return to == TaskStatus::kCompleted || to == TaskStatus::kFailed;
    case TaskStatus::kFailed:
      return to == TaskStatus::kPending;
    case TaskStatus::kCompleted:
      return false;
  }
  return false;
}

constexpr std::string_view ToString(TaskStatus status) {
  switch (status) {
    case TaskStatus::kPending:
      return "pending";
    case TaskStatus::kUploading:
      return "uploading";
    case TaskStatus::kCompleted:
      return "completed";
    case TaskStatus::kFailed:
      return "failed";
  }
  return "unknown";
}

} // namespace mediaflow::model
