#include "proto_mapping.hpp"

#include <stdexcept>

#include "internal/util/time.hpp"

namespace mediaflow::service {

using namespace mediaflow::uploader::v1;

MediaKind ToProto(model::MediaKind kind) {
  return kind == model::MediaKind::kVideo ? MEDIA_KIND_VIDEO : MEDIA_KIND_IMAGE;
}

model::MediaKind FromProto(MediaKind kind) {
  switch (kind) {
    case MEDIA_KIND_IMAGE:
      return model::MediaKind::kImage;
    case MEDIA_KIND_VIDEO:
      return model::MediaKind::kVideo;
    default:
      throw std::invalid_argument("media_kind must be MEDIA_KIND_IMAGE or MEDIA_KIND_VIDEO");
  }
}

TaskStatus ToProto(model::TaskStatus status) {
  switch (status) {
    case model::TaskStatus::kPending:
      return TASK_STATUS_PENDING;
    case model::TaskStatus::kUploading:
      return TASK_STATUS_UPLOADING;
    case model::TaskStatus::kCompleted:
      return TASK_STATUS_COMPLETED;
    case model::TaskStatus::kFailed:
      return TASK_STATUS_FAILED;
  }
  return TASK_STATUS_UNSPECIFIED;
}

NetworkQuality ToProto(network::NetworkQuality quality) {
  switch (quality) {
    case network::NetworkQuality::kOffline:
      return NETWORK_QUALITY_OFFLINE;
    case network::NetworkQuality::kSlow:
      return NETWORK_QUALITY_SLOW;
    case network::NetworkQuality::kModerate:
      return NETWORK_QUALITY_MODERATE;
    case network::NetworkQuality::kFast:
      return NETWORK_QUALITY_FAST;
    case network::NetworkQuality::kUnknown:
      return NETWORK_QUALITY_UNKNOWN;
  }
  return NETWORK_QUALITY_UNSPECIFIED;
}

UploadErrorKind ToProto(upload::UploadErrorKind kind) {
  switch (kind) {
    case upload::UploadErrorKind::kOffline:
      return UPLOAD_ERROR_KIND_OFFLINE;
    case upload::UploadErrorKind::kTimeout:
      return UPLOAD_ERROR_KIND_TIMEOUT;
    case upload::UploadErrorKind::kStalled:
      return UPLOAD_ERROR_KIND_STALLED;
    case upload::UploadErrorKind::kUnauthorized:
      return UPLOAD_ERROR_KIND_UNAUTHORIZED;
    case upload::UploadErrorKind::kForbidden:
      return UPLOAD_ERROR_KIND_FORBIDDEN;
    case upload::UploadErrorKind::kQuotaExceeded:
      return UPLOAD_ERROR_KIND_QUOTA_EXCEEDED;
    case upload::UploadErrorKind::kNetwork:
      return UPLOAD_ERROR_KIND_NETWORK;
    case upload::UploadErrorKind::kUnknown:
      return UPLOAD_ERROR_KIND_UNKNOWN;
  }
  return UPLOAD_ERROR_KIND_UNSPECIFIED;
}

UploadTask ToProto(const queue::UploadTask& task) {
  UploadTask out;
  out.set_id(task.id);
  out.set_owner_id(task.owner_id);
  out.set_caption(task.caption);
  out.set_media_kind(ToProto(task.media_kind));
  out.set_status(ToProto(task.status));
  out.set_progress(task.progress);
  out.set_placeholder_record_id(task.placeholder_record_id);
  if (task.final_url) out.set_final_url(*task.final_url);
  if (task.last_error) {
    out.mutable_last_error()->set_kind(ToProto(task.last_error->kind));
    out.mutable_last_error()->set_message(task.last_error->message);
  }
  out.set_size_bytes(task.payload.size());
  out.set_content_type(task.payload.content_type);
  out.set_preview(task.preview);
  out.set_attempt(task.attempt);
  *out.mutable_submitted_at() = util::ToProto(task.submitted_at);
  return out;
}

TaskSnapshot ToProto(const queue::TaskSnapshot& snapshot) {
  TaskSnapshot out;
  for (const auto& task : snapshot) {
    *out.add_tasks() = ToProto(task);
  }
  return out;
}

QueueStatus ToProto(const queue::QueueStatus& status) {
  QueueStatus out;
  out.set_total(status.total);
  out.set_pending(status.pending);
  out.set_uploading(status.uploading);
  out.set_completed(status.completed);
  out.set_failed(status.failed);
  return out;
}

NetworkStatus ToProto(const network::NetworkStatus& status) {
  NetworkStatus out;
  out.set_online(status.online);
  out.set_quality(ToProto(status.quality));
  if (status.hint) {
    out.set_effective_type(status.hint->effective_type);
    out.set_downlink_mbps(status.hint->downlink_mbps);
    out.set_rtt_ms(status.hint->rtt_ms);
    out.set_metered(status.hint->metered);
  }
  return out;
}

UploadEstimate ToProto(const network::UploadEstimate& estimate) {
  UploadEstimate out;
  out.set_estimated_seconds(estimate.estimated_seconds);
  out.set_recommend_proceed(estimate.recommend_proceed);
  if (estimate.warning_message) out.set_warning_message(*estimate.warning_message);
  out.set_data_usage_mb(estimate.data_usage_mb);
  return out;
}

} // namespace mediaflow::service
