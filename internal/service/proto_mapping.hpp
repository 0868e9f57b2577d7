#pragma once

#include "internal/model/media.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/network/network_quality.hpp"
#include "internal/queue/upload_task.hpp"
#include "internal/upload/upload_error.hpp"
#include "mediaflow/uploader/v1.hpp"

namespace mediaflow::service {

// Domain <-> wire conversions for the uploader API.

mediaflow::uploader::v1::MediaKind ToProto(model::MediaKind kind);
model::MediaKind                   FromProto(mediaflow::uploader::v1::MediaKind kind);

mediaflow::uploader::v1::TaskStatus      ToProto(model::TaskStatus status);
mediaflow::uploader::v1::NetworkQuality  ToProto(network::NetworkQuality quality);
mediaflow::uploader::v1::UploadErrorKind ToProto(upload::UploadErrorKind kind);

mediaflow::uploader::v1::UploadTask     ToProto(const queue::UploadTask& task);
mediaflow::uploader::v1::TaskSnapshot   ToProto(const queue::TaskSnapshot& snapshot);
mediaflow::uploader::v1::QueueStatus    ToProto(const queue::QueueStatus& status);
mediaflow::uploader::v1::NetworkStatus  ToProto(const network::NetworkStatus& status);
mediaflow::uploader::v1::UploadEstimate ToProto(const network::UploadEstimate& estimate);

} // namespace mediaflow::service
