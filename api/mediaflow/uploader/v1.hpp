#pragma once

#include "mediaflow/uploader/v1/types.pb.h"

#include "mediaflow/uploader/v1/transfer_admin_service.pb.h"
#include "mediaflow/uploader/v1/upload_queue_service.pb.h"

#include "mediaflow/uploader/v1/transfer_admin_service.grpc.pb.h"
#include "mediaflow/uploader/v1/upload_queue_service.grpc.pb.h"
