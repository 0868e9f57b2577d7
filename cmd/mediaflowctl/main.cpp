#include <grpcpp/grpcpp.h>

#include <cstdint>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>

#include "client/cpp/upload_client.h"
#include "mediaflow/uploader/v1.hpp"

using mediaflow::client::UploadClient;
using namespace mediaflow::uploader::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  mediaflowctl <addr> submit <owner_id> <file> [image|video] [caption]\n"
            << "  mediaflowctl <addr> retry <task_id>\n"
            << "  mediaflowctl <addr> cancel <task_id>\n"
            << "  mediaflowctl <addr> status\n"
            << "  mediaflowctl <addr> watch\n"
            << "  mediaflowctl <addr> estimate <size_bytes>\n"
            << "  mediaflowctl <addr> active\n"
            << "  mediaflowctl <addr> cancel-all\n"
            << "  mediaflowctl <addr> network\n";
}

static std::optional<MediaKind> ParseKind(const std::string& value) {
  if (value == "image") return MEDIA_KIND_IMAGE;
  if (value == "video") return MEDIA_KIND_VIDEO;
  return std::nullopt;
}

static std::string GuessContentType(const std::string& path) {
  const auto dot = path.find_last_of('.');
  const auto ext = dot == std::string::npos ? std::string() : path.substr(dot + 1);
  if (ext == "jpg" || ext == "jpeg") return "image/jpeg";
  if (ext == "png") return "image/png";
  if (ext == "gif") return "image/gif";
  if (ext == "webp") return "image/webp";
  if (ext == "mp4") return "video/mp4";
  if (ext == "mov") return "video/quicktime";
  if (ext == "webm") return "video/webm";
  return "application/octet-stream";
}

static void PrintTask(const UploadTask& task) {
  std::cout << task.id() << " " << TaskStatus_Name(task.status()) << " " << std::fixed << std::setprecision(1) << task.progress() << "%"
            << " attempt=" << task.attempt() << " record=" << task.placeholder_record_id();
  if (!task.final_url().empty()) std::cout << " url=" << task.final_url();
  if (task.has_last_error()) std::cout << " error=\"" << task.last_error().message() << "\"";
  std::cout << "\n";
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  const std::string addr = argv[1];
  const std::string cmd  = argv[2];

  UploadClient client(grpc::CreateChannel(addr, grpc::InsecureChannelCredentials()));

  // ------------------------------------------------------------

  if (cmd == "submit") {
    if (argc < 5) {
      Usage();
      return 1;
    }

    UploadClient::Submission submission;
    submission.owner_id     = argv[3];
    submission.content_type = GuessContentType(argv[4]);
    submission.media_kind   = submission.content_type.rfind("video/", 0) == 0 ? MEDIA_KIND_VIDEO : MEDIA_KIND_IMAGE;
    if (argc >= 6) {
      auto kind = ParseKind(argv[5]);
      if (!kind) {
        std::cerr << "unsupported media kind: " << argv[5] << "\n";
        return 1;
      }
      submission.media_kind = *kind;
    }
    if (argc >= 7) submission.caption = argv[6];

    auto task_id = client.SubmitFile(submission, argv[4]);
    if (!task_id.ok()) {
      std::cerr << task_id.status().ToString() << "\n";
      return 2;
    }
    std::cout << *task_id << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "retry") {
    if (argc < 4) return 1;
    auto status = client.Retry(argv[3]);
    if (!status.ok()) {
      std::cerr << status.ToString() << "\n";
      return 2;
    }
    std::cout << "retrying\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "cancel") {
    if (argc < 4) return 1;
    auto cancelled = client.Cancel(argv[3]);
    if (!cancelled.ok()) {
      std::cerr << cancelled.status().ToString() << "\n";
      return 2;
    }
    std::cout << (*cancelled ? "cancelled" : "unknown task") << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "status") {
    auto status = client.GetQueueStatus();
    if (!status.ok()) {
      std::cerr << status.status().ToString() << "\n";
      return 2;
    }
    std::cout << "total=" << status->total() << " pending=" << status->pending() << " uploading=" << status->uploading()
              << " completed=" << status->completed() << " failed=" << status->failed() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "watch") {
    grpc::ClientContext ctx;
    auto                reader = client.WatchTasks(&ctx);

    TaskSnapshot snapshot;
    while (reader->Read(&snapshot)) {
      std::cout << "--- " << snapshot.tasks_size() << " task(s)\n";
      for (const auto& task : snapshot.tasks()) PrintTask(task);
      std::cout.flush();
    }

    auto status = reader->Finish();
    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "estimate") {
    if (argc < 4) return 1;
    auto estimate = client.EstimateUpload(std::stoull(argv[3]));
    if (!estimate.ok()) {
      std::cerr << estimate.status().ToString() << "\n";
      return 2;
    }
    std::cout << "seconds=" << std::fixed << std::setprecision(1) << estimate->estimated_seconds()
              << " proceed=" << (estimate->recommend_proceed() ? "yes" : "no") << " data_mb=" << estimate->data_usage_mb() << "\n";
    if (!estimate->warning_message().empty()) std::cout << estimate->warning_message() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "active") {
    auto active = client.GetActiveTransfers();
    if (!active.ok()) {
      std::cerr << active.status().ToString() << "\n";
      return 2;
    }
    std::cout << "active=" << *active << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "cancel-all") {
    auto cancelled = client.CancelAllTransfers();
    if (!cancelled.ok()) {
      std::cerr << cancelled.status().ToString() << "\n";
      return 2;
    }
    std::cout << "cancelled=" << *cancelled << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "network") {
    auto network = client.GetNetworkStatus();
    if (!network.ok()) {
      std::cerr << network.status().ToString() << "\n";
      return 2;
    }
    std::cout << "online=" << (network->online() ? "yes" : "no") << " quality=" << NetworkQuality_Name(network->quality());
    if (!network->effective_type().empty()) std::cout << " type=" << network->effective_type();
    if (network->downlink_mbps() > 0) std::cout << " downlink_mbps=" << network->downlink_mbps();
    std::cout << "\n";
    return 0;
  }

  Usage();
  return 1;
}
