#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include <filesystem>
#include <iostream>
#include <string>

#include "client/cpp/upload_client.h"
#include "mediaflow/uploader/v1.hpp"

using namespace mediaflow::uploader::v1;

int main(int argc, char** argv) {
  if (argc < 3) {
    std::cerr << "usage: submit_and_watch_example <file> <owner_id> [target]\n";
    return 1;
  }
  const std::string target = argc > 3 ? argv[3] : "localhost:50061";

  mediaflow::client::UploadClient client(grpc::CreateChannel(target, grpc::InsecureChannelCredentials()));

  // Ask first: slow or metered links get a warning before the bytes go out.
  auto estimate = client.EstimateUpload(std::filesystem::file_size(argv[1]));
  if (!estimate.ok()) {
    std::cerr << "EstimateUpload failed: " << estimate.status().ToString() << '\n';
    return 1;
  }
  if (!estimate->warning_message().empty()) {
    std::cout << estimate->warning_message() << '\n';
  }
  if (!estimate->recommend_proceed()) {
    std::cerr << "not recommended on the current connection\n";
    return 1;
  }

  mediaflow::client::UploadClient::Submission submission;
  submission.owner_id     = argv[2];
  submission.content_type = "image/jpeg";

  auto task_id = client.SubmitFile(submission, argv[1]);
  if (!task_id.ok()) {
    std::cerr << "Submit failed: " << task_id.status().ToString() << '\n';
    return 1;
  }
  std::cout << "submitted " << *task_id << '\n';

  // Follow the task until it leaves the uploading state.
  grpc::ClientContext ctx;
  auto                reader = client.WatchTasks(&ctx);
  TaskSnapshot        snapshot;
  while (reader->Read(&snapshot)) {
    for (const auto& task : snapshot.tasks()) {
      if (task.id() != *task_id) continue;
      std::cout << TaskStatus_Name(task.status()) << " " << task.progress() << "%\n";

      if (task.status() == TASK_STATUS_COMPLETED) {
        std::cout << "url: " << task.final_url() << '\n';
        ctx.TryCancel();
      } else if (task.status() == TASK_STATUS_FAILED) {
        std::cerr << "failed: " << task.last_error().message() << '\n';
        ctx.TryCancel();
      }
    }
  }
  const auto status = reader->Finish();
  if (!status.ok() && status.error_code() != grpc::StatusCode::CANCELLED) {
    std::cerr << "watch failed: " << status.error_message() << '\n';
    return 1;
  }
  return 0;
}
