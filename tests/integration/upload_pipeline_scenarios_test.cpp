#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "internal/db/memory/memory_document_store.hpp"
#include "internal/queue/upload_queue.hpp"
#include "internal/upload/timeout_calculator.hpp"
#include "tests/unit/fakes/scripted_blob_store.hpp"

namespace {

using namespace mediaflow;
using namespace mediaflow::testing;
using model::MediaKind;
using model::TaskStatus;
using network::NetworkQuality;

constexpr std::size_t kMiB = 1024 * 1024;

/*
  Full pipeline: scripted backend → controller → queue → memory documents.
*/
struct Pipeline {
  Pipeline(std::shared_ptr<network::StaticConnectivity> link, upload::ControllerPolicy policy = {}) : connectivity(std::move(link)) {
    controller = std::make_shared<upload::UploadController>(store, connectivity, policy);
    queue      = std::make_shared<queue::UploadQueue>(controller, documents, std::make_shared<media::InlinePreviewGenerator>());
    queue->Start();
  }

  ~Pipeline() {
    queue->Stop();
  }

  std::optional<queue::UploadTask> Task(const std::string& id) const {
    for (auto& task : queue->Tasks()) {
      if (task.id == id) return task;
    }
    return std::nullopt;
  }

  std::optional<queue::UploadTask> WaitSettled(const std::string& id) const {
    std::optional<queue::UploadTask> settled;
    WaitUntil(
        [&] {
          settled = Task(id);
          return settled && (settled->status == TaskStatus::kCompleted || settled->status == TaskStatus::kFailed);
        },
        util::Millis{15'000});
    return settled;
  }

  std::shared_ptr<ScriptedBlobStore>             store     = std::make_shared<ScriptedBlobStore>();
  std::shared_ptr<db::memory::MemoryDocumentStore> documents = std::make_shared<db::memory::MemoryDocumentStore>();
  std::shared_ptr<network::StaticConnectivity>   connectivity;
  std::shared_ptr<upload::UploadController>      controller;
  std::shared_ptr<queue::UploadQueue>            queue;
};

model::MediaPayload Payload(std::size_t size, std::string content_type, std::string filename) {
  return model::MediaPayload{.bytes = Bytes(size), .content_type = std::move(content_type), .filename = std::move(filename)};
}

// The production policy divided by 100 so the slow-link scenario runs in well under a second.
upload::ControllerPolicy HundredthScale() {
  upload::ControllerPolicy policy;
  policy.timeout.floor         = util::Millis{300};
  policy.timeout.image_ceiling = util::Millis{3'000};
  policy.timeout.video_ceiling = util::Millis{9'000};
  policy.timeout.per_megabyte  = {
       .fast = util::Millis{20}, .moderate = util::Millis{50}, .slow = util::Millis{80}, .unknown = util::Millis{50}, .offline = util::Millis{80}};

  policy.watchdog.sample_interval = util::Millis{20};
  policy.watchdog.initial_grace   = util::Millis{300};
  policy.watchdog.threshold       = {
            .fast = util::Millis{300}, .moderate = util::Millis{450}, .slow = util::Millis{900}, .unknown = util::Millis{600}, .offline = util::Millis{900}};
  return policy;
}

void ScenarioFastImageCompletes() {
  const auto size = 2 * kMiB;
  assert(upload::ComputeTimeout(size, NetworkQuality::kFast, std::nullopt, MediaKind::kImage) == upload::TimeoutPolicy::kDefaultFloor);

  Pipeline pipeline(Link("4g", 20.0));
  pipeline.store->Push(Completes(util::Millis{1'000}));

  const auto started = util::SteadyNow();
  const auto id      = pipeline.queue->Submit("user-a", Payload(size, "image/jpeg", "holiday.jpg"), "holiday", MediaKind::kImage);
  const auto task    = pipeline.WaitSettled(id);

  assert(task);
  assert(task->status == TaskStatus::kCompleted);
  assert(task->final_url && !task->final_url->empty());
  assert(util::SteadyNow() - started >= util::Millis{1'000});

  const auto record = pipeline.documents->GetRecord("posts", task->placeholder_record_id);
  assert(record);
  assert(record->fields.fields().at("media_url").string_value() == *task->final_url);
  assert(!record->fields.fields().at("uploading").bool_value());
}

void ScenarioSlowVideoStalls() {
  const auto size   = 40 * kMiB;
  const auto policy = HundredthScale();

  // Size-based estimate wins over the floor, at full and at test scale.
  assert(upload::ComputeTimeout(size, NetworkQuality::kSlow, std::nullopt, MediaKind::kVideo) == util::Millis{320'000});
  assert(upload::ComputeTimeout(size, NetworkQuality::kSlow, std::nullopt, MediaKind::kVideo, policy.timeout) == util::Millis{3'200});
  assert(policy.watchdog.ThresholdFor(NetworkQuality::kSlow) == util::Millis{900});

  Pipeline pipeline(Link("2g"), policy);
  pipeline.store->Push(Hangs({{util::Millis{10}, 4 * kMiB}}));

  const auto started = util::SteadyNow();
  const auto id      = pipeline.queue->Submit("user-b", Payload(size, "video/mp4", "ride.mp4"), "", MediaKind::kVideo);
  const auto task    = pipeline.WaitSettled(id);
  const auto elapsed = util::SteadyNow() - started;

  assert(task);
  assert(task->status == TaskStatus::kFailed);
  assert(task->last_error && task->last_error->kind == upload::UploadErrorKind::kStalled);
  assert(task->last_error->message.rfind("Upload stalled: no progress for 1s", 0) == 0);
  assert(task->progress > 0.0 && task->progress < 100.0);

  // The watchdog fired long before the transfer deadline: within one sample
  // interval of the threshold after the last report (10ms in), plus one more
  // interval and a little queue pickup and polling time.
  const auto threshold = policy.watchdog.ThresholdFor(NetworkQuality::kSlow);
  assert(elapsed >= threshold);
  assert(elapsed <= util::Millis{10} + threshold + 2 * policy.watchdog.sample_interval + util::Millis{100});
  assert(pipeline.controller->ActiveCount() == 0);
}

void ScenarioOfflineFailsImmediately() {
  auto offline = std::make_shared<network::StaticConnectivity>(false);

  Pipeline pipeline(offline);

  bool                saw_session = false;
  upload::UploadOptions options;
  options.on_session = [&](const std::string&) { saw_session = true; };

  const auto started = util::SteadyNow();
  const auto result  = pipeline.controller->Upload(Payload(kMiB, "image/png", "a.png"), "posts/r/p_r.png", options);
  assert(util::SteadyNow() - started < util::Millis{500});
  assert(result.error && result.error->kind == upload::UploadErrorKind::kOffline);
  assert(!saw_session);
  assert(pipeline.controller->ActiveCount() == 0);

  const auto id   = pipeline.queue->Submit("user-c", Payload(kMiB, "image/png", "a.png"), "", MediaKind::kImage);
  const auto task = pipeline.WaitSettled(id);
  assert(task && task->status == TaskStatus::kFailed);
  assert(task->last_error->kind == upload::UploadErrorKind::kOffline);
  assert(pipeline.store->put_count() == 0);

  // Back online, the same task goes through on retry.
  offline->SetOnline(true);
  pipeline.store->Push(Completes(util::Millis{5}));
  pipeline.queue->Retry(id);
  const auto retried = pipeline.WaitSettled(id);
  assert(retried && retried->status == TaskStatus::kCompleted);
}

} // namespace

int main() {
  ScenarioFastImageCompletes();
  ScenarioSlowVideoStalls();
  ScenarioOfflineFailsImmediately();

  std::cout << "mediaflow_integration_upload_pipeline_scenarios: pass\n";
  return 0;
}
