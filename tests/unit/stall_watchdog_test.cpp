#include <atomic>
#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <thread>

#include "internal/upload/stall_watchdog.hpp"
#include "internal/upload/transfer_session.hpp"
#include "tests/unit/fakes/scripted_blob_store.hpp"

namespace {

using namespace mediaflow;
using upload::CancelReason;
using upload::StallWatchdog;
using upload::TransferSession;
using Kind = TransferSession::Outcome::Kind;

upload::WatchdogPolicy FastSampling(util::Millis grace = util::Millis{0}) {
  upload::WatchdogPolicy policy;
  policy.sample_interval = util::Millis{10};
  policy.initial_grace   = grace;
  return policy;
}

std::shared_ptr<TransferSession> NewSession() {
  return std::make_shared<TransferSession>("upl_test", "posts/p_1.jpg", 1000);
}

class CountingHandle final : public storage::TransferHandle {
 public:
  void Cancel() override {
    ++cancels;
  }
  std::atomic<int> cancels{0};
};

void TestProgressOnlyAdvancesOnIncrease() {
  auto session = NewSession();
  assert(session->RecordProgress(100) == TransferSession::ProgressUpdate::kAdvanced);
  const auto first = session->ProgressSnapshot();

  std::this_thread::sleep_for(util::Millis{5});
  assert(session->RecordProgress(100) == TransferSession::ProgressUpdate::kUnchanged);
  assert(session->RecordProgress(40) == TransferSession::ProgressUpdate::kRegressed);

  const auto after = session->ProgressSnapshot();
  assert(after.bytes == 40);
  assert(after.last_progress_at == first.last_progress_at);
}

void TestSessionSettlesOnce() {
  auto session = NewSession();
  session->Complete("https://cdn.test/a");
  session->Fail(storage::BlobError{storage::BlobErrorCode::kNetwork, "late"});
  assert(!session->Cancel(CancelReason::kCaller));

  const auto outcome = session->Await(util::SteadyNow() + util::Millis{10});
  assert(outcome.kind == Kind::kCompleted);
  assert(outcome.url == "https://cdn.test/a");
  assert(session->token().Reason() == CancelReason::kNone);
}

void TestCancelReachesHandleAttachedLater() {
  auto session = NewSession();
  assert(session->Cancel(CancelReason::kCaller));
  assert(!session->Cancel(CancelReason::kStalled));
  assert(session->token().Reason() == CancelReason::kCaller);

  auto handle = std::make_shared<CountingHandle>();
  session->AttachTransfer(handle);
  assert(handle->cancels == 1);
  assert(session->Await(util::SteadyNow()).kind == Kind::kCancelled);
}

void TestDeadlineCancelsWithTimeoutReason() {
  auto session = NewSession();
  auto handle  = std::make_shared<CountingHandle>();
  session->AttachTransfer(handle);

  const auto outcome = session->Await(util::SteadyNow() + util::Millis{20});
  assert(outcome.kind == Kind::kDeadline);
  assert(session->token().Reason() == CancelReason::kTimeout);
  assert(handle->cancels == 1);
  assert(session->IsSettled());
}

void TestWatchdogFiresWithoutProgress() {
  const auto threshold   = util::Millis{120};
  auto       policy      = FastSampling();
  policy.sample_interval = util::Millis{25};

  auto             session = NewSession();
  std::atomic<int> stalls{0};
  auto             watchdog = StallWatchdog::Attach(session, threshold, policy, [&] { ++stalls; });

  std::this_thread::sleep_for(util::Millis{30});
  const auto last_report = util::SteadyNow();
  session->RecordProgress(100);

  const auto outcome = session->Await(last_report + util::Millis{2'000});
  const auto elapsed = util::SteadyNow() - last_report;
  assert(outcome.kind == Kind::kCancelled);
  assert(session->token().Reason() == CancelReason::kStalled);

  // Not before the threshold, and within one sample interval after it
  // (plus one interval for scheduling).
  assert(elapsed >= threshold);
  assert(elapsed <= threshold + 2 * policy.sample_interval);

  watchdog->Cancel();
  assert(watchdog->Triggered());
  assert(stalls == 1);
  assert(watchdog->threshold() == threshold);
  assert(watchdog->fired_threshold() == threshold);
}

void TestSteadyProgressKeepsWatchdogQuiet() {
  auto session  = NewSession();
  auto watchdog = StallWatchdog::Attach(session, util::Millis{60}, FastSampling());

  for (std::uint64_t bytes = 50; bytes <= 500; bytes += 50) {
    session->RecordProgress(bytes);
    std::this_thread::sleep_for(util::Millis{15});
  }
  assert(!session->IsSettled());
  watchdog->Cancel();
  assert(!watchdog->Triggered());
}

void TestGraceDoublesThreshold() {
  // 40ms threshold doubled to 80ms while younger than the 10s grace.
  auto session  = NewSession();
  auto watchdog = StallWatchdog::Attach(session, util::Millis{40}, FastSampling(util::Millis{10'000}));

  std::this_thread::sleep_for(util::Millis{55});
  assert(!session->IsSettled());

  const auto outcome = session->Await(util::SteadyNow() + util::Millis{2'000});
  assert(outcome.kind == Kind::kCancelled);
  assert(watchdog->Triggered());
  assert(watchdog->threshold() == util::Millis{40});
  assert(watchdog->fired_threshold() == util::Millis{80});
}

void TestWatchdogLeavesSettledSessionAlone() {
  auto session  = NewSession();
  auto watchdog = StallWatchdog::Attach(session, util::Millis{20}, FastSampling());
  session->Complete("https://cdn.test/done");

  std::this_thread::sleep_for(util::Millis{60});
  watchdog->Cancel();
  assert(!watchdog->Triggered());
  assert(watchdog->fired_threshold() == util::Millis{20});
  assert(session->token().Reason() == CancelReason::kNone);
}

void TestAttachRejectsBadArguments() {
  bool threw = false;
  try {
    StallWatchdog::Attach(nullptr, util::Millis{10}, FastSampling());
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    StallWatchdog::Attach(NewSession(), util::Millis{0}, FastSampling());
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestPolicyValidation() {
  upload::WatchdogPolicy policy;
  policy.Validate();

  policy.threshold.slow = util::Millis{1'000};
  bool threw            = false;
  try {
    policy.Validate();
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);

  upload::WatchdogPolicy zero_interval;
  zero_interval.sample_interval = util::Millis{0};
  threw                         = false;
  try {
    zero_interval.Validate();
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestProgressOnlyAdvancesOnIncrease();
  TestSessionSettlesOnce();
  TestCancelReachesHandleAttachedLater();
  TestDeadlineCancelsWithTimeoutReason();
  TestWatchdogFiresWithoutProgress();
  TestSteadyProgressKeepsWatchdogQuiet();
  TestGraceDoublesThreshold();
  TestWatchdogLeavesSettledSessionAlone();
  TestAttachRejectsBadArguments();
  TestPolicyValidation();

  std::cout << "mediaflow_unit_stall_watchdog: pass\n";
  return 0;
}
