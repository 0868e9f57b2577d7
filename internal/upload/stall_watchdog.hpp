#pragma once

#include <atomic>
#include <cstdint>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

#include "internal/network/network_quality.hpp"
#include "internal/upload/timeout_calculator.hpp"
#include "internal/upload/transfer_session.hpp"
#include "internal/util/time.hpp"

namespace mediaflow::upload {

struct WatchdogPolicy {
  util::Millis     sample_interval{2'000};
  util::Millis     initial_grace{30'000};
  QualityDurations threshold{
      .fast     = util::Millis{30'000},
      .moderate = util::Millis{45'000},
      .slow     = util::Millis{90'000},
      .unknown  = util::Millis{60'000},
      .offline  = util::Millis{90'000},
  };

  util::Millis ThresholdFor(network::NetworkQuality quality) const {
    return threshold.For(quality);
  }

  void Validate() const;
};

/*
  StallWatchdog

  Samples a session's reported byte count on a fixed interval. When bytes
  have not increased for longer than the threshold (doubled while the
  session is younger than initial_grace) it cancels the session with
  reason kStalled and records that it did so.

  One thread per attached session; stopped through a condition variable.
*/
class StallWatchdog {
 public:
  class Handle {
   public:
    ~Handle();

    Handle(const Handle&)            = delete;
    Handle& operator=(const Handle&) = delete;

    // Stops sampling immediately. Idempotent.
    void Cancel();

    // True only if this watchdog cancelled the session.
    bool Triggered() const {
      return triggered_.load();
    }

    util::Millis threshold() const {
      return threshold_;
    }

    // The threshold in force when the watchdog fired: doubled inside the
    // grace period. Equals threshold() until then.
    util::Millis fired_threshold() const;

   private:
    friend class StallWatchdog;

    Handle(std::shared_ptr<TransferSession> session, util::Millis threshold, WatchdogPolicy policy, std::function<void()> on_stall);

    void Run();

    std::shared_ptr<TransferSession> session_;
    const util::Millis               threshold_;
    const WatchdogPolicy             policy_;
    std::function<void()>            on_stall_;

    std::mutex                     mutex_;
    std::condition_variable        cv_;
    bool                           stop_{false};
    std::atomic<bool>              triggered_{false};
    std::atomic<util::Millis::rep> fired_threshold_ms_{0};
    std::thread                    thread_;
  };

  static std::unique_ptr<Handle> Attach(std::shared_ptr<TransferSession> session, util::Millis threshold, const WatchdogPolicy& policy,
                                        std::function<void()> on_stall = {});
};

} // namespace mediaflow::upload
