#pragma once

#include <atomic>
#include <cstdint>
#include <string_view>

namespace mediaflow::upload {

enum class CancelReason : std::uint8_t {
  kNone    = 0,
  kCaller  = 1, // Cancel(id), CancelAll(), queue cancel
  kStalled = 2, // stall watchdog
  kTimeout = 3, // adaptive deadline
};

constexpr std::string_view ToString(CancelReason reason) {
  switch (reason) {
    case CancelReason::kNone:
      return "none";
    case CancelReason::kCaller:
      return "caller";
    case CancelReason::kStalled:
      return "stalled";
    case CancelReason::kTimeout:
      return "timeout";
  }
  return "none";
}

/*
  Cooperative cancellation flag. The first reason recorded wins; later
  requests are ignored so a watchdog stall cannot be relabelled as a caller
  cancel (or vice versa).
*/
class CancellationToken {
 public:
  // Returns true if this call set the reason.
  bool Cancel(CancelReason reason) {
    auto expected = static_cast<std::uint8_t>(CancelReason::kNone);
    return reason_.compare_exchange_strong(expected, static_cast<std::uint8_t>(reason));
  }

  bool IsCancelled() const {
    return reason_.load() != static_cast<std::uint8_t>(CancelReason::kNone);
  }

  CancelReason Reason() const {
    return static_cast<CancelReason>(reason_.load());
  }

 private:
  std::atomic<std::uint8_t> reason_{static_cast<std::uint8_t>(CancelReason::kNone)};
};

} // namespace mediaflow::upload
