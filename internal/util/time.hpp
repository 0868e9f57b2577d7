#pragma once

#include <chrono>
#include <cstdint>

#include "google/protobuf/timestamp.pb.h"

namespace mediaflow::util {

/*
  Clock sources for the upload pipeline.

  Wall clock (Clock) stamps records and snapshots.
  Deadlines, stall windows and progress ages use SteadyClock.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

using SteadyClock     = std::chrono::steady_clock;
using SteadyTimePoint = SteadyClock::time_point;

using Millis = std::chrono::milliseconds;

TimePoint       Now();
SteadyTimePoint SteadyNow();

google::protobuf::Timestamp ToProto(TimePoint tp);

uint64_t ToUnixMillis(TimePoint tp);

// Whole seconds, rounded up, for user-facing messages.
int64_t CeilSeconds(Millis duration);

} // namespace mediaflow::util
