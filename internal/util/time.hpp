#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

#include "google/protobuf/duration.pb.h"

namespace faucet::util {

/*
  Clock helpers shared by admission, ledger and submitter.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using Millis    = std::chrono::milliseconds;

// Injectable clock for components whose staleness rules need to be tested.
using NowFn = std::function<TimePoint()>;

TimePoint Now();

Millis ToMillis(const google::protobuf::Duration& d);
Millis ToMillisOr(const google::protobuf::Duration& d, Millis fallback);

uint64_t ToUnixMillis(TimePoint tp);

} // namespace faucet::util
