#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

#include "google/protobuf/duration.pb.h"

namespace finq::util {

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// Injectable clock, used by the queue so tests can move time.
using ClockFn = std::function<TimePoint()>;

TimePoint Now();

// ISO 8601 UTC with microsecond precision, e.g. 2026-10-17T08:30:00.000123Z
std::string ToIso8601(TimePoint tp);

std::chrono::milliseconds FromProto(const google::protobuf::Duration& d);

} // namespace finq::util
