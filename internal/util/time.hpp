#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

#include "google/protobuf/timestamp.pb.h"

namespace epicflow::util {

/*
  Time utilities. Single place to control the clock source.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// Injectable clock; components default to Now.
using NowFn = std::function<TimePoint()>;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

// False when ts falls outside the range TimePoint can hold; FromProto
// requires a representable timestamp.
bool IsRepresentable(const google::protobuf::Timestamp& ts);

} // namespace epicflow::util
