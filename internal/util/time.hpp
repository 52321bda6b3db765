#pragma once

#include <chrono>
#include <cstdint>

#include "google/protobuf/timestamp.pb.h"

namespace hostreg::util {

/*
  Time utilities. Single place to control the clock source.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
google::protobuf::Timestamp UnixMillisToProto(uint64_t ms);

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

} // namespace hostreg::util
