#include "time.hpp"

namespace hostreg::util {

TimePoint Now() {
  return Clock::now();
}

google::protobuf::Timestamp ToProto(TimePoint tp) {
  auto sec   = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(tp - sec);

  google::protobuf::Timestamp ts;
  ts.set_seconds(sec.time_since_epoch().count());
  ts.set_nanos(static_cast<int32_t>(nanos.count()));
  return ts;
}

google::protobuf::Timestamp UnixMillisToProto(uint64_t ms) {
  return ToProto(FromUnixMillis(ms));
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMillis(uint64_t ms) {
  return TimePoint{} + std::chrono::milliseconds(ms);
}

} // namespace hostreg::util
