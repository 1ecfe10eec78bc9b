#include "time.hpp"

namespace epicflow::util {

TimePoint Now() {
  return Clock::now();
}

google::protobuf::Timestamp ToProto(TimePoint tp) {
  auto sec   = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(tp - sec);
  if (nanos.count() < 0) {
    sec -= std::chrono::seconds(1);
    nanos += std::chrono::seconds(1);
  }

  google::protobuf::Timestamp ts;
  ts.set_seconds(sec.time_since_epoch().count());
  ts.set_nanos(static_cast<int32_t>(nanos.count()));
  return ts;
}

bool IsRepresentable(const google::protobuf::Timestamp& ts) {
  using Seconds = std::chrono::duration<std::int64_t>;

  // One second of margin on each side leaves room for the nanos part.
  constexpr auto kMax = std::chrono::duration_cast<Seconds>(Clock::duration::max()).count() - 1;
  constexpr auto kMin = std::chrono::duration_cast<Seconds>(Clock::duration::min()).count() + 1;

  return ts.seconds() >= kMin && ts.seconds() <= kMax && ts.nanos() >= 0 && ts.nanos() < 1'000'000'000;
}

TimePoint FromProto(const google::protobuf::Timestamp& ts) {
  return TimePoint{} + std::chrono::duration_cast<Clock::duration>(std::chrono::seconds(ts.seconds()) + std::chrono::nanoseconds(ts.nanos()));
}

} // namespace epicflow::util
