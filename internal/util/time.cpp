#include "time.hpp"

namespace trustmem::util {

TimePoint SystemClock::Now() const {
  return SystemClockType::now();
}

ManualClock::ManualClock(TimePoint start) : now_ms_(ToUnixMillis(start)) {
}

TimePoint ManualClock::Now() const {
  return FromUnixMillis(now_ms_.load());
}

void ManualClock::Set(TimePoint tp) {
  now_ms_.store(ToUnixMillis(tp));
}

void ManualClock::Advance(Duration d) {
  now_ms_.fetch_add(d.count());
}

TimePoint Now() {
  return SystemClockType::now();
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

TimePoint FromProto(const google::protobuf::Timestamp& ts) {
  return TimePoint{} + std::chrono::duration_cast<TimePoint::duration>(std::chrono::seconds(ts.seconds()) + std::chrono::nanoseconds(ts.nanos()));
}

google::protobuf::Duration ToProtoDuration(Duration d) {
  google::protobuf::Duration out;
  out.set_seconds(d.count() / 1000);
  out.set_nanos(static_cast<int32_t>((d.count() % 1000) * 1000000));
  return out;
}

Duration FromProtoDuration(const google::protobuf::Duration& d) {
  return std::chrono::duration_cast<Duration>(std::chrono::seconds(d.seconds()) + std::chrono::nanoseconds(d.nanos()));
}

std::int64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMillis(std::int64_t ms) {
  return TimePoint{} + std::chrono::milliseconds(ms);
}

} // namespace trustmem::util
