#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

#include "google/protobuf/duration.pb.h"
#include "google/protobuf/timestamp.pb.h"

namespace trustmem::util {

/*
  Time utilities.

  All decay and age math goes through a Clock so tests can pin "now".
*/

using SystemClockType = std::chrono::system_clock;
using TimePoint       = SystemClockType::time_point;
using Duration        = std::chrono::milliseconds;

class Clock {
 public:
  virtual ~Clock() = default;

  virtual TimePoint Now() const = 0;
};

class SystemClock final : public Clock {
 public:
  TimePoint Now() const override;
};

// Manually advanced clock for tests and offline tooling.
class ManualClock final : public Clock {
 public:
  explicit ManualClock(TimePoint start = TimePoint{});

  TimePoint Now() const override;

  void Set(TimePoint tp);
  void Advance(Duration d);

 private:
  std::atomic<std::int64_t> now_ms_;
};

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

google::protobuf::Duration ToProtoDuration(Duration d);
Duration                   FromProtoDuration(const google::protobuf::Duration& d);

std::int64_t ToUnixMillis(TimePoint tp);
TimePoint    FromUnixMillis(std::int64_t ms);

constexpr Duration Days(double days) {
  return Duration(static_cast<std::int64_t>(days * 24.0 * 3600.0 * 1000.0));
}

} // namespace trustmem::util
