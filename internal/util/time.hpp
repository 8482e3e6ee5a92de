#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>

#include "google/protobuf/timestamp.pb.h"

namespace vidpipe::util {

/*
  Time utilities: single place to control the clock source.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

/*
  Injectable clock. Lease expiry and upload expiry read time through
  this so tests can move time forward without sleeping.
*/
class ClockSource {
 public:
  virtual ~ClockSource() = default;

  virtual TimePoint Now() const = 0;

  uint64_t NowMs() const {
    return ToUnixMillis(Now());
  }
};

class SystemClockSource final : public ClockSource {
 public:
  TimePoint Now() const override {
    return Clock::now();
  }
};

class ManualClockSource final : public ClockSource {
 public:
  explicit ManualClockSource(TimePoint start = Clock::now()) : now_(start) {
  }

  TimePoint Now() const override {
    std::lock_guard lock(mutex_);
    return now_;
  }

  void Advance(std::chrono::milliseconds delta) {
    std::lock_guard lock(mutex_);
    now_ += delta;
  }

 private:
  mutable std::mutex mutex_;
  TimePoint          now_;
};

std::shared_ptr<ClockSource> DefaultClock();

} // namespace vidpipe::util
