#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <limits>

namespace devstatus::core::common::clock {

// Milliseconds on a monotonic timeline. Only differences are meaningful.
using TimestampMs = std::int64_t;
using DurationMs = std::int64_t;

constexpr TimestampMs kMaxTimestampMs = std::numeric_limits<TimestampMs>::max();
constexpr TimestampMs kMinTimestampMs = std::numeric_limits<TimestampMs>::min();

// Timestamps arrive from devices, so deadline math clamps at the int64 limits.
inline TimestampMs SaturatingAdd(TimestampMs t, DurationMs d) {
  if (d > 0 && t > kMaxTimestampMs - d) return kMaxTimestampMs;
  if (d < 0 && t < kMinTimestampMs - d) return kMinTimestampMs;
  return t + d;
}

inline DurationMs SaturatingSub(TimestampMs a, TimestampMs b) {
  if (b < 0 && a > kMaxTimestampMs + b) return kMaxTimestampMs;
  if (b > 0 && a < kMinTimestampMs + b) return kMinTimestampMs;
  return a - b;
}

class Clock {
public:
  virtual ~Clock() = default;
  virtual TimestampMs NowMs() const = 0;
};

class SteadyClock final : public Clock {
public:
  TimestampMs NowMs() const override {
    const auto d = std::chrono::steady_clock::now().time_since_epoch();
    return static_cast<TimestampMs>(std::chrono::duration_cast<std::chrono::milliseconds>(d).count());
  }
};

// Time only moves when told to. Safe to advance from one thread while others read.
class ManualClock final : public Clock {
public:
  explicit ManualClock(TimestampMs start_ms = 0) : now_ms_(start_ms) {}

  TimestampMs NowMs() const override { return now_ms_.load(); }

  void Set(TimestampMs now_ms) { now_ms_.store(now_ms); }
  void Advance(DurationMs delta_ms) { now_ms_.fetch_add(delta_ms); }

private:
  std::atomic<TimestampMs> now_ms_;
};

}  // namespace devstatus::core::common::clock
