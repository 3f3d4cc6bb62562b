#pragma once

#include <chrono>
#include <mutex>
#include <string>

namespace ftr::core {

using Instant = std::chrono::steady_clock::time_point;
using Duration = std::chrono::steady_clock::duration;

// Abstract clock interface for time injection.
// Wall-clock timestamps feed records and audit events; the monotonic instant and sleep_for
// drive token-bucket refill, breaker cooldown and retry backoff. Tests substitute a
// FixedClock so that no test ever waits in real time.
class IClock {
 public:
  virtual ~IClock() = default;

  // Return current wall-clock timestamp in ISO 8601 format (UTC).
  virtual std::string now_iso8601() = 0;

  // Return the current monotonic instant.
  virtual Instant now() = 0;

  // Suspend the calling request (never the whole process) for the given duration.
  virtual void sleep_for(Duration duration) = 0;

 protected:
  IClock() = default;
  IClock(const IClock&) = default;
  IClock& operator=(const IClock&) = default;
  IClock(IClock&&) = default;
  IClock& operator=(IClock&&) = default;
};

// Production clock: system time, steady_clock and a real thread sleep.
class SystemClock final : public IClock {
 public:
  SystemClock() = default;
  ~SystemClock() override = default;

  SystemClock(const SystemClock&) = default;
  SystemClock& operator=(const SystemClock&) = default;
  SystemClock(SystemClock&&) = default;
  SystemClock& operator=(SystemClock&&) = default;

  std::string now_iso8601() override;
  Instant now() override;
  void sleep_for(Duration duration) override;
};

// Fixed clock: constant wall-clock timestamp and a simulated monotonic timeline.
// sleep_for() advances the timeline instead of blocking, so backoff and refill waits are
// observable and instantaneous. Thread-safe.
class FixedClock final : public IClock {
 public:
  explicit FixedClock(std::string fixed_time) : fixed_time_(std::move(fixed_time)) {}
  ~FixedClock() override = default;

  FixedClock(const FixedClock&) = delete;
  FixedClock& operator=(const FixedClock&) = delete;
  FixedClock(FixedClock&&) = delete;
  FixedClock& operator=(FixedClock&&) = delete;

  std::string now_iso8601() override;
  Instant now() override;
  void sleep_for(Duration duration) override;

  // Move the simulated timeline forward without recording a sleep.
  void advance(Duration duration);

  // Total simulated time spent inside sleep_for().
  [[nodiscard]] Duration total_slept() const;

 private:
  std::string fixed_time_;
  mutable std::mutex mutex_;
  Duration elapsed_{Duration::zero()};
  Duration slept_{Duration::zero()};
};

}  // namespace ftr::core
