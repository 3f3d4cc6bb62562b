#include "ftr/core/clock.h"

#include <ctime>
#include <iomanip>
#include <sstream>
#include <thread>

namespace ftr::core {

std::string SystemClock::now_iso8601() {
  const auto now = std::chrono::system_clock::now();
  const auto time_t_now = std::chrono::system_clock::to_time_t(now);

  std::tm utc{};
  gmtime_r(&time_t_now, &utc);

  std::ostringstream oss;
  oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
  return oss.str();
}

Instant SystemClock::now() {
  return std::chrono::steady_clock::now();
}

void SystemClock::sleep_for(const Duration duration) {
  if (duration > Duration::zero()) {
    std::this_thread::sleep_for(duration);
  }
}

std::string FixedClock::now_iso8601() {
  return fixed_time_;
}

Instant FixedClock::now() {
  std::lock_guard<std::mutex> lock(mutex_);
  return Instant{} + elapsed_;
}

void FixedClock::sleep_for(const Duration duration) {
  if (duration <= Duration::zero()) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  elapsed_ += duration;
  slept_ += duration;
}

void FixedClock::advance(const Duration duration) {
  std::lock_guard<std::mutex> lock(mutex_);
  elapsed_ += duration;
}

Duration FixedClock::total_slept() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return slept_;
}

}  // namespace ftr::core
