#pragma once

#include "ftr/core/clock.h"
#include "ftr/core/error.h"
#include "ftr/core/result.h"

#include <chrono>
#include <mutex>
#include <optional>
#include <string_view>

namespace ftr::resilience {

enum class CircuitState {
  kClosed,
  kOpen,
  kHalfOpen,
};

[[nodiscard]] std::string_view to_string(CircuitState state);

struct CircuitBreakerConfig {
  int failure_threshold{5};
  std::chrono::milliseconds open_duration{std::chrono::seconds{60}};
};

[[nodiscard]] core::Result<bool, core::Error> validate_breaker_config(
    const CircuitBreakerConfig& config);

// CircuitPermit is handed to an admitted caller and must be returned through exactly one of
// record_success, record_failure or release.
struct CircuitPermit {
  bool trial{false};  // the single half-open trial call
};

struct CircuitSnapshot {
  CircuitState state{CircuitState::kClosed};
  int consecutive_failures{0};
  std::optional<core::Instant> opened_at;
  bool trial_in_flight{false};
};

// CircuitBreaker is the per-provider failure tracker shared by all sessions.
//
//   closed    --threshold consecutive failures-->   open
//   open      --open_duration elapsed, next call--> half_open (that call is the trial)
//   half_open --trial succeeds-->                   closed
//   half_open --trial fails-->                      open (timer restarts)
//
// Every transition happens inside one critical section. Outcomes of non-trial calls that
// were admitted while closed but finish after the circuit opened are ignored, so a burst
// of late failures cannot push opened_at forward.
class CircuitBreaker {
 public:
  CircuitBreaker(CircuitBreakerConfig config, core::IClock& clock);

  CircuitBreaker(const CircuitBreaker&) = delete;
  CircuitBreaker& operator=(const CircuitBreaker&) = delete;
  CircuitBreaker(CircuitBreaker&&) = delete;
  CircuitBreaker& operator=(CircuitBreaker&&) = delete;
  ~CircuitBreaker() = default;

  // try_acquire admits the caller or fails with kCircuitOpen without any side effect on
  // the failure count.
  [[nodiscard]] core::Result<CircuitPermit, core::Error> try_acquire();

  void record_success(const CircuitPermit& permit);

  // record_failure returns true when this failure opened (or re-opened) the circuit.
  bool record_failure(const CircuitPermit& permit);

  // release returns a permit whose call never completed (cancelled, or stopped before the
  // network attempt). Not counted as a failure; an abandoned trial frees the trial slot.
  void release(const CircuitPermit& permit);

  [[nodiscard]] CircuitSnapshot snapshot() const;
  [[nodiscard]] const CircuitBreakerConfig& config() const { return config_; }

 private:
  CircuitBreakerConfig config_;
  core::IClock& clock_;

  mutable std::mutex mutex_;
  CircuitState state_{CircuitState::kClosed};
  int consecutive_failures_{0};
  std::optional<core::Instant> opened_at_;
  bool trial_in_flight_{false};

  void open_locked(core::Instant now);
};

}  // namespace ftr::resilience
