#include "ftr/resilience/circuit_breaker.h"

#include <string>

namespace ftr::resilience {

std::string_view to_string(const CircuitState state) {
  switch (state) {
    case CircuitState::kClosed:
      return "closed";
    case CircuitState::kOpen:
      return "open";
    case CircuitState::kHalfOpen:
      return "half_open";
  }
  return "closed";
}

core::Result<bool, core::Error> validate_breaker_config(const CircuitBreakerConfig& config) {
  using R = core::Result<bool, core::Error>;

  if (config.failure_threshold < 1) {
    return R::err(
        core::make_error(core::ErrorKind::kInvalidConfig, "failure_threshold must be >= 1"));
  }
  if (config.open_duration.count() <= 0) {
    return R::err(
        core::make_error(core::ErrorKind::kInvalidConfig, "open_duration must be positive"));
  }
  return R::ok(true);
}

CircuitBreaker::CircuitBreaker(CircuitBreakerConfig config, core::IClock& clock)
    : config_(config), clock_(clock) {}

void CircuitBreaker::open_locked(const core::Instant now) {
  state_ = CircuitState::kOpen;
  opened_at_ = now;
  trial_in_flight_ = false;
}

core::Result<CircuitPermit, core::Error> CircuitBreaker::try_acquire() {
  using R = core::Result<CircuitPermit, core::Error>;

  std::lock_guard<std::mutex> lock(mutex_);
  switch (state_) {
    case CircuitState::kClosed:
      return R::ok(CircuitPermit{false});

    case CircuitState::kOpen: {
      const core::Instant now = clock_.now();
      if (opened_at_.has_value() && now - *opened_at_ < config_.open_duration) {
        return R::err(
            core::make_error(core::ErrorKind::kCircuitOpen, "circuit open; failing fast"));
      }
      state_ = CircuitState::kHalfOpen;
      trial_in_flight_ = true;
      return R::ok(CircuitPermit{true});
    }

    case CircuitState::kHalfOpen:
      if (trial_in_flight_) {
        return R::err(core::make_error(core::ErrorKind::kCircuitOpen,
                                       "circuit half-open; trial call already in flight"));
      }
      trial_in_flight_ = true;
      return R::ok(CircuitPermit{true});
  }
  return R::err(core::make_error(core::ErrorKind::kCircuitOpen, "circuit state unknown"));
}

void CircuitBreaker::record_success(const CircuitPermit& permit) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (permit.trial) {
    if (state_ == CircuitState::kHalfOpen) {
      state_ = CircuitState::kClosed;
      consecutive_failures_ = 0;
      opened_at_.reset();
      trial_in_flight_ = false;
    }
    return;
  }
  if (state_ == CircuitState::kClosed) {
    consecutive_failures_ = 0;
  }
}

bool CircuitBreaker::record_failure(const CircuitPermit& permit) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (permit.trial) {
    if (state_ != CircuitState::kHalfOpen) {
      return false;
    }
    open_locked(clock_.now());
    return true;
  }
  if (state_ != CircuitState::kClosed) {
    return false;
  }
  ++consecutive_failures_;
  if (consecutive_failures_ >= config_.failure_threshold) {
    open_locked(clock_.now());
    return true;
  }
  return false;
}

void CircuitBreaker::release(const CircuitPermit& permit) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (permit.trial && state_ == CircuitState::kHalfOpen) {
    trial_in_flight_ = false;
  }
}

CircuitSnapshot CircuitBreaker::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return CircuitSnapshot{state_, consecutive_failures_, opened_at_, trial_in_flight_};
}

}  // namespace ftr::resilience
