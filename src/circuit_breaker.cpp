#include "arf/circuit_breaker.hpp"

namespace arf {

std::string to_string(BreakerState s) {
  switch (s) {
    case BreakerState::closed: return "CLOSED";
    case BreakerState::open: return "OPEN";
    case BreakerState::half_open: return "HALF_OPEN";
  }
  return "CLOSED";
}

CircuitBreaker::CircuitBreaker(std::string name, BreakerConfig config, ClockFn clock)
    : name_(std::move(name)), config_(config), clock_(clock_or_system(std::move(clock))) {}

bool CircuitBreaker::recovery_elapsed_locked(uint64_t now) const {
  return now >= opened_at_ms_ && now - opened_at_ms_ >= config_.recovery_timeout_ms;
}

bool CircuitBreaker::allow() {
  const uint64_t now = clock_();
  std::lock_guard<std::mutex> lk(mu_);
  switch (state_) {
    case BreakerState::closed:
      return true;
    case BreakerState::open:
      if (recovery_elapsed_locked(now)) {
        state_ = BreakerState::half_open;
        trial_in_flight_ = true;
        log_event(LogLevel::info, "circuit_breaker", "breaker_half_open",
                  "recovery timeout elapsed; admitting one trial call", {{"breaker", name_}});
        return true;
      }
      ++rejected_;
      return false;
    case BreakerState::half_open:
      if (!trial_in_flight_) {
        trial_in_flight_ = true;
        return true;
      }
      ++rejected_;
      return false;
  }
  return false;
}

bool CircuitBreaker::would_allow() const {
  const uint64_t now = clock_();
  std::lock_guard<std::mutex> lk(mu_);
  switch (state_) {
    case BreakerState::closed: return true;
    case BreakerState::open: return recovery_elapsed_locked(now);
    case BreakerState::half_open: return !trial_in_flight_;
  }
  return false;
}

void CircuitBreaker::on_success() {
  std::lock_guard<std::mutex> lk(mu_);
  if (state_ != BreakerState::closed) {
    log_event(LogLevel::info, "circuit_breaker", "breaker_closed", "trial call succeeded",
              {{"breaker", name_}});
  }
  state_ = BreakerState::closed;
  consecutive_failures_ = 0;
  first_failure_ms_ = 0;
  trial_in_flight_ = false;
}

void CircuitBreaker::on_failure() {
  const uint64_t now = clock_();
  std::lock_guard<std::mutex> lk(mu_);
  if (state_ == BreakerState::half_open) {
    state_ = BreakerState::open;
    opened_at_ms_ = now;
    trial_in_flight_ = false;
    log_event(LogLevel::warn, "circuit_breaker", "breaker_reopened", "trial call failed",
              {{"breaker", name_}});
    return;
  }
  if (state_ == BreakerState::open) return;

  // Failures older than the observation window do not count toward the run.
  if (consecutive_failures_ == 0 ||
      (now >= first_failure_ms_ && now - first_failure_ms_ > config_.observation_window_ms)) {
    consecutive_failures_ = 0;
    first_failure_ms_ = now;
  }
  ++consecutive_failures_;
  if (consecutive_failures_ >= config_.failure_threshold) {
    state_ = BreakerState::open;
    opened_at_ms_ = now;
    log_event(LogLevel::warn, "circuit_breaker", "breaker_opened",
              "consecutive failure threshold reached",
              {{"breaker", name_}, {"failures", std::to_string(consecutive_failures_)}});
  }
}

BreakerState CircuitBreaker::state() const {
  std::lock_guard<std::mutex> lk(mu_);
  return state_;
}

uint32_t CircuitBreaker::consecutive_failures() const {
  std::lock_guard<std::mutex> lk(mu_);
  return consecutive_failures_;
}

uint64_t CircuitBreaker::rejected_calls() const {
  std::lock_guard<std::mutex> lk(mu_);
  return rejected_;
}

}  // namespace arf
