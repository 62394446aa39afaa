#pragma once

// arf/circuit_breaker.hpp — Explicit CLOSED / OPEN / HALF_OPEN state machine.
//
// TRANSITIONS:
//   CLOSED    --failure_threshold consecutive failures within observation_window--> OPEN
//   OPEN      --recovery_timeout elapsed, next allow()--> HALF_OPEN (one trial call)
//   HALF_OPEN --trial success--> CLOSED
//   HALF_OPEN --trial failure--> OPEN (recovery timer restarts)
//
// While OPEN, allow() returns false immediately and the protected call is never
// invoked. In HALF_OPEN exactly one caller holds the trial permit; concurrent
// callers are rejected until it reports back.
//
// Each protected resource owns its breaker. All state is guarded by an
// internal mutex that is never held while the protected call runs.

#include <cstdint>
#include <exception>
#include <mutex>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>

#include "arf/observability.hpp"
#include "arf/types.hpp"

namespace arf {

enum class BreakerState { closed, open, half_open };

std::string to_string(BreakerState s);

struct BreakerConfig {
  uint32_t failure_threshold{3};
  uint64_t observation_window_ms{60000};
  uint64_t recovery_timeout_ms{30000};
};

template <typename T>
struct BreakerResult {
  bool available{false};            // false = fast-failed, fn not invoked
  std::optional<T> value;           // engaged when the call succeeded
  ErrorCode error{ErrorCode::none};
  std::string message;

  bool ok() const { return value.has_value(); }
};

class CircuitBreaker {
 public:
  explicit CircuitBreaker(std::string name, BreakerConfig config = {}, ClockFn clock = {});

  // Acquire permission for one call. OPEN → HALF_OPEN transition happens here.
  bool allow();

  // Non-consuming view of whether allow() would currently succeed.
  bool would_allow() const;

  void on_success();
  void on_failure();

  BreakerState state() const;
  uint32_t consecutive_failures() const;
  uint64_t rejected_calls() const;
  const std::string& name() const { return name_; }

  // Protected call. fn returns std::optional<T>; nullopt counts as a failure,
  // as does any throw (logged, converted to an error result), so a HALF_OPEN
  // trial permit is always handed back.
  template <typename Fn>
  auto call(Fn&& fn) -> BreakerResult<typename std::invoke_result_t<Fn>::value_type> {
    using T = typename std::invoke_result_t<Fn>::value_type;
    BreakerResult<T> r;
    if (!allow()) {
      r.error = ErrorCode::circuit_open;
      r.message = name_ + " circuit open";
      return r;
    }
    r.available = true;
    try {
      r.value = fn();
    } catch (const std::exception& ex) {
      log_event(LogLevel::error, "circuit_breaker", "protected_call_threw", ex.what(),
                {{"breaker", name_}});
      r.value.reset();
      r.message = ex.what();
    } catch (...) {
      log_event(LogLevel::error, "circuit_breaker", "protected_call_threw",
                "non-standard exception", {{"breaker", name_}});
      r.value.reset();
      r.message = name_ + " call threw a non-standard exception";
    }
    if (r.value) {
      on_success();
    } else {
      on_failure();
      if (r.message.empty()) r.message = name_ + " call failed";
    }
    return r;
  }

 private:
  bool recovery_elapsed_locked(uint64_t now) const;

  std::string name_;
  BreakerConfig config_;
  ClockFn clock_;

  mutable std::mutex mu_;
  BreakerState state_{BreakerState::closed};
  uint32_t consecutive_failures_{0};
  uint64_t first_failure_ms_{0};
  uint64_t opened_at_ms_{0};
  bool trial_in_flight_{false};
  uint64_t rejected_{0};
};

}  // namespace arf
