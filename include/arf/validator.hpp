#pragma once

// arf/validator.hpp — Event validation, canonicalization and fingerprinting.
//
// Pure functions. The only side effect is a "validation_rejected" log line
// when an event is dropped. Rejected events are never forwarded.
//
// FIELD CONTRACT:
//   component    required, 1..255 chars of [a-z0-9-]
//   latency_p99  required, milliseconds in [0, 300000)
//   error_rate   required, [0, 1]
//   throughput   required, >= 0
//   cpu_util     optional, [0, 1]
//   memory_util  optional, [0, 1]
//   revenue_impact, user_impact  optional, >= 0
//   Unknown keys are ignored. Every number must be finite.

#include <string>

#include "arf/types.hpp"

namespace arf {

struct ValidationResult {
  bool ok{false};
  Event event;                        // valid only when ok
  ErrorCode error{ErrorCode::none};
  std::string field;                  // offending field when !ok
  std::string message;
};

constexpr size_t kMaxComponentLength = 255;
constexpr double kMaxLatencyMs = 300000.0;

ValidationResult validate_event(const RawEvent& raw, uint64_t timestamp_ms,
                                const StaticThresholds& thresholds = {});

// Same contract for a JSON object document.
ValidationResult validate_event_json(const std::string& json, uint64_t timestamp_ms,
                                     const StaticThresholds& thresholds = {});

bool is_valid_component(const std::string& component);

// Canonical encoding: sorted-key JSON over the metric fields and component.
// Timestamp and severity are excluded.
std::string canonical_event(const Event& e);
std::string event_fingerprint(const Event& e);

Severity derive_severity(const Event& e, const StaticThresholds& thresholds);

}  // namespace arf
