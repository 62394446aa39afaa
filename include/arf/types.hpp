#pragma once

// arf/types.hpp — Core value types for the ARF decision-and-safety engine.
//
// ARCHITECTURE NOTES:
//
// DETERMINISM GUARANTEES:
//   - Event canonicalization is deterministic: same field values → same canonical
//     JSON → same fingerprint. Timestamps and derived severity are NOT part of the
//     canonical form, so a repeated report of the same condition deduplicates.
//   - HealingIntent ids derive from (fingerprint, tool, component, parameters).
//     Identical proposals always produce identical ids.
//
// CONCURRENCY NOTES:
//   - Event, Classification, HealingIntent are value types with no shared state.
//   - Long-lived mutable state lives only in IncidentMemory, PolicyEngine trackers,
//     AnomalyClassifier baselines and SafetyGateway. Each owns its own locking.
//
// MEMORY OWNERSHIP:
//   - All string members are value-owned. No borrowed references.
//   - Components are shared via std::shared_ptr from EngineContext.
//
// EXTENSION_POINT: metric_catalogue
//   Current: fixed metric set (latency_p99, error_rate, throughput, cpu_util,
//   memory_util). Adding a metric requires a FINGERPRINT_VERSION bump because
//   the canonical encoding changes.

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace arf {

enum class ErrorCode {
  none,
  validation_error,
  classification_error,
  memory_unavailable,
  policy_evaluation_error,
  gateway_denied,
  tool_execution_error,
  tool_timeout,
  unknown_tool,
  unknown_incident,
  approval_not_found,
  approval_expired,
  circuit_open,
  cancelled,
  analysis_timeout,
  config_invalid,
  json_parse_error,
  json_duplicate_key,
};

std::string to_string(ErrorCode code);

// Wall-clock source in unix milliseconds. Every time-dependent component takes
// one so cooldowns, rate windows and breaker timeouts are testable.
using ClockFn = std::function<uint64_t()>;

uint64_t system_now_ms();

// Returns clock if set, otherwise system_now_ms.
ClockFn clock_or_system(ClockFn clock);

// ---------------------------------------------------------------------------
// Severity — coarse label derived by the validator from static thresholds
// ---------------------------------------------------------------------------
enum class Severity { low, medium, high, critical };

std::string to_string(Severity s);

// ---------------------------------------------------------------------------
// AnomalyBucket — classifier output
// ---------------------------------------------------------------------------
// NORMAL < 0.3 <= DEGRADING < 0.6 <= CRITICAL < 0.85 <= SYSTEMIC
enum class AnomalyBucket { normal = 0, degrading = 1, critical = 2, systemic = 3 };

std::string to_string(AnomalyBucket b);
std::optional<AnomalyBucket> bucket_from_string(std::string_view s);
AnomalyBucket bucket_for_score(double score);

// ---------------------------------------------------------------------------
// StaticThresholds — fixed operating thresholds
// ---------------------------------------------------------------------------
struct StaticThresholds {
  double latency_warning_ms{150.0};
  double latency_critical_ms{300.0};
  double latency_extreme_ms{500.0};
  double error_rate_warning{0.05};
  double error_rate_high{0.15};
  double error_rate_critical{0.3};
  double cpu_warning{0.8};
  double cpu_critical{0.9};
  double memory_warning{0.8};
  double memory_critical{0.9};
};

// ---------------------------------------------------------------------------
// Event — canonical, validated telemetry record
// ---------------------------------------------------------------------------
struct Event {
  std::string component;
  double latency_p99{0.0};  // milliseconds, [0, 300000)
  double error_rate{0.0};   // [0, 1]
  double throughput{0.0};   // requests per second, >= 0
  std::optional<double> cpu_util;
  std::optional<double> memory_util;
  std::optional<double> revenue_impact;
  std::optional<double> user_impact;
  Severity severity{Severity::low};
  uint64_t timestamp_ms{0};
  std::string fingerprint;  // 64-char BLAKE3 hex over canonical_event()
};

// Metric lookup by name. Returns nullopt for an unknown metric or an absent
// optional metric.
std::optional<double> metric_value(const Event& e, std::string_view metric);
bool is_known_metric(std::string_view metric);

// Raw ingestion input: field name → textual value.
using RawEvent = std::map<std::string, std::string>;

// ---------------------------------------------------------------------------
// Classification
// ---------------------------------------------------------------------------
struct MetricScore {
  std::string metric;
  double static_score{0.0};
  double dynamic_score{0.0};
  double score{0.0};
};

struct Classification {
  double score{0.0};
  AnomalyBucket bucket{AnomalyBucket::normal};
  std::vector<MetricScore> metrics;
  bool used_static_only{true};
  ErrorCode error{ErrorCode::none};  // classification_error when baseline was reset
};

// ---------------------------------------------------------------------------
// Execution ladder
// ---------------------------------------------------------------------------
enum class ExecutionMode { advisory, approval, autonomous };

std::string to_string(ExecutionMode m);
std::optional<ExecutionMode> execution_mode_from_string(std::string_view s);

enum class SafetyLevel { low, medium, high };

std::string to_string(SafetyLevel s);

enum class GatewayStatus {
  received,
  validating,
  denied,
  pending_approval,
  approved,
  advisory_only,
  executing,
  completed,
  failed,
  rejected,
  expired,
};

std::string to_string(GatewayStatus s);

// ---------------------------------------------------------------------------
// HealingIntent — immutable declarative proposal
// ---------------------------------------------------------------------------
struct RiskProfile {
  SafetyLevel safety_level{SafetyLevel::medium};
  uint32_t blast_radius{1};  // components/instances affected
  bool safe_for_business_hours{false};
};

struct HealingIntent {
  std::string intent_id;
  std::string tool;
  std::string component;
  std::map<std::string, std::string> parameters;
  std::string justification;
  double confidence{0.0};
  RiskProfile risk;
  std::string incident_id;
  std::string fingerprint;
  std::string source_policy;
  uint32_t similar_incidents{0};
};

std::string intent_to_json(const HealingIntent& intent);

// ---------------------------------------------------------------------------
// BusinessImpact — produced by an injected estimator
// ---------------------------------------------------------------------------
struct BusinessImpact {
  double revenue_loss_estimate{0.0};
  uint64_t affected_users_estimate{0};
  std::string severity_level{"LOW"};
  double throughput_reduction_pct{0.0};
};

using BusinessImpactFn =
    std::function<BusinessImpact(const Event&, const Classification&)>;

}  // namespace arf
