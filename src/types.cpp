#include "arf/types.hpp"

#include <chrono>

#include "arf/jsonlite.hpp"

namespace arf {

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::none: return "";
    case ErrorCode::validation_error: return "validation_error";
    case ErrorCode::classification_error: return "classification_error";
    case ErrorCode::memory_unavailable: return "memory_unavailable";
    case ErrorCode::policy_evaluation_error: return "policy_evaluation_error";
    case ErrorCode::gateway_denied: return "gateway_denied";
    case ErrorCode::tool_execution_error: return "tool_execution_error";
    case ErrorCode::tool_timeout: return "tool_timeout";
    case ErrorCode::unknown_tool: return "unknown_tool";
    case ErrorCode::unknown_incident: return "unknown_incident";
    case ErrorCode::approval_not_found: return "approval_not_found";
    case ErrorCode::approval_expired: return "approval_expired";
    case ErrorCode::circuit_open: return "circuit_open";
    case ErrorCode::cancelled: return "cancelled";
    case ErrorCode::analysis_timeout: return "analysis_timeout";
    case ErrorCode::config_invalid: return "config_invalid";
    case ErrorCode::json_parse_error: return "json_parse_error";
    case ErrorCode::json_duplicate_key: return "json_duplicate_key";
  }
  return "";
}

uint64_t system_now_ms() {
  using SC = std::chrono::system_clock;
  return static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(SC::now().time_since_epoch())
          .count());
}

ClockFn clock_or_system(ClockFn clock) {
  if (clock) return clock;
  return [] { return system_now_ms(); };
}

std::string to_string(Severity s) {
  switch (s) {
    case Severity::low: return "LOW";
    case Severity::medium: return "MEDIUM";
    case Severity::high: return "HIGH";
    case Severity::critical: return "CRITICAL";
  }
  return "LOW";
}

std::string to_string(AnomalyBucket b) {
  switch (b) {
    case AnomalyBucket::normal: return "NORMAL";
    case AnomalyBucket::degrading: return "DEGRADING";
    case AnomalyBucket::critical: return "CRITICAL";
    case AnomalyBucket::systemic: return "SYSTEMIC";
  }
  return "NORMAL";
}

std::optional<AnomalyBucket> bucket_from_string(std::string_view s) {
  if (s == "NORMAL") return AnomalyBucket::normal;
  if (s == "DEGRADING") return AnomalyBucket::degrading;
  if (s == "CRITICAL") return AnomalyBucket::critical;
  if (s == "SYSTEMIC") return AnomalyBucket::systemic;
  return std::nullopt;
}

AnomalyBucket bucket_for_score(double score) {
  if (score >= 0.85) return AnomalyBucket::systemic;
  if (score >= 0.6) return AnomalyBucket::critical;
  if (score >= 0.3) return AnomalyBucket::degrading;
  return AnomalyBucket::normal;
}

std::optional<double> metric_value(const Event& e, std::string_view metric) {
  if (metric == "latency_p99") return e.latency_p99;
  if (metric == "error_rate") return e.error_rate;
  if (metric == "throughput") return e.throughput;
  if (metric == "cpu_util") return e.cpu_util;
  if (metric == "memory_util") return e.memory_util;
  if (metric == "revenue_impact") return e.revenue_impact;
  if (metric == "user_impact") return e.user_impact;
  return std::nullopt;
}

bool is_known_metric(std::string_view metric) {
  return metric == "latency_p99" || metric == "error_rate" || metric == "throughput" ||
         metric == "cpu_util" || metric == "memory_util" || metric == "revenue_impact" ||
         metric == "user_impact";
}

std::string to_string(ExecutionMode m) {
  switch (m) {
    case ExecutionMode::advisory: return "ADVISORY";
    case ExecutionMode::approval: return "APPROVAL";
    case ExecutionMode::autonomous: return "AUTONOMOUS";
  }
  return "ADVISORY";
}

std::optional<ExecutionMode> execution_mode_from_string(std::string_view s) {
  if (s == "ADVISORY" || s == "advisory") return ExecutionMode::advisory;
  if (s == "APPROVAL" || s == "approval") return ExecutionMode::approval;
  if (s == "AUTONOMOUS" || s == "autonomous") return ExecutionMode::autonomous;
  return std::nullopt;
}

std::string to_string(SafetyLevel s) {
  switch (s) {
    case SafetyLevel::low: return "low";
    case SafetyLevel::medium: return "medium";
    case SafetyLevel::high: return "high";
  }
  return "medium";
}

std::string to_string(GatewayStatus s) {
  switch (s) {
    case GatewayStatus::received: return "RECEIVED";
    case GatewayStatus::validating: return "VALIDATING";
    case GatewayStatus::denied: return "DENIED";
    case GatewayStatus::pending_approval: return "PENDING_APPROVAL";
    case GatewayStatus::approved: return "APPROVED";
    case GatewayStatus::advisory_only: return "ADVISORY_ONLY";
    case GatewayStatus::executing: return "EXECUTING";
    case GatewayStatus::completed: return "COMPLETED";
    case GatewayStatus::failed: return "FAILED";
    case GatewayStatus::rejected: return "REJECTED";
    case GatewayStatus::expired: return "EXPIRED";
  }
  return "RECEIVED";
}

std::string intent_to_json(const HealingIntent& intent) {
  jsonlite::Object params;
  for (const auto& [k, v] : intent.parameters) params[k] = jsonlite::Value{v};

  jsonlite::Object risk;
  risk["safety_level"] = jsonlite::Value{to_string(intent.risk.safety_level)};
  risk["blast_radius"] = jsonlite::Value{static_cast<std::uint64_t>(intent.risk.blast_radius)};
  risk["safe_for_business_hours"] = jsonlite::Value{intent.risk.safe_for_business_hours};

  jsonlite::Object o;
  o["intent_id"] = jsonlite::Value{intent.intent_id};
  o["tool"] = jsonlite::Value{intent.tool};
  o["component"] = jsonlite::Value{intent.component};
  o["parameters"] = jsonlite::Value{params};
  o["justification"] = jsonlite::Value{intent.justification};
  o["confidence"] = jsonlite::Value{intent.confidence};
  o["risk"] = jsonlite::Value{risk};
  o["incident_id"] = jsonlite::Value{intent.incident_id};
  o["source_policy"] = jsonlite::Value{intent.source_policy};
  o["similar_incidents"] = jsonlite::Value{static_cast<std::uint64_t>(intent.similar_incidents)};
  return jsonlite::to_json(o);
}

}  // namespace arf
