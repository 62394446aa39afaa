#pragma once

// arf/config.hpp — Engine configuration: JSON file, ARF_* environment
// overrides, validation.
//
// LOAD ORDER:
//   defaults → JSON document (load_config_file / parse_config)
//            → environment (apply_env_overrides) → validate_config
//
// ENVIRONMENT:
//   ARF_MAX_INCIDENTS        memory.max_incidents
//   ARF_ANALYSIS_TIMEOUT_MS  pipeline.analysis_timeout_ms
//   ARF_AUDIT_LOG            audit.path (NDJSON sink)
//   ARF_BUSINESS_HOURS       "off" or "START-END" in hours, e.g. "9-17"
//   ARF_MAX_BLAST_RADIUS     gateway.max_blast_radius
//
// The execution capability is deliberately absent: it is supplied to
// EngineContext::create() by the host after its own entitlement check.

#include <cstdint>
#include <string>
#include <vector>

#include "arf/circuit_breaker.hpp"
#include "arf/classifier.hpp"
#include "arf/gateway.hpp"
#include "arf/impact.hpp"
#include "arf/memory.hpp"
#include "arf/policy.hpp"
#include "arf/types.hpp"

namespace arf {

struct EngineConfig {
  ClassifierConfig classifier;
  MemoryConfig memory;
  size_t embedding_dimension{384};
  size_t recall_k{5};
  BreakerConfig memory_breaker;
  PolicyEngineConfig policy_engine;
  std::vector<HealingPolicy> policies = default_policies();
  GatewayConfig gateway;
  uint64_t tool_timeout_ms{30000};
  uint64_t analysis_timeout_ms{10000};
  ExecutionMode default_mode{ExecutionMode::advisory};
  size_t recorder_queue{1024};
  std::string audit_log_path;
  ImpactConfig impact;
};

struct ConfigResult {
  bool ok{false};
  EngineConfig config;
  ErrorCode error{ErrorCode::none};
  std::vector<std::string> errors;
};

ConfigResult parse_config(const std::string& json);
ConfigResult load_config_file(const std::string& path);

// Returns one message per malformed variable; valid variables still apply.
std::vector<std::string> apply_env_overrides(EngineConfig& config);

// Empty when the configuration is usable.
std::vector<std::string> validate_config(const EngineConfig& config);

// Full startup sequence. An empty path skips the file step.
ConfigResult load_config(const std::string& path);

std::string config_to_json(const EngineConfig& config);

}  // namespace arf
