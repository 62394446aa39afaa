#pragma once

// arf/intent.hpp — HealingIntent construction.
//
// An intent is a declarative proposal and never an execution. Its id is
// BLAKE3 over (fingerprint, tool, component, canonical parameters) under the
// intent domain, so re-proposing the same action for the same condition
// yields the same id and the gateway can recognise the duplicate.
//
// Parameters and justification are derived only from the event and the
// firing policy; adaptive state (baselines, recall) influences confidence and
// justification text but never the id.

#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "arf/policy.hpp"
#include "arf/types.hpp"

namespace arf {

// Static knowledge about a remediation action.
struct ActionProfile {
  std::string action;
  double confidence_weight{0.5};
  SafetyLevel safety_level{SafetyLevel::high};
  uint32_t blast_radius{1};
  bool safe_for_business_hours{false};
  std::map<std::string, std::string> default_parameters;
};

// nullopt for an action with no built-in profile.
std::optional<ActionProfile> action_profile(std::string_view action);

constexpr size_t kMaxParameterKeyLength = 100;
constexpr size_t kMaxParameterValueLength = 10000;
constexpr size_t kMaxJustificationLength = 1000;
constexpr double kBaseConfidence = 0.85;

// Drops empty or overlong keys, truncates values, strips control characters.
std::map<std::string, std::string> sanitize_parameters(
    const std::map<std::string, std::string>& params);

std::string compute_intent_id(const std::string& fingerprint, const std::string& tool,
                              const std::string& component,
                              const std::map<std::string, std::string>& params);

struct IntentInputs {
  const Event* event{nullptr};
  const Classification* classification{nullptr};
  std::string incident_id;
  const FiredPolicy* policy{nullptr};
  std::string action;
  uint32_t similar_incidents{0};
  std::optional<double> historical_success_rate;  // engaged when >= 1 attempt
};

double intent_confidence(const ActionProfile& profile, uint32_t similar_incidents,
                         std::optional<double> historical_success_rate);

HealingIntent make_intent(const IntentInputs& in);

}  // namespace arf
