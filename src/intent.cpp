#include "arf/intent.hpp"

#include <algorithm>
#include <cstdio>

#include "arf/hash.hpp"
#include "arf/jsonlite.hpp"

namespace arf {

namespace {

std::string strip_control(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    const auto u = static_cast<unsigned char>(c);
    if (u < 0x20 || u == 0x7f) continue;
    out.push_back(c);
  }
  return out;
}

std::string format_score(double d) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.3f", d);
  return buf;
}

}  // namespace

std::optional<ActionProfile> action_profile(std::string_view action) {
  ActionProfile p;
  p.action = std::string(action);
  if (action == "restart_container") {
    p.confidence_weight = 1.0;
    p.safety_level = SafetyLevel::medium;
    p.default_parameters = {{"grace_period_seconds", "30"}, {"strategy", "rolling"}};
  } else if (action == "scale_out") {
    p.confidence_weight = 0.95;
    p.safety_level = SafetyLevel::low;
    p.default_parameters = {{"scale_factor", "2"}};
  } else if (action == "circuit_breaker") {
    p.confidence_weight = 0.9;
    p.safety_level = SafetyLevel::medium;
    p.default_parameters = {{"duration_seconds", "300"}, {"failure_threshold", "0.5"}};
  } else if (action == "traffic_shift") {
    p.confidence_weight = 0.85;
    p.safety_level = SafetyLevel::medium;
    p.blast_radius = 2;
    p.default_parameters = {{"percentage", "50"}, {"target", "standby"}};
  } else if (action == "rollback") {
    p.confidence_weight = 0.8;
    p.safety_level = SafetyLevel::high;
    p.default_parameters = {{"revision", "previous"}};
  } else if (action == "alert_team") {
    p.confidence_weight = 0.99;
    p.safety_level = SafetyLevel::low;
    p.blast_radius = 0;
    p.safe_for_business_hours = true;
    p.default_parameters = {{"channel", "oncall"}};
  } else {
    return std::nullopt;
  }
  return p;
}

std::map<std::string, std::string> sanitize_parameters(
    const std::map<std::string, std::string>& params) {
  std::map<std::string, std::string> out;
  for (const auto& [key, value] : params) {
    std::string k = strip_control(key);
    if (k.empty() || k.size() > kMaxParameterKeyLength) continue;
    std::string v = strip_control(value);
    if (v.size() > kMaxParameterValueLength) v.resize(kMaxParameterValueLength);
    out[k] = std::move(v);
  }
  return out;
}

std::string compute_intent_id(const std::string& fingerprint, const std::string& tool,
                              const std::string& component,
                              const std::map<std::string, std::string>& params) {
  jsonlite::Object p;
  for (const auto& [k, v] : params) p[k] = jsonlite::Value{v};
  jsonlite::Object doc;
  doc["component"] = jsonlite::Value{component};
  doc["fingerprint"] = jsonlite::Value{fingerprint};
  doc["parameters"] = jsonlite::Value{p};
  doc["tool"] = jsonlite::Value{tool};
  return short_id("intent_", hash_domain(kIntentDomain, jsonlite::to_json(doc)));
}

double intent_confidence(const ActionProfile& profile, uint32_t similar_incidents,
                         std::optional<double> historical_success_rate) {
  double c = kBaseConfidence * profile.confidence_weight;
  if (similar_incidents > 0) c = std::min(1.0, c * 1.1);
  if (historical_success_rate) {
    const double h = std::clamp(*historical_success_rate, 0.0, 1.0);
    c = 0.7 * c + 0.3 * h;
  }
  return std::clamp(c, 0.0, 1.0);
}

HealingIntent make_intent(const IntentInputs& in) {
  const Event& e = *in.event;
  const Classification& cls = *in.classification;

  // Unknown actions still become intents; the gateway's registry rejects
  // them so the denial is audited.
  ActionProfile profile = action_profile(in.action).value_or(ActionProfile{in.action});

  std::map<std::string, std::string> params = profile.default_parameters;
  if (in.action == "alert_team") params["severity"] = to_string(e.severity);

  HealingIntent intent;
  intent.tool = in.action;
  intent.component = e.component;
  intent.parameters = sanitize_parameters(params);
  intent.fingerprint = e.fingerprint;
  intent.incident_id = in.incident_id;
  intent.source_policy = in.policy ? in.policy->policy : std::string();
  intent.similar_incidents = in.similar_incidents;
  intent.intent_id =
      compute_intent_id(e.fingerprint, intent.tool, intent.component, intent.parameters);
  intent.confidence =
      intent_confidence(profile, in.similar_incidents, in.historical_success_rate);
  intent.risk.safety_level = profile.safety_level;
  intent.risk.blast_radius = profile.blast_radius;
  intent.risk.safe_for_business_hours = profile.safe_for_business_hours;

  std::string j = "Policy '" + intent.source_policy + "'";
  if (in.policy) j += " (priority " + std::to_string(in.policy->priority) + ")";
  j += " proposed " + in.action + " for " + e.component + ": anomaly score " +
       format_score(cls.score) + " (" + to_string(cls.bucket) + ")";
  if (in.similar_incidents > 0) {
    j += "; " + std::to_string(in.similar_incidents) + " similar incident(s) recalled";
  }
  if (in.historical_success_rate) {
    j += "; historical success rate " + format_score(*in.historical_success_rate);
  }
  j = strip_control(j);
  if (j.size() > kMaxJustificationLength) j.resize(kMaxJustificationLength);
  intent.justification = std::move(j);
  return intent;
}

}  // namespace arf
