#include "arf/validator.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <map>
#include <string>

#include "arf/hash.hpp"
#include "arf/jsonlite.hpp"
#include "arf/observability.hpp"

namespace arf {

namespace {

struct FieldRule {
  const char* name;
  bool required;
  double min;
  double max;
  bool max_inclusive;
};

constexpr FieldRule kFieldRules[] = {
    {"latency_p99", true, 0.0, kMaxLatencyMs, false},
    {"error_rate", true, 0.0, 1.0, true},
    {"throughput", true, 0.0, INFINITY, true},
    {"cpu_util", false, 0.0, 1.0, true},
    {"memory_util", false, 0.0, 1.0, true},
    {"revenue_impact", false, 0.0, INFINITY, true},
    {"user_impact", false, 0.0, INFINITY, true},
};

ValidationResult reject(const std::string& field, const std::string& message) {
  ValidationResult r;
  r.ok = false;
  r.error = ErrorCode::validation_error;
  r.field = field;
  r.message = message;
  log_event(LogLevel::warn, "validator", "validation_rejected", message, {{"field", field}});
  return r;
}

std::optional<double> parse_number(const std::string& text) {
  if (text.empty()) return std::nullopt;
  char* end = nullptr;
  const double v = std::strtod(text.c_str(), &end);
  if (!end || *end != '\0') return std::nullopt;
  return v;
}

void assign_metric(Event& e, const std::string& name, double v) {
  if (name == "latency_p99") e.latency_p99 = v;
  else if (name == "error_rate") e.error_rate = v;
  else if (name == "throughput") e.throughput = v;
  else if (name == "cpu_util") e.cpu_util = v;
  else if (name == "memory_util") e.memory_util = v;
  else if (name == "revenue_impact") e.revenue_impact = v;
  else if (name == "user_impact") e.user_impact = v;
}

std::string format_raw_number(double v) {
  char buf[40];
  std::snprintf(buf, sizeof(buf), "%.17g", v);
  return buf;
}

std::string canonical_number(double v) {
  if (v == 0.0) v = 0.0;  // -0 and +0 share one encoding
  return format_raw_number(v);
}

}  // namespace

bool is_valid_component(const std::string& component) {
  if (component.empty() || component.size() > kMaxComponentLength) return false;
  for (char c : component) {
    const bool ok = (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-';
    if (!ok) return false;
  }
  return true;
}

ValidationResult validate_event(const RawEvent& raw, uint64_t timestamp_ms,
                                const StaticThresholds& thresholds) {
  auto comp = raw.find("component");
  if (comp == raw.end()) return reject("component", "component is required");
  if (!is_valid_component(comp->second)) {
    return reject("component", "component must be 1-255 chars of [a-z0-9-]");
  }

  Event e;
  e.component = comp->second;
  for (const auto& rule : kFieldRules) {
    auto it = raw.find(rule.name);
    if (it == raw.end() || it->second.empty()) {
      if (rule.required) return reject(rule.name, std::string(rule.name) + " is required");
      continue;
    }
    const auto v = parse_number(it->second);
    if (!v || !std::isfinite(*v)) {
      return reject(rule.name, std::string(rule.name) + " must be a finite number");
    }
    const bool above = rule.max_inclusive ? (*v > rule.max) : (*v >= rule.max);
    if (*v < rule.min || above) {
      return reject(rule.name, std::string(rule.name) + " out of range: " + it->second);
    }
    assign_metric(e, rule.name, *v);
  }

  e.timestamp_ms = timestamp_ms;
  e.severity = derive_severity(e, thresholds);
  e.fingerprint = event_fingerprint(e);

  ValidationResult r;
  r.ok = true;
  r.event = std::move(e);
  return r;
}

ValidationResult validate_event_json(const std::string& json, uint64_t timestamp_ms,
                                     const StaticThresholds& thresholds) {
  std::optional<jsonlite::JsonError> err;
  const auto obj = jsonlite::parse(json, &err);
  if (err) return reject("$", err->code + ": " + err->message);

  RawEvent raw;
  for (const auto& [key, value] : obj) {
    if (key != "component" && !is_known_metric(key)) continue;
    if (std::holds_alternative<std::string>(value.v)) {
      if (key != "component") return reject(key, key + " must be a number");
      raw[key] = std::get<std::string>(value.v);
    } else if (key == "component") {
      return reject(key, "component must be a string");
    } else if (std::holds_alternative<double>(value.v)) {
      raw[key] = format_raw_number(std::get<double>(value.v));
    } else if (std::holds_alternative<std::uint64_t>(value.v)) {
      raw[key] = std::to_string(std::get<std::uint64_t>(value.v));
    } else if (std::holds_alternative<std::nullptr_t>(value.v)) {
      continue;  // explicit null == absent optional
    } else {
      return reject(key, key + " must be a number");
    }
  }
  return validate_event(raw, timestamp_ms, thresholds);
}

// Metrics are written at round-trip precision so that values differing below
// the display precision of jsonlite::format_double still fingerprint apart.
// Keys are emitted in sorted order, matching jsonlite::to_json(Object).
std::string canonical_event(const Event& e) {
  std::map<std::string, std::string> fields;
  fields["component"] = jsonlite::to_json(jsonlite::Value{e.component});
  fields["latency_p99"] = canonical_number(e.latency_p99);
  fields["error_rate"] = canonical_number(e.error_rate);
  fields["throughput"] = canonical_number(e.throughput);
  if (e.cpu_util) fields["cpu_util"] = canonical_number(*e.cpu_util);
  if (e.memory_util) fields["memory_util"] = canonical_number(*e.memory_util);
  if (e.revenue_impact) fields["revenue_impact"] = canonical_number(*e.revenue_impact);
  if (e.user_impact) fields["user_impact"] = canonical_number(*e.user_impact);

  std::string out = "{";
  bool first = true;
  for (const auto& [key, value] : fields) {
    if (!first) out += ",";
    first = false;
    out += "\"" + key + "\":" + value;
  }
  out += "}";
  return out;
}

std::string event_fingerprint(const Event& e) {
  return hash_domain(kEventDomain, canonical_event(e));
}

Severity derive_severity(const Event& e, const StaticThresholds& t) {
  if (e.latency_p99 > t.latency_extreme_ms || e.error_rate > t.error_rate_critical) {
    return Severity::critical;
  }
  if (e.latency_p99 > t.latency_critical_ms || e.error_rate > t.error_rate_high ||
      e.cpu_util.value_or(0.0) > t.cpu_critical ||
      e.memory_util.value_or(0.0) > t.memory_critical) {
    return Severity::high;
  }
  if (e.latency_p99 > t.latency_warning_ms || e.error_rate > t.error_rate_warning ||
      e.cpu_util.value_or(0.0) > t.cpu_warning ||
      e.memory_util.value_or(0.0) > t.memory_warning) {
    return Severity::medium;
  }
  return Severity::low;
}

}  // namespace arf
