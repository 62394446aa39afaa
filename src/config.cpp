#include "arf/config.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>

#include "arf/jsonlite.hpp"
#include "arf/observability.hpp"
#include "arf/version.hpp"

namespace arf {

namespace {

using jsonlite::Object;
using jsonlite::Value;

void read_breaker(const Object* o, BreakerConfig& b) {
  if (!o) return;
  b.failure_threshold =
      static_cast<uint32_t>(jsonlite::get_u64(*o, "failure_threshold", b.failure_threshold));
  b.observation_window_ms = jsonlite::get_u64(*o, "observation_window_ms", b.observation_window_ms);
  b.recovery_timeout_ms = jsonlite::get_u64(*o, "recovery_timeout_ms", b.recovery_timeout_ms);
}

Object breaker_json(const BreakerConfig& b) {
  Object o;
  o["failure_threshold"] = Value{static_cast<std::uint64_t>(b.failure_threshold)};
  o["observation_window_ms"] = Value{static_cast<std::uint64_t>(b.observation_window_ms)};
  o["recovery_timeout_ms"] = Value{static_cast<std::uint64_t>(b.recovery_timeout_ms)};
  return o;
}

std::optional<uint64_t> env_u64(const char* name, std::vector<std::string>& errors) {
  const char* e = std::getenv(name);
  if (!e || !*e) return std::nullopt;
  char* end = nullptr;
  const unsigned long long v = std::strtoull(e, &end, 10);
  if (!end || *end != '\0' || e[0] == '-') {
    errors.push_back(std::string(name) + " must be a non-negative integer");
    return std::nullopt;
  }
  return static_cast<uint64_t>(v);
}

}  // namespace

ConfigResult parse_config(const std::string& json) {
  ConfigResult r;
  std::optional<jsonlite::JsonError> err;
  const Object doc = jsonlite::parse(json, &err);
  if (err) {
    r.error = err->code == "json_duplicate_key" ? ErrorCode::json_duplicate_key
                                                : ErrorCode::json_parse_error;
    r.errors.push_back(err->code + ": " + err->message);
    return r;
  }

  EngineConfig& c = r.config;

  if (const Object* t = jsonlite::get_object(doc, "thresholds")) {
    StaticThresholds& s = c.classifier.thresholds;
    s.latency_warning_ms = jsonlite::get_double(*t, "latency_warning_ms", s.latency_warning_ms);
    s.latency_critical_ms = jsonlite::get_double(*t, "latency_critical_ms", s.latency_critical_ms);
    s.latency_extreme_ms = jsonlite::get_double(*t, "latency_extreme_ms", s.latency_extreme_ms);
    s.error_rate_warning = jsonlite::get_double(*t, "error_rate_warning", s.error_rate_warning);
    s.error_rate_high = jsonlite::get_double(*t, "error_rate_high", s.error_rate_high);
    s.error_rate_critical = jsonlite::get_double(*t, "error_rate_critical", s.error_rate_critical);
    s.cpu_warning = jsonlite::get_double(*t, "cpu_warning", s.cpu_warning);
    s.cpu_critical = jsonlite::get_double(*t, "cpu_critical", s.cpu_critical);
    s.memory_warning = jsonlite::get_double(*t, "memory_warning", s.memory_warning);
    s.memory_critical = jsonlite::get_double(*t, "memory_critical", s.memory_critical);
  }
  if (const Object* w = jsonlite::get_object(doc, "weights")) {
    MetricWeights& m = c.classifier.weights;
    m.latency = jsonlite::get_double(*w, "latency", m.latency);
    m.error_rate = jsonlite::get_double(*w, "error_rate", m.error_rate);
    m.throughput = jsonlite::get_double(*w, "throughput", m.throughput);
    m.cpu = jsonlite::get_double(*w, "cpu", m.cpu);
    m.memory = jsonlite::get_double(*w, "memory", m.memory);
  }
  if (const Object* k = jsonlite::get_object(doc, "classifier")) {
    c.classifier.alpha = jsonlite::get_double(*k, "alpha", c.classifier.alpha);
    c.classifier.warmup_samples =
        static_cast<uint32_t>(jsonlite::get_u64(*k, "warmup_samples", c.classifier.warmup_samples));
    c.classifier.max_components = jsonlite::get_u64(*k, "max_components", c.classifier.max_components);
  }
  if (const Object* m = jsonlite::get_object(doc, "memory")) {
    c.memory.max_incidents = jsonlite::get_u64(*m, "max_incidents", c.memory.max_incidents);
    c.memory.outcome_bucket_ms = jsonlite::get_u64(*m, "outcome_bucket_ms", c.memory.outcome_bucket_ms);
    c.memory.max_lessons_length =
        jsonlite::get_u64(*m, "max_lessons_length", c.memory.max_lessons_length);
    c.embedding_dimension = jsonlite::get_u64(*m, "embedding_dimension", c.embedding_dimension);
    c.recall_k = jsonlite::get_u64(*m, "recall_k", c.recall_k);
    read_breaker(jsonlite::get_object(*m, "breaker"), c.memory_breaker);
  }
  if (const Object* p = jsonlite::get_object(doc, "policy_engine")) {
    c.policy_engine.max_tracked_components =
        jsonlite::get_u64(*p, "max_tracked_components", c.policy_engine.max_tracked_components);
  }
  if (const jsonlite::Array* arr = jsonlite::get_array(doc, "policies")) {
    Object pdoc;
    pdoc["schema_version"] = Value{static_cast<std::uint64_t>(
        jsonlite::get_u64(doc, "policy_schema_version", version::POLICY_SCHEMA_VERSION))};
    pdoc["policies"] = Value{*arr};
    PolicyLoadResult pl = load_policies(pdoc);
    if (!pl.ok) {
      r.error = ErrorCode::config_invalid;
      r.errors.insert(r.errors.end(), pl.errors.begin(), pl.errors.end());
      return r;
    }
    // Individually malformed policies were skipped and logged.
    c.policies = std::move(pl.policies);
  }
  if (const Object* g = jsonlite::get_object(doc, "gateway")) {
    GatewayConfig& gw = c.gateway;
    if (jsonlite::get_array(*g, "blacklist")) gw.blacklist = jsonlite::get_string_array(*g, "blacklist");
    gw.max_blast_radius =
        static_cast<uint32_t>(jsonlite::get_u64(*g, "max_blast_radius", gw.max_blast_radius));
    gw.tool_cooldown_ms = jsonlite::get_u64(*g, "tool_cooldown_ms", gw.tool_cooldown_ms);
    gw.approval_expiry_ms = jsonlite::get_u64(*g, "approval_expiry_ms", gw.approval_expiry_ms);
    gw.duplicate_window_ms = jsonlite::get_u64(*g, "duplicate_window_ms", gw.duplicate_window_ms);
    c.tool_timeout_ms = jsonlite::get_u64(*g, "tool_timeout_ms", c.tool_timeout_ms);
    if (const Object* bh = jsonlite::get_object(*g, "business_hours")) {
      gw.business_hours.enabled = jsonlite::get_bool(*bh, "enabled", gw.business_hours.enabled);
      gw.business_hours.start_hour =
          static_cast<int>(jsonlite::get_double(*bh, "start_hour", gw.business_hours.start_hour));
      gw.business_hours.end_hour =
          static_cast<int>(jsonlite::get_double(*bh, "end_hour", gw.business_hours.end_hour));
      gw.business_hours.weekdays_only =
          jsonlite::get_bool(*bh, "weekdays_only", gw.business_hours.weekdays_only);
      gw.business_hours.utc_offset_minutes = static_cast<int>(
          jsonlite::get_double(*bh, "utc_offset_minutes", gw.business_hours.utc_offset_minutes));
    }
    read_breaker(jsonlite::get_object(*g, "breaker"), gw.tool_breaker);
  }
  if (const Object* p = jsonlite::get_object(doc, "pipeline")) {
    c.analysis_timeout_ms = jsonlite::get_u64(*p, "analysis_timeout_ms", c.analysis_timeout_ms);
    c.recorder_queue = jsonlite::get_u64(*p, "recorder_queue", c.recorder_queue);
    const std::string mode = jsonlite::get_string(*p, "default_mode", to_string(c.default_mode));
    const auto m = execution_mode_from_string(mode);
    if (!m) {
      r.error = ErrorCode::config_invalid;
      r.errors.push_back("pipeline.default_mode: unknown mode " + mode);
      return r;
    }
    c.default_mode = *m;
  }
  if (const Object* a = jsonlite::get_object(doc, "audit")) {
    c.audit_log_path = jsonlite::get_string(*a, "path", c.audit_log_path);
  }
  if (const Object* i = jsonlite::get_object(doc, "impact")) {
    c.impact.base_revenue_per_minute =
        jsonlite::get_double(*i, "base_revenue_per_minute", c.impact.base_revenue_per_minute);
    c.impact.window_minutes = jsonlite::get_double(*i, "window_minutes", c.impact.window_minutes);
  }

  r.ok = true;
  return r;
}

ConfigResult load_config_file(const std::string& path) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) {
    ConfigResult r;
    r.error = ErrorCode::config_invalid;
    r.errors.push_back("cannot open config file " + path);
    return r;
  }
  std::stringstream ss;
  ss << ifs.rdbuf();
  return parse_config(ss.str());
}

std::vector<std::string> apply_env_overrides(EngineConfig& config) {
  std::vector<std::string> errors;
  if (auto v = env_u64("ARF_MAX_INCIDENTS", errors)) config.memory.max_incidents = *v;
  if (auto v = env_u64("ARF_ANALYSIS_TIMEOUT_MS", errors)) config.analysis_timeout_ms = *v;
  if (auto v = env_u64("ARF_MAX_BLAST_RADIUS", errors)) {
    config.gateway.max_blast_radius = static_cast<uint32_t>(*v);
  }
  if (const char* e = std::getenv("ARF_AUDIT_LOG")) config.audit_log_path = e;

  if (const char* e = std::getenv("ARF_BUSINESS_HOURS"); e && *e) {
    const std::string s = e;
    BusinessHours& bh = config.gateway.business_hours;
    if (s == "off" || s == "0") {
      bh.enabled = false;
    } else {
      int start = -1;
      int end = -1;
      char tail = 0;
      if (std::sscanf(s.c_str(), "%d-%d%c", &start, &end, &tail) == 2 && start >= 0 &&
          start <= 23 && end >= 0 && end <= 24 && start != end) {
        bh.enabled = true;
        bh.start_hour = start;
        bh.end_hour = end;
      } else {
        errors.push_back("ARF_BUSINESS_HOURS must be 'off' or 'START-END', got '" + s + "'");
      }
    }
  }
  return errors;
}

std::vector<std::string> validate_config(const EngineConfig& c) {
  std::vector<std::string> errors;
  const StaticThresholds& t = c.classifier.thresholds;
  if (!(t.latency_warning_ms > 0 && t.latency_warning_ms < t.latency_critical_ms &&
        t.latency_critical_ms < t.latency_extreme_ms)) {
    errors.push_back("thresholds: latency must satisfy 0 < warning < critical < extreme");
  }
  if (!(t.error_rate_warning > 0 && t.error_rate_warning < t.error_rate_high &&
        t.error_rate_high < t.error_rate_critical && t.error_rate_critical <= 1.0)) {
    errors.push_back("thresholds: error_rate must satisfy 0 < warning < high < critical <= 1");
  }
  if (!(t.cpu_warning > 0 && t.cpu_warning < t.cpu_critical && t.cpu_critical <= 1.0)) {
    errors.push_back("thresholds: cpu must satisfy 0 < warning < critical <= 1");
  }
  if (!(t.memory_warning > 0 && t.memory_warning < t.memory_critical && t.memory_critical <= 1.0)) {
    errors.push_back("thresholds: memory must satisfy 0 < warning < critical <= 1");
  }
  const MetricWeights& w = c.classifier.weights;
  for (double x : {w.latency, w.error_rate, w.throughput, w.cpu, w.memory}) {
    if (!std::isfinite(x) || x < 0.0) {
      errors.push_back("weights must be finite and non-negative");
      break;
    }
  }
  if (w.latency + w.error_rate + w.throughput + w.cpu + w.memory <= 0.0) {
    errors.push_back("weights: at least one weight must be positive");
  }
  if (!(c.classifier.alpha > 0.0 && c.classifier.alpha <= 1.0)) {
    errors.push_back("classifier.alpha must be in (0, 1]");
  }
  if (c.classifier.max_components == 0) errors.push_back("classifier.max_components must be >= 1");
  if (c.memory.max_incidents == 0) errors.push_back("memory.max_incidents must be >= 1");
  if (c.memory.outcome_bucket_ms == 0) errors.push_back("memory.outcome_bucket_ms must be >= 1");
  if (c.embedding_dimension < 8) errors.push_back("memory.embedding_dimension must be >= 8");
  if (c.recall_k == 0) errors.push_back("memory.recall_k must be >= 1");
  if (c.memory_breaker.failure_threshold == 0 || c.gateway.tool_breaker.failure_threshold == 0) {
    errors.push_back("breaker.failure_threshold must be >= 1");
  }
  if (c.policy_engine.max_tracked_components == 0) {
    errors.push_back("policy_engine.max_tracked_components must be >= 1");
  }
  if (c.analysis_timeout_ms == 0) errors.push_back("pipeline.analysis_timeout_ms must be >= 1");
  if (c.tool_timeout_ms == 0) errors.push_back("gateway.tool_timeout_ms must be >= 1");
  if (c.recorder_queue == 0) errors.push_back("pipeline.recorder_queue must be >= 1");
  const BusinessHours& bh = c.gateway.business_hours;
  if (bh.enabled && (bh.start_hour < 0 || bh.start_hour > 23 || bh.end_hour < 0 ||
                     bh.end_hour > 24 || bh.start_hour == bh.end_hour)) {
    errors.push_back("gateway.business_hours: hours must be in [0, 24] and differ");
  }
  if (bh.utc_offset_minutes < -14 * 60 || bh.utc_offset_minutes > 14 * 60) {
    errors.push_back("gateway.business_hours.utc_offset_minutes out of range");
  }
  if (!std::isfinite(c.impact.base_revenue_per_minute) || c.impact.base_revenue_per_minute < 0 ||
      !std::isfinite(c.impact.window_minutes) || c.impact.window_minutes < 0) {
    errors.push_back("impact values must be finite and non-negative");
  }
  return errors;
}

ConfigResult load_config(const std::string& path) {
  ConfigResult r;
  if (!path.empty()) {
    r = load_config_file(path);
    if (!r.ok) {
      log_event(LogLevel::error, "config", "config_load_failed",
                r.errors.empty() ? "unknown error" : r.errors.front(), {{"path", path}});
      return r;
    }
  } else {
    r.ok = true;
  }

  std::vector<std::string> env_errors = apply_env_overrides(r.config);
  std::vector<std::string> errors = validate_config(r.config);
  errors.insert(errors.begin(), env_errors.begin(), env_errors.end());
  if (!errors.empty()) {
    r.ok = false;
    r.error = ErrorCode::config_invalid;
    r.errors = std::move(errors);
    for (const auto& e : r.errors) {
      log_event(LogLevel::error, "config", "config_invalid", e, {{"path", path}});
    }
  }
  return r;
}

std::string config_to_json(const EngineConfig& c) {
  const StaticThresholds& t = c.classifier.thresholds;
  Object thresholds;
  thresholds["latency_warning_ms"] = Value{t.latency_warning_ms};
  thresholds["latency_critical_ms"] = Value{t.latency_critical_ms};
  thresholds["latency_extreme_ms"] = Value{t.latency_extreme_ms};
  thresholds["error_rate_warning"] = Value{t.error_rate_warning};
  thresholds["error_rate_high"] = Value{t.error_rate_high};
  thresholds["error_rate_critical"] = Value{t.error_rate_critical};
  thresholds["cpu_warning"] = Value{t.cpu_warning};
  thresholds["cpu_critical"] = Value{t.cpu_critical};
  thresholds["memory_warning"] = Value{t.memory_warning};
  thresholds["memory_critical"] = Value{t.memory_critical};

  const MetricWeights& w = c.classifier.weights;
  Object weights;
  weights["latency"] = Value{w.latency};
  weights["error_rate"] = Value{w.error_rate};
  weights["throughput"] = Value{w.throughput};
  weights["cpu"] = Value{w.cpu};
  weights["memory"] = Value{w.memory};

  Object classifier;
  classifier["alpha"] = Value{c.classifier.alpha};
  classifier["warmup_samples"] = Value{static_cast<std::uint64_t>(c.classifier.warmup_samples)};
  classifier["max_components"] = Value{static_cast<std::uint64_t>(c.classifier.max_components)};

  Object memory;
  memory["max_incidents"] = Value{static_cast<std::uint64_t>(c.memory.max_incidents)};
  memory["outcome_bucket_ms"] = Value{static_cast<std::uint64_t>(c.memory.outcome_bucket_ms)};
  memory["max_lessons_length"] = Value{static_cast<std::uint64_t>(c.memory.max_lessons_length)};
  memory["embedding_dimension"] = Value{static_cast<std::uint64_t>(c.embedding_dimension)};
  memory["recall_k"] = Value{static_cast<std::uint64_t>(c.recall_k)};
  memory["breaker"] = Value{breaker_json(c.memory_breaker)};

  Object policy_engine;
  policy_engine["max_tracked_components"] =
      Value{static_cast<std::uint64_t>(c.policy_engine.max_tracked_components)};

  const GatewayConfig& g = c.gateway;
  jsonlite::Array blacklist;
  for (const auto& b : g.blacklist) blacklist.push_back(Value{b});
  Object bh;
  bh["enabled"] = Value{g.business_hours.enabled};
  bh["start_hour"] = Value{static_cast<double>(g.business_hours.start_hour)};
  bh["end_hour"] = Value{static_cast<double>(g.business_hours.end_hour)};
  bh["weekdays_only"] = Value{g.business_hours.weekdays_only};
  bh["utc_offset_minutes"] = Value{static_cast<double>(g.business_hours.utc_offset_minutes)};
  Object gateway;
  gateway["blacklist"] = Value{blacklist};
  gateway["max_blast_radius"] = Value{static_cast<std::uint64_t>(g.max_blast_radius)};
  gateway["tool_cooldown_ms"] = Value{static_cast<std::uint64_t>(g.tool_cooldown_ms)};
  gateway["approval_expiry_ms"] = Value{static_cast<std::uint64_t>(g.approval_expiry_ms)};
  gateway["duplicate_window_ms"] = Value{static_cast<std::uint64_t>(g.duplicate_window_ms)};
  gateway["tool_timeout_ms"] = Value{static_cast<std::uint64_t>(c.tool_timeout_ms)};
  gateway["business_hours"] = Value{bh};
  gateway["breaker"] = Value{breaker_json(g.tool_breaker)};

  Object pipeline;
  pipeline["analysis_timeout_ms"] = Value{static_cast<std::uint64_t>(c.analysis_timeout_ms)};
  pipeline["recorder_queue"] = Value{static_cast<std::uint64_t>(c.recorder_queue)};
  pipeline["default_mode"] = Value{to_string(c.default_mode)};

  Object audit;
  audit["path"] = Value{c.audit_log_path};

  Object impact;
  impact["base_revenue_per_minute"] = Value{c.impact.base_revenue_per_minute};
  impact["window_minutes"] = Value{c.impact.window_minutes};

  std::optional<jsonlite::JsonError> err;
  const Object policies_doc = jsonlite::parse(policies_to_json(c.policies), &err);

  Object o;
  o["thresholds"] = Value{thresholds};
  o["weights"] = Value{weights};
  o["classifier"] = Value{classifier};
  o["memory"] = Value{memory};
  o["policy_engine"] = Value{policy_engine};
  o["policy_schema_version"] =
      Value{static_cast<std::uint64_t>(version::POLICY_SCHEMA_VERSION)};
  if (const jsonlite::Array* arr = jsonlite::get_array(policies_doc, "policies")) {
    o["policies"] = Value{*arr};
  }
  o["gateway"] = Value{gateway};
  o["pipeline"] = Value{pipeline};
  o["audit"] = Value{audit};
  o["impact"] = Value{impact};
  return jsonlite::to_json(o);
}

}  // namespace arf
