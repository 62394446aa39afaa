#include "arf/policy.hpp"

#include <algorithm>
#include <cmath>
#include <set>

#include "arf/observability.hpp"
#include "arf/version.hpp"

namespace arf {

namespace {

constexpr uint64_t kRateWindowMs = 60ull * 60ull * 1000ull;

bool is_known_operator(const std::string& op) {
  return op == ">" || op == "<" || op == ">=" || op == "<=" || op == "==";
}

HealingPolicy make_policy(std::string name, std::vector<PolicyCondition> conditions,
                          std::vector<std::string> actions, int priority,
                          uint64_t cooldown_seconds, uint32_t max_per_hour) {
  HealingPolicy p;
  p.name = std::move(name);
  p.conditions = std::move(conditions);
  p.actions = dedupe_actions(actions);
  p.priority = priority;
  p.cooldown_seconds = cooldown_seconds;
  p.max_executions_per_hour = max_per_hour;
  return p;
}

}  // namespace

std::string policy_defect(const HealingPolicy& p) {
  if (p.name.empty()) return "policy name is empty";
  if (p.actions.empty()) return "policy has no actions";
  if (p.max_executions_per_hour == 0) return "max_executions_per_hour must be >= 1";
  for (const auto& c : p.conditions) {
    if (!is_known_metric(c.metric)) return "unknown metric '" + c.metric + "'";
    if (!is_known_operator(c.op)) return "unknown operator '" + c.op + "'";
    if (!std::isfinite(c.threshold)) return "non-finite threshold for " + c.metric;
  }
  return {};
}

std::vector<std::string> dedupe_actions(const std::vector<std::string>& actions) {
  std::vector<std::string> out;
  std::set<std::string> seen;
  for (const auto& a : actions) {
    if (seen.insert(a).second) out.push_back(a);
  }
  return out;
}

bool condition_matches(const PolicyCondition& c, const Event& e) {
  const auto v = metric_value(e, c.metric);
  if (!v) return false;
  if (c.op == ">") return *v > c.threshold;
  if (c.op == "<") return *v < c.threshold;
  if (c.op == ">=") return *v >= c.threshold;
  if (c.op == "<=") return *v <= c.threshold;
  if (c.op == "==") return *v == c.threshold;
  return false;
}

std::vector<HealingPolicy> default_policies() {
  std::vector<HealingPolicy> out;
  out.push_back(make_policy("high_latency_restart",
                            {{"latency_p99", ">", 300.0}, {"error_rate", "<", 0.1}},
                            {"restart_container"}, 2, 300, 5));
  out.push_back(make_policy("cascading_failure", {{"error_rate", ">", 0.15}},
                            {"circuit_breaker", "alert_team"}, 1, 180, 3));
  out.push_back(make_policy("resource_exhaustion",
                            {{"cpu_util", ">", 0.85}, {"memory_util", ">", 0.85}},
                            {"scale_out", "alert_team"}, 1, 600, 5));
  out.push_back(make_policy("moderate_performance_issue",
                            {{"latency_p99", ">", 200.0}, {"error_rate", ">", 0.05}},
                            {"traffic_shift"}, 3, 300, 5));
  out.push_back(make_policy("critical_failure",
                            {{"latency_p99", ">", 500.0}, {"error_rate", ">", 0.1}},
                            {"restart_container", "alert_team", "traffic_shift"}, 1, 900, 2));
  return out;
}

// ---------------------------------------------------------------------------
// JSON loading
// ---------------------------------------------------------------------------

PolicyLoadResult load_policies_json(const std::string& json) {
  std::optional<jsonlite::JsonError> err;
  const auto doc = jsonlite::parse(json, &err);
  if (err) {
    PolicyLoadResult r;
    r.errors.push_back(err->code + ": " + err->message);
    return r;
  }
  return load_policies(doc);
}

PolicyLoadResult load_policies(const jsonlite::Object& doc) {
  PolicyLoadResult r;
  const auto schema = static_cast<uint32_t>(jsonlite::get_u64(doc, "schema_version", 1));
  const auto compat = version::check_policy_schema(schema);
  if (!compat.ok) {
    r.errors.push_back(compat.error_code + ": " + compat.description);
    return r;
  }
  const jsonlite::Array* entries = jsonlite::get_array(doc, "policies");
  if (!entries) {
    r.errors.push_back("policies array is required");
    return r;
  }
  r.ok = true;

  std::set<std::string> names;
  size_t index = 0;
  for (const auto& entry : *entries) {
    const std::string where = "policies[" + std::to_string(index++) + "]";
    auto skip = [&](const std::string& why) {
      r.errors.push_back(where + ": " + why);
      log_event(LogLevel::warn, "policy", "policy_skipped", why, {{"policy", where}});
    };
    if (!std::holds_alternative<jsonlite::Object>(entry.v)) {
      skip("entry is not an object");
      continue;
    }
    const auto& obj = std::get<jsonlite::Object>(entry.v);

    HealingPolicy p;
    p.name = jsonlite::get_string(obj, "name");
    if (p.name.empty()) { skip("name is required"); continue; }
    if (!names.insert(p.name).second) { skip("duplicate policy name " + p.name); continue; }

    const auto priority = jsonlite::get_u64(obj, "priority", 3);
    if (priority > 1000) { skip("priority out of range"); continue; }
    p.priority = static_cast<int>(priority);
    p.cooldown_seconds = jsonlite::get_u64(obj, "cooldown_seconds", 300);
    p.max_executions_per_hour =
        static_cast<uint32_t>(std::min<unsigned long long>(jsonlite::get_u64(obj, "max_executions_per_hour", 5), 1000000));
    p.enabled = jsonlite::get_bool(obj, "enabled", true);
    p.terminal = jsonlite::get_bool(obj, "terminal", false);
    const std::string min_bucket = jsonlite::get_string(obj, "min_bucket", "DEGRADING");
    const auto bucket = bucket_from_string(min_bucket);
    if (!bucket) { skip("unknown min_bucket " + min_bucket); continue; }
    p.min_bucket = *bucket;
    p.actions = dedupe_actions(jsonlite::get_string_array(obj, "actions"));

    bool conditions_ok = true;
    if (const jsonlite::Array* conds = jsonlite::get_array(obj, "conditions")) {
      for (const auto& c : *conds) {
        if (!std::holds_alternative<jsonlite::Object>(c.v)) { conditions_ok = false; break; }
        const auto& co = std::get<jsonlite::Object>(c.v);
        PolicyCondition pc;
        pc.metric = jsonlite::get_string(co, "metric");
        pc.op = jsonlite::get_string(co, "operator", jsonlite::get_string(co, "op"));
        const auto threshold = jsonlite::get_number(co, "threshold");
        if (!threshold) { conditions_ok = false; break; }
        pc.threshold = *threshold;
        p.conditions.push_back(std::move(pc));
      }
    }
    if (!conditions_ok) { skip("malformed condition"); continue; }
    r.policies.push_back(std::move(p));
  }
  return r;
}

std::string policies_to_json(const std::vector<HealingPolicy>& policies) {
  jsonlite::Array arr;
  for (const auto& p : policies) {
    jsonlite::Array conds;
    for (const auto& c : p.conditions) {
      jsonlite::Object co;
      co["metric"] = jsonlite::Value{c.metric};
      co["operator"] = jsonlite::Value{c.op};
      co["threshold"] = jsonlite::Value{c.threshold};
      conds.push_back(jsonlite::Value{co});
    }
    jsonlite::Array actions;
    for (const auto& a : p.actions) actions.push_back(jsonlite::Value{a});
    jsonlite::Object o;
    o["name"] = jsonlite::Value{p.name};
    o["priority"] = jsonlite::Value{static_cast<std::uint64_t>(p.priority)};
    o["conditions"] = jsonlite::Value{conds};
    o["actions"] = jsonlite::Value{actions};
    o["cooldown_seconds"] = jsonlite::Value{static_cast<std::uint64_t>(p.cooldown_seconds)};
    o["max_executions_per_hour"] = jsonlite::Value{static_cast<std::uint64_t>(p.max_executions_per_hour)};
    o["enabled"] = jsonlite::Value{p.enabled};
    o["terminal"] = jsonlite::Value{p.terminal};
    o["min_bucket"] = jsonlite::Value{to_string(p.min_bucket)};
    arr.push_back(jsonlite::Value{o});
  }
  jsonlite::Object doc;
  doc["schema_version"] = jsonlite::Value{static_cast<std::uint64_t>(version::POLICY_SCHEMA_VERSION)};
  doc["policies"] = jsonlite::Value{arr};
  return jsonlite::to_json(doc);
}

// ---------------------------------------------------------------------------
// PolicyEngine
// ---------------------------------------------------------------------------

PolicyEngine::PolicyEngine(std::vector<HealingPolicy> policies, PolicyEngineConfig config,
                           ClockFn clock)
    : policies_(std::move(policies)),
      config_(config),
      clock_(clock_or_system(std::move(clock))),
      trackers_(config.shards, config.max_tracked_components) {
  std::sort(policies_.begin(), policies_.end(), [](const HealingPolicy& a, const HealingPolicy& b) {
    if (a.priority != b.priority) return a.priority < b.priority;
    return a.name < b.name;
  });
  defects_.reserve(policies_.size());
  for (const auto& p : policies_) {
    defects_.push_back(policy_defect(p));
    if (!defects_.back().empty()) {
      log_event(LogLevel::warn, "policy", "policy_malformed",
                "policy will be skipped at evaluation: " + defects_.back(),
                {{"policy", p.name}});
    }
  }
}

bool PolicyEngine::allowed(const HealingPolicy& p, const Firing* f, uint64_t now) {
  if (!f) return true;
  // A clock that stepped backwards counts as inside the cooldown and window.
  if (f->ever_fired &&
      (now < f->last_fired_ms || now - f->last_fired_ms < p.cooldown_seconds * 1000ull)) {
    return false;
  }
  size_t in_window = 0;
  for (uint64_t t : f->window) {
    if (now < t || now - t < kRateWindowMs) ++in_window;
  }
  return in_window < p.max_executions_per_hour;
}

void PolicyEngine::record(const HealingPolicy& /*p*/, Firing& f, uint64_t now) {
  while (!f.window.empty() && now >= f.window.front() &&
         now - f.window.front() >= kRateWindowMs) {
    f.window.pop_front();
  }
  f.window.push_back(now);
  f.last_fired_ms = now;
  f.ever_fired = true;
}

const HealingPolicy* PolicyEngine::find_policy(const std::string& name) const {
  for (const auto& p : policies_) {
    if (p.name == name) return &p;
  }
  return nullptr;
}

PolicyDecision PolicyEngine::run(const Event& e, const Classification& c,
                                 ComponentTracker* tracker, const ComponentTracker* view,
                                 uint64_t now) const {
  PolicyDecision d;
  for (size_t i = 0; i < policies_.size(); ++i) {
    const HealingPolicy& p = policies_[i];
    if (!p.enabled) continue;
    if (!defects_[i].empty()) {
      d.skipped.push_back(p.name);
      log_event(LogLevel::debug, "policy", "policy_skipped", defects_[i], {{"policy", p.name}});
      continue;
    }
    if (static_cast<int>(c.bucket) < static_cast<int>(p.min_bucket)) continue;

    const bool matched = std::all_of(p.conditions.begin(), p.conditions.end(),
                                     [&](const PolicyCondition& pc) { return condition_matches(pc, e); });
    if (!matched) continue;

    bool fire = false;
    if (tracker) {
      Firing& f = (*tracker)[p.name];
      fire = allowed(p, &f, now);
      if (fire) record(p, f, now);
    } else {
      const Firing* f = nullptr;
      if (view) {
        auto it = view->find(p.name);
        if (it != view->end()) f = &it->second;
      }
      fire = allowed(p, f, now);
    }
    if (!fire) {
      d.suppressed.push_back(p.name);
      continue;
    }

    d.fired.push_back(FiredPolicy{p.name, p.priority, p.actions, p.terminal});
    d.actions.insert(d.actions.end(), p.actions.begin(), p.actions.end());
    if (p.terminal) break;
  }
  d.actions = dedupe_actions(d.actions);
  return d;
}

PolicyDecision PolicyEngine::evaluate(const Event& e, const Classification& c) {
  const uint64_t now = clock_();
  return trackers_.with(e.component,
                        [&](ComponentTracker& t) { return run(e, c, &t, &t, now); });
}

PolicyDecision PolicyEngine::preview(const Event& e, const Classification& c) const {
  const uint64_t now = clock_();
  return trackers_.peek(e.component, [&](const ComponentTracker* t) {
    return run(e, c, nullptr, t, now);
  });
}

bool PolicyEngine::commit_firing(const std::string& component, const std::string& policy_name) {
  const HealingPolicy* p = find_policy(policy_name);
  if (!p) return false;
  const uint64_t now = clock_();
  return trackers_.with(component, [&](ComponentTracker& t) {
    Firing& f = t[policy_name];
    if (!allowed(*p, &f, now)) return false;
    record(*p, f, now);
    return true;
  });
}

}  // namespace arf
