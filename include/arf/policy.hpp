#pragma once

// arf/policy.hpp — Deterministic, priority-ordered healing policies.
//
// EVALUATION CONTRACT:
//   - Policies evaluate in ascending priority (ties by name), all conditions
//     ANDed. A condition on an absent optional metric does not match.
//   - A policy is eligible only when the classification bucket is at or above
//     its min_bucket.
//   - Firing is gated by a per-(policy, component) cooldown and a rolling
//     60-minute rate limit. The check and the bookkeeping update happen under
//     one shard lock per policy firing: all-or-nothing, never per action.
//   - Fired policies are additive. A terminal policy that fires stops the
//     evaluation of every lower-priority policy.
//   - A malformed policy (unknown metric/operator, no actions, non-finite
//     threshold) is skipped and logged; the rest still evaluate.
//
// CONCURRENCY:
//   Tracking state lives in a ShardedLru keyed by component: concurrent
//   evaluations for one component serialize, different components do not
//   contend. Tracked components are LRU-bounded.

#include <cstdint>
#include <deque>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "arf/jsonlite.hpp"
#include "arf/sharded_lru.hpp"
#include "arf/types.hpp"

namespace arf {

struct PolicyCondition {
  std::string metric;
  std::string op;        // one of > < >= <= ==
  double threshold{0.0};
};

struct HealingPolicy {
  std::string name;
  std::vector<PolicyCondition> conditions;
  std::vector<std::string> actions;      // ordered, de-duplicated on load
  int priority{3};                       // lower evaluates first
  uint64_t cooldown_seconds{300};
  uint32_t max_executions_per_hour{5};
  bool enabled{true};
  bool terminal{false};
  AnomalyBucket min_bucket{AnomalyBucket::degrading};
};

// Empty string = well-formed; otherwise a human-readable reason.
std::string policy_defect(const HealingPolicy& p);

// Removes duplicate actions keeping first occurrence.
std::vector<std::string> dedupe_actions(const std::vector<std::string>& actions);

bool condition_matches(const PolicyCondition& c, const Event& e);

std::vector<HealingPolicy> default_policies();

struct PolicyLoadResult {
  bool ok{false};
  std::vector<HealingPolicy> policies;
  std::vector<std::string> errors;       // per skipped policy, or document error
};

PolicyLoadResult load_policies_json(const std::string& json);
PolicyLoadResult load_policies(const jsonlite::Object& doc);
std::string policies_to_json(const std::vector<HealingPolicy>& policies);

struct FiredPolicy {
  std::string policy;
  int priority{0};
  std::vector<std::string> actions;
  bool terminal{false};
};

struct PolicyDecision {
  std::vector<std::string> actions;      // ordered by priority then policy order
  std::vector<FiredPolicy> fired;
  std::vector<std::string> suppressed;   // matched but gated by cooldown/rate limit
  std::vector<std::string> skipped;      // malformed
};

struct PolicyEngineConfig {
  size_t max_tracked_components{100};
  size_t shards{16};
};

class PolicyEngine {
 public:
  PolicyEngine(std::vector<HealingPolicy> policies, PolicyEngineConfig config = {},
               ClockFn clock = {});

  // Evaluate and commit firings.
  PolicyDecision evaluate(const Event& e, const Classification& c);

  // Evaluate without touching cooldowns or counters.
  PolicyDecision preview(const Event& e, const Classification& c) const;

  // Atomically re-check and record one firing found by preview(). Returns
  // false when the policy is no longer allowed to fire.
  bool commit_firing(const std::string& component, const std::string& policy_name);

  const std::vector<HealingPolicy>& policies() const { return policies_; }
  size_t tracked_components() const { return trackers_.size(); }
  uint64_t tracker_evictions() const { return trackers_.evictions(); }

 private:
  struct Firing {
    uint64_t last_fired_ms{0};
    bool ever_fired{false};
    std::deque<uint64_t> window;         // firing times within the last hour
  };
  using ComponentTracker = std::map<std::string, Firing>;

  static bool allowed(const HealingPolicy& p, const Firing* f, uint64_t now);
  static void record(const HealingPolicy& p, Firing& f, uint64_t now);
  const HealingPolicy* find_policy(const std::string& name) const;
  PolicyDecision run(const Event& e, const Classification& c, ComponentTracker* tracker,
                     const ComponentTracker* view, uint64_t now) const;

  std::vector<HealingPolicy> policies_;  // sorted, immutable after construction
  std::vector<std::string> defects_;     // parallel to policies_
  PolicyEngineConfig config_;
  ClockFn clock_;
  ShardedLru<ComponentTracker> trackers_;
};

}  // namespace arf
